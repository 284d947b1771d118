/**
 * @file Plane.h
 * @brief Oriented plane used as a workplane for builder scopes.
 */
#ifndef SCOPECAD_CORE_GEOM_PLANE_H
#define SCOPECAD_CORE_GEOM_PLANE_H

#include "Location.h"

#include <gp_Pln.hxx>

#include <string>

namespace scopecad::core::geom {

class Plane {
public:
    /// XY plane through the origin
    Plane();

    /**
     * @brief Construct from origin, local x direction and normal
     *
     * The x direction is orthonormalised against the normal; a degenerate
     * x direction is replaced by an arbitrary perpendicular.
     */
    Plane(const Vec3d& origin, const Vec3d& xDirection, const Vec3d& normal);

    explicit Plane(const Location& location);

    static Plane XY();
    static Plane YZ();
    static Plane ZX();
    static Plane XZ();
    static Plane YX();
    static Plane ZY();
    static Plane Front();
    static Plane Back();
    static Plane Left();
    static Plane Right();
    static Plane Top();
    static Plane Bottom();

    const Vec3d& origin() const { return origin_; }
    const Vec3d& xDirection() const { return xDir_; }
    Vec3d yDirection() const { return zDir_.cross(xDir_); }
    const Vec3d& zDirection() const { return zDir_; }

    Plane offset(double distance) const;
    Plane shiftedTo(const Vec3d& origin) const;

    /// Frame mapping local XY coordinates onto this plane
    Location location() const;

    Vec3d toGlobal(const Vec3d& local) const;
    Vec3d toLocal(const Vec3d& global) const;

    double signedDistance(const Vec3d& point) const { return (point - origin_).dot(zDir_); }
    bool contains(const Vec3d& point, double tolerance) const;

    gp_Pln toGpPln() const;

    bool isApprox(const Plane& other, double tolerance = Location::kLinearTolerance) const;

private:
    Vec3d origin_ = Vec3d::Zero();
    Vec3d xDir_ = Vec3d::UnitX();
    Vec3d zDir_ = Vec3d::UnitZ();
};

/// Relocate a plane by a location
Plane operator*(const Location& location, const Plane& plane);

} // namespace scopecad::core::geom

#endif // SCOPECAD_CORE_GEOM_PLANE_H
