/**
 * @file Location.h
 * @brief Rigid 3D transform (position + orientation) and its algebra.
 *
 * Locations are immutable values. Composition follows matrix order:
 * (A * B) applies B first, then A. Orientation is stored as a unit
 * quaternion and reported as intrinsic XYZ Euler angles in degrees.
 */
#ifndef SCOPECAD_CORE_GEOM_LOCATION_H
#define SCOPECAD_CORE_GEOM_LOCATION_H

#include "Axis.h"

#include <Eigen/Geometry>
#include <TopLoc_Location.hxx>
#include <gp_Trsf.hxx>

#include <iosfwd>
#include <string>
#include <vector>

namespace scopecad::core::geom {

using Quat = Eigen::Quaterniond;

class Location {
public:
    static constexpr double kLinearTolerance = 1e-6;
    static constexpr double kAngularTolerance = 1e-6;

    /// Identity
    Location();

    explicit Location(const Vec3d& position);

    /**
     * @brief Position plus intrinsic XYZ Euler angles (degrees)
     */
    Location(const Vec3d& position, const Vec3d& eulerDegrees);

    /**
     * @brief Position plus a rotation of angleDegrees about axis
     */
    Location(const Vec3d& position, const Vec3d& axis, double angleDegrees);

    Location(const Vec3d& position, const Quat& rotation);

    static Location fromTrsf(const gp_Trsf& trsf);
    static Location fromTopLoc(const TopLoc_Location& location);

    const Vec3d& position() const { return position_; }
    const Quat& rotation() const { return rotation_; }

    /// Intrinsic XYZ Euler angles in degrees
    Vec3d orientation() const;

    Location withPosition(const Vec3d& position) const;
    Location withOrientation(const Vec3d& eulerDegrees) const;

    /// this * other: apply other first, then this
    Location compose(const Location& other) const;
    Location inverse() const;
    Location pow(int exponent) const;

    Vec3d transformPoint(const Vec3d& point) const;
    Vec3d transformDirection(const Vec3d& direction) const;

    Vec3d xDirection() const { return rotation_ * Vec3d::UnitX(); }
    Vec3d zDirection() const { return rotation_ * Vec3d::UnitZ(); }

    /// Axis through the position along the local Z direction
    Axis toAxis() const;

    gp_Trsf toTrsf() const;
    TopLoc_Location toTopLoc() const;

    bool isApprox(const Location& other,
                  double linearTolerance = kLinearTolerance,
                  double angularTolerance = kAngularTolerance) const;
    bool isIdentity(double linearTolerance = kLinearTolerance,
                    double angularTolerance = kAngularTolerance) const;

    bool operator==(const Location& other) const { return isApprox(other); }
    bool operator!=(const Location& other) const { return !isApprox(other); }

    std::string toString() const;

private:
    Vec3d position_ = Vec3d::Zero();
    Quat rotation_ = Quat::Identity();
};

Location compose(const Location& a, const Location& b);
Location invert(const Location& location);

Location operator*(const Location& a, const Location& b);
Location operator-(const Location& location);
std::vector<Location> operator*(const Location& a, const std::vector<Location>& locations);

std::ostream& operator<<(std::ostream& os, const Location& location);

/// Pure translation
Location Pos(double x, double y, double z = 0.0);
Location Pos(const Vec3d& position);

/// Pure rotation, intrinsic XYZ Euler degrees
Location Rot(double x, double y, double z);
Location RotX(double degrees);
Location RotY(double degrees);
Location RotZ(double degrees);

/**
 * @brief Multiply a list of locations together, outermost first.
 */
Location flatten(const std::vector<Location>& stack);

} // namespace scopecad::core::geom

#endif // SCOPECAD_CORE_GEOM_LOCATION_H
