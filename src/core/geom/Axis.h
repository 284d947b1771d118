#ifndef SCOPECAD_CORE_GEOM_AXIS_H
#define SCOPECAD_CORE_GEOM_AXIS_H

#include <Eigen/Dense>

#include <cmath>

namespace scopecad::core::geom {

using Vec3d = Eigen::Vector3d;

/**
 * @brief Infinite oriented line: origin plus unit direction.
 */
class Axis {
public:
    Axis() = default;
    Axis(const Vec3d& origin, const Vec3d& direction)
        : origin_(origin), direction_(direction.normalized()) {}

    static Axis X() { return Axis(Vec3d::Zero(), Vec3d::UnitX()); }
    static Axis Y() { return Axis(Vec3d::Zero(), Vec3d::UnitY()); }
    static Axis Z() { return Axis(Vec3d::Zero(), Vec3d::UnitZ()); }

    const Vec3d& origin() const { return origin_; }
    const Vec3d& direction() const { return direction_; }

    // Signed distance of the projection of point onto the axis.
    double project(const Vec3d& point) const { return (point - origin_).dot(direction_); }

    bool isParallel(const Vec3d& direction, double angularTolerance) const {
        const double n = direction.norm();
        if (n < 1e-12) {
            return false;
        }
        return direction_.cross(direction / n).norm() <= angularTolerance;
    }

    bool isNormal(const Vec3d& direction, double angularTolerance) const {
        const double n = direction.norm();
        if (n < 1e-12) {
            return false;
        }
        return std::abs(direction_.dot(direction / n)) <= angularTolerance;
    }

    Axis reversed() const { return Axis(origin_, -direction_); }

private:
    Vec3d origin_ = Vec3d::Zero();
    Vec3d direction_ = Vec3d::UnitZ();
};

} // namespace scopecad::core::geom

#endif // SCOPECAD_CORE_GEOM_AXIS_H
