#include "Plane.h"

#include <gp_Ax3.hxx>

#include <cmath>

namespace scopecad::core::geom {

namespace {

constexpr double kAxisEpsilon = 1e-9;

Vec3d pickPerpendicular(const Vec3d& n) {
    Vec3d basis = (std::abs(n.z()) < 0.9) ? Vec3d::UnitZ() : Vec3d::UnitY();
    Vec3d perp = basis.cross(n);
    if (perp.norm() < kAxisEpsilon) {
        return Vec3d::UnitX();
    }
    return perp.normalized();
}

} // namespace

Plane::Plane() = default;

Plane::Plane(const Vec3d& origin, const Vec3d& xDirection, const Vec3d& normal)
    : origin_(origin) {
    zDir_ = normal.norm() < kAxisEpsilon ? Vec3d::UnitZ() : normal.normalized();

    // Orthonormalize xDirection against normal
    Vec3d x = xDirection - xDirection.dot(zDir_) * zDir_;
    xDir_ = x.norm() < kAxisEpsilon ? pickPerpendicular(zDir_) : x.normalized();
}

Plane::Plane(const Location& location)
    : Plane(location.position(), location.xDirection(), location.zDirection()) {}

Plane Plane::XY() { return Plane(Vec3d::Zero(), Vec3d::UnitX(), Vec3d::UnitZ()); }
Plane Plane::YZ() { return Plane(Vec3d::Zero(), Vec3d::UnitY(), Vec3d::UnitX()); }
Plane Plane::ZX() { return Plane(Vec3d::Zero(), Vec3d::UnitZ(), Vec3d::UnitY()); }
Plane Plane::XZ() { return Plane(Vec3d::Zero(), Vec3d::UnitX(), -Vec3d::UnitY()); }
Plane Plane::YX() { return Plane(Vec3d::Zero(), Vec3d::UnitY(), -Vec3d::UnitZ()); }
Plane Plane::ZY() { return Plane(Vec3d::Zero(), Vec3d::UnitZ(), -Vec3d::UnitX()); }
Plane Plane::Front() { return XZ(); }
Plane Plane::Back() { return Plane(Vec3d::Zero(), -Vec3d::UnitX(), Vec3d::UnitY()); }
Plane Plane::Left() { return Plane(Vec3d::Zero(), -Vec3d::UnitY(), -Vec3d::UnitX()); }
Plane Plane::Right() { return YZ(); }
Plane Plane::Top() { return XY(); }
Plane Plane::Bottom() { return Plane(Vec3d::Zero(), Vec3d::UnitX(), -Vec3d::UnitZ()); }

Plane Plane::offset(double distance) const {
    return Plane(origin_ + zDir_ * distance, xDir_, zDir_);
}

Plane Plane::shiftedTo(const Vec3d& origin) const {
    return Plane(origin, xDir_, zDir_);
}

Location Plane::location() const {
    Eigen::Matrix3d basis;
    basis.col(0) = xDir_;
    basis.col(1) = yDirection();
    basis.col(2) = zDir_;
    return Location(origin_, Quat(basis));
}

Vec3d Plane::toGlobal(const Vec3d& local) const {
    return origin_ + local.x() * xDir_ + local.y() * yDirection() + local.z() * zDir_;
}

Vec3d Plane::toLocal(const Vec3d& global) const {
    const Vec3d d = global - origin_;
    return Vec3d(d.dot(xDir_), d.dot(yDirection()), d.dot(zDir_));
}

bool Plane::contains(const Vec3d& point, double tolerance) const {
    return std::abs(signedDistance(point)) <= tolerance;
}

gp_Pln Plane::toGpPln() const {
    gp_Ax3 ax3(gp_Pnt(origin_.x(), origin_.y(), origin_.z()),
               gp_Dir(zDir_.x(), zDir_.y(), zDir_.z()),
               gp_Dir(xDir_.x(), xDir_.y(), xDir_.z()));
    return gp_Pln(ax3);
}

bool Plane::isApprox(const Plane& other, double tolerance) const {
    return (origin_ - other.origin_).norm() <= tolerance &&
           (xDir_ - other.xDir_).norm() <= tolerance &&
           (zDir_ - other.zDir_).norm() <= tolerance;
}

Plane operator*(const Location& location, const Plane& plane) {
    return Plane(location.compose(plane.location()));
}

} // namespace scopecad::core::geom
