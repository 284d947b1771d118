#include "Location.h"

#include <gp_Quaternion.hxx>
#include <gp_Vec.hxx>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numbers>
#include <ostream>
#include <sstream>

namespace scopecad::core::geom {

namespace {

constexpr double kGimbalEpsilon = 1e-9;

double toRadians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

double toDegrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

Quat fromEulerDegrees(const Vec3d& euler) {
    Quat q = Eigen::AngleAxisd(toRadians(euler.x()), Vec3d::UnitX()) *
             Eigen::AngleAxisd(toRadians(euler.y()), Vec3d::UnitY()) *
             Eigen::AngleAxisd(toRadians(euler.z()), Vec3d::UnitZ());
    q.normalize();
    return q;
}

// Canonical sign so +0 and -0 print the same
double cleanZero(double value) {
    return std::abs(value) < 5e-13 ? 0.0 : value;
}

} // namespace

Location::Location() = default;

Location::Location(const Vec3d& position)
    : position_(position) {}

Location::Location(const Vec3d& position, const Vec3d& eulerDegrees)
    : position_(position),
      rotation_(fromEulerDegrees(eulerDegrees)) {}

Location::Location(const Vec3d& position, const Vec3d& axis, double angleDegrees)
    : position_(position) {
    const double n = axis.norm();
    if (n > kGimbalEpsilon) {
        rotation_ = Quat(Eigen::AngleAxisd(toRadians(angleDegrees), axis / n));
        rotation_.normalize();
    }
}

Location::Location(const Vec3d& position, const Quat& rotation)
    : position_(position),
      rotation_(rotation.normalized()) {}

Location Location::fromTrsf(const gp_Trsf& trsf) {
    const gp_Quaternion q = trsf.GetRotation();
    const gp_XYZ t = trsf.TranslationPart();
    return Location(Vec3d(t.X(), t.Y(), t.Z()), Quat(q.W(), q.X(), q.Y(), q.Z()));
}

Location Location::fromTopLoc(const TopLoc_Location& location) {
    if (location.IsIdentity()) {
        return Location();
    }
    return fromTrsf(location.Transformation());
}

Vec3d Location::orientation() const {
    // R = Rx(a) * Ry(b) * Rz(c)
    const Eigen::Matrix3d r = rotation_.toRotationMatrix();
    const double sinB = std::clamp(r(0, 2), -1.0, 1.0);
    double a = 0.0;
    double b = std::asin(sinB);
    double c = 0.0;
    if (std::abs(sinB) < 1.0 - kGimbalEpsilon) {
        a = std::atan2(-r(1, 2), r(2, 2));
        c = std::atan2(-r(0, 1), r(0, 0));
    } else {
        // Gimbal lock: fold the whole roll into X
        a = std::atan2(r(2, 1), r(1, 1));
        c = 0.0;
    }
    return Vec3d(cleanZero(toDegrees(a)), cleanZero(toDegrees(b)), cleanZero(toDegrees(c)));
}

Location Location::withPosition(const Vec3d& position) const {
    return Location(position, rotation_);
}

Location Location::withOrientation(const Vec3d& eulerDegrees) const {
    return Location(position_, eulerDegrees);
}

Location Location::compose(const Location& other) const {
    return Location(rotation_ * other.position_ + position_, rotation_ * other.rotation_);
}

Location Location::inverse() const {
    const Quat inv = rotation_.conjugate();
    return Location(-(inv * position_), inv);
}

Location Location::pow(int exponent) const {
    Location base = exponent < 0 ? inverse() : *this;
    // -INT_MIN does not fit in an int
    const long long wide = exponent;
    unsigned long long remaining = static_cast<unsigned long long>(wide < 0 ? -wide : wide);
    Location result;
    while (remaining > 0) {
        if (remaining & 1ULL) {
            result = result.compose(base);
        }
        remaining >>= 1;
        if (remaining > 0) {
            base = base.compose(base);
        }
    }
    return result;
}

Vec3d Location::transformPoint(const Vec3d& point) const {
    return rotation_ * point + position_;
}

Vec3d Location::transformDirection(const Vec3d& direction) const {
    return rotation_ * direction;
}

Axis Location::toAxis() const {
    return Axis(position_, zDirection());
}

gp_Trsf Location::toTrsf() const {
    gp_Trsf trsf;
    trsf.SetTransformation(gp_Quaternion(rotation_.x(), rotation_.y(), rotation_.z(), rotation_.w()),
                           gp_Vec(position_.x(), position_.y(), position_.z()));
    return trsf;
}

TopLoc_Location Location::toTopLoc() const {
    if (isIdentity(0.0, 0.0)) {
        return TopLoc_Location();
    }
    return TopLoc_Location(toTrsf());
}

bool Location::isApprox(const Location& other, double linearTolerance, double angularTolerance) const {
    if ((position_ - other.position_).norm() > linearTolerance) {
        return false;
    }
    return rotation_.angularDistance(other.rotation_) <= angularTolerance;
}

bool Location::isIdentity(double linearTolerance, double angularTolerance) const {
    return isApprox(Location(), linearTolerance, angularTolerance);
}

std::string Location::toString() const {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
}

Location compose(const Location& a, const Location& b) {
    return a.compose(b);
}

Location invert(const Location& location) {
    return location.inverse();
}

Location operator*(const Location& a, const Location& b) {
    return a.compose(b);
}

Location operator-(const Location& location) {
    return location.inverse();
}

std::vector<Location> operator*(const Location& a, const std::vector<Location>& locations) {
    std::vector<Location> result;
    result.reserve(locations.size());
    for (const auto& location : locations) {
        result.push_back(a.compose(location));
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const Location& location) {
    const Vec3d p = location.position();
    const Vec3d o = location.orientation();
    const std::ios_base::fmtflags flags = os.flags();
    const std::streamsize precision = os.precision();
    os << std::fixed << std::setprecision(2)
       << "Location(position=(" << cleanZero(p.x()) << ", " << cleanZero(p.y()) << ", "
       << cleanZero(p.z()) << "), orientation=(" << o.x() << ", " << o.y() << ", " << o.z() << "))";
    os.flags(flags);
    os.precision(precision);
    return os;
}

Location Pos(double x, double y, double z) {
    return Location(Vec3d(x, y, z));
}

Location Pos(const Vec3d& position) {
    return Location(position);
}

Location Rot(double x, double y, double z) {
    return Location(Vec3d::Zero(), Vec3d(x, y, z));
}

Location RotX(double degrees) {
    return Location(Vec3d::Zero(), Vec3d::UnitX(), degrees);
}

Location RotY(double degrees) {
    return Location(Vec3d::Zero(), Vec3d::UnitY(), degrees);
}

Location RotZ(double degrees) {
    return Location(Vec3d::Zero(), Vec3d::UnitZ(), degrees);
}

Location flatten(const std::vector<Location>& stack) {
    Location result;
    for (const auto& location : stack) {
        result = result.compose(location);
    }
    return result;
}

} // namespace scopecad::core::geom
