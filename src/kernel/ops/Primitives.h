/**
 * @file Primitives.h
 * @brief Primitive construction at the origin through OCCT.
 *
 * Each primitive is described by a small spec struct; makePrimitive()
 * dispatches on the variant tag. Results are always built in the global
 * frame, placement is applied afterwards by the caller.
 */
#ifndef SCOPECAD_KERNEL_OPS_PRIMITIVES_H
#define SCOPECAD_KERNEL_OPS_PRIMITIVES_H

#include "KernelResult.h"
#include "../../core/geom/Axis.h"

#include <string>
#include <variant>
#include <vector>

namespace scopecad::kernel::ops {

using core::geom::Vec3d;

enum class Align {
    Min,
    Center,
    Max
};

// ---- 3D ----

struct BoxSpec {
    double length = 1.0;
    double width = 1.0;
    double height = 1.0;
    Align alignX = Align::Min;
    Align alignY = Align::Min;
    Align alignZ = Align::Min;
};

/// Base on the XY plane, axis along +Z
struct CylinderSpec {
    double radius = 1.0;
    double height = 1.0;
};

struct ConeSpec {
    double bottomRadius = 1.0;
    double topRadius = 0.0;
    double height = 1.0;
};

struct SphereSpec {
    double radius = 1.0;
};

struct TorusSpec {
    double majorRadius = 2.0;
    double minorRadius = 0.5;
};

// ---- 2D (on the XY plane, centered) ----

struct RectangleSpec {
    double width = 1.0;
    double height = 1.0;
};

struct CircleSpec {
    double radius = 1.0;
};

struct EllipseSpec {
    double xRadius = 2.0;
    double yRadius = 1.0;
};

/// radius is the circumscribed radius; first vertex on +X
struct RegularPolygonSpec {
    double radius = 1.0;
    int sides = 6;
};

struct PolygonSpec {
    std::vector<Vec3d> points;
};

// ---- 1D ----

struct LineSpec {
    Vec3d start = Vec3d::Zero();
    Vec3d end = Vec3d::UnitX();
};

struct PolylineSpec {
    std::vector<Vec3d> points;
    bool close = false;
};

/// Arc in the XY plane; angles in degrees, counter-clockwise
struct ArcSpec {
    Vec3d center = Vec3d::Zero();
    double radius = 1.0;
    double startAngle = 0.0;
    double arcSize = 90.0;
};

/// Interpolating B-spline through points
struct SplineSpec {
    std::vector<Vec3d> points;
};

using PrimitiveSpec = std::variant<BoxSpec, CylinderSpec, ConeSpec, SphereSpec, TorusSpec,
                                   RectangleSpec, CircleSpec, EllipseSpec, RegularPolygonSpec,
                                   PolygonSpec, LineSpec, PolylineSpec, ArcSpec, SplineSpec>;

/// Name used in logs and errors ("box", "circle", ...)
std::string primitiveName(const PrimitiveSpec& spec);

/// Name and parameters, recorded as the input of primitive results
std::string primitiveDescription(const PrimitiveSpec& spec);

/// Dimension of the primitive the spec produces (1, 2 or 3)
int primitiveDimension(const PrimitiveSpec& spec);

KernelResult makePrimitive(const PrimitiveSpec& spec, const KernelOptions& options = {});

} // namespace scopecad::kernel::ops

#endif // SCOPECAD_KERNEL_OPS_PRIMITIVES_H
