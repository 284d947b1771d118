/**
 * @file Objects.h
 * @brief Primitive constructors returning shapes at the origin.
 *
 * Used directly in algebra expressions (Pos(5, 0, 0) * box(1, 1, 1)) and by
 * the builders, which place the result at the active frames.
 * Kernel failures (non-positive sizes, degenerate points) throw
 * core::GeometricOperationError.
 */
#ifndef SCOPECAD_APP_ALGEBRA_OBJECTS_H
#define SCOPECAD_APP_ALGEBRA_OBJECTS_H

#include "Algebra.h"
#include "../../kernel/ops/Primitives.h"
#include "../../kernel/topology/Shape.h"

#include <vector>

namespace scopecad::app::algebra {

using core::geom::Vec3d;
using kernel::ops::Align;
using kernel::topology::Shape;

/// Build any primitive spec; the generic entry point of the helpers below
Shape makeShape(const kernel::ops::PrimitiveSpec& spec,
                const kernel::ops::KernelOptions& options = activeKernelOptions());

// 3D
Shape box(double length, double width, double height,
          Align alignX = Align::Min, Align alignY = Align::Min, Align alignZ = Align::Min);
Shape cylinder(double radius, double height);
Shape cone(double bottomRadius, double topRadius, double height);
Shape sphere(double radius);
Shape torus(double majorRadius, double minorRadius);

// 2D, centered on the origin in the XY plane
Shape rectangle(double width, double height);
Shape circle(double radius);
Shape ellipse(double xRadius, double yRadius);
Shape regularPolygon(double radius, int sides);
Shape polygon(const std::vector<Vec3d>& points);

// 1D
Shape line(const Vec3d& start, const Vec3d& end);
Shape polyline(const std::vector<Vec3d>& points, bool close = false);
Shape centerArc(const Vec3d& center, double radius, double startAngle, double arcSize);
Shape spline(const std::vector<Vec3d>& points);

} // namespace scopecad::app::algebra

#endif // SCOPECAD_APP_ALGEBRA_OBJECTS_H
