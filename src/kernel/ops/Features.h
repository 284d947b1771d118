/**
 * @file Features.h
 * @brief Edge features, face construction and shape maintenance.
 */
#ifndef SCOPECAD_KERNEL_OPS_FEATURES_H
#define SCOPECAD_KERNEL_OPS_FEATURES_H

#include "KernelResult.h"
#include "../../core/geom/Axis.h"

#include <gp_Trsf.hxx>

#include <string>
#include <vector>

namespace scopecad::kernel::ops {

/**
 * @brief Round the given edges of solid with a constant radius
 *
 * Edges not belonging to solid fail the whole call.
 */
KernelResult fillet(const TopoDS_Shape& solid,
                    const std::vector<TopoDS_Shape>& edges,
                    double radius,
                    const std::vector<std::string>& inputIds = {},
                    const KernelOptions& options = {});

/// Symmetric chamfer of the given edges
KernelResult chamfer(const TopoDS_Shape& solid,
                     const std::vector<TopoDS_Shape>& edges,
                     double length,
                     const std::vector<std::string>& inputIds = {},
                     const KernelOptions& options = {});

/**
 * @brief Planar face bounded by a closed loop of edges/wires
 */
KernelResult makeFace(const std::vector<TopoDS_Shape>& edges,
                      const std::vector<std::string>& inputIds = {},
                      const KernelOptions& options = {});

/**
 * @brief Convex hull of points in the XY plane as a polygon face
 *
 * Z coordinates are ignored. Needs three non-collinear points.
 */
KernelResult convexHull(const std::vector<core::geom::Vec3d>& points,
                        const KernelOptions& options = {});

/**
 * @brief Points along every edge of shape
 *
 * Straight edges give their two ends; curved edges give curveSegments + 1
 * points evenly spaced in parameter, ends included.
 */
std::vector<core::geom::Vec3d> edgeSamplePoints(const TopoDS_Shape& shape, int curveSegments = 32);

/**
 * @brief Rewrite geometry under trsf (copying it)
 *
 * Expensive compared to relocating a shape; only explicit transforms use it.
 */
KernelResult bakeTransform(const TopoDS_Shape& shape,
                           const gp_Trsf& trsf,
                           const KernelOptions& options = {});

/// BRepCheck_Analyzer validity
bool validate(const TopoDS_Shape& shape);

} // namespace scopecad::kernel::ops

#endif // SCOPECAD_KERNEL_OPS_FEATURES_H
