/**
 * @file TopoExplore.h
 * @brief Relational queries answered through an element's topology parent.
 *
 * All queries need the element to have been extracted from a still living
 * shape (see Shape::topologyParent()); otherwise they throw
 * std::logic_error("... has no topology parent").
 */
#ifndef SCOPECAD_KERNEL_TOPOLOGY_TOPO_EXPLORE_H
#define SCOPECAD_KERNEL_TOPOLOGY_TOPO_EXPLORE_H

#include "Shape.h"

#include <TopoDS_Face.hxx>

#include <optional>

namespace scopecad::kernel::selection {
class ShapeList;
}

namespace scopecad::kernel::topology {

/// Faces of the parent that contain edge
selection::ShapeList connectedFaces(const Shape& edge);

/// Edges of the parent sharing at least one vertex with edge (edge excluded)
selection::ShapeList connectedEdges(const Shape& edge);

std::optional<Shape> commonVertex(const Shape& edgeA, const Shape& edgeB);

/// Elements of kind in the parent that contain element
selection::ShapeList ancestors(const Shape& element, ShapeKind kind);

/**
 * @brief Concave feature edge test
 *
 * True when edge is shared by exactly two faces that belong to one solid
 * of the parent, the faces are not tangent at the edge midpoint, and the
 * second face turns back over the first one (the material angle across
 * the edge exceeds 180 degrees).
 */
bool isInteriorEdge(const Shape& edge, double angularTolerance = 1e-6);

/// Outward unit normal of face at the surface point closest to point
std::optional<Vec3d> faceNormalAt(const TopoDS_Face& face, const Vec3d& point);

} // namespace scopecad::kernel::topology

#endif // SCOPECAD_KERNEL_TOPOLOGY_TOPO_EXPLORE_H
