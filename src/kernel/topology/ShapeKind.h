/**
 * @file ShapeKind.h
 * @brief Topological kind tag and curve/surface type of a shape.
 */
#ifndef SCOPECAD_KERNEL_TOPOLOGY_SHAPE_KIND_H
#define SCOPECAD_KERNEL_TOPOLOGY_SHAPE_KIND_H

#include <TopAbs_ShapeEnum.hxx>

#include <optional>

namespace scopecad::kernel::topology {

enum class ShapeKind {
    Vertex,
    Edge,
    Wire,
    Face,
    Shell,
    Solid,
    Compound
};

/// Underlying geometry of an edge or face; None for other kinds
enum class GeomType {
    None,
    Line,
    Circle,
    Ellipse,
    Hyperbola,
    Parabola,
    BezierCurve,
    BSplineCurve,
    OtherCurve,
    Plane,
    Cylinder,
    Cone,
    Sphere,
    Torus,
    BezierSurface,
    BSplineSurface,
    Revolution,
    Extrusion,
    OtherSurface
};

inline const char* shapeKindName(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Vertex: return "Vertex";
        case ShapeKind::Edge: return "Edge";
        case ShapeKind::Wire: return "Wire";
        case ShapeKind::Face: return "Face";
        case ShapeKind::Shell: return "Shell";
        case ShapeKind::Solid: return "Solid";
        case ShapeKind::Compound: return "Compound";
    }
    return "Unknown";
}

const char* geomTypeName(GeomType type);

/// CompSolid and the generic TopAbs_SHAPE map to Compound
inline ShapeKind kindOf(TopAbs_ShapeEnum type) {
    switch (type) {
        case TopAbs_VERTEX: return ShapeKind::Vertex;
        case TopAbs_EDGE: return ShapeKind::Edge;
        case TopAbs_WIRE: return ShapeKind::Wire;
        case TopAbs_FACE: return ShapeKind::Face;
        case TopAbs_SHELL: return ShapeKind::Shell;
        case TopAbs_SOLID: return ShapeKind::Solid;
        default: return ShapeKind::Compound;
    }
}

inline TopAbs_ShapeEnum toTopAbs(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Vertex: return TopAbs_VERTEX;
        case ShapeKind::Edge: return TopAbs_EDGE;
        case ShapeKind::Wire: return TopAbs_WIRE;
        case ShapeKind::Face: return TopAbs_FACE;
        case ShapeKind::Shell: return TopAbs_SHELL;
        case ShapeKind::Solid: return TopAbs_SOLID;
        case ShapeKind::Compound: return TopAbs_COMPOUND;
    }
    return TopAbs_SHAPE;
}

/// Vertex 0, edge/wire 1, face/shell 2, solid 3; compounds have no fixed dimension
inline std::optional<int> kindDimension(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::Vertex: return 0;
        case ShapeKind::Edge:
        case ShapeKind::Wire: return 1;
        case ShapeKind::Face:
        case ShapeKind::Shell: return 2;
        case ShapeKind::Solid: return 3;
        case ShapeKind::Compound: return std::nullopt;
    }
    return std::nullopt;
}

} // namespace scopecad::kernel::topology

#endif // SCOPECAD_KERNEL_TOPOLOGY_SHAPE_KIND_H
