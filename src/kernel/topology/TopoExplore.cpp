#include "TopoExplore.h"
#include "../selection/ShapeList.h"

#include <BRepAdaptor_Curve.hxx>
#include <BRepClass_FaceClassifier.hxx>
#include <BRepTools.hxx>
#include <BRep_Tool.hxx>
#include <GeomAPI_ProjectPointOnSurf.hxx>
#include <GeomLProp_SLProps.hxx>
#include <Geom_Surface.hxx>
#include <TopoDS.hxx>
#include <gp_Pnt2d.hxx>

#include <QDebug>
#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <stdexcept>

namespace scopecad::kernel::topology {

Q_LOGGING_CATEGORY(logTopology, "scopecad.topology")

namespace {

using selection::ShapeList;

constexpr double kStepFraction = 1e-3;
constexpr double kMinStep = 1e-5;

std::shared_ptr<const TopologyIndex> requireParent(const Shape& element, const char* query) {
    auto parent = element.topologyParent();
    if (!parent) {
        throw std::logic_error(std::string(query) + ": " + element.id() + " has no topology parent");
    }
    return parent;
}

void requireKind(const Shape& element, ShapeKind kind, const char* query) {
    if (element.kind() != kind) {
        throw std::invalid_argument(std::string(query) + " expects a " + shapeKindName(kind) + ", got " +
                                    shapeKindName(element.kind()));
    }
}

gp_Vec toGp(const Vec3d& v) {
    return gp_Vec(v.x(), v.y(), v.z());
}

bool surfaceParameters(const TopoDS_Face& face, const gp_Pnt& point, double& u, double& v) {
    Handle(Geom_Surface) surface = BRep_Tool::Surface(face);
    if (surface.IsNull()) {
        return false;
    }
    GeomAPI_ProjectPointOnSurf projector(point, surface);
    if (projector.NbPoints() > 0) {
        projector.LowerDistanceParameters(u, v);
        return true;
    }
    double umin = 0.0, umax = 0.0, vmin = 0.0, vmax = 0.0;
    BRepTools::UVBounds(face, umin, umax, vmin, vmax);
    u = (umin + umax) / 2.0;
    v = (vmin + vmax) / 2.0;
    return true;
}

} // namespace

std::optional<Vec3d> faceNormalAt(const TopoDS_Face& face, const Vec3d& point) {
    double u = 0.0;
    double v = 0.0;
    if (!surfaceParameters(face, gp_Pnt(point.x(), point.y(), point.z()), u, v)) {
        return std::nullopt;
    }
    GeomLProp_SLProps props(BRep_Tool::Surface(face), u, v, 1, 1e-9);
    if (!props.IsNormalDefined()) {
        return std::nullopt;
    }
    gp_Dir n = props.Normal();
    if (face.Orientation() == TopAbs_REVERSED) {
        n.Reverse();
    }
    return Vec3d(n.X(), n.Y(), n.Z());
}

ShapeList connectedFaces(const Shape& edge) {
    requireKind(edge, ShapeKind::Edge, "connectedFaces");
    auto parent = requireParent(edge, "connectedFaces");
    return ShapeList(wrapAll(parent->ancestors(edge.handle(), ShapeKind::Face), parent), parent);
}

ShapeList connectedEdges(const Shape& edge) {
    requireKind(edge, ShapeKind::Edge, "connectedEdges");
    auto parent = requireParent(edge, "connectedEdges");

    std::vector<TopoDS_Shape> result;
    const auto& vertices = edge.index()->elements(ShapeKind::Vertex);
    for (int i = 1; i <= vertices.Extent(); ++i) {
        for (const auto& other : parent->ancestors(vertices(i), ShapeKind::Edge)) {
            if (other.IsSame(edge.handle())) {
                continue;
            }
            const bool seen = std::any_of(result.begin(), result.end(),
                                          [&](const TopoDS_Shape& s) { return s.IsSame(other); });
            if (!seen) {
                result.push_back(other);
            }
        }
    }
    return ShapeList(wrapAll(result, parent), parent);
}

std::optional<Shape> commonVertex(const Shape& edgeA, const Shape& edgeB) {
    requireKind(edgeA, ShapeKind::Edge, "commonVertex");
    requireKind(edgeB, ShapeKind::Edge, "commonVertex");
    const auto& a = edgeA.index()->elements(ShapeKind::Vertex);
    const auto& b = edgeB.index()->elements(ShapeKind::Vertex);
    for (int i = 1; i <= a.Extent(); ++i) {
        for (int j = 1; j <= b.Extent(); ++j) {
            if (a(i).IsSame(b(j))) {
                return Shape(a(i)).withTopologyParent(edgeA.topologyParent());
            }
        }
    }
    return std::nullopt;
}

ShapeList ancestors(const Shape& element, ShapeKind kind) {
    auto parent = requireParent(element, "ancestors");
    return ShapeList(wrapAll(parent->ancestors(element.handle(), kind), parent), parent);
}

bool isInteriorEdge(const Shape& edge, double angularTolerance) {
    requireKind(edge, ShapeKind::Edge, "isInteriorEdge");
    auto parent = requireParent(edge, "isInteriorEdge");

    const auto faces = parent->ancestors(edge.handle(), ShapeKind::Face);
    if (faces.size() != 2) {
        return false;
    }

    const auto solids0 = parent->ancestors(faces[0], ShapeKind::Solid);
    const auto solids1 = parent->ancestors(faces[1], ShapeKind::Solid);
    const bool sameSolid = std::any_of(solids0.begin(), solids0.end(), [&](const TopoDS_Shape& s0) {
        return std::any_of(solids1.begin(), solids1.end(),
                           [&](const TopoDS_Shape& s1) { return s0.IsSame(s1); });
    });
    if (!sameSolid) {
        return false;
    }

    const TopoDS_Edge& e = TopoDS::Edge(edge.handle());
    if (BRep_Tool::Degenerated(e)) {
        return false;
    }
    BRepAdaptor_Curve curve(e);
    const double mid = (curve.FirstParameter() + curve.LastParameter()) / 2.0;
    gp_Pnt p;
    gp_Vec t;
    curve.D1(mid, p, t);
    if (t.Magnitude() < 1e-12) {
        return false;
    }
    t.Normalize();

    const Vec3d point(p.X(), p.Y(), p.Z());
    const TopoDS_Face& face0 = TopoDS::Face(faces[0]);
    const TopoDS_Face& face1 = TopoDS::Face(faces[1]);
    const auto n0 = faceNormalAt(face0, point);
    const auto n1 = faceNormalAt(face1, point);
    if (!n0 || !n1) {
        qCDebug(logTopology) << "isInteriorEdge:normal-undefined" << QString::fromStdString(edge.id());
        return false;
    }
    if (n0->cross(*n1).norm() <= angularTolerance) {
        return false;
    }

    // Direction leaving the edge across face0, pointed into face0
    gp_Vec across = toGp(*n0).Crossed(t);
    if (across.Magnitude() < 1e-12) {
        return false;
    }
    across.Normalize();

    const double step = std::max(kMinStep, kStepFraction * edge.length());
    double u = 0.0;
    double v = 0.0;
    if (!surfaceParameters(face0, p.Translated(across * step), u, v)) {
        return false;
    }
    BRepClass_FaceClassifier classifier(face0, gp_Pnt2d(u, v), BRep_Tool::Tolerance(face0));
    if (classifier.State() != TopAbs_IN) {
        across.Reverse();
    }

    const double turn = across.Dot(toGp(*n1));
    return turn > angularTolerance;
}

} // namespace scopecad::kernel::topology
