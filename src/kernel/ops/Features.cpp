#include "Features.h"
#include "KernelGuard.h"

#include <BRepAdaptor_Curve.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepBuilderAPI_MakeWire.hxx>
#include <BRepBuilderAPI_Transform.hxx>
#include <BRepCheck_Analyzer.hxx>
#include <BRepFilletAPI_MakeChamfer.hxx>
#include <BRepFilletAPI_MakeFillet.hxx>
#include <BRep_Tool.hxx>
#include <GeomAbs_CurveType.hxx>
#include <ShapeFix_Wire.hxx>
#include <TopExp.hxx>
#include <TopExp_Explorer.hxx>
#include <TopTools_IndexedDataMapOfShapeListOfShape.hxx>
#include <TopTools_IndexedMapOfShape.hxx>
#include <TopoDS.hxx>
#include <gp_Pnt.hxx>

#include <QLoggingCategory>

#include <algorithm>

namespace scopecad::kernel::ops {

Q_LOGGING_CATEGORY(logFeature, "scopecad.kernel.feature")

namespace {

using core::geom::Vec3d;

double cross2d(const Vec3d& o, const Vec3d& a, const Vec3d& b) {
    return (a.x() - o.x()) * (b.y() - o.y()) - (a.y() - o.y()) * (b.x() - o.x());
}

/// Andrew's monotone chain, counter-clockwise, without collinear points
std::vector<Vec3d> hull2d(std::vector<Vec3d> points, double tolerance) {
    for (auto& p : points) {
        p.z() = 0.0;
    }
    std::sort(points.begin(), points.end(), [](const Vec3d& a, const Vec3d& b) {
        return a.x() < b.x() || (a.x() == b.x() && a.y() < b.y());
    });
    points.erase(std::unique(points.begin(), points.end(),
                             [tolerance](const Vec3d& a, const Vec3d& b) {
                                 return (a - b).norm() <= tolerance;
                             }),
                 points.end());
    if (points.size() < 3) {
        return points;
    }

    std::vector<Vec3d> hull(2 * points.size());
    size_t k = 0;
    for (size_t i = 0; i < points.size(); ++i) {
        while (k >= 2 && cross2d(hull[k - 2], hull[k - 1], points[i]) <= tolerance) {
            --k;
        }
        hull[k++] = points[i];
    }
    for (size_t i = points.size() - 1, lower = k + 1; i > 0; --i) {
        while (k >= lower && cross2d(hull[k - 2], hull[k - 1], points[i - 1]) <= tolerance) {
            --k;
        }
        hull[k++] = points[i - 1];
    }
    hull.resize(k - 1);
    return hull;
}

void collectEdges(const TopoDS_Shape& shape, std::vector<TopoDS_Edge>& out) {
    for (TopExp_Explorer exp(shape, TopAbs_EDGE); exp.More(); exp.Next()) {
        out.push_back(TopoDS::Edge(exp.Current()));
    }
}

} // namespace

KernelResult fillet(const TopoDS_Shape& solid,
                    const std::vector<TopoDS_Shape>& edges,
                    double radius,
                    const std::vector<std::string>& inputIds,
                    const KernelOptions& options) {
    const std::string operation = "feature.fillet";
    return detail::guarded(logFeature, operation, inputIds, options, [&]() {
        if (solid.IsNull()) {
            return KernelResult::fail(operation, "fillet target is empty", inputIds);
        }
        if (radius <= options.linearTolerance) {
            return KernelResult::fail(operation, "fillet radius too small", inputIds);
        }

        TopTools_IndexedMapOfShape solidEdges;
        TopExp::MapShapes(solid, TopAbs_EDGE, solidEdges);

        BRepFilletAPI_MakeFillet maker(solid);
        int added = 0;
        for (const auto& shape : edges) {
            std::vector<TopoDS_Edge> collected;
            collectEdges(shape, collected);
            for (const auto& edge : collected) {
                if (!solidEdges.Contains(edge)) {
                    return KernelResult::fail(operation, "edge does not belong to the fillet target",
                                              inputIds);
                }
                maker.Add(radius, edge);
                ++added;
            }
        }
        if (added == 0) {
            return KernelResult::fail(operation, "no edges to fillet", inputIds);
        }

        maker.Build();
        if (!maker.IsDone()) {
            return KernelResult::fail(operation, "fillet failed (radius too large?)", inputIds);
        }
        return KernelResult::ok(operation, maker.Shape());
    });
}

KernelResult chamfer(const TopoDS_Shape& solid,
                     const std::vector<TopoDS_Shape>& edges,
                     double length,
                     const std::vector<std::string>& inputIds,
                     const KernelOptions& options) {
    const std::string operation = "feature.chamfer";
    return detail::guarded(logFeature, operation, inputIds, options, [&]() {
        if (solid.IsNull()) {
            return KernelResult::fail(operation, "chamfer target is empty", inputIds);
        }
        if (length <= options.linearTolerance) {
            return KernelResult::fail(operation, "chamfer length too small", inputIds);
        }

        TopTools_IndexedDataMapOfShapeListOfShape edgeFaces;
        TopExp::MapShapesAndAncestors(solid, TopAbs_EDGE, TopAbs_FACE, edgeFaces);

        BRepFilletAPI_MakeChamfer maker(solid);
        int added = 0;
        for (const auto& shape : edges) {
            std::vector<TopoDS_Edge> collected;
            collectEdges(shape, collected);
            for (const auto& edge : collected) {
                const int index = edgeFaces.FindIndex(edge);
                if (index == 0 || edgeFaces(index).IsEmpty()) {
                    return KernelResult::fail(operation, "edge does not belong to the chamfer target",
                                              inputIds);
                }
                maker.Add(length, length, edge, TopoDS::Face(edgeFaces(index).First()));
                ++added;
            }
        }
        if (added == 0) {
            return KernelResult::fail(operation, "no edges to chamfer", inputIds);
        }

        maker.Build();
        if (!maker.IsDone()) {
            return KernelResult::fail(operation, "chamfer failed", inputIds);
        }
        return KernelResult::ok(operation, maker.Shape());
    });
}

KernelResult makeFace(const std::vector<TopoDS_Shape>& edges,
                      const std::vector<std::string>& inputIds,
                      const KernelOptions& options) {
    const std::string operation = "feature.make-face";
    return detail::guarded(logFeature, operation, inputIds, options, [&]() {
        std::vector<TopoDS_Edge> collected;
        for (const auto& shape : edges) {
            if (!shape.IsNull()) {
                collectEdges(shape, collected);
            }
        }
        if (collected.empty()) {
            return KernelResult::fail(operation, "no edges to build a face from", inputIds);
        }

        BRepBuilderAPI_MakeWire wireMaker;
        for (const auto& edge : collected) {
            wireMaker.Add(edge);
        }
        if (!wireMaker.IsDone()) {
            return KernelResult::fail(operation, "edges do not form a connected wire", inputIds);
        }

        ShapeFix_Wire fixer;
        fixer.Load(wireMaker.Wire());
        fixer.SetPrecision(options.linearTolerance);
        fixer.ClosedWireMode() = Standard_True;
        fixer.FixReorder();
        fixer.FixConnected();
        fixer.FixClosed();
        TopoDS_Wire wire = fixer.Wire();
        if (wire.IsNull() || !BRep_Tool::IsClosed(wire)) {
            return KernelResult::fail(operation, "edges do not form a closed wire", inputIds);
        }

        BRepBuilderAPI_MakeFace faceMaker(wire, Standard_True);
        if (!faceMaker.IsDone()) {
            return KernelResult::fail(operation, "wire is not planar", inputIds);
        }
        return KernelResult::ok(operation, faceMaker.Face());
    });
}

std::vector<core::geom::Vec3d> edgeSamplePoints(const TopoDS_Shape& shape, int curveSegments) {
    std::vector<core::geom::Vec3d> points;
    if (shape.IsNull()) {
        return points;
    }
    const int segments = std::max(curveSegments, 1);
    TopTools_IndexedMapOfShape edges;
    TopExp::MapShapes(shape, TopAbs_EDGE, edges);
    for (int i = 1; i <= edges.Extent(); ++i) {
        const TopoDS_Edge& edge = TopoDS::Edge(edges(i));
        if (BRep_Tool::Degenerated(edge)) {
            continue;
        }
        BRepAdaptor_Curve curve(edge);
        const int steps = curve.GetType() == GeomAbs_Line ? 1 : segments;
        const double first = curve.FirstParameter();
        const double last = curve.LastParameter();
        for (int k = 0; k <= steps; ++k) {
            const gp_Pnt p = curve.Value(first + (last - first) * k / steps);
            points.emplace_back(p.X(), p.Y(), p.Z());
        }
    }
    return points;
}

KernelResult convexHull(const std::vector<core::geom::Vec3d>& points, const KernelOptions& options) {
    const std::string operation = "feature.convex-hull";
    return detail::guarded(logFeature, operation, {}, options, [&]() {
        const std::vector<Vec3d> hull = hull2d(points, options.linearTolerance);
        if (hull.size() < 3) {
            return KernelResult::fail(operation, "convex hull needs three non-collinear points");
        }

        BRepBuilderAPI_MakePolygon polygon;
        for (const auto& p : hull) {
            polygon.Add(gp_Pnt(p.x(), p.y(), 0.0));
        }
        polygon.Close();
        if (!polygon.IsDone()) {
            return KernelResult::fail(operation, "hull polygon construction failed");
        }
        BRepBuilderAPI_MakeFace faceMaker(polygon.Wire(), Standard_True);
        if (!faceMaker.IsDone()) {
            return KernelResult::fail(operation, "hull face construction failed");
        }
        return KernelResult::ok(operation, faceMaker.Face());
    });
}

KernelResult bakeTransform(const TopoDS_Shape& shape, const gp_Trsf& trsf, const KernelOptions& options) {
    const std::string operation = "feature.bake-transform";
    return detail::guarded(logFeature, operation, {}, options, [&]() {
        if (shape.IsNull()) {
            return KernelResult::fail(operation, "cannot transform an empty shape");
        }
        BRepBuilderAPI_Transform transform(shape, trsf, Standard_True);
        if (!transform.IsDone()) {
            return KernelResult::fail(operation, "BRepBuilderAPI_Transform failed");
        }
        return KernelResult::ok(operation, transform.Shape());
    });
}

bool validate(const TopoDS_Shape& shape) {
    if (shape.IsNull()) {
        return false;
    }
    BRepCheck_Analyzer analyzer(shape);
    return analyzer.IsValid() == Standard_True;
}

} // namespace scopecad::kernel::ops
