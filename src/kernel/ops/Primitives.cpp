/**
 * @file Primitives.cpp
 * @brief OCCT construction of the primitive specs
 */
#include "Primitives.h"
#include "KernelGuard.h"

#include <BRepBuilderAPI_MakeEdge.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepBuilderAPI_MakeWire.hxx>
#include <BRepPrimAPI_MakeBox.hxx>
#include <BRepPrimAPI_MakeCone.hxx>
#include <BRepPrimAPI_MakeCylinder.hxx>
#include <BRepPrimAPI_MakeSphere.hxx>
#include <BRepPrimAPI_MakeTorus.hxx>
#include <GeomAPI_Interpolate.hxx>
#include <Geom_BSplineCurve.hxx>
#include <TColgp_HArray1OfPnt.hxx>
#include <TopoDS_Wire.hxx>
#include <gp_Ax2.hxx>
#include <gp_Circ.hxx>
#include <gp_Dir.hxx>
#include <gp_Elips.hxx>
#include <gp_Pnt.hxx>

#include <QLoggingCategory>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <numbers>
#include <sstream>
#include <utility>

namespace scopecad::kernel::ops {

Q_LOGGING_CATEGORY(logPrimitives, "scopecad.kernel.primitives")

namespace {

constexpr double kMinSweepDegrees = 1e-6;

gp_Pnt toGpPnt(const Vec3d& p) {
    return gp_Pnt(p.x(), p.y(), p.z());
}

double alignOffset(Align align, double size) {
    switch (align) {
        case Align::Min:
            return 0.0;
        case Align::Center:
            return -size / 2.0;
        case Align::Max:
            return -size;
    }
    return 0.0;
}

KernelResult nonPositive(const std::string& operation, const char* what, double value) {
    return KernelResult::fail(operation, std::string(what) + " must be positive, got " +
                                             std::to_string(value));
}

TopoDS_Shape faceFromWire(const TopoDS_Wire& wire) {
    BRepBuilderAPI_MakeFace maker(wire, Standard_True);
    if (!maker.IsDone()) {
        return {};
    }
    return maker.Face();
}

TopoDS_Shape closedPolygonFace(const std::vector<Vec3d>& points) {
    BRepBuilderAPI_MakePolygon polygon;
    for (const auto& p : points) {
        polygon.Add(toGpPnt(p));
    }
    polygon.Close();
    if (!polygon.IsDone()) {
        return {};
    }
    return faceFromWire(polygon.Wire());
}

TopoDS_Wire circleWire(const gp_Circ& circle) {
    BRepBuilderAPI_MakeEdge edge(circle);
    return BRepBuilderAPI_MakeWire(edge.Edge()).Wire();
}

struct PrimitiveBuilder {
    const std::string& operation;
    const KernelOptions& options;

    KernelResult operator()(const BoxSpec& spec) const {
        if (spec.length <= 0.0) return nonPositive(operation, "length", spec.length);
        if (spec.width <= 0.0) return nonPositive(operation, "width", spec.width);
        if (spec.height <= 0.0) return nonPositive(operation, "height", spec.height);

        gp_Pnt corner(alignOffset(spec.alignX, spec.length),
                      alignOffset(spec.alignY, spec.width),
                      alignOffset(spec.alignZ, spec.height));
        BRepPrimAPI_MakeBox maker(corner, spec.length, spec.width, spec.height);
        maker.Build();
        if (!maker.IsDone()) {
            return KernelResult::fail(operation, "BRepPrimAPI_MakeBox failed");
        }
        return KernelResult::ok(operation, maker.Shape());
    }

    KernelResult operator()(const CylinderSpec& spec) const {
        if (spec.radius <= 0.0) return nonPositive(operation, "radius", spec.radius);
        if (spec.height <= 0.0) return nonPositive(operation, "height", spec.height);
        BRepPrimAPI_MakeCylinder maker(gp_Ax2(), spec.radius, spec.height);
        maker.Build();
        if (!maker.IsDone()) {
            return KernelResult::fail(operation, "BRepPrimAPI_MakeCylinder failed");
        }
        return KernelResult::ok(operation, maker.Shape());
    }

    KernelResult operator()(const ConeSpec& spec) const {
        if (spec.height <= 0.0) return nonPositive(operation, "height", spec.height);
        if (spec.bottomRadius < 0.0 || spec.topRadius < 0.0 ||
            (spec.bottomRadius <= options.linearTolerance && spec.topRadius <= options.linearTolerance)) {
            return KernelResult::fail(operation, "cone needs at least one positive radius");
        }
        BRepPrimAPI_MakeCone maker(gp_Ax2(), spec.bottomRadius, spec.topRadius, spec.height);
        maker.Build();
        if (!maker.IsDone()) {
            return KernelResult::fail(operation, "BRepPrimAPI_MakeCone failed");
        }
        return KernelResult::ok(operation, maker.Shape());
    }

    KernelResult operator()(const SphereSpec& spec) const {
        if (spec.radius <= 0.0) return nonPositive(operation, "radius", spec.radius);
        BRepPrimAPI_MakeSphere maker(spec.radius);
        maker.Build();
        if (!maker.IsDone()) {
            return KernelResult::fail(operation, "BRepPrimAPI_MakeSphere failed");
        }
        return KernelResult::ok(operation, maker.Shape());
    }

    KernelResult operator()(const TorusSpec& spec) const {
        if (spec.minorRadius <= 0.0) return nonPositive(operation, "minorRadius", spec.minorRadius);
        if (spec.majorRadius <= spec.minorRadius) {
            return KernelResult::fail(operation, "majorRadius must exceed minorRadius");
        }
        BRepPrimAPI_MakeTorus maker(spec.majorRadius, spec.minorRadius);
        maker.Build();
        if (!maker.IsDone()) {
            return KernelResult::fail(operation, "BRepPrimAPI_MakeTorus failed");
        }
        return KernelResult::ok(operation, maker.Shape());
    }

    KernelResult operator()(const RectangleSpec& spec) const {
        if (spec.width <= 0.0) return nonPositive(operation, "width", spec.width);
        if (spec.height <= 0.0) return nonPositive(operation, "height", spec.height);
        const double hw = spec.width / 2.0;
        const double hh = spec.height / 2.0;
        TopoDS_Shape face = closedPolygonFace({Vec3d(-hw, -hh, 0.0), Vec3d(hw, -hh, 0.0),
                                               Vec3d(hw, hh, 0.0), Vec3d(-hw, hh, 0.0)});
        if (face.IsNull()) {
            return KernelResult::fail(operation, "rectangle face construction failed");
        }
        return KernelResult::ok(operation, face);
    }

    KernelResult operator()(const CircleSpec& spec) const {
        if (spec.radius <= 0.0) return nonPositive(operation, "radius", spec.radius);
        TopoDS_Shape face = faceFromWire(circleWire(gp_Circ(gp_Ax2(), spec.radius)));
        if (face.IsNull()) {
            return KernelResult::fail(operation, "circle face construction failed");
        }
        return KernelResult::ok(operation, face);
    }

    KernelResult operator()(const EllipseSpec& spec) const {
        if (spec.xRadius <= 0.0) return nonPositive(operation, "xRadius", spec.xRadius);
        if (spec.yRadius <= 0.0) return nonPositive(operation, "yRadius", spec.yRadius);

        // gp_Elips requires major >= minor; swap the axes instead of the radii
        gp_Ax2 axes = spec.xRadius >= spec.yRadius
                          ? gp_Ax2(gp_Pnt(), gp_Dir(0.0, 0.0, 1.0), gp_Dir(1.0, 0.0, 0.0))
                          : gp_Ax2(gp_Pnt(), gp_Dir(0.0, 0.0, 1.0), gp_Dir(0.0, 1.0, 0.0));
        gp_Elips ellipse(axes, std::max(spec.xRadius, spec.yRadius), std::min(spec.xRadius, spec.yRadius));
        BRepBuilderAPI_MakeEdge edge(ellipse);
        if (!edge.IsDone()) {
            return KernelResult::fail(operation, "ellipse edge construction failed");
        }
        TopoDS_Shape face = faceFromWire(BRepBuilderAPI_MakeWire(edge.Edge()).Wire());
        if (face.IsNull()) {
            return KernelResult::fail(operation, "ellipse face construction failed");
        }
        return KernelResult::ok(operation, face);
    }

    KernelResult operator()(const RegularPolygonSpec& spec) const {
        if (spec.radius <= 0.0) return nonPositive(operation, "radius", spec.radius);
        if (spec.sides < 3) {
            return KernelResult::fail(operation, "regular polygon needs at least 3 sides");
        }
        std::vector<Vec3d> points;
        points.reserve(static_cast<size_t>(spec.sides));
        for (int i = 0; i < spec.sides; ++i) {
            const double angle = 2.0 * std::numbers::pi * i / spec.sides;
            points.emplace_back(spec.radius * std::cos(angle), spec.radius * std::sin(angle), 0.0);
        }
        TopoDS_Shape face = closedPolygonFace(points);
        if (face.IsNull()) {
            return KernelResult::fail(operation, "regular polygon face construction failed");
        }
        return KernelResult::ok(operation, face);
    }

    KernelResult operator()(const PolygonSpec& spec) const {
        if (spec.points.size() < 3) {
            return KernelResult::fail(operation, "polygon needs at least 3 points");
        }
        TopoDS_Shape face = closedPolygonFace(spec.points);
        if (face.IsNull()) {
            return KernelResult::fail(operation, "polygon is not planar or is degenerate");
        }
        return KernelResult::ok(operation, face);
    }

    KernelResult operator()(const LineSpec& spec) const {
        if ((spec.end - spec.start).norm() <= options.linearTolerance) {
            return KernelResult::fail(operation, "line endpoints coincide");
        }
        BRepBuilderAPI_MakeEdge edge(toGpPnt(spec.start), toGpPnt(spec.end));
        if (!edge.IsDone()) {
            return KernelResult::fail(operation, "BRepBuilderAPI_MakeEdge failed");
        }
        return KernelResult::ok(operation, edge.Edge());
    }

    KernelResult operator()(const PolylineSpec& spec) const {
        if (spec.points.size() < 2) {
            return KernelResult::fail(operation, "polyline needs at least 2 points");
        }
        BRepBuilderAPI_MakePolygon polygon;
        for (const auto& p : spec.points) {
            polygon.Add(toGpPnt(p));
        }
        if (spec.close) {
            polygon.Close();
        }
        if (!polygon.IsDone()) {
            return KernelResult::fail(operation, "polyline has coincident consecutive points");
        }
        return KernelResult::ok(operation, polygon.Wire());
    }

    KernelResult operator()(const ArcSpec& spec) const {
        if (spec.radius <= 0.0) return nonPositive(operation, "radius", spec.radius);
        if (std::abs(spec.arcSize) < kMinSweepDegrees) {
            return KernelResult::fail(operation, "arc size is zero");
        }
        const double start = spec.startAngle * std::numbers::pi / 180.0;
        const double end = (spec.startAngle + spec.arcSize) * std::numbers::pi / 180.0;
        gp_Circ circle(gp_Ax2(toGpPnt(spec.center), gp_Dir(0.0, 0.0, 1.0)), spec.radius);
        BRepBuilderAPI_MakeEdge edge = spec.arcSize > 0.0 ? BRepBuilderAPI_MakeEdge(circle, start, end)
                                                          : BRepBuilderAPI_MakeEdge(circle, end, start);
        if (!edge.IsDone()) {
            return KernelResult::fail(operation, "arc edge construction failed");
        }
        TopoDS_Shape shape = edge.Edge();
        if (spec.arcSize < 0.0) {
            shape.Reverse();
        }
        return KernelResult::ok(operation, shape);
    }

    KernelResult operator()(const SplineSpec& spec) const {
        if (spec.points.size() < 2) {
            return KernelResult::fail(operation, "spline needs at least 2 points");
        }
        const int count = static_cast<int>(spec.points.size());
        Handle(TColgp_HArray1OfPnt) points = new TColgp_HArray1OfPnt(1, count);
        for (int i = 0; i < count; ++i) {
            points->SetValue(i + 1, toGpPnt(spec.points[static_cast<size_t>(i)]));
        }
        GeomAPI_Interpolate interpolate(points, Standard_False, options.linearTolerance);
        interpolate.Perform();
        if (!interpolate.IsDone()) {
            return KernelResult::fail(operation, "spline interpolation failed");
        }
        BRepBuilderAPI_MakeEdge edge(interpolate.Curve());
        if (!edge.IsDone()) {
            return KernelResult::fail(operation, "spline edge construction failed");
        }
        return KernelResult::ok(operation, edge.Edge());
    }
};

struct NameVisitor {
    std::string operator()(const BoxSpec&) const { return "box"; }
    std::string operator()(const CylinderSpec&) const { return "cylinder"; }
    std::string operator()(const ConeSpec&) const { return "cone"; }
    std::string operator()(const SphereSpec&) const { return "sphere"; }
    std::string operator()(const TorusSpec&) const { return "torus"; }
    std::string operator()(const RectangleSpec&) const { return "rectangle"; }
    std::string operator()(const CircleSpec&) const { return "circle"; }
    std::string operator()(const EllipseSpec&) const { return "ellipse"; }
    std::string operator()(const RegularPolygonSpec&) const { return "regular-polygon"; }
    std::string operator()(const PolygonSpec&) const { return "polygon"; }
    std::string operator()(const LineSpec&) const { return "line"; }
    std::string operator()(const PolylineSpec&) const { return "polyline"; }
    std::string operator()(const ArcSpec&) const { return "arc"; }
    std::string operator()(const SplineSpec&) const { return "spline"; }
};

/// "box(length=1, width=2, height=3)"; point lists are reported by count
struct DescriptionVisitor {
    std::string operator()(const BoxSpec& s) const {
        return format("box", {{"length", s.length}, {"width", s.width}, {"height", s.height}});
    }
    std::string operator()(const CylinderSpec& s) const {
        return format("cylinder", {{"radius", s.radius}, {"height", s.height}});
    }
    std::string operator()(const ConeSpec& s) const {
        return format("cone", {{"bottomRadius", s.bottomRadius}, {"topRadius", s.topRadius}, {"height", s.height}});
    }
    std::string operator()(const SphereSpec& s) const { return format("sphere", {{"radius", s.radius}}); }
    std::string operator()(const TorusSpec& s) const {
        return format("torus", {{"majorRadius", s.majorRadius}, {"minorRadius", s.minorRadius}});
    }
    std::string operator()(const RectangleSpec& s) const {
        return format("rectangle", {{"width", s.width}, {"height", s.height}});
    }
    std::string operator()(const CircleSpec& s) const { return format("circle", {{"radius", s.radius}}); }
    std::string operator()(const EllipseSpec& s) const {
        return format("ellipse", {{"xRadius", s.xRadius}, {"yRadius", s.yRadius}});
    }
    std::string operator()(const RegularPolygonSpec& s) const {
        return format("regular-polygon", {{"radius", s.radius}, {"sides", static_cast<double>(s.sides)}});
    }
    std::string operator()(const PolygonSpec& s) const {
        return format("polygon", {{"points", static_cast<double>(s.points.size())}});
    }
    std::string operator()(const LineSpec& s) const {
        return format("line", {{"length", (s.end - s.start).norm()}});
    }
    std::string operator()(const PolylineSpec& s) const {
        return format("polyline", {{"points", static_cast<double>(s.points.size())}, {"close", s.close ? 1.0 : 0.0}});
    }
    std::string operator()(const ArcSpec& s) const {
        return format("arc", {{"radius", s.radius}, {"startAngle", s.startAngle}, {"arcSize", s.arcSize}});
    }
    std::string operator()(const SplineSpec& s) const {
        return format("spline", {{"points", static_cast<double>(s.points.size())}});
    }

    static std::string format(const char* name, std::initializer_list<std::pair<const char*, double>> params) {
        std::ostringstream out;
        out << name << '(';
        bool first = true;
        for (const auto& [key, value] : params) {
            out << (first ? "" : ", ") << key << '=' << value;
            first = false;
        }
        out << ')';
        return out.str();
    }
};

} // namespace

std::string primitiveDescription(const PrimitiveSpec& spec) {
    return std::visit(DescriptionVisitor{}, spec);
}

std::string primitiveName(const PrimitiveSpec& spec) {
    return std::visit(NameVisitor{}, spec);
}

int primitiveDimension(const PrimitiveSpec& spec) {
    // Variant order: five solids, five faces, then the edge/wire specs
    const size_t index = spec.index();
    if (index < 5) {
        return 3;
    }
    if (index < 10) {
        return 2;
    }
    return 1;
}

KernelResult makePrimitive(const PrimitiveSpec& spec, const KernelOptions& options) {
    const std::string operation = "primitive." + primitiveName(spec);
    const std::vector<std::string> inputIds{primitiveDescription(spec)};
    KernelResult result = detail::guarded(logPrimitives, operation, inputIds, options, [&]() {
        return std::visit(PrimitiveBuilder{operation, options}, spec);
    });
    if (result.inputIds.empty()) {
        result.inputIds = inputIds;
    }
    return result;
}

} // namespace scopecad::kernel::ops
