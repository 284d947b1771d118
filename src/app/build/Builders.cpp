#include "Builders.h"
#include "../algebra/Objects.h"
#include "../../core/errors/Errors.h"
#include "../../kernel/ops/Features.h"
#include "../../kernel/ops/Sweeps.h"

#include <QDebug>
#include <QLoggingCategory>
#include <QString>

#include <exception>
#include <stdexcept>

namespace scopecad::app::build {

Q_LOGGING_CATEGORY(logBuilder, "scopecad.build.scope")

namespace ops = kernel::ops;

namespace {

Shape fromResult(const ops::KernelResult& result) {
    if (!result.success) {
        throw core::GeometricOperationError(result.operation, result.errorMessage, result.inputIds);
    }
    return Shape(result.shape);
}

std::vector<TopoDS_Shape> handlesOf(const std::vector<Shape>& shapes) {
    std::vector<TopoDS_Shape> handles;
    handles.reserve(shapes.size());
    for (const auto& shape : shapes) {
        handles.push_back(shape.handle());
    }
    return handles;
}

std::vector<std::string> idsOf(const std::vector<Shape>& shapes) {
    std::vector<std::string> ids;
    ids.reserve(shapes.size());
    for (const auto& shape : shapes) {
        ids.push_back(shape.id());
    }
    return ids;
}

} // namespace

// ---- Builder ----

Builder::Builder(BuildSession& session, ScopeKind kind, std::optional<Mode> mode,
                 std::vector<Plane> workplanes, std::string name)
    : session_(session) {
    const Scope& scope = session_.enter(kind, mode, std::move(workplanes), std::move(name));
    scopeId_ = scope.id;
    name_ = scope.name;
    mode_ = scope.mode;
    uncaughtOnEntry_ = std::uncaught_exceptions();
    open_ = true;
}

Builder::~Builder() noexcept(false) {
    if (!open_) {
        return;
    }
    open_ = false;
    if (!ownsActiveScope()) {
        qCWarning(logBuilder) << "builder:scope-gone" << QString::fromStdString(name_);
        return;
    }
    if (std::uncaught_exceptions() > uncaughtOnEntry_) {
        session_.abandon();
        return;
    }
    session_.exit();
}

Shape Builder::close() {
    if (!open_) {
        throw std::logic_error("builder '" + name_ + "' is already closed");
    }
    requireTop("close");
    open_ = false;
    return session_.exit();
}

bool Builder::ownsActiveScope() const {
    const Scope* active = session_.active();
    return active && active->id == scopeId_;
}

Scope& Builder::requireTop(const char* operation) {
    if (!open_ || !ownsActiveScope()) {
        throw core::InvalidNestingError(std::string(operation) + " on builder '" + name_ +
                                        "', which is not the active scope");
    }
    return *session_.active();
}

const Scope& Builder::requireTop(const char* operation) const {
    return const_cast<Builder*>(this)->requireTop(operation);
}

Shape Builder::shape() const {
    return requireTop("shape").working;
}

ShapeList Builder::vertices(Select select) const {
    requireTop("vertices");
    return session_.select(ShapeKind::Vertex, select);
}

ShapeList Builder::edges(Select select) const {
    requireTop("edges");
    return session_.select(ShapeKind::Edge, select);
}

ShapeList Builder::wires(Select select) const {
    requireTop("wires");
    return session_.select(ShapeKind::Wire, select);
}

ShapeList Builder::faces(Select select) const {
    requireTop("faces");
    return session_.select(ShapeKind::Face, select);
}

ShapeList Builder::solids(Select select) const {
    requireTop("solids");
    return session_.select(ShapeKind::Solid, select);
}

ShapeList Builder::interiorEdges(Select select) const {
    requireTop("interiorEdges");
    return session_.interiorEdges(select);
}

kernel::selection::GroupedShapes Builder::groupBy(ShapeKind kind, const Axis& axis, Select select) const {
    requireTop("groupBy");
    return session_.groupBy(kind, axis, select);
}

ShapeList Builder::add(const Shape& shape, std::optional<Mode> mode) {
    requireTop("add");
    return session_.record(shape, mode);
}

ShapeList Builder::create(const ops::PrimitiveSpec& spec, std::optional<Mode> mode) {
    requireTop(ops::primitiveName(spec).c_str());
    return session_.record(algebra::makeShape(spec, session_.kernelOptions()), mode);
}

std::vector<Shape> Builder::pendingFaces(const char* operation) {
    Scope& scope = requireTop(operation);
    std::vector<Shape> faces;
    for (const auto& pending : scope.pendingFaces) {
        for (const auto& face : pending.faces()) {
            faces.push_back(face);
        }
    }
    if (faces.empty()) {
        throw core::EmptySelectionError(std::string(operation) + ": no pending faces in '" + name_ + "'");
    }
    return faces;
}

std::vector<Shape> Builder::pendingEdges(const char* operation) {
    Scope& scope = requireTop(operation);
    std::vector<Shape> edges;
    for (const auto& pending : scope.pendingEdges) {
        for (const auto& edge : pending.edges()) {
            edges.push_back(edge);
        }
    }
    if (edges.empty()) {
        throw core::EmptySelectionError(std::string(operation) + ": no pending edges in '" + name_ + "'");
    }
    return edges;
}

// ---- BuildPart ----

BuildPart::BuildPart(BuildSession& session, std::optional<Mode> mode, std::vector<Plane> workplanes,
                     std::string name)
    : Builder(session, ScopeKind::Part, mode, std::move(workplanes), std::move(name)) {}

ShapeList BuildPart::box(double length, double width, double height, Align alignX, Align alignY, Align alignZ,
                         std::optional<Mode> mode) {
    return create(ops::BoxSpec{length, width, height, alignX, alignY, alignZ}, mode);
}

ShapeList BuildPart::cylinder(double radius, double height, std::optional<Mode> mode) {
    return create(ops::CylinderSpec{radius, height}, mode);
}

ShapeList BuildPart::cone(double bottomRadius, double topRadius, double height, std::optional<Mode> mode) {
    return create(ops::ConeSpec{bottomRadius, topRadius, height}, mode);
}

ShapeList BuildPart::sphere(double radius, std::optional<Mode> mode) {
    return create(ops::SphereSpec{radius}, mode);
}

ShapeList BuildPart::torus(double majorRadius, double minorRadius, std::optional<Mode> mode) {
    return create(ops::TorusSpec{majorRadius, minorRadius}, mode);
}

ShapeList BuildPart::extrude(double amount, bool both, std::optional<Mode> mode) {
    const auto faces = pendingFaces("extrude");
    const auto options = session_.kernelOptions();

    std::vector<Shape> solids;
    for (const auto& face : faces) {
        const auto normal = face.normal();
        if (!normal) {
            throw core::GeometricOperationError("extrude", "profile face has no normal", {face.id()});
        }
        solids.push_back(fromResult(ops::extrude(face.handle(), *normal, amount, both, {face.id()}, options)));
    }

    ShapeList added = session_.recordPlaced(solids, mode, "extrude");
    Scope& scope = requireTop("extrude");
    scope.pendingFaces.clear();
    return added;
}

ShapeList BuildPart::revolve(const Axis& axis, double angleDegrees, std::optional<Mode> mode) {
    const auto faces = pendingFaces("revolve");
    const auto options = session_.kernelOptions();

    std::vector<Shape> solids;
    for (const auto& face : faces) {
        solids.push_back(fromResult(ops::revolve(face.handle(), axis, angleDegrees, {face.id()}, options)));
    }

    ShapeList added = session_.recordPlaced(solids, mode, "revolve");
    Scope& scope = requireTop("revolve");
    scope.pendingFaces.clear();
    return added;
}

ShapeList BuildPart::loft(bool ruled, std::optional<Mode> mode) {
    const auto sections = pendingFaces("loft");
    if (sections.size() < 2) {
        throw core::EmptySelectionError("loft: needs two pending sections, found " +
                                        std::to_string(sections.size()));
    }
    Shape solid = fromResult(ops::loft(handlesOf(sections), ruled, idsOf(sections), session_.kernelOptions()));

    ShapeList added = session_.recordPlaced({solid}, mode, "loft");
    Scope& scope = requireTop("loft");
    scope.pendingFaces.clear();
    return added;
}

ShapeList BuildPart::sweep(SweepTransition transition, std::optional<Mode> mode) {
    const auto profiles = pendingFaces("sweep");
    const auto path = pendingEdges("sweep");
    const auto options = session_.kernelOptions();
    const auto pathHandles = handlesOf(path);

    std::vector<Shape> solids;
    for (const auto& profile : profiles) {
        std::vector<std::string> ids = idsOf(path);
        ids.insert(ids.begin(), profile.id());
        solids.push_back(fromResult(ops::sweep(profile.handle(), pathHandles, transition, ids, options)));
    }

    ShapeList added = session_.recordPlaced(solids, mode, "sweep");
    Scope& scope = requireTop("sweep");
    scope.pendingFaces.clear();
    scope.pendingEdges.clear();
    return added;
}

Shape BuildPart::fillet(const ShapeList& edges, double radius) {
    Scope& scope = requireTop("fillet");
    edges.requireNonEmpty("fillet edges");
    if (scope.working.isNull()) {
        throw core::GeometricOperationError("fillet", "working shape is empty", idsOf(edges.shapes()));
    }
    Shape result = fromResult(ops::fillet(scope.working.handle(), handlesOf(edges.shapes()), radius,
                                          idsOf(edges.shapes()), session_.kernelOptions()));
    session_.replaceWorking(scope, result);
    return result;
}

Shape BuildPart::chamfer(const ShapeList& edges, double length) {
    Scope& scope = requireTop("chamfer");
    edges.requireNonEmpty("chamfer edges");
    if (scope.working.isNull()) {
        throw core::GeometricOperationError("chamfer", "working shape is empty", idsOf(edges.shapes()));
    }
    Shape result = fromResult(ops::chamfer(scope.working.handle(), handlesOf(edges.shapes()), length,
                                           idsOf(edges.shapes()), session_.kernelOptions()));
    session_.replaceWorking(scope, result);
    return result;
}

// ---- BuildSketch ----

BuildSketch::BuildSketch(BuildSession& session, std::optional<Mode> mode, std::vector<Plane> workplanes,
                         std::string name)
    : Builder(session, ScopeKind::Sketch, mode, std::move(workplanes), std::move(name)) {}

ShapeList BuildSketch::rectangle(double width, double height, std::optional<Mode> mode) {
    return create(ops::RectangleSpec{width, height}, mode);
}

ShapeList BuildSketch::circle(double radius, std::optional<Mode> mode) {
    return create(ops::CircleSpec{radius}, mode);
}

ShapeList BuildSketch::ellipse(double xRadius, double yRadius, std::optional<Mode> mode) {
    return create(ops::EllipseSpec{xRadius, yRadius}, mode);
}

ShapeList BuildSketch::regularPolygon(double radius, int sides, std::optional<Mode> mode) {
    return create(ops::RegularPolygonSpec{radius, sides}, mode);
}

ShapeList BuildSketch::polygon(const std::vector<Vec3d>& points, std::optional<Mode> mode) {
    return create(ops::PolygonSpec{points}, mode);
}

ShapeList BuildSketch::makeFace(std::optional<Mode> mode) {
    const auto edges = pendingEdges("makeFace");
    Shape face = fromResult(ops::makeFace(handlesOf(edges), idsOf(edges), session_.kernelOptions()));

    ShapeList added = session_.recordPlaced({face}, mode, "makeFace");
    Scope& scope = requireTop("makeFace");
    scope.pendingEdges.clear();
    return added;
}

ShapeList BuildSketch::makeHull(std::optional<Mode> mode) {
    const auto edges = pendingEdges("makeHull");
    std::vector<Vec3d> points;
    for (const auto& edge : edges) {
        const auto sampled = ops::edgeSamplePoints(edge.handle());
        points.insert(points.end(), sampled.begin(), sampled.end());
    }
    Shape hull = fromResult(ops::convexHull(points, session_.kernelOptions()));

    ShapeList added = session_.recordPlaced({hull}, mode, "makeHull");
    Scope& scope = requireTop("makeHull");
    scope.pendingEdges.clear();
    return added;
}

// ---- BuildLine ----

BuildLine::BuildLine(BuildSession& session, std::optional<Mode> mode, std::vector<Plane> workplanes,
                     std::string name)
    : Builder(session, ScopeKind::Line, mode, std::move(workplanes), std::move(name)) {}

ShapeList BuildLine::line(const Vec3d& start, const Vec3d& end, std::optional<Mode> mode) {
    return create(ops::LineSpec{start, end}, mode);
}

ShapeList BuildLine::polyline(const std::vector<Vec3d>& points, bool close, std::optional<Mode> mode) {
    return create(ops::PolylineSpec{points, close}, mode);
}

ShapeList BuildLine::centerArc(const Vec3d& center, double radius, double startAngle, double arcSize,
                               std::optional<Mode> mode) {
    return create(ops::ArcSpec{center, radius, startAngle, arcSize}, mode);
}

ShapeList BuildLine::spline(const std::vector<Vec3d>& points, std::optional<Mode> mode) {
    return create(ops::SplineSpec{points}, mode);
}

} // namespace scopecad::app::build
