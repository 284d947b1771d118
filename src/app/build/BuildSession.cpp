#include "BuildSession.h"
#include "../algebra/Algebra.h"
#include "../../core/errors/Errors.h"
#include "../../kernel/topology/TopoExplore.h"

#include <QDebug>
#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <stdexcept>

namespace scopecad::app::build {

Q_LOGGING_CATEGORY(logScope, "scopecad.build.scope")
Q_LOGGING_CATEGORY(logSession, "scopecad.build.session")

namespace {

using kernel::ops::BooleanOp;

QString describe(const Scope& scope) {
    return QStringLiteral("%1:%2").arg(QString::fromLatin1(scopeKindName(scope.kind)),
                                       QString::fromStdString(scope.name));
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

BuildSession::BuildSession(SessionConfig config)
    : config_(std::move(config)) {}

BuildSession::~BuildSession() {
    teardown();
}

void BuildSession::start() {
    teardown();
    qCDebug(logSession) << "session:start"
                        << "linearTolerance=" << config_.linearTolerance
                        << "defaultMode=" << modeName(config_.defaultMode);
}

void BuildSession::teardown() {
    while (!scopes_.empty()) {
        std::unique_ptr<Scope> scope = scopes_.pop();
        qCWarning(logSession) << "session:leaked-scope" << describe(*scope);
    }
    releaseOptionsWhenIdle();
    locations_.clear();
    results_.clear();
}

// ---- scopes ----

Scope& BuildSession::enter(ScopeKind kind, std::optional<Mode> mode, std::vector<Plane> workplanes,
                           std::string name) {
    if (workplanes.empty()) {
        throw std::invalid_argument("a scope needs at least one workplane");
    }
    if (const Scope* top = active(); top && scopeDimension(kind) > top->dimension()) {
        throw core::InvalidNestingError(std::string("a ") + scopeKindName(kind) + " scope cannot be opened inside a " +
                                        scopeKindName(top->kind) + " scope");
    }

    auto scope = std::make_unique<Scope>();
    scope->kind = kind;
    scope->name = name.empty() ? std::string(scopeKindName(kind)) : std::move(name);
    scope->mode = mode.value_or(config_.defaultMode);
    scope->workplanes = std::move(workplanes);

    std::vector<Location> planeFrames;
    planeFrames.reserve(scope->workplanes.size());
    for (const auto& plane : scope->workplanes) {
        planeFrames.push_back(plane.location());
    }

    if (kind == ScopeKind::Sketch) {
        for (const auto& outer : locations_.top()) {
            for (const auto& frame : planeFrames) {
                scope->deliveryFrames.push_back(outer * frame);
            }
        }
        scope->locationDepth = locations_.pushAbsolute({Location()});
    } else {
        scope->deliveryFrames = {Location()};
        scope->locationDepth = locations_.push(planeFrames);
    }

    Scope& entered = scopes_.push(std::move(scope));
    if (!installedOptions_) {
        installedOptions_ = std::make_unique<algebra::ScopedKernelOptions>(kernelOptions());
    }
    qCDebug(logScope) << "scope:enter" << describe(entered)
                      << "mode=" << modeName(entered.mode)
                      << "depth=" << static_cast<int>(scopes_.depth());
    return entered;
}

Shape BuildSession::exit() {
    Scope* top = active();
    if (!top) {
        throw core::InvalidNestingError("exit called without an open scope");
    }
    locations_.pop(top->locationDepth);
    std::unique_ptr<Scope> scope = scopes_.pop();
    releaseOptionsWhenIdle();

    if (!scope->pendingEdges.empty() || !scope->pendingFaces.empty()) {
        qCWarning(logScope) << "scope:unconsumed-pending" << describe(*scope)
                            << "edges=" << static_cast<int>(scope->pendingEdges.size())
                            << "faces=" << static_cast<int>(scope->pendingFaces.size());
    }

    std::vector<Shape> delivered;
    if (!scope->working.isNull()) {
        if (scope->kind == ScopeKind::Sketch) {
            delivered = algebra::place(scope->deliveryFrames, scope->working);
        } else {
            delivered.push_back(scope->working);
        }
    }
    Shape result = algebra::compound(delivered);

    Scope* parent = active();
    qCDebug(logScope) << "scope:exit" << describe(*scope)
                      << "delivered=" << static_cast<int>(delivered.size())
                      << "toParent=" << (parent != nullptr);

    if (!parent) {
        results_[scope->name] = result;
        return result;
    }
    if (delivered.empty()) {
        return result;
    }
    if (scope->dimension() == parent->dimension()) {
        combineInto(*parent, delivered, parent->mode, "scope.exit");
    } else {
        for (const auto& shape : delivered) {
            deliver(*parent, shape, scope->dimension());
        }
    }
    return result;
}

void BuildSession::abandon() {
    Scope* top = active();
    if (!top) {
        return;
    }
    while (locations_.depth() >= top->locationDepth && !locations_.empty()) {
        locations_.pop(locations_.depth());
    }
    std::unique_ptr<Scope> scope = scopes_.pop();
    releaseOptionsWhenIdle();
    qCWarning(logScope) << "scope:abandoned" << describe(*scope);
}

void BuildSession::releaseOptionsWhenIdle() {
    if (scopes_.empty()) {
        installedOptions_.reset();
    }
}

Scope& BuildSession::requireActive(const char* operation) {
    Scope* top = active();
    if (!top) {
        throw core::InvalidNestingError(std::string(operation) + " requires an open scope");
    }
    return *top;
}

Scope& BuildSession::requireActive(ScopeKind kind, const char* operation) {
    Scope& top = requireActive(operation);
    if (top.kind != kind) {
        throw core::InvalidNestingError(std::string(operation) + " requires an open " + scopeKindName(kind) +
                                        " scope, the active scope is a " + scopeKindName(top.kind));
    }
    return top;
}

// ---- combining ----

void BuildSession::combineInto(Scope& scope, const std::vector<Shape>& shapes, Mode mode, const char* operation) {
    const auto options = kernelOptions();
    Shape next;
    switch (mode) {
        case Mode::Private:
            scope.lastPrivate = ShapeList(shapes);
            scope.lastWasPrivate = true;
            return;
        case Mode::Add:
            next = algebra::combine(scope.working, shapes, BooleanOp::Fuse, options);
            break;
        case Mode::Subtract:
            if (scope.working.isNull()) {
                throw core::GeometricOperationError(operation, "cannot subtract from an empty working shape",
                                                    idsOf(shapes));
            }
            next = algebra::combine(scope.working, shapes, BooleanOp::Cut, options);
            break;
        case Mode::Intersect:
            if (scope.working.isNull()) {
                throw core::GeometricOperationError(operation, "cannot intersect with an empty working shape",
                                                    idsOf(shapes));
            }
            next = algebra::combine(scope.working, shapes, BooleanOp::Common, options);
            break;
        case Mode::Replace:
            next = algebra::combine(Shape(), shapes, BooleanOp::Fuse, options);
            break;
    }

    scope.previousWorking = scope.working;
    scope.working = next;
    scope.lastWasPrivate = false;
    scope.lastPrivate = ShapeList();
    qCDebug(logScope) << "scope:combine" << describe(scope)
                      << "operation=" << operation
                      << "mode=" << modeName(mode)
                      << "inputs=" << static_cast<int>(shapes.size());
}

void BuildSession::deliver(Scope& parent, const Shape& result, int dimension) {
    if (dimension == 1) {
        parent.pendingEdges.push_back(result);
    } else {
        parent.pendingFaces.push_back(result);
    }
}

ShapeList BuildSession::record(const Shape& primitive, std::optional<Mode> mode) {
    Scope& scope = requireActive("record");
    if (primitive.isNull()) {
        throw std::invalid_argument("cannot record an empty shape");
    }
    if (const auto dim = primitive.dimension(); dim && *dim != scope.dimension()) {
        throw core::AlgebraShapeMismatchError(std::string("record into ") + scopeKindName(scope.kind),
                                              scope.dimension(), *dim);
    }

    std::vector<Shape> placed = algebra::place(effectiveFrames(), primitive);
    combineInto(scope, placed, mode.value_or(scope.mode), "record");
    return ShapeList(std::move(placed));
}

ShapeList BuildSession::recordPlaced(const std::vector<Shape>& shapes, std::optional<Mode> mode,
                                     const char* operation) {
    Scope& scope = requireActive(operation);
    for (const auto& shape : shapes) {
        if (const auto dim = shape.dimension(); dim && *dim != scope.dimension()) {
            throw core::AlgebraShapeMismatchError(operation, scope.dimension(), *dim);
        }
    }
    combineInto(scope, shapes, mode.value_or(scope.mode), operation);
    return ShapeList(shapes);
}

void BuildSession::replaceWorking(Scope& scope, const Shape& shape) {
    scope.previousWorking = scope.working;
    scope.working = shape;
    scope.lastWasPrivate = false;
    scope.lastPrivate = ShapeList();
}

// ---- queries ----

ShapeList BuildSession::select(ShapeKind kind, Select select) const {
    const Scope* scope = active();
    if (!scope) {
        throw core::InvalidNestingError("selection requires an open scope");
    }
    if (select == Select::All) {
        return scope->working.subShapes(kind);
    }
    if (scope->lastWasPrivate) {
        return scope->lastPrivate.subShapes(kind);
    }

    const ShapeList current = scope->working.subShapes(kind);
    if (scope->previousWorking.isNull()) {
        return current;
    }
    const ShapeList before = scope->previousWorking.subShapes(kind);
    return current.filterBy([&before](const Shape& s) {
        return std::none_of(before.begin(), before.end(), [&s](const Shape& b) { return b.isSame(s); });
    });
}

ShapeList BuildSession::interiorEdges(Select select) const {
    const double tolerance = config_.angularTolerance;
    return this->select(ShapeKind::Edge, select).filterBy([tolerance](const Shape& edge) {
        return kernel::topology::isInteriorEdge(edge, tolerance);
    });
}

kernel::selection::GroupedShapes BuildSession::groupBy(ShapeKind kind, const core::geom::Axis& axis,
                                                      Select select) const {
    return this->select(kind, select).groupBy(axis, config_.groupTolerance);
}

// ---- results ----

bool BuildSession::hasResult(const std::string& name) const {
    return results_.count(name) > 0;
}

const Shape& BuildSession::result(const std::string& name) const {
    auto it = results_.find(name);
    if (it == results_.end()) {
        throw std::out_of_range("no build result named '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> BuildSession::resultNames() const {
    std::vector<std::string> names;
    names.reserve(results_.size());
    for (const auto& [name, shape] : results_) {
        names.push_back(name);
    }
    return names;
}

} // namespace scopecad::app::build
