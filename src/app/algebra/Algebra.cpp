#include "Algebra.h"
#include "../../core/errors/Errors.h"
#include "../../kernel/ops/Features.h"

#include <QDebug>
#include <QLoggingCategory>
#include <QString>

#include <algorithm>

namespace scopecad::app::algebra {

Q_LOGGING_CATEGORY(logAlgebra, "scopecad.algebra")

namespace {

Shape fromResult(const kernel::ops::KernelResult& result) {
    if (!result.success) {
        throw core::GeometricOperationError(result.operation, result.errorMessage, result.inputIds);
    }
    return Shape(result.shape);
}

struct InstalledOptions {
    uint64_t token;
    KernelOptions options;
};

thread_local std::vector<InstalledOptions> installedOptions;
thread_local uint64_t nextOptionsToken = 1;

} // namespace

KernelOptions activeKernelOptions() {
    return installedOptions.empty() ? KernelOptions{} : installedOptions.back().options;
}

ScopedKernelOptions::ScopedKernelOptions(const KernelOptions& options)
    : token_(nextOptionsToken++) {
    installedOptions.push_back({token_, options});
    qCDebug(logAlgebra) << "options:install" << "fuzzy=" << options.fuzzyValue
                        << "clean=" << options.cleanAfterBoolean
                        << "depth=" << static_cast<int>(installedOptions.size());
}

ScopedKernelOptions::~ScopedKernelOptions() {
    // Released out of order when two sessions interleave on one thread
    const uint64_t token = token_;
    installedOptions.erase(std::remove_if(installedOptions.begin(), installedOptions.end(),
                                          [token](const InstalledOptions& entry) { return entry.token == token; }),
                           installedOptions.end());
}

void requireSameDimension(const char* operation, const Shape& a, const Shape& b) {
    const auto da = a.dimension();
    const auto db = b.dimension();
    if (da && db && *da != *db) {
        throw core::AlgebraShapeMismatchError(operation, *da, *db);
    }
}

Shape combine(const Shape& target, const std::vector<Shape>& tools, BooleanOp op,
              const KernelOptions& options) {
    const std::string operation = std::string("boolean.") + kernel::ops::booleanOpName(op);

    std::vector<Shape> live;
    for (const auto& tool : tools) {
        requireSameDimension(operation.c_str(), target, tool);
        if (!tool.isNull()) {
            live.push_back(tool);
        }
    }
    for (size_t i = 1; i < live.size(); ++i) {
        requireSameDimension(operation.c_str(), live.front(), live[i]);
    }

    if (target.isNull()) {
        if (op != BooleanOp::Fuse) {
            std::vector<std::string> ids;
            for (const auto& tool : live) {
                ids.push_back(tool.id());
            }
            throw core::GeometricOperationError(operation, "target shape is empty", ids);
        }
        if (live.empty()) {
            return Shape();
        }
        if (live.size() == 1) {
            return live.front();
        }
        return combine(live.front(), std::vector<Shape>(live.begin() + 1, live.end()), op, options);
    }
    if (live.empty()) {
        if (op == BooleanOp::Common) {
            throw core::GeometricOperationError(operation, "empty boolean result", {target.id()});
        }
        return target;
    }

    std::vector<TopoDS_Shape> handles;
    std::vector<std::string> ids{target.id()};
    handles.reserve(live.size());
    for (const auto& tool : live) {
        handles.push_back(tool.handle());
        ids.push_back(tool.id());
    }
    qCDebug(logAlgebra) << "combine" << QString::fromStdString(operation) << "tools=" << static_cast<int>(live.size());
    return fromResult(kernel::ops::boolean(op, target.handle(), handles, ids, options));
}

Shape combine(const Shape& a, const Shape& b, BooleanOp op, const KernelOptions& options) {
    return combine(a, std::vector<Shape>{b}, op, options);
}

Shape place(const Location& location, const Shape& shape) {
    return shape.moved(location);
}

std::vector<Shape> place(const Location& location, const std::vector<Shape>& shapes) {
    std::vector<Shape> result;
    result.reserve(shapes.size());
    for (const auto& shape : shapes) {
        result.push_back(shape.moved(location));
    }
    return result;
}

std::vector<Shape> place(const std::vector<Location>& locations, const Shape& shape) {
    std::vector<Shape> result;
    result.reserve(locations.size());
    for (const auto& location : locations) {
        result.push_back(shape.moved(location));
    }
    return result;
}

Shape compound(const std::vector<Shape>& shapes) {
    std::vector<TopoDS_Shape> handles;
    for (const auto& shape : shapes) {
        if (!shape.isNull()) {
            handles.push_back(shape.handle());
        }
    }
    if (handles.empty()) {
        return Shape();
    }
    return Shape(kernel::ops::makeCompound(handles));
}

Shape bakedTransform(const Shape& shape, const Location& location, const KernelOptions& options) {
    if (shape.isNull()) {
        return Shape();
    }
    return fromResult(kernel::ops::bakeTransform(shape.handle(), location.toTrsf(), options));
}

Shape translate(const Shape& shape, const Vec3d& offset) {
    return bakedTransform(shape, core::geom::Pos(offset));
}

Shape rotate(const Shape& shape, const Axis& axis, double angleDegrees) {
    // Rotation about an axis that does not pass through the origin
    const Location toAxis = core::geom::Pos(axis.origin());
    const Location spin(Vec3d::Zero(), axis.direction(), angleDegrees);
    return bakedTransform(shape, toAxis * spin * toAxis.inverse());
}

} // namespace scopecad::app::algebra

namespace scopecad::kernel::topology {

using app::algebra::combine;
using app::algebra::compound;
using app::algebra::place;
using kernel::ops::BooleanOp;

Shape operator+(const Shape& a, const Shape& b) {
    return combine(a, b, BooleanOp::Fuse);
}

Shape operator-(const Shape& a, const Shape& b) {
    return combine(a, b, BooleanOp::Cut);
}

Shape operator&(const Shape& a, const Shape& b) {
    return combine(a, b, BooleanOp::Common);
}

Shape& operator+=(Shape& a, const Shape& b) {
    a = a + b;
    return a;
}

Shape& operator-=(Shape& a, const Shape& b) {
    a = a - b;
    return a;
}

Shape& operator&=(Shape& a, const Shape& b) {
    a = a & b;
    return a;
}

Shape operator*(const Location& location, const Shape& shape) {
    return place(location, shape);
}

Shape operator*(const std::vector<Location>& locations, const Shape& shape) {
    return compound(place(locations, shape));
}

std::vector<Shape> operator*(const Location& location, const std::vector<Shape>& shapes) {
    return place(location, shapes);
}

} // namespace scopecad::kernel::topology
