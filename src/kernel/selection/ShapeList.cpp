#include "ShapeList.h"
#include "../../core/errors/Errors.h"

#include <QDebug>
#include <QLoggingCategory>
#include <QString>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace scopecad::kernel::selection {

Q_LOGGING_CATEGORY(logSelect, "scopecad.select")

namespace {

bool isLinearEdge(const Shape& shape) {
    return shape.kind() == ShapeKind::Edge && shape.geomType() == GeomType::Line;
}

bool isPlanarFace(const Shape& shape) {
    return shape.kind() == ShapeKind::Face && shape.geomType() == GeomType::Plane;
}

bool matchesAxis(const Shape& shape, const Axis& axis, double tolerance) {
    if (isLinearEdge(shape)) {
        const auto tangent = shape.tangentAt(0.5);
        return tangent && axis.isParallel(*tangent, tolerance);
    }
    if (isPlanarFace(shape)) {
        const auto normal = shape.normal();
        return normal && axis.isParallel(*normal, tolerance);
    }
    return false;
}

bool liesIn(const Shape& shape, const Plane& plane, double tolerance) {
    if (shape.isNull()) {
        return false;
    }
    if (shape.kind() == ShapeKind::Face) {
        const auto normal = shape.normal();
        if (!normal || normal->cross(plane.zDirection()).norm() > tolerance) {
            return false;
        }
    }
    if (!plane.contains(shape.center(), tolerance)) {
        return false;
    }
    for (const auto& vertex : shape.vertices()) {
        if (!plane.contains(vertex.center(), tolerance)) {
            return false;
        }
    }
    return true;
}

double sortKey(const Shape& shape, SortBy key) {
    switch (key) {
        case SortBy::Length:
            return shape.length();
        case SortBy::Radius:
            return shape.radius().value_or(std::numeric_limits<double>::infinity());
        case SortBy::Area:
            return shape.area();
        case SortBy::Volume:
            return shape.volume();
        case SortBy::Distance:
            return shape.center().norm();
        case SortBy::X:
            return shape.center().x();
        case SortBy::Y:
            return shape.center().y();
        case SortBy::Z:
            return shape.center().z();
    }
    return 0.0;
}

GroupedShapes groupKeys(const ShapeList& list, const std::vector<double>& keys,
                        double tolerance, bool reverse,
                        const std::function<ShapeList(std::vector<Shape>)>& makeList) {
    std::vector<size_t> order(list.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return reverse ? keys[b] < keys[a] : keys[a] < keys[b];
    });

    std::vector<GroupedShapes::Group> groups;
    std::vector<Shape> current;
    double currentKey = 0.0;
    for (size_t i : order) {
        if (current.empty() || std::abs(keys[i] - currentKey) > tolerance) {
            if (!current.empty()) {
                groups.push_back({currentKey, makeList(std::move(current))});
                current.clear();
            }
            currentKey = keys[i];
        }
        current.push_back(list.shapes()[i]);
    }
    if (!current.empty()) {
        groups.push_back({currentKey, makeList(std::move(current))});
    }
    return GroupedShapes(std::move(groups), tolerance);
}

} // namespace

const char* sortByName(SortBy key) {
    switch (key) {
        case SortBy::Length: return "Length";
        case SortBy::Radius: return "Radius";
        case SortBy::Area: return "Area";
        case SortBy::Volume: return "Volume";
        case SortBy::Distance: return "Distance";
        case SortBy::X: return "X";
        case SortBy::Y: return "Y";
        case SortBy::Z: return "Z";
    }
    return "Unknown";
}

ShapeList::ShapeList(std::vector<Shape> shapes, std::shared_ptr<const TopologyIndex> source)
    : shapes_(std::move(shapes)) {
    addSource(source);
}

ShapeList::ShapeList(std::initializer_list<Shape> shapes)
    : shapes_(shapes) {}

void ShapeList::addSource(const std::shared_ptr<const TopologyIndex>& source) {
    if (source && std::find(sources_.begin(), sources_.end(), source) == sources_.end()) {
        sources_.push_back(source);
    }
}

ShapeList ShapeList::derived(std::vector<Shape> shapes) const {
    ShapeList result(std::move(shapes));
    result.sources_ = sources_;
    return result;
}

// ---- kind extraction ----

ShapeList ShapeList::subShapes(ShapeKind kind) const {
    ShapeList result;
    result.sources_ = sources_;
    for (const auto& member : shapes_) {
        ShapeList children = member.subShapes(kind);
        for (const auto& source : children.sources_) {
            result.addSource(source);
        }
        for (const auto& child : children) {
            const bool seen = std::any_of(result.shapes_.begin(), result.shapes_.end(),
                                          [&](const Shape& s) { return s.isSame(child); });
            if (!seen) {
                result.shapes_.push_back(child);
            }
        }
    }
    return result;
}

ShapeList ShapeList::vertices() const { return subShapes(ShapeKind::Vertex); }
ShapeList ShapeList::edges() const { return subShapes(ShapeKind::Edge); }
ShapeList ShapeList::wires() const { return subShapes(ShapeKind::Wire); }
ShapeList ShapeList::faces() const { return subShapes(ShapeKind::Face); }
ShapeList ShapeList::shells() const { return subShapes(ShapeKind::Shell); }
ShapeList ShapeList::solids() const { return subShapes(ShapeKind::Solid); }
ShapeList ShapeList::compounds() const { return subShapes(ShapeKind::Compound); }

// ---- filters ----

ShapeList ShapeList::filterBy(ShapeKind kind) const {
    return filterBy([kind](const Shape& s) { return s.kind() == kind; });
}

ShapeList ShapeList::filterBy(GeomType type, bool reverse) const {
    return filterBy([type](const Shape& s) { return s.geomType() == type; }, reverse);
}

ShapeList ShapeList::filterBy(const Axis& axis, double tolerance, bool reverse) const {
    return filterBy([&axis, tolerance](const Shape& s) { return matchesAxis(s, axis, tolerance); }, reverse);
}

ShapeList ShapeList::filterBy(const Plane& plane, double tolerance, bool reverse) const {
    return filterBy([&plane, tolerance](const Shape& s) { return liesIn(s, plane, tolerance); }, reverse);
}

ShapeList ShapeList::filterBy(const Predicate& predicate, bool reverse) const {
    std::vector<Shape> kept;
    for (const auto& shape : shapes_) {
        if (predicate(shape) != reverse) {
            kept.push_back(shape);
        }
    }
    return derived(std::move(kept));
}

ShapeList ShapeList::filterByPosition(const Axis& axis, double minimum, double maximum,
                                      bool inclusiveMin, bool inclusiveMax) const {
    return filterBy([&](const Shape& s) {
        const double p = axis.project(s.center());
        const bool aboveMin = inclusiveMin ? p >= minimum - kDefaultTolerance : p > minimum;
        const bool belowMax = inclusiveMax ? p <= maximum + kDefaultTolerance : p < maximum;
        return aboveMin && belowMax;
    });
}

// ---- ordering ----

ShapeList ShapeList::sortedByKeys(const std::vector<double>& keys, bool reverse) const {
    std::vector<size_t> order(shapes_.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return reverse ? keys[b] < keys[a] : keys[a] < keys[b];
    });
    std::vector<Shape> sorted;
    sorted.reserve(shapes_.size());
    for (size_t i : order) {
        sorted.push_back(shapes_[i]);
    }
    return derived(std::move(sorted));
}

ShapeList ShapeList::sortBy(const Axis& axis, bool reverse) const {
    return sortBy([&axis](const Shape& s) { return axis.project(s.center()); }, reverse);
}

ShapeList ShapeList::sortBy(SortBy key, bool reverse) const {
    return sortBy([key](const Shape& s) { return sortKey(s, key); }, reverse);
}

ShapeList ShapeList::sortBy(const KeyFunction& key, bool reverse) const {
    std::vector<double> keys;
    keys.reserve(shapes_.size());
    for (const auto& shape : shapes_) {
        keys.push_back(key(shape));
    }
    return sortedByKeys(keys, reverse);
}

ShapeList ShapeList::sortByDistance(const Vec3d& point, bool reverse) const {
    return sortBy([&point](const Shape& s) { return s.distanceTo(point); }, reverse);
}

// ---- grouping ----

GroupedShapes ShapeList::groupBy(const Axis& axis, double tolerance, bool reverse) const {
    return groupBy([&axis](const Shape& s) { return axis.project(s.center()); }, tolerance, reverse);
}

GroupedShapes ShapeList::groupBy(SortBy key, double tolerance, bool reverse) const {
    return groupBy([key](const Shape& s) { return sortKey(s, key); }, tolerance, reverse);
}

GroupedShapes ShapeList::groupBy(const KeyFunction& key, double tolerance, bool reverse) const {
    std::vector<double> keys;
    keys.reserve(shapes_.size());
    for (const auto& shape : shapes_) {
        keys.push_back(key(shape));
    }
    return groupKeys(*this, keys, tolerance, reverse,
                     [this](std::vector<Shape> shapes) { return derived(std::move(shapes)); });
}

// ---- indexing ----

const Shape& ShapeList::at(long index) const {
    const long count = static_cast<long>(shapes_.size());
    const long resolved = index < 0 ? count + index : index;
    if (resolved < 0 || resolved >= count) {
        throw core::EmptySelectionError("index " + std::to_string(index) +
                                        " out of range for a selection of " + std::to_string(count));
    }
    return shapes_[static_cast<size_t>(resolved)];
}

const Shape& ShapeList::first() const {
    requireNonEmpty("first element");
    return shapes_.front();
}

const Shape& ShapeList::last() const {
    requireNonEmpty("last element");
    return shapes_.back();
}

Shape ShapeList::single(ShapeKind kind) const {
    ShapeList matches = filterBy(kind);
    if (matches.empty()) {
        matches = subShapes(kind);
    }
    if (matches.empty()) {
        throw core::EmptySelectionError(std::string("selection holds no ") + topology::shapeKindName(kind));
    }
    if (matches.size() > 1) {
        qCWarning(logSelect) << "single:ambiguous"
                             << "kind=" << topology::shapeKindName(kind)
                             << "count=" << static_cast<int>(matches.size());
    }
    return matches.shapes_.front();
}

Shape ShapeList::vertex() const { return single(ShapeKind::Vertex); }
Shape ShapeList::edge() const { return single(ShapeKind::Edge); }
Shape ShapeList::wire() const { return single(ShapeKind::Wire); }
Shape ShapeList::face() const { return single(ShapeKind::Face); }
Shape ShapeList::solid() const { return single(ShapeKind::Solid); }

const ShapeList& ShapeList::requireNonEmpty(const std::string& what) const {
    if (shapes_.empty()) {
        throw core::EmptySelectionError("empty selection: " + what);
    }
    return *this;
}

// ---- set operations ----

bool ShapeList::contains(const Shape& shape) const {
    return std::any_of(shapes_.begin(), shapes_.end(), [&](const Shape& s) { return s == shape; });
}

ShapeList ShapeList::operator+(const ShapeList& other) const {
    ShapeList result = derived({});
    for (const auto& source : other.sources_) {
        result.addSource(source);
    }
    for (const auto* list : {this, &other}) {
        for (const auto& shape : *list) {
            if (!result.contains(shape)) {
                result.shapes_.push_back(shape);
            }
        }
    }
    return result;
}

ShapeList ShapeList::operator-(const ShapeList& other) const {
    return filterBy([&other](const Shape& s) { return !other.contains(s); });
}

ShapeList ShapeList::operator&(const ShapeList& other) const {
    return filterBy([&other](const Shape& s) { return other.contains(s); });
}

bool ShapeList::operator==(const ShapeList& other) const {
    return shapes_ == other.shapes_;
}

Vec3d ShapeList::center() const {
    if (shapes_.empty()) {
        return Vec3d::Zero();
    }
    Vec3d sum = Vec3d::Zero();
    for (const auto& shape : shapes_) {
        sum += shape.center();
    }
    return sum / static_cast<double>(shapes_.size());
}

// ---- GroupedShapes ----

GroupedShapes::GroupedShapes(std::vector<Group> groups, double tolerance)
    : groups_(std::move(groups)),
      tolerance_(tolerance) {}

const ShapeList& GroupedShapes::operator[](long index) const {
    const long count = static_cast<long>(groups_.size());
    const long resolved = index < 0 ? count + index : index;
    if (resolved < 0 || resolved >= count) {
        throw core::EmptySelectionError("group index " + std::to_string(index) +
                                        " out of range for " + std::to_string(count) + " groups");
    }
    return groups_[static_cast<size_t>(resolved)].shapes;
}

std::vector<double> GroupedShapes::keys() const {
    std::vector<double> result;
    result.reserve(groups_.size());
    for (const auto& g : groups_) {
        result.push_back(g.key);
    }
    return result;
}

const ShapeList& GroupedShapes::group(double key) const {
    for (const auto& g : groups_) {
        if (std::abs(g.key - key) <= tolerance_) {
            return g.shapes;
        }
    }
    throw std::out_of_range("no group with key " + std::to_string(key));
}

const ShapeList& GroupedShapes::groupFor(const Shape& shape) const {
    for (const auto& g : groups_) {
        if (g.shapes.contains(shape)) {
            return g.shapes;
        }
    }
    throw std::out_of_range("shape " + shape.id() + " is in no group");
}

} // namespace scopecad::kernel::selection
