/**
 * @file ShapeList.h
 * @brief Ordered selections of topology elements with filter/sort/group.
 *
 * Every operation returns a new list; a ShapeList is never modified by a
 * query. The list keeps the adjacency indices its elements were extracted
 * from alive, so relational predicates work on pipelines such as
 * part.edges().filterBy(isInteriorEdge).
 */
#ifndef SCOPECAD_KERNEL_SELECTION_SHAPE_LIST_H
#define SCOPECAD_KERNEL_SELECTION_SHAPE_LIST_H

#include "../topology/Shape.h"
#include "../../core/geom/Plane.h"

#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace scopecad::kernel::selection {

using core::geom::Axis;
using core::geom::Plane;
using core::geom::Vec3d;
using topology::GeomType;
using topology::Shape;
using topology::ShapeKind;
using topology::TopologyIndex;

enum class SortBy {
    Length,
    Radius,
    Area,
    Volume,
    Distance,
    X,
    Y,
    Z
};

const char* sortByName(SortBy key);

class GroupedShapes;

class ShapeList {
public:
    using Predicate = std::function<bool(const Shape&)>;
    using KeyFunction = std::function<double(const Shape&)>;
    using const_iterator = std::vector<Shape>::const_iterator;

    static constexpr double kDefaultTolerance = 1e-6;
    static constexpr double kDefaultGroupTolerance = 1e-4;

    ShapeList() = default;
    explicit ShapeList(std::vector<Shape> shapes,
                       std::shared_ptr<const TopologyIndex> source = nullptr);
    ShapeList(std::initializer_list<Shape> shapes);

    size_t size() const { return shapes_.size(); }
    bool empty() const { return shapes_.empty(); }
    const_iterator begin() const { return shapes_.begin(); }
    const_iterator end() const { return shapes_.end(); }
    const std::vector<Shape>& shapes() const { return shapes_; }

    // ---- kind extraction (unique, in member order) ----

    ShapeList vertices() const;
    ShapeList edges() const;
    ShapeList wires() const;
    ShapeList faces() const;
    ShapeList shells() const;
    ShapeList solids() const;
    ShapeList compounds() const;
    ShapeList subShapes(ShapeKind kind) const;

    // ---- filters ----

    ShapeList filterBy(ShapeKind kind) const;
    ShapeList filterBy(GeomType type, bool reverse = false) const;

    /**
     * @brief Linear edges parallel to axis and planar faces whose normal is
     * parallel to it; other elements never match.
     */
    ShapeList filterBy(const Axis& axis, double tolerance = kDefaultTolerance, bool reverse = false) const;

    /// Elements lying in plane (faces must also be parallel to it)
    ShapeList filterBy(const Plane& plane, double tolerance = kDefaultTolerance, bool reverse = false) const;

    ShapeList filterBy(const Predicate& predicate, bool reverse = false) const;

    /// Elements whose center projects onto axis within [minimum, maximum]
    ShapeList filterByPosition(const Axis& axis, double minimum, double maximum,
                               bool inclusiveMin = true, bool inclusiveMax = true) const;

    // ---- ordering (stable, ascending unless reverse) ----

    ShapeList sortBy(const Axis& axis, bool reverse = false) const;
    ShapeList sortBy(SortBy key, bool reverse = false) const;
    ShapeList sortBy(const KeyFunction& key, bool reverse = false) const;
    ShapeList sortByDistance(const Vec3d& point, bool reverse = false) const;

    // ---- grouping ----

    GroupedShapes groupBy(const Axis& axis, double tolerance = kDefaultGroupTolerance,
                          bool reverse = false) const;
    GroupedShapes groupBy(SortBy key, double tolerance = kDefaultGroupTolerance,
                          bool reverse = false) const;
    GroupedShapes groupBy(const KeyFunction& key, double tolerance = kDefaultGroupTolerance,
                          bool reverse = false) const;

    // ---- indexing ----

    /// Negative indices count from the end
    const Shape& at(long index) const;
    const Shape& operator[](long index) const { return at(index); }
    const Shape& first() const;
    const Shape& last() const;

    /// Single element of a kind; warns when the list holds more than one
    Shape vertex() const;
    Shape edge() const;
    Shape wire() const;
    Shape face() const;
    Shape solid() const;

    /// @throws core::EmptySelectionError naming what when empty
    const ShapeList& requireNonEmpty(const std::string& what) const;

    // ---- set operations ----

    ShapeList operator+(const ShapeList& other) const;
    ShapeList operator-(const ShapeList& other) const;
    ShapeList operator&(const ShapeList& other) const;

    bool operator==(const ShapeList& other) const;
    bool operator!=(const ShapeList& other) const { return !(*this == other); }

    bool contains(const Shape& shape) const;

    /// Mean of member centers (origin when empty)
    Vec3d center() const;

    const std::vector<std::shared_ptr<const TopologyIndex>>& sources() const { return sources_; }

private:
    ShapeList derived(std::vector<Shape> shapes) const;
    ShapeList sortedByKeys(const std::vector<double>& keys, bool reverse) const;
    Shape single(ShapeKind kind) const;

    void addSource(const std::shared_ptr<const TopologyIndex>& source);

    std::vector<Shape> shapes_;
    std::vector<std::shared_ptr<const TopologyIndex>> sources_;
};

/**
 * @brief Consecutive groups of a sorted selection whose keys agree within
 * a tolerance.
 */
class GroupedShapes {
public:
    struct Group {
        double key = 0.0;
        ShapeList shapes;
    };

    GroupedShapes() = default;
    GroupedShapes(std::vector<Group> groups, double tolerance);

    size_t size() const { return groups_.size(); }
    bool empty() const { return groups_.empty(); }
    std::vector<Group>::const_iterator begin() const { return groups_.begin(); }
    std::vector<Group>::const_iterator end() const { return groups_.end(); }

    /// Negative indices count from the end
    const ShapeList& operator[](long index) const;
    const ShapeList& first() const { return (*this)[0]; }
    const ShapeList& last() const { return (*this)[-1]; }

    std::vector<double> keys() const;

    /// @throws std::out_of_range when no group key matches within tolerance
    const ShapeList& group(double key) const;

    /// @throws std::out_of_range when shape is in no group
    const ShapeList& groupFor(const Shape& shape) const;

private:
    std::vector<Group> groups_;
    double tolerance_ = ShapeList::kDefaultGroupTolerance;
};

} // namespace scopecad::kernel::selection

#endif // SCOPECAD_KERNEL_SELECTION_SHAPE_LIST_H
