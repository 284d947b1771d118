/**
 * @file Shape.h
 * @brief Value wrapper around a kernel topology handle.
 *
 * A Shape is a TopoDS_Shape plus its declared kind. Copies share the kernel
 * geometry and the lazily computed measures; every operation that changes
 * geometry or placement returns a new Shape.
 *
 * Elements extracted from a shape (faces(), edges(), ...) keep a weak
 * reference to the adjacency index of the shape they came from so that
 * relational queries (connected faces, interior edges) can be answered.
 */
#ifndef SCOPECAD_KERNEL_TOPOLOGY_SHAPE_H
#define SCOPECAD_KERNEL_TOPOLOGY_SHAPE_H

#include "ShapeKind.h"
#include "TopologyIndex.h"
#include "../../core/geom/Location.h"

#include <TopoDS_Shape.hxx>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scopecad::kernel::selection {
class ShapeList;
}

namespace scopecad::kernel::topology {

using core::geom::Location;
using core::geom::Vec3d;

struct BoundingBox {
    Vec3d min = Vec3d::Zero();
    Vec3d max = Vec3d::Zero();

    Vec3d center() const { return (min + max) / 2.0; }
    Vec3d size() const { return max - min; }
};

class Shape {
public:
    /// Empty shape: isNull(), kind Compound, no children
    Shape();

    /// Kind taken from the handle
    explicit Shape(const TopoDS_Shape& handle);

    /**
     * @brief Wrap handle, checking it is of the declared kind
     * @throws std::invalid_argument on mismatch
     */
    Shape(const TopoDS_Shape& handle, ShapeKind declared);

    bool isNull() const { return handle_.IsNull(); }
    ShapeKind kind() const { return kind_; }
    const TopoDS_Shape& handle() const { return handle_; }

    /**
     * @brief Topological dimension
     *
     * Compounds report the maximum dimension of their non-compound
     * members; an empty compound has none.
     */
    std::optional<int> dimension() const;

    // ---- placement ----

    Location location() const;

    /// Same geometry with the location replaced
    Shape located(const Location& location) const;

    /// Same geometry with location composed in front: location * this.location()
    Shape moved(const Location& location) const;

    // ---- identity ----

    /// Label if set, otherwise "Kind#hash"
    std::string id() const;
    const std::string& label() const { return label_; }
    void setLabel(std::string label) { label_ = std::move(label); }

    /// Same TShape, location and orientation
    bool operator==(const Shape& other) const;
    bool operator!=(const Shape& other) const { return !(*this == other); }

    /// Same TShape and location, any orientation
    bool isSame(const Shape& other) const;

    // ---- measures (cached per value) ----

    double volume() const;
    double area() const;
    double length() const;
    Vec3d centerOfMass() const;
    BoundingBox boundingBox() const;

    /// Center of mass; a vertex's point; the origin for an empty shape
    Vec3d center() const;

    GeomType geomType() const;

    /// Radius of a circular edge or of a cylindrical/spherical face
    std::optional<double> radius() const;

    /// Outward normal of a face at its center
    std::optional<Vec3d> normal() const;

    /// Tangent of an edge at parameter fraction t in [0, 1]
    std::optional<Vec3d> tangentAt(double t = 0.5) const;

    double distanceTo(const Shape& other) const;
    double distanceTo(const Vec3d& point) const;

    bool isValid() const;

    // ---- topology ----

    /// Direct sub-shapes
    selection::ShapeList children() const;

    selection::ShapeList vertices() const;
    selection::ShapeList edges() const;
    selection::ShapeList wires() const;
    selection::ShapeList faces() const;
    selection::ShapeList shells() const;
    selection::ShapeList solids() const;
    selection::ShapeList compounds() const;

    /// Unique sub-elements of kind in exploration order
    selection::ShapeList subShapes(ShapeKind kind) const;

    /// Adjacency index of this shape as a root (created on first use)
    std::shared_ptr<const TopologyIndex> index() const;

    /// Index of the shape this element was extracted from, null if gone or none
    std::shared_ptr<const TopologyIndex> topologyParent() const { return parent_.lock(); }
    bool hasTopologyParent() const { return !parent_.expired(); }

    Shape withTopologyParent(const std::shared_ptr<const TopologyIndex>& parent) const;

private:
    struct Cache;

    Cache& cache() const;

    TopoDS_Shape handle_;
    ShapeKind kind_ = ShapeKind::Compound;
    std::string label_;
    std::weak_ptr<const TopologyIndex> parent_;
    mutable std::shared_ptr<Cache> cache_;
};

std::ostream& operator<<(std::ostream& os, const Shape& shape);

/// Wrap every handle, all with the same topology parent
std::vector<Shape> wrapAll(const std::vector<TopoDS_Shape>& handles,
                           const std::shared_ptr<const TopologyIndex>& parent);

} // namespace scopecad::kernel::topology

#endif // SCOPECAD_KERNEL_TOPOLOGY_SHAPE_H
