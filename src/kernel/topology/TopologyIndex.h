/**
 * @file TopologyIndex.h
 * @brief Adjacency maps of one root shape.
 *
 * Built once per root and shared by every element extracted from it.
 * Elements hold it weakly; whoever keeps the root (or a ShapeList taken
 * from it) keeps the index alive.
 */
#ifndef SCOPECAD_KERNEL_TOPOLOGY_TOPOLOGY_INDEX_H
#define SCOPECAD_KERNEL_TOPOLOGY_TOPOLOGY_INDEX_H

#include "ShapeKind.h"

#include <TopTools_IndexedDataMapOfShapeListOfShape.hxx>
#include <TopTools_IndexedMapOfShape.hxx>
#include <TopoDS_Shape.hxx>

#include <array>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace scopecad::kernel::topology {

class TopologyIndex {
public:
    explicit TopologyIndex(const TopoDS_Shape& root);

    const TopoDS_Shape& root() const { return root_; }

    /// Unique elements of kind in exploration order
    const TopTools_IndexedMapOfShape& elements(ShapeKind kind) const;

    bool contains(const TopoDS_Shape& element) const;

    /**
     * @brief Elements of ancestorKind containing element (unique, map order)
     *
     * Returns an empty list when element is not part of the root.
     */
    std::vector<TopoDS_Shape> ancestors(const TopoDS_Shape& element, ShapeKind ancestorKind) const;

private:
    using AncestorKey = std::pair<int, int>;

    const TopTools_IndexedDataMapOfShapeListOfShape& ancestorMap(ShapeKind childKind,
                                                                 ShapeKind ancestorKind) const;

    TopoDS_Shape root_;
    mutable std::array<std::optional<TopTools_IndexedMapOfShape>, 7> elements_;
    mutable std::map<AncestorKey, TopTools_IndexedDataMapOfShapeListOfShape> ancestors_;
};

} // namespace scopecad::kernel::topology

#endif // SCOPECAD_KERNEL_TOPOLOGY_TOPOLOGY_INDEX_H
