#include "TopologyIndex.h"

#include <TopExp.hxx>
#include <TopTools_ListOfShape.hxx>

namespace scopecad::kernel::topology {

TopologyIndex::TopologyIndex(const TopoDS_Shape& root)
    : root_(root) {}

const TopTools_IndexedMapOfShape& TopologyIndex::elements(ShapeKind kind) const {
    auto& slot = elements_[static_cast<size_t>(kind)];
    if (!slot.has_value()) {
        slot.emplace();
        if (!root_.IsNull()) {
            TopExp::MapShapes(root_, toTopAbs(kind), *slot);
        }
    }
    return *slot;
}

bool TopologyIndex::contains(const TopoDS_Shape& element) const {
    if (element.IsNull() || root_.IsNull()) {
        return false;
    }
    return elements(kindOf(element.ShapeType())).Contains(element);
}

const TopTools_IndexedDataMapOfShapeListOfShape& TopologyIndex::ancestorMap(ShapeKind childKind,
                                                                            ShapeKind ancestorKind) const {
    const AncestorKey key{static_cast<int>(childKind), static_cast<int>(ancestorKind)};
    auto it = ancestors_.find(key);
    if (it == ancestors_.end()) {
        it = ancestors_.emplace(key, TopTools_IndexedDataMapOfShapeListOfShape()).first;
        if (!root_.IsNull()) {
            TopExp::MapShapesAndAncestors(root_, toTopAbs(childKind), toTopAbs(ancestorKind), it->second);
        }
    }
    return it->second;
}

std::vector<TopoDS_Shape> TopologyIndex::ancestors(const TopoDS_Shape& element, ShapeKind ancestorKind) const {
    std::vector<TopoDS_Shape> result;
    if (element.IsNull()) {
        return result;
    }
    const ShapeKind childKind = kindOf(element.ShapeType());
    const auto& map = ancestorMap(childKind, ancestorKind);
    const int index = map.FindIndex(element);
    if (index == 0) {
        return result;
    }

    // Ancestor lists repeat a face once per use of a seam edge
    TopTools_IndexedMapOfShape unique;
    for (const TopoDS_Shape& ancestor : map(index)) {
        unique.Add(ancestor);
    }
    result.reserve(static_cast<size_t>(unique.Extent()));
    for (int i = 1; i <= unique.Extent(); ++i) {
        result.push_back(unique(i));
    }
    return result;
}

} // namespace scopecad::kernel::topology
