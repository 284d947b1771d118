/**
 * @file ScopeStack.h
 * @brief Builder scopes and the stack that owns them.
 */
#ifndef SCOPECAD_APP_BUILD_SCOPE_STACK_H
#define SCOPECAD_APP_BUILD_SCOPE_STACK_H

#include "Mode.h"
#include "../../core/geom/Plane.h"
#include "../../kernel/selection/ShapeList.h"
#include "../../kernel/topology/Shape.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace scopecad::app::build {

using core::geom::Location;
using core::geom::Plane;
using kernel::selection::ShapeList;
using kernel::topology::Shape;

/**
 * @brief One open construction block
 *
 * The working shape starts empty and is replaced (never mutated) by every
 * combining operation. Pending edges/faces are lower dimensional results
 * delivered by child scopes, waiting for extrude, makeFace and friends.
 */
struct Scope {
    ScopeKind kind = ScopeKind::Part;
    std::string name;
    Mode mode = Mode::Add;
    Shape working;

    /// Assigned on push; unique for the lifetime of the stack, never reused
    uint64_t id = 0;

    std::vector<Plane> workplanes;

    /// Frames the result is relocated to when delivered to the parent
    std::vector<Location> deliveryFrames;

    /// Location stack depth right after this scope pushed its frames
    size_t locationDepth = 0;

    /// Working shape before the last operation, for Select::Last
    Shape previousWorking;

    /// Shapes created by the last Private operation
    ShapeList lastPrivate;
    bool lastWasPrivate = false;

    std::vector<Shape> pendingEdges;
    std::vector<Shape> pendingFaces;

    int dimension() const { return scopeDimension(kind); }
};

class ScopeStack {
public:
    Scope& push(std::unique_ptr<Scope> scope);

    /// @throws std::logic_error when empty
    std::unique_ptr<Scope> pop();

    Scope* top() { return scopes_.empty() ? nullptr : scopes_.back().get(); }
    const Scope* top() const { return scopes_.empty() ? nullptr : scopes_.back().get(); }

    size_t depth() const { return scopes_.size(); }
    bool empty() const { return scopes_.empty(); }

private:
    std::vector<std::unique_ptr<Scope>> scopes_;
    uint64_t nextId_ = 1;
};

} // namespace scopecad::app::build

#endif // SCOPECAD_APP_BUILD_SCOPE_STACK_H
