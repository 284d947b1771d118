/**
 * @file LocationStack.h
 * @brief Stack of placement frame lists owned by a build session.
 *
 * Each level holds a list of locations. Pushing onto a non-empty stack
 * composes every new location with every location of the current top
 * (outer * inner, outer-major), so the top always holds the effective
 * global frames.
 */
#ifndef SCOPECAD_APP_BUILD_LOCATION_STACK_H
#define SCOPECAD_APP_BUILD_LOCATION_STACK_H

#include "../../core/geom/Location.h"

#include <cstddef>
#include <vector>

namespace scopecad::app::build {

using core::geom::Location;

class LocationStack {
public:
    /**
     * @brief Push frames relative to the current top
     * @return depth after the push, to be handed back to pop()
     * @throws std::invalid_argument for an empty list
     */
    size_t push(const std::vector<Location>& frames);

    /// Push frames as they are, ignoring the current top
    size_t pushAbsolute(const std::vector<Location>& frames);

    /**
     * @brief Pop the top level, which must be the one pushed at depth
     * @throws std::logic_error when depth is not the current depth
     */
    void pop(size_t depth);

    /// Effective frames; a single identity when the stack is empty
    const std::vector<Location>& top() const;

    size_t depth() const { return levels_.size(); }
    bool empty() const { return levels_.empty(); }
    void clear() { levels_.clear(); }

private:
    std::vector<std::vector<Location>> levels_;
};

} // namespace scopecad::app::build

#endif // SCOPECAD_APP_BUILD_LOCATION_STACK_H
