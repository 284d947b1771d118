#include "LocationStack.h"

#include <stdexcept>
#include <string>

namespace scopecad::app::build {

size_t LocationStack::push(const std::vector<Location>& frames) {
    if (frames.empty()) {
        throw std::invalid_argument("cannot push an empty location list");
    }
    if (levels_.empty()) {
        return pushAbsolute(frames);
    }

    const std::vector<Location>& outer = levels_.back();
    std::vector<Location> composed;
    composed.reserve(outer.size() * frames.size());
    for (const auto& o : outer) {
        for (const auto& inner : frames) {
            composed.push_back(o * inner);
        }
    }
    levels_.push_back(std::move(composed));
    return levels_.size();
}

size_t LocationStack::pushAbsolute(const std::vector<Location>& frames) {
    if (frames.empty()) {
        throw std::invalid_argument("cannot push an empty location list");
    }
    levels_.push_back(frames);
    return levels_.size();
}

void LocationStack::pop(size_t depth) {
    if (levels_.empty() || depth != levels_.size()) {
        throw std::logic_error("unbalanced location pop: expected depth " + std::to_string(depth) +
                               ", stack depth is " + std::to_string(levels_.size()));
    }
    levels_.pop_back();
}

const std::vector<Location>& LocationStack::top() const {
    static const std::vector<Location> kIdentity{Location()};
    return levels_.empty() ? kIdentity : levels_.back();
}

} // namespace scopecad::app::build
