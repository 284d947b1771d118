#include "ScopeStack.h"

#include <stdexcept>

namespace scopecad::app::build {

Scope& ScopeStack::push(std::unique_ptr<Scope> scope) {
    scope->id = nextId_++;
    scopes_.push_back(std::move(scope));
    return *scopes_.back();
}

std::unique_ptr<Scope> ScopeStack::pop() {
    if (scopes_.empty()) {
        throw std::logic_error("scope stack is empty");
    }
    std::unique_ptr<Scope> scope = std::move(scopes_.back());
    scopes_.pop_back();
    return scope;
}

} // namespace scopecad::app::build
