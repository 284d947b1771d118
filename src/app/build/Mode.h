/**
 * @file Mode.h
 * @brief Combination modes and scope kinds of the builder layer.
 */
#ifndef SCOPECAD_APP_BUILD_MODE_H
#define SCOPECAD_APP_BUILD_MODE_H

#include <optional>
#include <string>

namespace scopecad::app::build {

/**
 * @brief How a newly created shape merges into a scope's working shape
 */
enum class Mode {
    Add,        ///< union
    Subtract,   ///< difference
    Intersect,  ///< common
    Replace,    ///< discard the previous working shape
    Private     ///< create only, leave the working shape alone
};

/// Scope kinds; the value is the dimension of the shapes the scope builds
enum class ScopeKind {
    Line = 1,
    Sketch = 2,
    Part = 3
};

inline const char* modeName(Mode mode) {
    switch (mode) {
        case Mode::Add: return "add";
        case Mode::Subtract: return "subtract";
        case Mode::Intersect: return "intersect";
        case Mode::Replace: return "replace";
        case Mode::Private: return "private";
    }
    return "unknown";
}

inline std::optional<Mode> modeFromName(const std::string& name) {
    if (name == "add") return Mode::Add;
    if (name == "subtract") return Mode::Subtract;
    if (name == "intersect") return Mode::Intersect;
    if (name == "replace") return Mode::Replace;
    if (name == "private") return Mode::Private;
    return std::nullopt;
}

inline const char* scopeKindName(ScopeKind kind) {
    switch (kind) {
        case ScopeKind::Line: return "line";
        case ScopeKind::Sketch: return "sketch";
        case ScopeKind::Part: return "part";
    }
    return "unknown";
}

inline int scopeDimension(ScopeKind kind) {
    return static_cast<int>(kind);
}

} // namespace scopecad::app::build

#endif // SCOPECAD_APP_BUILD_MODE_H
