/**
 * @file BuildSession.h
 * @brief Scope manager of one sequential build script.
 *
 * A session owns the scope stack and the location stack. Builders and
 * placement contexts are handed a session explicitly; there is no global
 * session, so independent sessions can run side by side in one process.
 * A session is not thread-safe and must not be re-entered from callbacks.
 *
 * While a session has open scopes its kernel options are the active
 * algebra options of the thread (see algebra::activeKernelOptions), so
 * operator expressions inside a builder block combine like the builder.
 */
#ifndef SCOPECAD_APP_BUILD_BUILD_SESSION_H
#define SCOPECAD_APP_BUILD_BUILD_SESSION_H

#include "LocationStack.h"
#include "Mode.h"
#include "ScopeStack.h"
#include "../SessionConfig.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scopecad::app::algebra {
class ScopedKernelOptions;
} // namespace scopecad::app::algebra

namespace scopecad::app::build {

using kernel::topology::ShapeKind;

enum class Select {
    All,
    Last
};

class BuildSession {
public:
    explicit BuildSession(SessionConfig config = SessionConfig());
    ~BuildSession();

    BuildSession(const BuildSession&) = delete;
    BuildSession& operator=(const BuildSession&) = delete;

    /// Reset both stacks and the named results
    void start();

    /// Drop open scopes (warning per leaked scope), frames and results
    void teardown();

    const SessionConfig& config() const { return config_; }
    kernel::ops::KernelOptions kernelOptions() const { return config_.toKernelOptions(); }

    // ---- scopes ----

    /**
     * @brief Open a scope of kind on top of the stack
     *
     * A scope may only nest in a scope of equal or higher dimension.
     * Part and line scopes push their workplane frames relative to the
     * current frames; a sketch records current frames x workplanes as
     * delivery frames and draws in an absolute identity frame.
     *
     * @throws core::InvalidNestingError
     */
    Scope& enter(ScopeKind kind,
                 std::optional<Mode> mode = std::nullopt,
                 std::vector<Plane> workplanes = {Plane::XY()},
                 std::string name = {});

    /**
     * @brief Close the active scope and deliver its result
     *
     * Same dimension: combined into the parent with the parent's mode.
     * Lower dimension: relocated to the delivery frames and queued as a
     * pending input of the parent. Top level: stored under the scope name.
     *
     * @return the delivered result
     */
    Shape exit();

    /// Close the active scope without delivering anything
    void abandon();

    Scope* active() { return scopes_.top(); }
    const Scope* active() const { return scopes_.top(); }

    /// Active scope, which must be of kind
    Scope& requireActive(ScopeKind kind, const char* operation);
    Scope& requireActive(const char* operation);

    size_t depth() const { return scopes_.depth(); }

    // ---- placement ----

    LocationStack& locations() { return locations_; }
    const LocationStack& locations() const { return locations_; }

    /// Frames a primitive created now would be placed at
    const std::vector<Location>& effectiveFrames() const { return locations_.top(); }

    // ---- combining ----

    /**
     * @brief Place one copy of primitive at every effective frame and
     * combine the copies into the active working shape
     *
     * @return the placed copies
     * @throws core::AlgebraShapeMismatchError for a primitive of another
     *         dimension than the scope
     * @throws core::GeometricOperationError when the kernel fails; the
     *         working shape is left unchanged
     */
    ShapeList record(const Shape& primitive, std::optional<Mode> mode = std::nullopt);

    /// Combine already placed shapes into the active working shape
    ShapeList recordPlaced(const std::vector<Shape>& shapes, std::optional<Mode> mode,
                           const char* operation);

    /// Replace the working shape (fillet, chamfer results)
    void replaceWorking(Scope& scope, const Shape& shape);

    // ---- queries ----

    ShapeList select(ShapeKind kind, Select select = Select::All) const;

    /// Edges of the selection where two faces of one solid meet concavely,
    /// compared with the configured angular tolerance
    ShapeList interiorEdges(Select select = Select::All) const;

    /// Elements of kind grouped by position along axis with the configured group tolerance
    kernel::selection::GroupedShapes groupBy(ShapeKind kind, const core::geom::Axis& axis,
                                             Select select = Select::All) const;

    // ---- results ----

    bool hasResult(const std::string& name) const;

    /// @throws std::out_of_range for an unknown name
    const Shape& result(const std::string& name) const;
    std::vector<std::string> resultNames() const;

private:
    void combineInto(Scope& scope, const std::vector<Shape>& shapes, Mode mode, const char* operation);
    void deliver(Scope& parent, const Shape& result, int dimension);
    void releaseOptionsWhenIdle();

    SessionConfig config_;
    ScopeStack scopes_;
    LocationStack locations_;
    std::map<std::string, Shape> results_;
    std::unique_ptr<algebra::ScopedKernelOptions> installedOptions_;
};

} // namespace scopecad::app::build

#endif // SCOPECAD_APP_BUILD_BUILD_SESSION_H
