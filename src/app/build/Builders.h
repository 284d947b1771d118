/**
 * @file Builders.h
 * @brief RAII builder scopes: BuildPart, BuildSketch, BuildLine.
 *
 * A builder enters its scope on construction and exits it in close() or,
 * when close() was not called, in the destructor. A builder destroyed
 * while an exception unwinds abandons its scope instead of merging the
 * partial result into the parent.
 *
 * Typical use:
 * @code
 *   BuildSession session;
 *   {
 *       BuildPart part(session);
 *       part.box(10, 10, 10);
 *       {
 *           BuildSketch sketch(session, std::nullopt, {Plane::XY().offset(10)});
 *           sketch.circle(2);
 *       }
 *       part.extrude(-10, false, Mode::Subtract);
 *   }
 * @endcode
 */
#ifndef SCOPECAD_APP_BUILD_BUILDERS_H
#define SCOPECAD_APP_BUILD_BUILDERS_H

#include "BuildSession.h"
#include "../../kernel/ops/Primitives.h"
#include "../../kernel/ops/Sweeps.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scopecad::app::build {

using core::geom::Axis;
using core::geom::Vec3d;
using kernel::ops::Align;
using kernel::ops::SweepTransition;

class Builder {
public:
    Builder(const Builder&) = delete;
    Builder& operator=(const Builder&) = delete;

    /// Exits an open scope; may throw like close() unless unwinding
    virtual ~Builder() noexcept(false);

    /**
     * @brief Exit the scope and return its delivered result
     * @throws std::logic_error when already closed
     */
    Shape close();

    bool isOpen() const { return open_; }
    const std::string& name() const { return name_; }
    Mode mode() const { return mode_; }

    /// Current working shape (empty before the first operation)
    Shape shape() const;

    ShapeList vertices(Select select = Select::All) const;
    ShapeList edges(Select select = Select::All) const;
    ShapeList wires(Select select = Select::All) const;
    ShapeList faces(Select select = Select::All) const;
    ShapeList solids(Select select = Select::All) const;

    /// Concave edges, using the session's angular tolerance
    ShapeList interiorEdges(Select select = Select::All) const;
    kernel::selection::GroupedShapes groupBy(ShapeKind kind, const Axis& axis,
                                             Select select = Select::All) const;

    /// Place shape at the active frames and combine it like a primitive
    ShapeList add(const Shape& shape, std::optional<Mode> mode = std::nullopt);

    BuildSession& session() { return session_; }

protected:
    Builder(BuildSession& session, ScopeKind kind, std::optional<Mode> mode,
            std::vector<Plane> workplanes, std::string name);

    /// This builder's scope, which must be the active one
    Scope& requireTop(const char* operation);
    const Scope& requireTop(const char* operation) const;

    ShapeList create(const kernel::ops::PrimitiveSpec& spec, std::optional<Mode> mode);

    /// Pending inputs flattened to faces/edges; throws core::EmptySelectionError when none
    std::vector<Shape> pendingFaces(const char* operation);
    std::vector<Shape> pendingEdges(const char* operation);

    BuildSession& session_;

private:
    /// True when the active scope carries this builder's scope id
    bool ownsActiveScope() const;

    uint64_t scopeId_ = 0;
    std::string name_;
    Mode mode_ = Mode::Add;
    int uncaughtOnEntry_ = 0;
    bool open_ = false;
};

class BuildPart : public Builder {
public:
    explicit BuildPart(BuildSession& session,
                       std::optional<Mode> mode = std::nullopt,
                       std::vector<Plane> workplanes = {Plane::XY()},
                       std::string name = {});

    ShapeList box(double length, double width, double height,
                  Align alignX = Align::Min, Align alignY = Align::Min, Align alignZ = Align::Min,
                  std::optional<Mode> mode = std::nullopt);
    ShapeList cylinder(double radius, double height, std::optional<Mode> mode = std::nullopt);
    ShapeList cone(double bottomRadius, double topRadius, double height,
                   std::optional<Mode> mode = std::nullopt);
    ShapeList sphere(double radius, std::optional<Mode> mode = std::nullopt);
    ShapeList torus(double majorRadius, double minorRadius, std::optional<Mode> mode = std::nullopt);

    /**
     * @brief Extrude every pending face along its normal
     *
     * A negative amount extrudes against the normal. Consumes the pending
     * faces on success.
     *
     * @throws core::EmptySelectionError when no face is pending
     */
    ShapeList extrude(double amount, bool both = false, std::optional<Mode> mode = std::nullopt);

    /// Revolve every pending face around a global axis
    ShapeList revolve(const Axis& axis = Axis::Z(), double angleDegrees = 360.0,
                      std::optional<Mode> mode = std::nullopt);

    /// Loft through the pending faces in delivery order (two at least)
    ShapeList loft(bool ruled = false, std::optional<Mode> mode = std::nullopt);

    /// Sweep every pending face along the chain of pending edges
    ShapeList sweep(SweepTransition transition = SweepTransition::Transformed,
                    std::optional<Mode> mode = std::nullopt);

    /// Round edges of the working shape; returns the new working shape
    Shape fillet(const ShapeList& edges, double radius);
    Shape chamfer(const ShapeList& edges, double length);

    Shape part() const { return shape(); }
};

class BuildSketch : public Builder {
public:
    explicit BuildSketch(BuildSession& session,
                         std::optional<Mode> mode = std::nullopt,
                         std::vector<Plane> workplanes = {Plane::XY()},
                         std::string name = {});

    ShapeList rectangle(double width, double height, std::optional<Mode> mode = std::nullopt);
    ShapeList circle(double radius, std::optional<Mode> mode = std::nullopt);
    ShapeList ellipse(double xRadius, double yRadius, std::optional<Mode> mode = std::nullopt);
    ShapeList regularPolygon(double radius, int sides, std::optional<Mode> mode = std::nullopt);
    ShapeList polygon(const std::vector<Vec3d>& points, std::optional<Mode> mode = std::nullopt);

    /// Face bounded by the pending edges; consumes them
    ShapeList makeFace(std::optional<Mode> mode = std::nullopt);

    /// Convex hull of points sampled along the pending edges; consumes them
    ShapeList makeHull(std::optional<Mode> mode = std::nullopt);

    Shape sketch() const { return shape(); }
};

class BuildLine : public Builder {
public:
    explicit BuildLine(BuildSession& session,
                       std::optional<Mode> mode = std::nullopt,
                       std::vector<Plane> workplanes = {Plane::XY()},
                       std::string name = {});

    ShapeList line(const Vec3d& start, const Vec3d& end, std::optional<Mode> mode = std::nullopt);
    ShapeList polyline(const std::vector<Vec3d>& points, bool close = false,
                       std::optional<Mode> mode = std::nullopt);
    ShapeList centerArc(const Vec3d& center, double radius, double startAngle, double arcSize,
                        std::optional<Mode> mode = std::nullopt);
    ShapeList spline(const std::vector<Vec3d>& points, std::optional<Mode> mode = std::nullopt);
};

} // namespace scopecad::app::build

#endif // SCOPECAD_APP_BUILD_BUILDERS_H
