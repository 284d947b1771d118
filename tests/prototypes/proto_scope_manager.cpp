#include "../test_harness/TestHarness.h"

#include "app/algebra/Objects.h"
#include "app/build/BuildSession.h"
#include "app/build/Builders.h"
#include "app/build/PlacementContexts.h"
#include "core/errors/Errors.h"

#include <cstdint>
#include <memory>
#include <numbers>
#include <stdexcept>

using namespace scopecad::app::build;
using scopecad::core::AlgebraShapeMismatchError;
using scopecad::core::EmptySelectionError;
using scopecad::core::GeometricOperationError;
using scopecad::core::InvalidNestingError;
using scopecad::core::geom::Pos;
using scopecad::kernel::topology::GeomType;

namespace {

constexpr double kTol = 1e-6;
constexpr double kPi = std::numbers::pi;

/// L-shaped step: one concave edge, vertices at heights 0, 1 and 1.5
void buildStep(BuildPart& part) {
    part.box(2, 1, 1);
    part.box(1, 1, 1.5);
}

} // namespace

// ---- nesting ----

TEST_CASE(allowed_nesting) {
    BuildSession session;
    session.enter(ScopeKind::Part);
    session.enter(ScopeKind::Part);
    session.enter(ScopeKind::Sketch);
    session.enter(ScopeKind::Sketch);
    session.enter(ScopeKind::Line);
    session.enter(ScopeKind::Line);
    EXPECT_EQ(session.depth(), size_t(6));
    for (int i = 0; i < 6; ++i) {
        session.exit();
    }
    EXPECT_EQ(session.depth(), size_t(0));
    EXPECT_TRUE(session.locations().empty());
}

TEST_CASE(higher_dimension_cannot_nest_in_lower) {
    BuildSession session;
    session.enter(ScopeKind::Sketch);
    EXPECT_THROWS(session.enter(ScopeKind::Part), InvalidNestingError);
    session.enter(ScopeKind::Line);
    EXPECT_THROWS(session.enter(ScopeKind::Sketch), InvalidNestingError);
    EXPECT_THROWS(session.enter(ScopeKind::Part), InvalidNestingError);
    EXPECT_EQ(session.depth(), size_t(2));
}

TEST_CASE(builders_reject_bad_nesting) {
    BuildSession session;
    BuildLine line(session);
    EXPECT_THROWS(BuildSketch(session), InvalidNestingError);
    EXPECT_THROWS(BuildPart(session), InvalidNestingError);
    EXPECT_EQ(session.depth(), size_t(1));
}

TEST_CASE(operations_need_an_open_scope) {
    BuildSession session;
    EXPECT_THROWS(session.exit(), InvalidNestingError);
    EXPECT_THROWS(session.select(ShapeKind::Face), InvalidNestingError);
    EXPECT_THROWS(session.record(scopecad::app::algebra::box(1, 1, 1)), InvalidNestingError);
}

TEST_CASE(outer_builder_is_locked_while_inner_is_open) {
    BuildSession session;
    BuildPart outer(session);
    {
        BuildPart inner(session);
        EXPECT_THROWS(outer.box(1, 1, 1), InvalidNestingError);
        inner.box(1, 1, 1);
    }
    EXPECT_NEAR(outer.part().volume(), 1.0, kTol);
}

// ---- scenarios ----

TEST_CASE(top_face_of_box_is_at_its_height) {
    BuildSession session;
    BuildPart part(session);
    part.box(10, 10, 10);
    const auto top = part.faces().sortBy(Axis::Z()).last();
    EXPECT_NEAR(top.center().z(), 10.0, kTol);
}

TEST_CASE(two_placed_squares_stay_disjoint) {
    BuildSession session;
    {
        BuildSketch sketch(session, Mode::Add, {Plane::XY()}, "squares");
        Locations places(session, {Pos(5.0, 0.0, 0.0), Pos(0.0, 5.0, 0.0)});
        sketch.rectangle(1, 1);
        EXPECT_EQ(sketch.faces().size(), size_t(2));
    }
    const Shape result = session.result("squares");
    EXPECT_EQ(result.faces().size(), size_t(2));
    EXPECT_NEAR(result.area(), 2.0, kTol);
}

TEST_CASE(disjoint_union_adds_volumes_and_intersection_fails) {
    BuildSession session;
    BuildPart part(session);
    part.box(1, 1, 1);
    {
        Locations away(session, {Pos(10.0, 0.0, 0.0)});
        part.sphere(1);
    }
    const double expected = 1.0 + 4.0 / 3.0 * kPi;
    EXPECT_NEAR(part.part().volume(), expected, 1e-4);

    {
        Locations away(session, {Pos(-20.0, 0.0, 0.0)});
        EXPECT_THROWS(part.sphere(1, Mode::Intersect), GeometricOperationError);
    }
    EXPECT_NEAR(part.part().volume(), expected, 1e-4);
}

// ---- modes ----

TEST_CASE(subtract_and_intersect_modes) {
    BuildSession session;
    BuildPart part(session);
    part.box(2, 2, 2);
    part.box(1, 2, 2, Align::Min, Align::Min, Align::Min, Mode::Subtract);
    EXPECT_NEAR(part.part().volume(), 4.0, kTol);

    part.box(2, 1, 2, Align::Min, Align::Min, Align::Min, Mode::Intersect);
    EXPECT_NEAR(part.part().volume(), 2.0, kTol);
}

TEST_CASE(replace_discards_previous_work) {
    BuildSession session;
    BuildPart part(session);
    part.box(10, 10, 10);
    part.sphere(1, Mode::Replace);
    EXPECT_NEAR(part.part().volume(), 4.0 / 3.0 * kPi, 1e-4);
}

TEST_CASE(private_shapes_do_not_change_the_working_shape) {
    BuildSession session;
    BuildPart part(session);
    part.box(10, 10, 10);
    const auto placed = part.cylinder(1, 20, Mode::Private);
    EXPECT_EQ(placed.size(), size_t(1));
    EXPECT_NEAR(part.part().volume(), 1000.0, kTol);
    EXPECT_EQ(part.faces(Select::Last).size(), size_t(3));
    EXPECT_EQ(part.faces().size(), size_t(6));
}

TEST_CASE(scope_mode_is_the_default_for_its_operations) {
    BuildSession session;
    BuildPart outer(session);
    outer.box(2, 2, 2);
    {
        BuildPart cutter(session, Mode::Private);
        EXPECT_EQ(cutter.mode(), Mode::Private);
        cutter.box(1, 1, 1);
        EXPECT_TRUE(cutter.part().isNull());
    }
    EXPECT_NEAR(outer.part().volume(), 8.0, kTol);
}

TEST_CASE(subtract_from_empty_scope_fails) {
    BuildSession session;
    BuildPart part(session, Mode::Subtract);
    EXPECT_THROWS(part.box(1, 1, 1), GeometricOperationError);
    EXPECT_TRUE(part.part().isNull());
}

TEST_CASE(dimension_mismatch_is_rejected) {
    BuildSession session;
    BuildPart part(session);
    EXPECT_THROWS(part.add(scopecad::app::algebra::circle(1)), AlgebraShapeMismatchError);
    EXPECT_TRUE(part.part().isNull());
}

TEST_CASE(failed_kernel_call_leaves_working_shape) {
    BuildSession session;
    BuildPart part(session);
    part.box(1, 1, 1);
    EXPECT_THROWS(part.box(-1, 1, 1), GeometricOperationError);
    EXPECT_NEAR(part.part().volume(), 1.0, kTol);
}

TEST_CASE(select_last_reports_new_elements) {
    BuildSession session;
    BuildPart part(session);
    part.box(10, 10, 10);
    EXPECT_EQ(part.faces(Select::Last).size(), size_t(6));
    {
        Locations center(session, {Pos(5.0, 5.0, -1.0)});
        part.cylinder(2, 12, Mode::Subtract);
    }
    const auto added = part.faces(Select::Last);
    EXPECT_EQ(added.filterBy(GeomType::Cylinder).size(), size_t(1));
    EXPECT_TRUE(added.size() < part.faces().size());
}

// ---- scope exit ----

TEST_CASE(same_dimension_child_merges_with_parent_mode) {
    BuildSession session;
    BuildPart outer(session, Mode::Add, {Plane::XY()}, "outer");
    outer.box(2, 2, 2);
    {
        BuildPart inner(session, std::nullopt, {Plane::XY().offset(2.0)});
        inner.box(2, 2, 2);
    }
    EXPECT_NEAR(outer.part().volume(), 16.0, kTol);
    EXPECT_NEAR(outer.part().boundingBox().max.z(), 4.0, 1e-5);
}

TEST_CASE(sketch_in_part_extrudes_to_expected_volume) {
    BuildSession session;
    BuildPart part(session);
    part.box(10, 10, 10);
    {
        BuildSketch sketch(session, std::nullopt, {Plane::XY().offset(10.0)});
        Locations center(session, {Pos(5.0, 5.0, 0.0)});
        sketch.circle(2);
    }
    part.extrude(-10, false, Mode::Subtract);
    EXPECT_NEAR(part.part().volume(), 1000.0 - 40.0 * kPi, 1e-3);
    EXPECT_THROWS(part.extrude(1), EmptySelectionError);
}

TEST_CASE(extrude_both_sides) {
    BuildSession session;
    BuildPart part(session);
    {
        BuildSketch sketch(session);
        sketch.rectangle(2, 2);
    }
    part.extrude(1, true);
    EXPECT_NEAR(part.part().volume(), 8.0, kTol);
    EXPECT_NEAR(part.part().boundingBox().min.z(), -1.0, 1e-5);
}

TEST_CASE(sketch_on_several_workplanes_delivers_each_copy) {
    BuildSession session;
    BuildPart part(session);
    {
        BuildSketch sketch(session, std::nullopt, {Plane::XY(), Plane::XY().offset(5.0)});
        sketch.rectangle(1, 1);
    }
    const auto solids = part.extrude(1);
    EXPECT_EQ(solids.size(), size_t(2));
    EXPECT_EQ(part.solids().size(), size_t(2));
    EXPECT_NEAR(part.part().volume(), 2.0, kTol);
}

TEST_CASE(revolve_pending_face) {
    BuildSession session;
    BuildPart part(session);
    {
        BuildSketch sketch(session, std::nullopt, {Plane::XZ()});
        Locations offset(session, {Pos(3.0, 0.0, 0.0)});
        sketch.rectangle(2, 2);
    }
    part.revolve(Axis::Z(), 360.0);
    EXPECT_NEAR(part.part().volume(), 24.0 * kPi, 1e-3);
}

TEST_CASE(loft_between_two_sections) {
    BuildSession session;
    BuildPart part(session);
    {
        BuildSketch low(session);
        low.rectangle(2, 2);
    }
    {
        BuildSketch high(session, std::nullopt, {Plane::XY().offset(3.0)});
        high.rectangle(2, 2);
    }
    part.loft(true);
    EXPECT_NEAR(part.part().volume(), 12.0, 1e-4);
}

TEST_CASE(loft_needs_two_sections) {
    BuildSession session;
    BuildPart part(session);
    {
        BuildSketch only(session);
        only.rectangle(2, 2);
    }
    EXPECT_THROWS(part.loft(), EmptySelectionError);
}

TEST_CASE(sweep_profile_along_path) {
    BuildSession session;
    BuildPart part(session);
    {
        BuildSketch profile(session);
        profile.circle(1);
    }
    {
        BuildLine path(session);
        path.line(Vec3d::Zero(), Vec3d(0.0, 0.0, 5.0));
    }
    part.sweep();
    EXPECT_NEAR(part.part().volume(), 5.0 * kPi, 1e-3);
}

TEST_CASE(line_scope_feeds_make_face) {
    BuildSession session;
    BuildSketch sketch(session);
    {
        BuildLine outline(session);
        outline.polyline({Vec3d::Zero(), Vec3d(2.0, 0.0, 0.0), Vec3d(2.0, 2.0, 0.0), Vec3d(0.0, 2.0, 0.0)}, true);
    }
    sketch.makeFace();
    EXPECT_NEAR(sketch.sketch().area(), 4.0, kTol);
    EXPECT_THROWS(sketch.makeFace(), EmptySelectionError);
}

TEST_CASE(make_hull_follows_arc_extents) {
    BuildSession session;
    BuildSketch sketch(session);
    {
        BuildLine outline(session);
        outline.centerArc(Vec3d::Zero(), 1.0, 0.0, 180.0);
        outline.line(Vec3d(-1.0, 0.0, 0.0), Vec3d(1.0, 0.0, 0.0));
    }
    sketch.makeHull();
    // 32 chords inscribed in the half disc
    EXPECT_NEAR(sketch.sketch().area(), kPi / 2.0, 5e-3);
    EXPECT_NEAR(sketch.sketch().boundingBox().max.y(), 1.0, 1e-3);
}

TEST_CASE(make_hull_around_pending_vertices) {
    BuildSession session;
    BuildSketch sketch(session);
    {
        BuildLine lines(session);
        lines.line(Vec3d::Zero(), Vec3d(2.0, 2.0, 0.0));
        lines.line(Vec3d(2.0, 0.0, 0.0), Vec3d(0.0, 2.0, 0.0));
    }
    sketch.makeHull();
    EXPECT_NEAR(sketch.sketch().area(), 4.0, kTol);
}

TEST_CASE(fillet_and_chamfer_replace_the_working_shape) {
    BuildSession session;
    BuildPart part(session);
    part.box(10, 10, 10);
    const auto edge = part.edges().filterBy(Axis::Z()).sortBy(Axis::X()).first();
    const Shape chamfered = part.chamfer({edge}, 1.0);
    EXPECT_NEAR(chamfered.volume(), 995.0, 1e-4);
    EXPECT_EQ(part.faces().size(), size_t(7));

    BuildPart rounded(session);
    rounded.box(10, 10, 10);
    const auto topEdges = rounded.edges().filterByPosition(Axis::Z(), 10.0, 10.0);
    EXPECT_EQ(topEdges.size(), size_t(4));
    const Shape result = rounded.fillet(topEdges, 1.0);
    EXPECT_TRUE(result.volume() < 1000.0);
    EXPECT_TRUE(result.volume() > 990.0);
    EXPECT_TRUE(result.isValid());
    EXPECT_THROWS(rounded.fillet(ShapeList(), 0.5), EmptySelectionError);
}

// ---- lifecycle ----

TEST_CASE(top_level_results_are_named) {
    BuildSession session;
    {
        BuildPart part(session);
        part.box(1, 1, 1);
    }
    {
        BuildSketch sketch(session, std::nullopt, {Plane::XY()}, "profile");
        sketch.circle(1);
    }
    EXPECT_TRUE(session.hasResult("part"));
    EXPECT_TRUE(session.hasResult("profile"));
    EXPECT_EQ(session.resultNames().size(), size_t(2));
    EXPECT_THROWS(session.result("missing"), std::out_of_range);
}

TEST_CASE(close_returns_the_result_once) {
    BuildSession session;
    BuildPart part(session);
    part.box(2, 2, 2);
    const Shape result = part.close();
    EXPECT_NEAR(result.volume(), 8.0, kTol);
    EXPECT_FALSE(part.isOpen());
    EXPECT_THROWS(part.close(), std::logic_error);
    EXPECT_THROWS(part.box(1, 1, 1), InvalidNestingError);
}

TEST_CASE(unwinding_abandons_the_scope) {
    BuildSession session;
    BuildPart outer(session, Mode::Add, {Plane::XY()}, "outer");
    outer.box(1, 1, 1);
    try {
        BuildPart inner(session);
        inner.box(5, 5, 5);
        throw std::runtime_error("script failure");
    } catch (const std::runtime_error&) {
        EXPECT_EQ(session.depth(), size_t(1));
    }
    EXPECT_NEAR(outer.part().volume(), 1.0, kTol);
    EXPECT_EQ(session.locations().depth(), size_t(1));
}

TEST_CASE(teardown_clears_leaked_scopes) {
    BuildSession session;
    session.enter(ScopeKind::Part);
    session.enter(ScopeKind::Sketch);
    session.teardown();
    EXPECT_EQ(session.depth(), size_t(0));
    EXPECT_TRUE(session.locations().empty());

    session.start();
    BuildPart part(session);
    part.box(1, 1, 1);
    EXPECT_EQ(session.depth(), size_t(1));
}

TEST_CASE(independent_sessions_do_not_share_state) {
    BuildSession first;
    BuildSession second;
    BuildPart a(first, Mode::Add, {Plane::XY()}, "a");
    BuildPart b(second, Mode::Add, {Plane::XY()}, "b");
    Locations shifted(first, {Pos(100.0, 0.0, 0.0)});
    a.box(1, 1, 1);
    b.box(2, 2, 2);
    EXPECT_NEAR(a.part().center().x(), 100.5, kTol);
    EXPECT_NEAR(b.part().center().x(), 1.0, kTol);
    EXPECT_EQ(first.locations().depth(), size_t(2));
    EXPECT_EQ(second.locations().depth(), size_t(1));
}

TEST_CASE(session_config_drives_default_mode) {
    scopecad::app::SessionConfig config;
    config.defaultMode = Mode::Private;
    BuildSession session(config);
    BuildPart part(session);
    EXPECT_EQ(part.mode(), Mode::Private);
    part.box(1, 1, 1);
    EXPECT_TRUE(part.part().isNull());
}

TEST_CASE(session_tolerances_drive_grouping_and_interior_edges) {
    BuildSession fine;
    BuildPart finePart(fine);
    buildStep(finePart);
    EXPECT_EQ(finePart.groupBy(ShapeKind::Vertex, Axis::Z()).size(), size_t(3));
    EXPECT_EQ(finePart.interiorEdges().size(), size_t(1));

    scopecad::app::SessionConfig config;
    config.groupTolerance = 0.6;
    config.angularTolerance = 1.5;
    BuildSession coarse(config);
    BuildPart coarsePart(coarse);
    buildStep(coarsePart);
    EXPECT_EQ(coarsePart.groupBy(ShapeKind::Vertex, Axis::Z()).size(), size_t(2));
    // A right angle is within 1.5 of flat, so the step is not reported
    EXPECT_EQ(coarsePart.interiorEdges().size(), size_t(0));
}

TEST_CASE(session_options_are_active_while_scopes_are_open) {
    using scopecad::app::algebra::activeKernelOptions;
    scopecad::app::SessionConfig config;
    config.booleanFuzzyValue = 0.25;
    BuildSession session(config);
    EXPECT_NEAR(activeKernelOptions().fuzzyValue, 0.0, 0.0);
    {
        BuildPart part(session);
        EXPECT_NEAR(activeKernelOptions().fuzzyValue, 0.25, 0.0);
        {
            BuildSketch sketch(session);
            EXPECT_NEAR(activeKernelOptions().fuzzyValue, 0.25, 0.0);
        }
        EXPECT_NEAR(activeKernelOptions().fuzzyValue, 0.25, 0.0);
    }
    EXPECT_NEAR(activeKernelOptions().fuzzyValue, 0.0, 0.0);

    session.enter(ScopeKind::Part);
    session.abandon();
    EXPECT_NEAR(activeKernelOptions().fuzzyValue, 0.0, 0.0);

    session.enter(ScopeKind::Part);
    session.teardown();
    EXPECT_NEAR(activeKernelOptions().fuzzyValue, 0.0, 0.0);
}

TEST_CASE(builder_detached_by_teardown_stays_detached) {
    BuildSession session;
    auto detached = std::make_unique<BuildPart>(session, std::nullopt, std::vector<Plane>{Plane::XY()}, "detached");
    session.teardown();

    // The new scope may be allocated where the torn down one lived
    BuildPart current(session, std::nullopt, {Plane::XY()}, "current");
    EXPECT_THROWS(detached->box(1, 1, 1), InvalidNestingError);
    EXPECT_THROWS(detached->shape(), InvalidNestingError);
    EXPECT_THROWS(detached->close(), InvalidNestingError);
    detached.reset();

    EXPECT_EQ(session.depth(), size_t(1));
    current.box(1, 1, 1);
    EXPECT_NEAR(current.part().volume(), 1.0, kTol);
    EXPECT_NEAR(current.close().volume(), 1.0, kTol);
    EXPECT_TRUE(session.hasResult("current"));
}

TEST_CASE(scope_ids_are_never_reused) {
    BuildSession session;
    const uint64_t first = session.enter(ScopeKind::Part).id;
    session.exit();
    const uint64_t second = session.enter(ScopeKind::Part).id;
    session.teardown();
    session.start();
    const uint64_t third = session.enter(ScopeKind::Part).id;
    EXPECT_TRUE(first < second);
    EXPECT_TRUE(second < third);
    session.exit();
}

int main() {
    return scopecad::test::runAllTests();
}
