#include "../test_harness/TestHarness.h"

#include "app/build/BuildSession.h"
#include "app/build/Builders.h"
#include "app/build/LocationStack.h"
#include "app/build/PlacementContexts.h"

#include <stdexcept>

using namespace scopecad::app::build;
using scopecad::core::geom::Pos;
using scopecad::core::geom::RotZ;
using scopecad::core::geom::Vec3d;

namespace {

constexpr double kTol = 1e-9;

} // namespace

TEST_CASE(empty_stack_reports_identity) {
    LocationStack stack;
    EXPECT_TRUE(stack.empty());
    EXPECT_EQ(stack.top().size(), size_t(1));
    EXPECT_TRUE(stack.top()[0].isIdentity());
}

TEST_CASE(push_onto_empty_is_absolute) {
    LocationStack stack;
    const size_t depth = stack.push({Pos(1.0, 2.0, 3.0)});
    EXPECT_EQ(depth, size_t(1));
    EXPECT_VEC3_NEAR(stack.top()[0].position(), Vec3d(1.0, 2.0, 3.0), kTol);
}

TEST_CASE(push_composes_outer_major) {
    LocationStack stack;
    stack.push({Pos(0.0, 0.0, 0.0), Pos(100.0, 0.0, 0.0)});
    stack.push({Pos(0.0, 1.0, 0.0), Pos(0.0, 2.0, 0.0)});

    const auto& top = stack.top();
    EXPECT_EQ(top.size(), size_t(4));
    EXPECT_VEC3_NEAR(top[0].position(), Vec3d(0.0, 1.0, 0.0), kTol);
    EXPECT_VEC3_NEAR(top[1].position(), Vec3d(0.0, 2.0, 0.0), kTol);
    EXPECT_VEC3_NEAR(top[2].position(), Vec3d(100.0, 1.0, 0.0), kTol);
    EXPECT_VEC3_NEAR(top[3].position(), Vec3d(100.0, 2.0, 0.0), kTol);
}

TEST_CASE(inner_frames_follow_outer_rotation) {
    LocationStack stack;
    stack.push({RotZ(90.0)});
    stack.push({Pos(1.0, 0.0, 0.0)});
    EXPECT_VEC3_NEAR(stack.top()[0].position(), Vec3d(0.0, 1.0, 0.0), kTol);
}

TEST_CASE(pop_restores_previous_top) {
    LocationStack stack;
    const size_t outer = stack.push({Pos(5.0, 0.0, 0.0)});
    const size_t inner = stack.push({Pos(0.0, 5.0, 0.0)});
    stack.pop(inner);
    EXPECT_VEC3_NEAR(stack.top()[0].position(), Vec3d(5.0, 0.0, 0.0), kTol);
    stack.pop(outer);
    EXPECT_TRUE(stack.empty());
}

TEST_CASE(absolute_push_ignores_outer_frames) {
    LocationStack stack;
    stack.push({Pos(5.0, 0.0, 0.0)});
    stack.pushAbsolute({Pos(0.0, 0.0, 1.0)});
    EXPECT_VEC3_NEAR(stack.top()[0].position(), Vec3d(0.0, 0.0, 1.0), kTol);
}

TEST_CASE(unbalanced_pop_is_a_logic_error) {
    LocationStack stack;
    const size_t outer = stack.push({Pos(1.0, 0.0, 0.0)});
    stack.push({Pos(2.0, 0.0, 0.0)});
    EXPECT_THROWS(stack.pop(outer), std::logic_error);
    EXPECT_EQ(stack.depth(), size_t(2));

    LocationStack empty;
    EXPECT_THROWS(empty.pop(1), std::logic_error);
    EXPECT_THROWS(empty.push({}), std::invalid_argument);
}

TEST_CASE(nested_guards_compose_relatively) {
    BuildSession session;
    {
        Locations outer(session, {Pos(10.0, 0.0, 0.0)});
        {
            GridLocations grid(session, 1.0, 1.0, 2, 1, false);
            const auto& frames = session.effectiveFrames();
            EXPECT_EQ(frames.size(), size_t(2));
            EXPECT_VEC3_NEAR(frames[0].position(), Vec3d(10.0, 0.0, 0.0), kTol);
            EXPECT_VEC3_NEAR(frames[1].position(), Vec3d(11.0, 0.0, 0.0), kTol);
        }
        EXPECT_EQ(session.effectiveFrames().size(), size_t(1));
        EXPECT_VEC3_NEAR(session.effectiveFrames()[0].position(), Vec3d(10.0, 0.0, 0.0), kTol);
    }
    EXPECT_TRUE(session.locations().empty());
}

TEST_CASE(released_guard_pops_once) {
    BuildSession session;
    PolarLocations polar(session, 2.0, 3);
    EXPECT_EQ(session.effectiveFrames().size(), size_t(3));
    polar.release();
    EXPECT_TRUE(session.locations().empty());
}

TEST_CASE(guard_outliving_teardown_skips_its_pop) {
    BuildSession session;
    {
        HexLocations hex(session, 1.0, 2, 2);
        session.teardown();
        EXPECT_TRUE(session.locations().empty());
    }
    EXPECT_TRUE(session.locations().empty());
}

TEST_CASE(primitive_is_replicated_per_frame) {
    BuildSession session;
    {
        BuildPart part(session, std::nullopt, {Plane::XY()}, "pins");
        PolarLocations polar(session, 10.0, 4);
        const auto placed = part.cylinder(1.0, 2.0);
        EXPECT_EQ(placed.size(), size_t(4));
        EXPECT_EQ(part.solids().size(), size_t(4));
    }
    EXPECT_TRUE(session.hasResult("pins"));
}

int main() {
    return scopecad::test::runAllTests();
}
