#include "../test_harness/TestHarness.h"

#include "app/algebra/Algebra.h"
#include "app/algebra/Objects.h"
#include "app/build/Builders.h"
#include "app/build/PlacementContexts.h"
#include "core/errors/Errors.h"
#include "core/geom/LocationGenerators.h"

#include <memory>
#include <numbers>
#include <vector>

using namespace scopecad::app;
using scopecad::core::AlgebraShapeMismatchError;
using scopecad::core::GeometricOperationError;
using scopecad::core::geom::Axis;
using scopecad::core::geom::Location;
using scopecad::core::geom::Plane;
using scopecad::core::geom::Pos;
using scopecad::core::geom::Rot;
using scopecad::core::geom::RotZ;
using scopecad::core::geom::Vec3d;
using scopecad::core::geom::gridLocations;
using scopecad::kernel::topology::Shape;

namespace {

constexpr double kTol = 1e-6;

void expectSameTopology(const Shape& built, const Shape& expression) {
    EXPECT_EQ(built.vertices().size(), expression.vertices().size());
    EXPECT_EQ(built.edges().size(), expression.edges().size());
    EXPECT_EQ(built.faces().size(), expression.faces().size());
    EXPECT_NEAR(built.volume(), expression.volume(), 1e-6);
    EXPECT_NEAR(built.area(), expression.area(), 1e-6);
}

} // namespace

TEST_CASE(add_matches_union) {
    build::BuildSession session;
    {
        build::BuildPart part(session, std::nullopt, {Plane::XY()}, "sum");
        part.box(2, 2, 2);
        build::Locations offset(session, {Pos(1.0, 1.0, 1.0)});
        part.box(2, 2, 2);
    }
    const Shape expression = algebra::box(2, 2, 2) + Pos(1.0, 1.0, 1.0) * algebra::box(2, 2, 2);
    expectSameTopology(session.result("sum"), expression);
}

TEST_CASE(subtract_matches_difference) {
    build::BuildSession session;
    {
        build::BuildPart part(session, std::nullopt, {Plane::XY()}, "cut");
        part.box(10, 10, 10);
        build::Locations center(session, {Pos(5.0, 5.0, -1.0)});
        part.cylinder(2, 12, build::Mode::Subtract);
    }
    const Shape expression = algebra::box(10, 10, 10) - Pos(5.0, 5.0, -1.0) * algebra::cylinder(2, 12);
    expectSameTopology(session.result("cut"), expression);
}

TEST_CASE(intersect_matches_common) {
    build::BuildSession session;
    {
        build::BuildPart part(session, std::nullopt, {Plane::XY()}, "common");
        part.box(4, 4, 4);
        part.sphere(3, build::Mode::Intersect);
    }
    const Shape expression = algebra::box(4, 4, 4) & algebra::sphere(3);
    expectSameTopology(session.result("common"), expression);
}

TEST_CASE(grid_placement_matches_location_list) {
    build::BuildSession session;
    {
        build::BuildPart part(session, std::nullopt, {Plane::XY()}, "plate");
        part.box(20, 20, 2, algebra::Align::Center, algebra::Align::Center, algebra::Align::Min);
        build::GridLocations grid(session, 10.0, 10.0, 2, 2);
        part.cylinder(1, 2, build::Mode::Subtract);
    }

    Shape expression = algebra::box(20, 20, 2, algebra::Align::Center, algebra::Align::Center);
    for (const auto& location : gridLocations(10.0, 10.0, 2, 2)) {
        expression -= location * algebra::cylinder(1, 2);
    }
    expectSameTopology(session.result("plate"), expression);
    EXPECT_EQ(expression.faces().filterBy(scopecad::kernel::topology::GeomType::Cylinder).size(), size_t(4));
}

TEST_CASE(sketch_extrude_matches_extruded_expression) {
    build::BuildSession session;
    {
        build::BuildPart part(session, std::nullopt, {Plane::XY()}, "slot");
        part.box(10, 10, 10);
        {
            build::BuildSketch sketch(session, std::nullopt, {Plane::XY().offset(10.0)});
            build::Locations center(session, {Pos(5.0, 5.0, 0.0)});
            sketch.rectangle(4, 2);
        }
        part.extrude(-3, false, build::Mode::Subtract);
    }
    const Shape pocket = Pos(3.0, 4.0, 7.0) * algebra::box(4, 2, 3);
    expectSameTopology(session.result("slot"), algebra::box(10, 10, 10) - pocket);
}

TEST_CASE(unclean_session_matches_expression_written_in_its_block) {
    SessionConfig config;
    config.cleanAfterBoolean = false;
    build::BuildSession session(config);
    build::BuildPart part(session, std::nullopt, {Plane::XY()}, "pair");
    part.box(1, 1, 1);
    {
        build::Locations offset(session, {Pos(1.0, 0.0, 0.0)});
        part.box(1, 1, 1);
    }
    const Shape expression = algebra::box(1, 1, 1) + Pos(1.0, 0.0, 0.0) * algebra::box(1, 1, 1);
    expectSameTopology(part.part(), expression);
    // Coplanar faces of the two boxes stay split without clean-up
    EXPECT_TRUE(expression.faces().size() > size_t(6));
}

TEST_CASE(fuzzy_session_matches_expression_written_in_its_block) {
    SessionConfig config;
    config.booleanFuzzyValue = 1e-3;
    build::BuildSession session(config);
    build::BuildPart part(session, std::nullopt, {Plane::XY()}, "gap");
    part.box(1, 1, 1);
    {
        build::Locations offset(session, {Pos(1.0005, 0.0, 0.0)});
        part.box(1, 1, 1);
    }
    const Shape expression = algebra::box(1, 1, 1) + Pos(1.0005, 0.0, 0.0) * algebra::box(1, 1, 1);
    expectSameTopology(part.part(), expression);
}

// ---- algebra semantics ----

TEST_CASE(scoped_kernel_options_reach_the_operators) {
    const Shape a = algebra::box(1, 1, 1);
    const Shape b = Pos(1.0, 0.0, 0.0) * algebra::box(1, 1, 1);
    {
        algebra::KernelOptions unclean;
        unclean.cleanAfterBoolean = false;
        const algebra::ScopedKernelOptions scoped(unclean);
        EXPECT_FALSE(algebra::activeKernelOptions().cleanAfterBoolean);
        EXPECT_TRUE((a + b).faces().size() > size_t(6));
    }
    EXPECT_TRUE(algebra::activeKernelOptions().cleanAfterBoolean);
    EXPECT_EQ((a + b).faces().size(), size_t(6));
}

TEST_CASE(scoped_kernel_options_release_out_of_order) {
    algebra::KernelOptions first;
    first.fuzzyValue = 0.1;
    algebra::KernelOptions second;
    second.fuzzyValue = 0.2;

    auto outer = std::make_unique<algebra::ScopedKernelOptions>(first);
    auto inner = std::make_unique<algebra::ScopedKernelOptions>(second);
    EXPECT_NEAR(algebra::activeKernelOptions().fuzzyValue, 0.2, 0.0);
    outer.reset();
    EXPECT_NEAR(algebra::activeKernelOptions().fuzzyValue, 0.2, 0.0);
    inner.reset();
    EXPECT_NEAR(algebra::activeKernelOptions().fuzzyValue, 0.0, 0.0);
}

TEST_CASE(disjoint_union_sums_volumes) {
    const Shape b = algebra::box(1, 1, 1);
    const Shape s = Pos(10.0, 0.0, 0.0) * algebra::sphere(1);
    const Shape both = b + s;
    EXPECT_NEAR(both.volume(), b.volume() + s.volume(), 1e-4);
    EXPECT_EQ(both.solids().size(), size_t(2));
}

TEST_CASE(empty_intersection_raises) {
    const Shape b = algebra::box(1, 1, 1);
    const Shape s = Pos(10.0, 0.0, 0.0) * algebra::sphere(1);
    EXPECT_THROWS(b & s, GeometricOperationError);

    Shape target = b;
    EXPECT_THROWS(target &= s, GeometricOperationError);
    EXPECT_NEAR(target.volume(), 1.0, kTol);
}

TEST_CASE(inverse_placement_restores_position) {
    const Location l(Vec3d(3.0, -2.0, 7.0), Vec3d(30.0, 45.0, 60.0));
    const Shape shape = algebra::box(1, 2, 3);
    const Shape back = -l * (l * shape);
    EXPECT_TRUE(back.location().isIdentity());
    EXPECT_VEC3_NEAR(back.center(), shape.center(), 1e-9);
    EXPECT_VEC3_NEAR(back.boundingBox().min, shape.boundingBox().min, 1e-6);
}

TEST_CASE(empty_operands_act_as_identity) {
    const Shape b = algebra::box(1, 1, 1);
    EXPECT_TRUE((Shape() + b).isSame(b));
    EXPECT_TRUE((b + Shape()).isSame(b));
    EXPECT_TRUE((b - Shape()).isSame(b));
    EXPECT_THROWS(Shape() - b, GeometricOperationError);
    EXPECT_THROWS(Shape() & b, GeometricOperationError);
    EXPECT_TRUE((Shape() + Shape()).isNull());
}

TEST_CASE(mixed_dimensions_are_rejected) {
    EXPECT_THROWS(algebra::box(1, 1, 1) + algebra::circle(1), AlgebraShapeMismatchError);
    EXPECT_THROWS(algebra::rectangle(1, 1) - algebra::line(Vec3d::Zero(), Vec3d::UnitX()),
                  AlgebraShapeMismatchError);
    try {
        (void)(algebra::box(1, 1, 1) & algebra::circle(1));
        EXPECT_TRUE(false);
    } catch (const AlgebraShapeMismatchError& error) {
        EXPECT_EQ(error.lhsDimension(), 3);
        EXPECT_EQ(error.rhsDimension(), 2);
    }
}

TEST_CASE(compound_assignment_operators) {
    Shape s = algebra::box(2, 2, 2);
    s -= algebra::box(1, 2, 2);
    EXPECT_NEAR(s.volume(), 4.0, kTol);
    s += Pos(0.0, 0.0, 2.0) * algebra::box(2, 2, 2);
    EXPECT_NEAR(s.volume(), 12.0, kTol);
    s &= algebra::box(2, 2, 3);
    EXPECT_NEAR(s.volume(), 6.0, kTol);
}

TEST_CASE(location_lists_place_copies) {
    const auto grid = gridLocations(5.0, 5.0, 3, 1);
    const Shape copies = grid * algebra::box(1, 1, 1);
    EXPECT_EQ(copies.solids().size(), size_t(3));
    EXPECT_NEAR(copies.volume(), 3.0, kTol);

    const std::vector<Shape> moved = Pos(0.0, 0.0, 4.0) * std::vector<Shape>{algebra::box(1, 1, 1), algebra::sphere(1)};
    EXPECT_EQ(moved.size(), size_t(2));
    EXPECT_NEAR(moved[1].center().z(), 4.0, kTol);
}

TEST_CASE(baked_transforms_rewrite_geometry) {
    const Shape b = algebra::box(1, 1, 1);
    const Shape shifted = algebra::translate(b, Vec3d(2.0, 0.0, 0.0));
    EXPECT_TRUE(shifted.location().isIdentity());
    EXPECT_VEC3_NEAR(shifted.center(), Vec3d(2.5, 0.5, 0.5), kTol);

    const Shape turned = algebra::rotate(b, Axis::Z(), 90.0);
    EXPECT_VEC3_NEAR(turned.center(), Vec3d(-0.5, 0.5, 0.5), kTol);

    const Shape baked = algebra::bakedTransform(b, Rot(0.0, 0.0, 180.0));
    EXPECT_VEC3_NEAR(baked.center(), (RotZ(180.0) * b).center(), kTol);
}

TEST_CASE(combine_many_tools_at_once) {
    std::vector<Shape> tools;
    for (const auto& location : gridLocations(3.0, 3.0, 2, 2)) {
        tools.push_back(location * algebra::box(1, 1, 1, algebra::Align::Center, algebra::Align::Center,
                                                algebra::Align::Center));
    }
    const Shape plate = algebra::box(10, 10, 1, algebra::Align::Center, algebra::Align::Center,
                                     algebra::Align::Center);
    const Shape cut = algebra::combine(plate, tools, algebra::BooleanOp::Cut);
    EXPECT_NEAR(cut.volume(), 100.0 - 4.0, kTol);
}

int main() {
    return scopecad::test::runAllTests();
}
