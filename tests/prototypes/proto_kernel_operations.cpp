#include "../test_harness/TestHarness.h"

#include "kernel/ops/Booleans.h"
#include "kernel/ops/Features.h"
#include "kernel/ops/Primitives.h"
#include "kernel/ops/Sweeps.h"
#include "kernel/topology/Shape.h"

#include <BRepBuilderAPI_MakeEdge.hxx>
#include <BRepGProp.hxx>
#include <GProp_GProps.hxx>
#include <TopExp_Explorer.hxx>
#include <TopoDS.hxx>
#include <gp_Pnt.hxx>
#include <gp_Trsf.hxx>
#include <gp_Vec.hxx>

#include <cmath>
#include <numbers>
#include <string>
#include <utility>
#include <vector>

using namespace scopecad::kernel::ops;
using scopecad::core::geom::Axis;
using scopecad::core::geom::Vec3d;
using scopecad::kernel::topology::Shape;
using scopecad::kernel::topology::ShapeKind;

namespace {

constexpr double kTol = 1e-6;
constexpr double kPi = std::numbers::pi;

double volumeOf(const TopoDS_Shape& shape) {
    GProp_GProps props;
    BRepGProp::VolumeProperties(shape, props);
    return props.Mass();
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

} // namespace

TEST_CASE(primitive_names_and_dimensions) {
    EXPECT_EQ(primitiveName(BoxSpec{}), std::string("box"));
    EXPECT_EQ(primitiveName(ArcSpec{}), std::string("arc"));
    EXPECT_EQ(primitiveDimension(TorusSpec{}), 3);
    EXPECT_EQ(primitiveDimension(RectangleSpec{}), 2);
    EXPECT_EQ(primitiveDimension(PolygonSpec{}), 2);
    EXPECT_EQ(primitiveDimension(LineSpec{}), 1);
    EXPECT_EQ(primitiveDimension(SplineSpec{}), 1);
}

TEST_CASE(primitives_report_bad_parameters) {
    const KernelResult box = makePrimitive(BoxSpec{-1.0, 1.0, 1.0});
    EXPECT_FALSE(box.success);
    EXPECT_EQ(box.operation, std::string("primitive.box"));
    EXPECT_TRUE(contains(box.errorMessage, "must be positive"));

    EXPECT_FALSE(makePrimitive(TorusSpec{1.0, 2.0}).success);
    EXPECT_FALSE(makePrimitive(RegularPolygonSpec{1.0, 2}).success);
    EXPECT_FALSE(makePrimitive(PolygonSpec{{Vec3d::Zero(), Vec3d::UnitX()}}).success);
    EXPECT_FALSE(makePrimitive(LineSpec{Vec3d::UnitX(), Vec3d::UnitX()}).success);
    EXPECT_FALSE(makePrimitive(SplineSpec{{Vec3d::Zero()}}).success);
    EXPECT_FALSE(makePrimitive(ArcSpec{Vec3d::Zero(), 1.0, 0.0, 0.0}).success);
}

TEST_CASE(solid_primitives_have_expected_volumes) {
    EXPECT_NEAR(volumeOf(makePrimitive(BoxSpec{1.0, 2.0, 3.0}).shape), 6.0, kTol);
    EXPECT_NEAR(volumeOf(makePrimitive(CylinderSpec{1.0, 2.0}).shape), 2.0 * kPi, 1e-6);
    EXPECT_NEAR(volumeOf(makePrimitive(ConeSpec{1.0, 0.0, 3.0}).shape), kPi, 1e-6);
    EXPECT_NEAR(volumeOf(makePrimitive(SphereSpec{2.0}).shape), 32.0 / 3.0 * kPi, 1e-4);
    EXPECT_NEAR(volumeOf(makePrimitive(TorusSpec{2.0, 0.5}).shape), 2.0 * kPi * kPi * 2.0 * 0.25, 1e-4);
}

TEST_CASE(planar_primitives) {
    const Shape ellipse(makePrimitive(EllipseSpec{1.0, 3.0}).shape);
    EXPECT_NEAR(ellipse.area(), 3.0 * kPi, 1e-6);
    EXPECT_NEAR(ellipse.boundingBox().max.y(), 3.0, 1e-5);

    const Shape hexagon(makePrimitive(RegularPolygonSpec{1.0, 6}).shape);
    EXPECT_NEAR(hexagon.area(), 3.0 * std::sqrt(3.0) / 2.0, 1e-9);

    const Shape triangle(makePrimitive(PolygonSpec{{Vec3d::Zero(), Vec3d(2.0, 0.0, 0.0), Vec3d(0.0, 2.0, 0.0)}}).shape);
    EXPECT_EQ(triangle.kind(), ShapeKind::Face);
    EXPECT_NEAR(triangle.area(), 2.0, kTol);
}

TEST_CASE(curve_primitives) {
    const Shape arc(makePrimitive(ArcSpec{Vec3d::Zero(), 1.0, 0.0, -90.0}).shape);
    EXPECT_NEAR(arc.length(), kPi / 2.0, 1e-9);
    EXPECT_TRUE(arc.center().y() < 0.0);

    const Shape closed(makePrimitive(PolylineSpec{{Vec3d::Zero(), Vec3d::UnitX(), Vec3d(1.0, 1.0, 0.0)}, true}).shape);
    EXPECT_EQ(closed.edges().size(), size_t(3));

    const Shape spline(makePrimitive(SplineSpec{{Vec3d::Zero(), Vec3d(1.0, 1.0, 0.0), Vec3d(2.0, 0.0, 0.0)}}).shape);
    EXPECT_EQ(spline.kind(), ShapeKind::Edge);
    EXPECT_TRUE(spline.length() > 2.0 * std::sqrt(2.0) - 1e-9);
}

TEST_CASE(boolean_fuse_cleans_coplanar_faces) {
    const TopoDS_Shape a = makePrimitive(BoxSpec{1.0, 1.0, 1.0}).shape;
    const TopoDS_Shape b = Shape(makePrimitive(BoxSpec{1.0, 1.0, 1.0}).shape)
                               .moved(scopecad::core::geom::Pos(1.0, 0.0, 0.0))
                               .handle();
    const KernelResult fused = boolean(BooleanOp::Fuse, a, {b});
    EXPECT_TRUE(fused.success);
    EXPECT_EQ(Shape(fused.shape).faces().size(), size_t(6));

    KernelOptions raw;
    raw.cleanAfterBoolean = false;
    const KernelResult unclean = boolean(BooleanOp::Fuse, a, {b}, {}, raw);
    EXPECT_TRUE(Shape(unclean.shape).faces().size() > size_t(6));
}

TEST_CASE(boolean_failures_are_results) {
    const TopoDS_Shape a = makePrimitive(BoxSpec{1.0, 1.0, 1.0}).shape;
    const TopoDS_Shape far = Shape(makePrimitive(BoxSpec{1.0, 1.0, 1.0}).shape)
                                 .moved(scopecad::core::geom::Pos(5.0, 0.0, 0.0))
                                 .handle();

    const KernelResult common = boolean(BooleanOp::Common, a, {far}, {"a", "far"});
    EXPECT_FALSE(common.success);
    EXPECT_EQ(common.errorMessage, std::string("empty boolean result"));
    EXPECT_EQ(common.inputIds.size(), size_t(2));

    EXPECT_FALSE(boolean(BooleanOp::Cut, TopoDS_Shape(), {a}).success);
    EXPECT_FALSE(boolean(BooleanOp::Cut, a, {}).success);
    EXPECT_EQ(booleanOpName(BooleanOp::Cut), std::string("cut"));
}

TEST_CASE(compound_helpers) {
    const TopoDS_Shape a = makePrimitive(BoxSpec{1.0, 1.0, 1.0}).shape;
    EXPECT_TRUE(makeCompound({a}).IsSame(a));
    const TopoDS_Shape pair = makeCompound({a, makePrimitive(SphereSpec{1.0}).shape});
    EXPECT_EQ(pair.ShapeType(), TopAbs_COMPOUND);
    // Null entries are skipped, leaving a one-child compound
    const TopoDS_Shape single = makeCompound({a, TopoDS_Shape()});
    EXPECT_EQ(single.ShapeType(), TopAbs_COMPOUND);
    EXPECT_TRUE(unwrapSingleton(single).IsSame(a));
    EXPECT_TRUE(unwrapSingleton(pair).IsSame(pair));
}

TEST_CASE(extrude_and_revolve_profiles) {
    const TopoDS_Shape square = makePrimitive(RectangleSpec{2.0, 2.0}).shape;
    const KernelResult prism = extrude(square, Vec3d::UnitZ(), 3.0);
    EXPECT_TRUE(prism.success);
    EXPECT_NEAR(volumeOf(prism.shape), 12.0, kTol);

    const KernelResult both = extrude(square, Vec3d::UnitZ(), 1.0, true);
    EXPECT_NEAR(volumeOf(both.shape), 8.0, kTol);
    EXPECT_NEAR(Shape(both.shape).boundingBox().min.z(), -1.0, 1e-5);

    EXPECT_FALSE(extrude(square, Vec3d::UnitZ(), 0.0).success);

    const TopoDS_Shape offsetSquare = Shape(square).moved(scopecad::core::geom::Pos(3.0, 0.0, 0.0)).handle();
    const KernelResult ring = revolve(offsetSquare, Axis::Y(), 360.0);
    EXPECT_TRUE(ring.success);
    EXPECT_NEAR(volumeOf(ring.shape), 24.0 * kPi, 1e-3);
    EXPECT_FALSE(revolve(offsetSquare, Axis::Y(), 0.0).success);
}

TEST_CASE(loft_and_sweep) {
    const TopoDS_Shape low = makePrimitive(RectangleSpec{2.0, 2.0}).shape;
    const TopoDS_Shape high = Shape(low).moved(scopecad::core::geom::Pos(0.0, 0.0, 2.0)).handle();
    const KernelResult lofted = loft({low, high}, true);
    EXPECT_TRUE(lofted.success);
    EXPECT_NEAR(volumeOf(lofted.shape), 8.0, 1e-4);
    EXPECT_FALSE(loft({low}).success);

    const TopoDS_Shape profile = makePrimitive(CircleSpec{1.0}).shape;
    const TopoDS_Shape path = makePrimitive(LineSpec{Vec3d::Zero(), Vec3d(0.0, 0.0, 4.0)}).shape;
    const KernelResult pipe = sweep(profile, {path});
    EXPECT_TRUE(pipe.success);
    EXPECT_NEAR(volumeOf(pipe.shape), 4.0 * kPi, 1e-3);
    EXPECT_FALSE(sweep(profile, {}).success);

    const KernelResult shell = sweep(profile, {path}, SweepTransition::Round, {"profile", "path"});
    EXPECT_TRUE(shell.success);
    EXPECT_EQ(shell.operation, std::string("sweep.pipe-shell.round"));
    EXPECT_NEAR(volumeOf(shell.shape), 4.0 * kPi, 1e-3);
    EXPECT_EQ(std::string(sweepTransitionName(SweepTransition::Right)), std::string("right"));
}

TEST_CASE(fillet_and_chamfer_check_their_edges) {
    const TopoDS_Shape box = makePrimitive(BoxSpec{4.0, 4.0, 4.0}).shape;
    TopExp_Explorer explorer(box, TopAbs_EDGE);
    const TopoDS_Shape edge = explorer.Current();

    const KernelResult chamfered = chamfer(box, {edge}, 1.0);
    EXPECT_TRUE(chamfered.success);
    EXPECT_NEAR(volumeOf(chamfered.shape), 64.0 - 2.0, 1e-6);

    const KernelResult rounded = fillet(box, {edge}, 1.0);
    EXPECT_TRUE(rounded.success);
    EXPECT_NEAR(volumeOf(rounded.shape), 64.0 - (1.0 - kPi / 4.0) * 4.0, 1e-4);

    const TopoDS_Shape foreign = BRepBuilderAPI_MakeEdge(gp_Pnt(0, 0, 0), gp_Pnt(1, 1, 1)).Edge();
    const KernelResult rejected = fillet(box, {foreign}, 1.0, {"box", "foreign"});
    EXPECT_FALSE(rejected.success);
    EXPECT_TRUE(contains(rejected.errorMessage, "does not belong"));
    EXPECT_FALSE(fillet(box, {edge}, 10.0).success);
}

TEST_CASE(make_face_and_hull) {
    std::vector<TopoDS_Shape> edges;
    const std::vector<Vec3d> corners{Vec3d::Zero(), Vec3d(3.0, 0.0, 0.0), Vec3d(3.0, 1.0, 0.0), Vec3d(0.0, 1.0, 0.0)};
    for (size_t i = 0; i < corners.size(); ++i) {
        edges.push_back(makePrimitive(LineSpec{corners[i], corners[(i + 1) % corners.size()]}).shape);
    }
    // Edges need not be ordered head to tail
    std::swap(edges[1], edges[3]);
    const KernelResult face = makeFace(edges);
    EXPECT_TRUE(face.success);
    EXPECT_NEAR(Shape(face.shape).area(), 3.0, kTol);

    edges.pop_back();
    EXPECT_FALSE(makeFace(edges).success);

    const KernelResult hull = convexHull({Vec3d::Zero(), Vec3d(2.0, 0.0, 0.0), Vec3d(1.0, 0.5, 0.0),
                                          Vec3d(2.0, 2.0, 0.0), Vec3d(0.0, 2.0, 0.0)});
    EXPECT_TRUE(hull.success);
    EXPECT_NEAR(Shape(hull.shape).area(), 4.0, kTol);
    EXPECT_FALSE(convexHull({Vec3d::Zero(), Vec3d::UnitX(), Vec3d(2.0, 0.0, 0.0)}).success);

    const TopoDS_Shape arc = makePrimitive(ArcSpec{Vec3d::Zero(), 1.0, 0.0, 90.0}).shape;
    const auto arcPoints = edgeSamplePoints(arc, 8);
    EXPECT_EQ(arcPoints.size(), size_t(9));
    for (const auto& point : arcPoints) {
        EXPECT_NEAR(point.norm(), 1.0, 1e-9);
    }
    EXPECT_EQ(edgeSamplePoints(makePrimitive(LineSpec{}).shape).size(), size_t(2));
    EXPECT_TRUE(edgeSamplePoints(TopoDS_Shape()).empty());
}

TEST_CASE(bake_and_validate) {
    const TopoDS_Shape box = makePrimitive(BoxSpec{1.0, 1.0, 1.0}).shape;
    gp_Trsf shift;
    shift.SetTranslation(gp_Vec(5.0, 0.0, 0.0));
    const KernelResult baked = bakeTransform(box, shift);
    EXPECT_TRUE(baked.success);
    EXPECT_TRUE(baked.shape.Location().IsIdentity());
    EXPECT_NEAR(Shape(baked.shape).center().x(), 5.5, kTol);
    EXPECT_TRUE(validate(box));
    EXPECT_FALSE(validate(TopoDS_Shape()));
    EXPECT_FALSE(bakeTransform(TopoDS_Shape(), shift).success);
}

int main() {
    return scopecad::test::runAllTests();
}
