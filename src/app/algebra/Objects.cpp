#include "Objects.h"
#include "../../core/errors/Errors.h"

namespace scopecad::app::algebra {

using namespace kernel::ops;

Shape makeShape(const PrimitiveSpec& spec, const KernelOptions& options) {
    KernelResult result = makePrimitive(spec, options);
    if (!result.success) {
        throw core::GeometricOperationError(result.operation, result.errorMessage, result.inputIds);
    }
    return Shape(result.shape);
}

Shape box(double length, double width, double height, Align alignX, Align alignY, Align alignZ) {
    return makeShape(BoxSpec{length, width, height, alignX, alignY, alignZ});
}

Shape cylinder(double radius, double height) {
    return makeShape(CylinderSpec{radius, height});
}

Shape cone(double bottomRadius, double topRadius, double height) {
    return makeShape(ConeSpec{bottomRadius, topRadius, height});
}

Shape sphere(double radius) {
    return makeShape(SphereSpec{radius});
}

Shape torus(double majorRadius, double minorRadius) {
    return makeShape(TorusSpec{majorRadius, minorRadius});
}

Shape rectangle(double width, double height) {
    return makeShape(RectangleSpec{width, height});
}

Shape circle(double radius) {
    return makeShape(CircleSpec{radius});
}

Shape ellipse(double xRadius, double yRadius) {
    return makeShape(EllipseSpec{xRadius, yRadius});
}

Shape regularPolygon(double radius, int sides) {
    return makeShape(RegularPolygonSpec{radius, sides});
}

Shape polygon(const std::vector<Vec3d>& points) {
    return makeShape(PolygonSpec{points});
}

Shape line(const Vec3d& start, const Vec3d& end) {
    return makeShape(LineSpec{start, end});
}

Shape polyline(const std::vector<Vec3d>& points, bool close) {
    return makeShape(PolylineSpec{points, close});
}

Shape centerArc(const Vec3d& center, double radius, double startAngle, double arcSize) {
    return makeShape(ArcSpec{center, radius, startAngle, arcSize});
}

Shape spline(const std::vector<Vec3d>& points) {
    return makeShape(SplineSpec{points});
}

} // namespace scopecad::app::algebra
