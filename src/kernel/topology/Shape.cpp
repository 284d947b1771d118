#include "Shape.h"
#include "TopoExplore.h"
#include "../ops/Features.h"
#include "../selection/ShapeList.h"
#include "../../core/errors/Errors.h"

#include <BRepAdaptor_CompCurve.hxx>
#include <BRepAdaptor_Curve.hxx>
#include <BRepAdaptor_Surface.hxx>
#include <BRepBndLib.hxx>
#include <BRepBuilderAPI_MakeVertex.hxx>
#include <BRepExtrema_DistShapeShape.hxx>
#include <BRepGProp.hxx>
#include <BRep_Tool.hxx>
#include <Bnd_Box.hxx>
#include <GProp_GProps.hxx>
#include <TopTools_ShapeMapHasher.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Iterator.hxx>

#include <algorithm>
#include <cstdio>
#include <ostream>
#include <stdexcept>

namespace scopecad::kernel::topology {

struct Shape::Cache {
    std::optional<std::optional<int>> dimension;
    std::optional<double> volume;
    std::optional<double> area;
    std::optional<double> length;
    std::optional<Vec3d> centerOfMass;
    std::optional<BoundingBox> boundingBox;
    std::shared_ptr<const TopologyIndex> index;
};

namespace {

constexpr double kMassEpsilon = 1e-12;

std::optional<int> compoundDimension(const TopoDS_Shape& shape) {
    std::optional<int> best;
    for (TopoDS_Iterator it(shape); it.More(); it.Next()) {
        const TopoDS_Shape& child = it.Value();
        const ShapeKind kind = kindOf(child.ShapeType());
        std::optional<int> dim = kind == ShapeKind::Compound ? compoundDimension(child) : kindDimension(kind);
        if (dim && (!best || *dim > *best)) {
            best = dim;
        }
    }
    return best;
}

Vec3d toVec(const gp_Pnt& p) {
    return Vec3d(p.X(), p.Y(), p.Z());
}

GeomType curveType(GeomAbs_CurveType type) {
    switch (type) {
        case GeomAbs_Line: return GeomType::Line;
        case GeomAbs_Circle: return GeomType::Circle;
        case GeomAbs_Ellipse: return GeomType::Ellipse;
        case GeomAbs_Hyperbola: return GeomType::Hyperbola;
        case GeomAbs_Parabola: return GeomType::Parabola;
        case GeomAbs_BezierCurve: return GeomType::BezierCurve;
        case GeomAbs_BSplineCurve: return GeomType::BSplineCurve;
        default: return GeomType::OtherCurve;
    }
}

GeomType surfaceType(GeomAbs_SurfaceType type) {
    switch (type) {
        case GeomAbs_Plane: return GeomType::Plane;
        case GeomAbs_Cylinder: return GeomType::Cylinder;
        case GeomAbs_Cone: return GeomType::Cone;
        case GeomAbs_Sphere: return GeomType::Sphere;
        case GeomAbs_Torus: return GeomType::Torus;
        case GeomAbs_BezierSurface: return GeomType::BezierSurface;
        case GeomAbs_BSplineSurface: return GeomType::BSplineSurface;
        case GeomAbs_SurfaceOfRevolution: return GeomType::Revolution;
        case GeomAbs_SurfaceOfExtrusion: return GeomType::Extrusion;
        default: return GeomType::OtherSurface;
    }
}

} // namespace

const char* geomTypeName(GeomType type) {
    switch (type) {
        case GeomType::None: return "None";
        case GeomType::Line: return "Line";
        case GeomType::Circle: return "Circle";
        case GeomType::Ellipse: return "Ellipse";
        case GeomType::Hyperbola: return "Hyperbola";
        case GeomType::Parabola: return "Parabola";
        case GeomType::BezierCurve: return "BezierCurve";
        case GeomType::BSplineCurve: return "BSplineCurve";
        case GeomType::OtherCurve: return "OtherCurve";
        case GeomType::Plane: return "Plane";
        case GeomType::Cylinder: return "Cylinder";
        case GeomType::Cone: return "Cone";
        case GeomType::Sphere: return "Sphere";
        case GeomType::Torus: return "Torus";
        case GeomType::BezierSurface: return "BezierSurface";
        case GeomType::BSplineSurface: return "BSplineSurface";
        case GeomType::Revolution: return "Revolution";
        case GeomType::Extrusion: return "Extrusion";
        case GeomType::OtherSurface: return "OtherSurface";
    }
    return "Unknown";
}

Shape::Shape()
    : cache_(std::make_shared<Cache>()) {}

Shape::Shape(const TopoDS_Shape& handle)
    : handle_(handle),
      kind_(handle.IsNull() ? ShapeKind::Compound : kindOf(handle.ShapeType())),
      cache_(std::make_shared<Cache>()) {}

Shape::Shape(const TopoDS_Shape& handle, ShapeKind declared)
    : Shape(handle) {
    if (!handle.IsNull() && kind_ != declared) {
        throw std::invalid_argument(std::string("shape declared as ") + shapeKindName(declared) +
                                    " but kernel handle is a " + shapeKindName(kind_));
    }
    if (handle.IsNull() && declared != ShapeKind::Compound) {
        throw std::invalid_argument(std::string("empty shape cannot be declared as ") +
                                    shapeKindName(declared));
    }
}

Shape::Cache& Shape::cache() const {
    if (!cache_) {
        cache_ = std::make_shared<Cache>();
    }
    return *cache_;
}

std::optional<int> Shape::dimension() const {
    if (isNull()) {
        return std::nullopt;
    }
    if (kind_ != ShapeKind::Compound) {
        return kindDimension(kind_);
    }
    auto& c = cache();
    if (!c.dimension) {
        c.dimension = compoundDimension(handle_);
    }
    return *c.dimension;
}

Location Shape::location() const {
    if (isNull()) {
        return Location();
    }
    return Location::fromTopLoc(handle_.Location());
}

Shape Shape::located(const Location& location) const {
    if (isNull()) {
        return Shape();
    }
    Shape result(handle_.Located(location.toTopLoc()));
    result.label_ = label_;
    return result;
}

Shape Shape::moved(const Location& location) const {
    if (isNull()) {
        return Shape();
    }
    Shape result(handle_.Moved(location.toTopLoc()));
    result.label_ = label_;
    return result;
}

std::string Shape::id() const {
    if (!label_.empty()) {
        return label_;
    }
    if (isNull()) {
        return "Empty";
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%zx", static_cast<size_t>(TopTools_ShapeMapHasher{}(handle_)));
    return std::string(shapeKindName(kind_)) + "#" + buffer;
}

bool Shape::operator==(const Shape& other) const {
    if (isNull() || other.isNull()) {
        return isNull() && other.isNull();
    }
    return handle_.IsEqual(other.handle_);
}

bool Shape::isSame(const Shape& other) const {
    if (isNull() || other.isNull()) {
        return isNull() && other.isNull();
    }
    return handle_.IsSame(other.handle_);
}

double Shape::volume() const {
    if (isNull() || dimension().value_or(0) < 3) {
        return 0.0;
    }
    auto& c = cache();
    if (!c.volume) {
        GProp_GProps props;
        BRepGProp::VolumeProperties(handle_, props);
        c.volume = std::abs(props.Mass());
    }
    return *c.volume;
}

double Shape::area() const {
    if (isNull() || dimension().value_or(0) < 2) {
        return 0.0;
    }
    auto& c = cache();
    if (!c.area) {
        GProp_GProps props;
        BRepGProp::SurfaceProperties(handle_, props);
        c.area = props.Mass();
    }
    return *c.area;
}

double Shape::length() const {
    if (isNull() || dimension().value_or(0) < 1) {
        return 0.0;
    }
    auto& c = cache();
    if (!c.length) {
        GProp_GProps props;
        BRepGProp::LinearProperties(handle_, props);
        c.length = props.Mass();
    }
    return *c.length;
}

Vec3d Shape::centerOfMass() const {
    if (isNull()) {
        return Vec3d::Zero();
    }
    auto& c = cache();
    if (c.centerOfMass) {
        return *c.centerOfMass;
    }

    Vec3d center = Vec3d::Zero();
    const int dim = dimension().value_or(-1);
    if (kind_ == ShapeKind::Vertex) {
        center = toVec(BRep_Tool::Pnt(TopoDS::Vertex(handle_)));
    } else if (dim <= 0) {
        const auto& vertices = index()->elements(ShapeKind::Vertex);
        for (int i = 1; i <= vertices.Extent(); ++i) {
            center += toVec(BRep_Tool::Pnt(TopoDS::Vertex(vertices(i))));
        }
        if (vertices.Extent() > 0) {
            center /= vertices.Extent();
        }
    } else {
        GProp_GProps props;
        if (dim == 3) {
            BRepGProp::VolumeProperties(handle_, props);
        } else if (dim == 2) {
            BRepGProp::SurfaceProperties(handle_, props);
        } else {
            BRepGProp::LinearProperties(handle_, props);
        }
        if (std::abs(props.Mass()) > kMassEpsilon) {
            center = toVec(props.CentreOfMass());
        } else {
            center = boundingBox().center();
        }
    }
    c.centerOfMass = center;
    return center;
}

BoundingBox Shape::boundingBox() const {
    if (isNull()) {
        return BoundingBox{};
    }
    auto& c = cache();
    if (!c.boundingBox) {
        Bnd_Box box;
        BRepBndLib::AddOptimal(handle_, box, Standard_False, Standard_False);
        BoundingBox result;
        if (!box.IsVoid()) {
            double xmin = 0.0, ymin = 0.0, zmin = 0.0, xmax = 0.0, ymax = 0.0, zmax = 0.0;
            box.Get(xmin, ymin, zmin, xmax, ymax, zmax);
            result.min = Vec3d(xmin, ymin, zmin);
            result.max = Vec3d(xmax, ymax, zmax);
        }
        c.boundingBox = result;
    }
    return *c.boundingBox;
}

Vec3d Shape::center() const {
    return centerOfMass();
}

GeomType Shape::geomType() const {
    if (kind_ == ShapeKind::Edge) {
        return curveType(BRepAdaptor_Curve(TopoDS::Edge(handle_)).GetType());
    }
    if (kind_ == ShapeKind::Face) {
        return surfaceType(BRepAdaptor_Surface(TopoDS::Face(handle_)).GetType());
    }
    return GeomType::None;
}

std::optional<double> Shape::radius() const {
    if (kind_ == ShapeKind::Edge) {
        BRepAdaptor_Curve curve(TopoDS::Edge(handle_));
        if (curve.GetType() == GeomAbs_Circle) {
            return curve.Circle().Radius();
        }
        return std::nullopt;
    }
    if (kind_ == ShapeKind::Face) {
        BRepAdaptor_Surface surface(TopoDS::Face(handle_));
        if (surface.GetType() == GeomAbs_Cylinder) {
            return surface.Cylinder().Radius();
        }
        if (surface.GetType() == GeomAbs_Sphere) {
            return surface.Sphere().Radius();
        }
    }
    return std::nullopt;
}

std::optional<Vec3d> Shape::normal() const {
    if (kind_ != ShapeKind::Face) {
        return std::nullopt;
    }
    return faceNormalAt(TopoDS::Face(handle_), center());
}

std::optional<Vec3d> Shape::tangentAt(double t) const {
    gp_Pnt point;
    gp_Vec tangent;
    if (kind_ == ShapeKind::Edge) {
        BRepAdaptor_Curve curve(TopoDS::Edge(handle_));
        const double param = curve.FirstParameter() + std::clamp(t, 0.0, 1.0) *
                                                          (curve.LastParameter() - curve.FirstParameter());
        curve.D1(param, point, tangent);
        if (handle_.Orientation() == TopAbs_REVERSED) {
            tangent.Reverse();
        }
    } else if (kind_ == ShapeKind::Wire) {
        BRepAdaptor_CompCurve curve(TopoDS::Wire(handle_));
        const double param = curve.FirstParameter() + std::clamp(t, 0.0, 1.0) *
                                                          (curve.LastParameter() - curve.FirstParameter());
        curve.D1(param, point, tangent);
    } else {
        return std::nullopt;
    }
    if (tangent.Magnitude() < kMassEpsilon) {
        return std::nullopt;
    }
    tangent.Normalize();
    return Vec3d(tangent.X(), tangent.Y(), tangent.Z());
}

double Shape::distanceTo(const Shape& other) const {
    if (isNull() || other.isNull()) {
        throw core::GeometricOperationError("distance", "distance to an empty shape", {id(), other.id()});
    }
    BRepExtrema_DistShapeShape dist(handle_, other.handle_);
    if (!dist.IsDone()) {
        throw core::GeometricOperationError("distance", "BRepExtrema_DistShapeShape failed",
                                            {id(), other.id()});
    }
    return dist.Value();
}

double Shape::distanceTo(const Vec3d& point) const {
    return distanceTo(Shape(BRepBuilderAPI_MakeVertex(gp_Pnt(point.x(), point.y(), point.z())).Vertex()));
}

bool Shape::isValid() const {
    return ops::validate(handle_);
}

std::shared_ptr<const TopologyIndex> Shape::index() const {
    auto& c = cache();
    if (!c.index) {
        c.index = std::make_shared<TopologyIndex>(handle_);
    }
    return c.index;
}

Shape Shape::withTopologyParent(const std::shared_ptr<const TopologyIndex>& parent) const {
    Shape result = *this;
    result.parent_ = parent;
    return result;
}

selection::ShapeList Shape::children() const {
    if (isNull()) {
        return selection::ShapeList();
    }
    std::shared_ptr<const TopologyIndex> source = topologyParent();
    if (!source) {
        source = index();
    }
    std::vector<TopoDS_Shape> handles;
    for (TopoDS_Iterator it(handle_); it.More(); it.Next()) {
        handles.push_back(it.Value());
    }
    return selection::ShapeList(wrapAll(handles, source), source);
}

selection::ShapeList Shape::subShapes(ShapeKind kind) const {
    if (isNull()) {
        return selection::ShapeList();
    }
    std::shared_ptr<const TopologyIndex> source = topologyParent();
    if (!source) {
        source = index();
    }

    std::vector<TopoDS_Shape> handles;
    if (source->root().IsEqual(handle_)) {
        const auto& map = source->elements(kind);
        handles.reserve(static_cast<size_t>(map.Extent()));
        for (int i = 1; i <= map.Extent(); ++i) {
            handles.push_back(map(i));
        }
    } else {
        const auto& map = index()->elements(kind);
        handles.reserve(static_cast<size_t>(map.Extent()));
        for (int i = 1; i <= map.Extent(); ++i) {
            handles.push_back(map(i));
        }
    }
    return selection::ShapeList(wrapAll(handles, source), source);
}

selection::ShapeList Shape::vertices() const { return subShapes(ShapeKind::Vertex); }
selection::ShapeList Shape::edges() const { return subShapes(ShapeKind::Edge); }
selection::ShapeList Shape::wires() const { return subShapes(ShapeKind::Wire); }
selection::ShapeList Shape::faces() const { return subShapes(ShapeKind::Face); }
selection::ShapeList Shape::shells() const { return subShapes(ShapeKind::Shell); }
selection::ShapeList Shape::solids() const { return subShapes(ShapeKind::Solid); }
selection::ShapeList Shape::compounds() const { return subShapes(ShapeKind::Compound); }

std::ostream& operator<<(std::ostream& os, const Shape& shape) {
    return os << shape.id();
}

std::vector<Shape> wrapAll(const std::vector<TopoDS_Shape>& handles,
                           const std::shared_ptr<const TopologyIndex>& parent) {
    std::vector<Shape> result;
    result.reserve(handles.size());
    for (const auto& handle : handles) {
        result.push_back(Shape(handle).withTopologyParent(parent));
    }
    return result;
}

} // namespace scopecad::kernel::topology
