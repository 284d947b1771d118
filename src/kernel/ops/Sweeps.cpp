#include "Sweeps.h"
#include "KernelGuard.h"

#include <BRepAlgoAPI_Cut.hxx>
#include <BRepBuilderAPI_MakeWire.hxx>
#include <BRepBuilderAPI_Transform.hxx>
#include <BRepOffsetAPI_MakePipe.hxx>
#include <BRepOffsetAPI_MakePipeShell.hxx>
#include <BRepOffsetAPI_ThruSections.hxx>
#include <BRepPrimAPI_MakePrism.hxx>
#include <BRepPrimAPI_MakeRevol.hxx>
#include <BRepTools.hxx>
#include <TopExp_Explorer.hxx>
#include <TopoDS.hxx>
#include <gp_Ax1.hxx>
#include <gp_Trsf.hxx>
#include <gp_Vec.hxx>

#include <QLoggingCategory>

#include <algorithm>
#include <cmath>
#include <numbers>

namespace scopecad::kernel::ops {

Q_LOGGING_CATEGORY(logSweep, "scopecad.kernel.sweep")

namespace {

constexpr double kMinAngleDeg = 1e-6;

bool isProfileType(const TopoDS_Shape& shape) {
    if (shape.IsNull()) {
        return false;
    }
    switch (shape.ShapeType()) {
        case TopAbs_VERTEX:
        case TopAbs_EDGE:
        case TopAbs_WIRE:
        case TopAbs_FACE:
        case TopAbs_SHELL:
        case TopAbs_COMPOUND:
            return true;
        default:
            return false;
    }
}

/// Outer wire of a face, or the wire itself
bool sectionWire(const TopoDS_Shape& section, TopoDS_Wire& wire) {
    if (section.ShapeType() == TopAbs_FACE) {
        wire = BRepTools::OuterWire(TopoDS::Face(section));
        return !wire.IsNull();
    }
    if (section.ShapeType() == TopAbs_WIRE) {
        wire = TopoDS::Wire(section);
        return true;
    }
    if (section.ShapeType() == TopAbs_EDGE) {
        wire = BRepBuilderAPI_MakeWire(TopoDS::Edge(section)).Wire();
        return true;
    }
    TopExp_Explorer exp(section, TopAbs_FACE);
    if (exp.More()) {
        wire = BRepTools::OuterWire(TopoDS::Face(exp.Current()));
        return !wire.IsNull();
    }
    return false;
}

} // namespace

KernelResult extrude(const TopoDS_Shape& profile,
                     const core::geom::Vec3d& direction,
                     double amount,
                     bool both,
                     const std::vector<std::string>& inputIds,
                     const KernelOptions& options) {
    const std::string operation = "sweep.extrude";
    return detail::guarded(logSweep, operation, inputIds, options, [&]() {
        if (!isProfileType(profile)) {
            return KernelResult::fail(operation, "extrude profile must be a face, wire or edge", inputIds);
        }
        if (direction.norm() <= options.linearTolerance) {
            return KernelResult::fail(operation, "extrude direction is zero", inputIds);
        }
        if (std::abs(amount) <= options.linearTolerance) {
            return KernelResult::fail(operation, "extrude amount is zero", inputIds);
        }

        const core::geom::Vec3d unit = direction.normalized();
        const double length = both ? 2.0 * amount : amount;
        gp_Vec prismVec(unit.x() * length, unit.y() * length, unit.z() * length);

        TopoDS_Shape base = profile;
        if (both) {
            gp_Trsf shift;
            shift.SetTranslation(gp_Vec(-unit.x() * amount, -unit.y() * amount, -unit.z() * amount));
            base = BRepBuilderAPI_Transform(profile, shift, Standard_True).Shape();
        }

        BRepPrimAPI_MakePrism prism(base, prismVec, Standard_True);
        prism.Build();
        if (!prism.IsDone()) {
            return KernelResult::fail(operation, "BRepPrimAPI_MakePrism failed", inputIds);
        }
        return KernelResult::ok(operation, prism.Shape());
    });
}

KernelResult revolve(const TopoDS_Shape& profile,
                     const core::geom::Axis& axis,
                     double angleDegrees,
                     const std::vector<std::string>& inputIds,
                     const KernelOptions& options) {
    const std::string operation = "sweep.revolve";
    return detail::guarded(logSweep, operation, inputIds, options, [&]() {
        if (!isProfileType(profile)) {
            return KernelResult::fail(operation, "revolve profile must be a face, wire or edge", inputIds);
        }
        if (std::abs(angleDegrees) < kMinAngleDeg) {
            return KernelResult::fail(operation, "revolve angle too small", inputIds);
        }

        const double clamped = std::clamp(angleDegrees, -360.0, 360.0);
        const auto& o = axis.origin();
        const auto& d = axis.direction();
        gp_Ax1 gpAxis(gp_Pnt(o.x(), o.y(), o.z()), gp_Dir(d.x(), d.y(), d.z()));

        BRepPrimAPI_MakeRevol revol(profile, gpAxis, clamped * std::numbers::pi / 180.0, Standard_True);
        revol.Build();
        if (!revol.IsDone()) {
            return KernelResult::fail(operation, "BRepPrimAPI_MakeRevol failed", inputIds);
        }
        return KernelResult::ok(operation, revol.Shape());
    });
}

KernelResult loft(const std::vector<TopoDS_Shape>& sections,
                  bool ruled,
                  const std::vector<std::string>& inputIds,
                  const KernelOptions& options) {
    const std::string operation = "sweep.loft";
    return detail::guarded(logSweep, operation, inputIds, options, [&]() {
        if (sections.size() < 2) {
            return KernelResult::fail(operation, "loft needs at least 2 sections", inputIds);
        }

        BRepOffsetAPI_ThruSections thru(Standard_True, ruled ? Standard_True : Standard_False);
        for (const auto& section : sections) {
            TopoDS_Wire wire;
            if (section.IsNull() || !sectionWire(section, wire)) {
                return KernelResult::fail(operation, "loft section has no wire", inputIds);
            }
            thru.AddWire(wire);
        }
        thru.Build();
        if (!thru.IsDone()) {
            return KernelResult::fail(operation, "BRepOffsetAPI_ThruSections failed", inputIds);
        }
        return KernelResult::ok(operation, thru.Shape());
    });
}

const char* sweepTransitionName(SweepTransition transition) {
    switch (transition) {
        case SweepTransition::Transformed: return "transformed";
        case SweepTransition::Round:       return "round";
        case SweepTransition::Right:       return "right";
    }
    return "unknown";
}

namespace {

/// Pipe shell of one closed or open wire; solid when makeSolid and the wire is closed
bool pipeShell(const TopoDS_Wire& spine, const TopoDS_Wire& section, SweepTransition transition,
               bool makeSolid, TopoDS_Shape& result) {
    BRepOffsetAPI_MakePipeShell shell(spine);
    shell.SetMode(false);
    shell.SetTransitionMode(transition == SweepTransition::Right ? BRepBuilderAPI_RightCorner
                                                                 : BRepBuilderAPI_RoundCorner);
    shell.Add(section, false, false);
    shell.Build();
    if (!shell.IsDone()) {
        return false;
    }
    if (makeSolid && !shell.MakeSolid()) {
        return false;
    }
    result = shell.Shape();
    return !result.IsNull();
}

} // namespace

KernelResult sweep(const TopoDS_Shape& profile,
                   const std::vector<TopoDS_Shape>& pathEdges,
                   SweepTransition transition,
                   const std::vector<std::string>& inputIds,
                   const KernelOptions& options) {
    const std::string operation = transition == SweepTransition::Transformed
        ? std::string("sweep.pipe")
        : std::string("sweep.pipe-shell.") + sweepTransitionName(transition);
    return detail::guarded(logSweep, operation, inputIds, options, [&]() {
        if (!isProfileType(profile)) {
            return KernelResult::fail(operation, "sweep profile must be a face, wire or edge", inputIds);
        }
        if (pathEdges.empty()) {
            return KernelResult::fail(operation, "sweep path is empty", inputIds);
        }

        BRepBuilderAPI_MakeWire pathMaker;
        for (const auto& shape : pathEdges) {
            for (TopExp_Explorer exp(shape, TopAbs_EDGE); exp.More(); exp.Next()) {
                pathMaker.Add(TopoDS::Edge(exp.Current()));
            }
        }
        if (!pathMaker.IsDone()) {
            return KernelResult::fail(operation, "sweep path edges are not connected", inputIds);
        }

        if (transition == SweepTransition::Transformed) {
            BRepOffsetAPI_MakePipe pipe(pathMaker.Wire(), profile);
            pipe.Build();
            if (!pipe.IsDone()) {
                return KernelResult::fail(operation, "BRepOffsetAPI_MakePipe failed", inputIds);
            }
            return KernelResult::ok(operation, pipe.Shape());
        }

        TopoDS_Face face;
        if (profile.ShapeType() == TopAbs_FACE) {
            face = TopoDS::Face(profile);
        } else if (profile.ShapeType() != TopAbs_EDGE && profile.ShapeType() != TopAbs_WIRE) {
            TopExp_Explorer faces(profile, TopAbs_FACE);
            if (faces.More()) {
                face = TopoDS::Face(faces.Current());
            }
        }

        if (face.IsNull()) {
            TopoDS_Wire wire;
            TopoDS_Shape shell;
            if (!sectionWire(profile, wire) || !pipeShell(pathMaker.Wire(), wire, transition, false, shell)) {
                return KernelResult::fail(operation, "BRepOffsetAPI_MakePipeShell failed", inputIds);
            }
            return KernelResult::ok(operation, shell);
        }

        const TopoDS_Wire outer = BRepTools::OuterWire(face);
        TopoDS_Shape solid;
        if (outer.IsNull() || !pipeShell(pathMaker.Wire(), outer, transition, true, solid)) {
            return KernelResult::fail(operation, "BRepOffsetAPI_MakePipeShell failed on the outer wire", inputIds);
        }
        for (TopExp_Explorer exp(face, TopAbs_WIRE); exp.More(); exp.Next()) {
            const TopoDS_Wire inner = TopoDS::Wire(exp.Current());
            if (inner.IsSame(outer)) {
                continue;
            }
            TopoDS_Shape hole;
            if (!pipeShell(pathMaker.Wire(), inner, transition, true, hole)) {
                return KernelResult::fail(operation, "BRepOffsetAPI_MakePipeShell failed on an inner wire", inputIds);
            }
            BRepAlgoAPI_Cut cut(solid, hole);
            if (!cut.IsDone()) {
                return KernelResult::fail(operation, "removing a swept hole failed", inputIds);
            }
            solid = cut.Shape();
        }
        return KernelResult::ok(operation, solid);
    });
}

} // namespace scopecad::kernel::ops
