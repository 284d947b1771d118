#include "Booleans.h"
#include "KernelGuard.h"

#include <BRepAlgoAPI_BooleanOperation.hxx>
#include <BRepAlgoAPI_Common.hxx>
#include <BRepAlgoAPI_Cut.hxx>
#include <BRepAlgoAPI_Fuse.hxx>
#include <BRep_Builder.hxx>
#include <Message_Report.hxx>
#include <ShapeUpgrade_UnifySameDomain.hxx>
#include <TopTools_ListOfShape.hxx>
#include <TopoDS_Compound.hxx>
#include <TopoDS_Iterator.hxx>

#include <QLoggingCategory>

#include <memory>
#include <sstream>

namespace scopecad::kernel::ops {

Q_LOGGING_CATEGORY(logBoolean, "scopecad.kernel.boolean")

namespace {

std::unique_ptr<BRepAlgoAPI_BooleanOperation> makeOperation(BooleanOp op) {
    switch (op) {
        case BooleanOp::Fuse:
            return std::make_unique<BRepAlgoAPI_Fuse>();
        case BooleanOp::Cut:
            return std::make_unique<BRepAlgoAPI_Cut>();
        case BooleanOp::Common:
            return std::make_unique<BRepAlgoAPI_Common>();
    }
    return nullptr;
}

std::string reportText(const BRepAlgoAPI_BooleanOperation& operation) {
    std::ostringstream out;
    operation.DumpErrors(out);
    std::string text = out.str();
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.pop_back();
    }
    return text.empty() ? std::string("boolean operation reported errors") : text;
}

} // namespace

const char* booleanOpName(BooleanOp op) {
    switch (op) {
        case BooleanOp::Fuse:
            return "fuse";
        case BooleanOp::Cut:
            return "cut";
        case BooleanOp::Common:
            return "common";
    }
    return "unknown";
}

TopoDS_Shape makeCompound(const std::vector<TopoDS_Shape>& shapes) {
    if (shapes.size() == 1) {
        return shapes.front();
    }
    BRep_Builder builder;
    TopoDS_Compound compound;
    builder.MakeCompound(compound);
    for (const auto& shape : shapes) {
        if (!shape.IsNull()) {
            builder.Add(compound, shape);
        }
    }
    return compound;
}

TopoDS_Shape unwrapSingleton(const TopoDS_Shape& shape) {
    TopoDS_Shape current = shape;
    while (!current.IsNull() && current.ShapeType() == TopAbs_COMPOUND) {
        TopoDS_Iterator it(current);
        if (!it.More()) {
            break;
        }
        TopoDS_Shape child = it.Value();
        it.Next();
        if (it.More()) {
            break;
        }
        current = child;
    }
    return current;
}

KernelResult boolean(BooleanOp op,
                     const TopoDS_Shape& target,
                     const std::vector<TopoDS_Shape>& tools,
                     const std::vector<std::string>& inputIds,
                     const KernelOptions& options) {
    const std::string operation = std::string("boolean.") + booleanOpName(op);
    return detail::guarded(logBoolean, operation, inputIds, options, [&]() {
        if (target.IsNull()) {
            return KernelResult::fail(operation, "boolean target is empty", inputIds);
        }
        if (tools.empty()) {
            return KernelResult::fail(operation, "boolean needs at least one tool", inputIds);
        }

        TopTools_ListOfShape arguments;
        arguments.Append(target);
        TopTools_ListOfShape toolList;
        for (const auto& tool : tools) {
            if (!tool.IsNull()) {
                toolList.Append(tool);
            }
        }
        if (toolList.IsEmpty()) {
            return KernelResult::fail(operation, "boolean tools are empty", inputIds);
        }

        auto algo = makeOperation(op);
        algo->SetArguments(arguments);
        algo->SetTools(toolList);
        if (options.fuzzyValue > 0.0) {
            algo->SetFuzzyValue(options.fuzzyValue);
        }
        algo->Build();
        if (!algo->IsDone() || algo->HasErrors()) {
            return KernelResult::fail(operation, reportText(*algo), inputIds);
        }

        TopoDS_Shape result = algo->Shape();
        if (!detail::hasVertices(result)) {
            return KernelResult::fail(operation, "empty boolean result", inputIds);
        }

        KernelResult out;
        if (options.cleanAfterBoolean) {
            ShapeUpgrade_UnifySameDomain unify(result, Standard_True, Standard_True, Standard_True);
            unify.Build();
            result = unify.Shape();
        }
        out = KernelResult::ok(operation, unwrapSingleton(result));
        if (algo->HasWarnings()) {
            out.warnings.push_back("boolean reported warnings");
        }
        return out;
    });
}

} // namespace scopecad::kernel::ops
