/**
 * @file KernelGuard.h
 * @brief Converts OCCT exceptions into failed KernelResults.
 *
 * No Standard_Failure may escape the adapter; callers above this layer only
 * ever see KernelResult.
 */
#ifndef SCOPECAD_KERNEL_OPS_KERNEL_GUARD_H
#define SCOPECAD_KERNEL_OPS_KERNEL_GUARD_H

#include "KernelResult.h"

#include <BRepCheck_Analyzer.hxx>
#include <Standard_Failure.hxx>
#include <TopExp_Explorer.hxx>

#include <QDebug>
#include <QLoggingCategory>
#include <QString>

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace scopecad::kernel::ops::detail {

using CategoryFn = const QLoggingCategory& (*)();

inline bool hasVertices(const TopoDS_Shape& shape) {
    if (shape.IsNull()) {
        return false;
    }
    TopExp_Explorer exp(shape, TopAbs_VERTEX);
    return exp.More();
}

/**
 * @brief Run fn, catching kernel and standard exceptions
 *
 * fn must return a KernelResult. Successful results are optionally validated.
 */
template <typename Fn>
KernelResult guarded(CategoryFn category,
                     const std::string& operation,
                     const std::vector<std::string>& inputIds,
                     const KernelOptions& options,
                     Fn&& fn) {
    KernelResult result;
    try {
        result = std::forward<Fn>(fn)();
    } catch (const Standard_Failure& failure) {
        const char* message = failure.GetMessageString();
        result = KernelResult::fail(operation,
                                    std::string("kernel exception: ") +
                                        (message && *message ? message : failure.DynamicType()->Name()),
                                    inputIds);
    } catch (const std::exception& ex) {
        result = KernelResult::fail(operation, std::string("exception: ") + ex.what(), inputIds);
    }

    result.operation = operation;
    if (result.success && options.validateResults && !BRepCheck_Analyzer(result.shape).IsValid()) {
        result = KernelResult::fail(operation, "result failed BRepCheck validation", inputIds);
    }

    if (!result.success) {
        if (result.inputIds.empty()) {
            result.inputIds = inputIds;
        }
        qCWarning(category).noquote() << "op-failed"
                                      << "operation=" << QString::fromStdString(operation)
                                      << "reason=" << QString::fromStdString(result.errorMessage)
                                      << "inputs=" << static_cast<int>(result.inputIds.size());
    } else {
        qCDebug(category).noquote() << "op-done" << "operation=" << QString::fromStdString(operation);
    }
    return result;
}

} // namespace scopecad::kernel::ops::detail

#endif // SCOPECAD_KERNEL_OPS_KERNEL_GUARD_H
