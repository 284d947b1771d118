/**
 * @file KernelResult.h
 * @brief Result and option types shared by every kernel adapter call.
 */
#ifndef SCOPECAD_KERNEL_OPS_KERNEL_RESULT_H
#define SCOPECAD_KERNEL_OPS_KERNEL_RESULT_H

#include <TopoDS_Shape.hxx>

#include <string>
#include <vector>

namespace scopecad::kernel::ops {

/**
 * @brief Result of a kernel operation
 */
struct KernelResult {
    /// Resulting shape (null if failed)
    TopoDS_Shape shape;

    /// Whether the operation succeeded
    bool success = false;

    /// Name of the kernel operation, e.g. "boolean.cut"
    std::string operation;

    /// Error message if failed
    std::string errorMessage;

    /// Identifiers of the inputs that took part in a failed call
    std::vector<std::string> inputIds;

    /// Warnings (non-fatal issues)
    std::vector<std::string> warnings;

    static KernelResult ok(const std::string& operation, const TopoDS_Shape& shape) {
        KernelResult result;
        result.operation = operation;
        result.shape = shape;
        result.success = true;
        return result;
    }

    static KernelResult fail(const std::string& operation, const std::string& message,
                             std::vector<std::string> inputIds = {}) {
        KernelResult result;
        result.operation = operation;
        result.errorMessage = message;
        result.inputIds = std::move(inputIds);
        return result;
    }
};

/**
 * @brief Options forwarded into kernel calls
 */
struct KernelOptions {
    /// Fuzzy value for booleans (0 = exact)
    double fuzzyValue = 0.0;

    /// Merge coplanar faces / collinear edges after booleans
    bool cleanAfterBoolean = true;

    /// Run BRepCheck_Analyzer on results
    bool validateResults = false;

    /// Tolerance for degenerate input detection
    double linearTolerance = 1e-6;
};

} // namespace scopecad::kernel::ops

#endif // SCOPECAD_KERNEL_OPS_KERNEL_RESULT_H
