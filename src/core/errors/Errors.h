/**
 * @file Errors.h
 * @brief Exception taxonomy raised by the scope, selection and algebra layers.
 *
 * The kernel adapter never throws; it reports failures through KernelResult.
 * These exceptions are raised where a failed result reaches user code.
 */
#ifndef SCOPECAD_CORE_ERRORS_ERRORS_H
#define SCOPECAD_CORE_ERRORS_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>

namespace scopecad::core {

class ScopeCadError : public std::runtime_error {
public:
    explicit ScopeCadError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A builder scope was entered where it cannot nest, or an operation
 * needed an active scope of a kind that is not on top of the stack.
 */
class InvalidNestingError : public ScopeCadError {
public:
    explicit InvalidNestingError(const std::string& message)
        : ScopeCadError(message) {}
};

/**
 * @brief A kernel call failed (degenerate, self-intersecting, non-manifold or
 * empty result).
 */
class GeometricOperationError : public ScopeCadError {
public:
    GeometricOperationError(const std::string& operation,
                            const std::string& reason,
                            std::vector<std::string> inputIds = {})
        : ScopeCadError(formatMessage(operation, reason, inputIds)),
          operation_(operation),
          reason_(reason),
          inputIds_(std::move(inputIds)) {}

    const std::string& operation() const { return operation_; }
    const std::string& reason() const { return reason_; }
    const std::vector<std::string>& inputIds() const { return inputIds_; }

private:
    static std::string formatMessage(const std::string& operation,
                                     const std::string& reason,
                                     const std::vector<std::string>& inputIds) {
        std::string message = operation + " failed: " + reason;
        if (!inputIds.empty()) {
            message += " [inputs:";
            for (const auto& id : inputIds) {
                message += " " + id;
            }
            message += "]";
        }
        return message;
    }

    std::string operation_;
    std::string reason_;
    std::vector<std::string> inputIds_;
};

class EmptySelectionError : public ScopeCadError {
public:
    explicit EmptySelectionError(const std::string& message)
        : ScopeCadError(message) {}
};

/**
 * @brief Two shapes of incompatible dimension were combined (e.g. a wire
 * unioned with a solid).
 */
class AlgebraShapeMismatchError : public ScopeCadError {
public:
    AlgebraShapeMismatchError(const std::string& operation, int lhsDimension, int rhsDimension)
        : ScopeCadError(operation + ": cannot combine a " + std::to_string(lhsDimension) +
                        "D shape with a " + std::to_string(rhsDimension) + "D shape"),
          lhsDimension_(lhsDimension),
          rhsDimension_(rhsDimension) {}

    int lhsDimension() const { return lhsDimension_; }
    int rhsDimension() const { return rhsDimension_; }

private:
    int lhsDimension_;
    int rhsDimension_;
};

} // namespace scopecad::core

#endif // SCOPECAD_CORE_ERRORS_ERRORS_H
