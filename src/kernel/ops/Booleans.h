/**
 * @file Booleans.h
 * @brief Fuse / cut / common with post-boolean clean-up.
 */
#ifndef SCOPECAD_KERNEL_OPS_BOOLEANS_H
#define SCOPECAD_KERNEL_OPS_BOOLEANS_H

#include "KernelResult.h"

#include <string>
#include <vector>

namespace scopecad::kernel::ops {

enum class BooleanOp {
    Fuse,
    Cut,
    Common
};

const char* booleanOpName(BooleanOp op);

/**
 * @brief Combine one target with one or more tools
 *
 * Runs BRepAlgoAPI_Fuse/Cut/Common with every tool at once, then merges
 * same-domain faces and edges when options.cleanAfterBoolean is set.
 * A result without any vertex fails with "empty boolean result".
 *
 * @param inputIds Identifiers of target followed by tools, reported on failure
 */
KernelResult boolean(BooleanOp op,
                     const TopoDS_Shape& target,
                     const std::vector<TopoDS_Shape>& tools,
                     const std::vector<std::string>& inputIds = {},
                     const KernelOptions& options = {});

/**
 * @brief Pack shapes into a compound without any boolean
 *
 * A single shape is returned unchanged.
 */
TopoDS_Shape makeCompound(const std::vector<TopoDS_Shape>& shapes);

/// Unwrap compounds holding exactly one child
TopoDS_Shape unwrapSingleton(const TopoDS_Shape& shape);

} // namespace scopecad::kernel::ops

#endif // SCOPECAD_KERNEL_OPS_BOOLEANS_H
