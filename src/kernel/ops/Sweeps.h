/**
 * @file Sweeps.h
 * @brief Solids and faces generated by moving a profile.
 */
#ifndef SCOPECAD_KERNEL_OPS_SWEEPS_H
#define SCOPECAD_KERNEL_OPS_SWEEPS_H

#include "KernelResult.h"
#include "../../core/geom/Axis.h"

#include <string>
#include <vector>

namespace scopecad::kernel::ops {

/**
 * @brief Linear extrusion of a face (or edge/wire) along direction
 *
 * @param both Extrude amount to each side of the profile
 */
KernelResult extrude(const TopoDS_Shape& profile,
                     const core::geom::Vec3d& direction,
                     double amount,
                     bool both = false,
                     const std::vector<std::string>& inputIds = {},
                     const KernelOptions& options = {});

KernelResult revolve(const TopoDS_Shape& profile,
                     const core::geom::Axis& axis,
                     double angleDegrees,
                     const std::vector<std::string>& inputIds = {},
                     const KernelOptions& options = {});

/**
 * @brief Solid through the outer wires of the given section faces/wires
 */
KernelResult loft(const std::vector<TopoDS_Shape>& sections,
                  bool ruled = false,
                  const std::vector<std::string>& inputIds = {},
                  const KernelOptions& options = {});

/// How a sweep treats sharp corners of its path
enum class SweepTransition {
    Transformed, ///< profile follows the path frame, corners are not patched
    Round,       ///< corners are filled with a rounded patch
    Right        ///< adjacent segments are extended to a mitred corner
};

const char* sweepTransitionName(SweepTransition transition);

/**
 * @brief Sweep profile along a path made of connected edges
 *
 * Round and Right sweep the profile's wires with a pipe shell and close
 * face profiles into a solid; holes of a face profile are swept and cut
 * out of the outer solid.
 */
KernelResult sweep(const TopoDS_Shape& profile,
                   const std::vector<TopoDS_Shape>& pathEdges,
                   SweepTransition transition = SweepTransition::Transformed,
                   const std::vector<std::string>& inputIds = {},
                   const KernelOptions& options = {});

} // namespace scopecad::kernel::ops

#endif // SCOPECAD_KERNEL_OPS_SWEEPS_H
