#pragma once

#include <array>
#include <cstddef>

#include "cst/core/types/LabelVolume.hpp"
#include "cst/core/util/StitchConfig.hpp"

namespace cst {

struct FusionStats {
    std::array<std::size_t, 3> components{0, 0, 0};  // per axis, kAllAxes order
    std::size_t groups = 0;
    std::size_t acceptedGroups = 0;
    std::size_t agreedVoxels = 0;       // resolved by the agreement pass
    std::size_t resolvedVoxels = 0;     // resolved by core fraction
    std::size_t ambiguousVoxels = 0;    // more than one candidate group
    std::size_t droppedVoxels = 0;      // foreground somewhere, no accepted group
    std::size_t instances = 0;
};

/**
 * @brief Fuses the three axis volumes into one consensus label volume.
 *
 * Components from different axes are linked when they are mutually each
 * other's best IoU partner above FusionParams::overlap_threshold. Linked
 * components form consensus groups; a group is kept when it spans at least
 * FusionParams::min_agreeing_axes axes. Voxels are then assigned by majority
 * over the axes, and the remaining disagreements go to the candidate group
 * whose component has the largest share of its voxels in that group's core.
 *
 * Output IDs are dense from 1 and ordered by the groups' smallest xy, yz, xz
 * component IDs. The result does not depend on the OpenMP thread count.
 */
class ConsensusFuser {
public:
    explicit ConsensusFuser(FusionParams params = {});

    // All volumes in the volume frame with the same shape; ShapeMismatch
    // names the first axis that differs from xy.
    LabelVolume fuse(const LabelVolume& xy, const LabelVolume& yz, const LabelVolume& xz);

    const FusionStats& stats() const { return stats_; }
    const FusionParams& params() const { return params_; }

private:
    FusionParams params_;
    FusionStats stats_;
};

} // namespace cst
