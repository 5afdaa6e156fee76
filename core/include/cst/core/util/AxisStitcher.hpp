#pragma once

#include <cstddef>
#include <vector>

#include "cst/core/types/LabelVolume.hpp"
#include "cst/core/util/IdRegistry.hpp"
#include "cst/core/util/SliceMatcher.hpp"
#include "cst/core/util/StitchConfig.hpp"

namespace cst {

struct StitchStats {
    std::size_t slices = 0;
    std::size_t emptySlices = 0;
    std::size_t freshIds = 0;
    std::size_t inherited = 0;
    std::size_t merges = 0;
    std::size_t splits = 0;
    std::size_t splitFreshIds = 0;
    std::size_t vetoed = 0;
    std::size_t degenerateMatches = 0;
};

// Raw 2D-mask stacks of the two other axes, slice-major in the frame of the
// axis being stitched. Both must have the stitched stack's shape.
struct OrthogonalVotes {
    const LabelVolume* first = nullptr;
    const LabelVolume* second = nullptr;
};

/**
 * @brief Stitches one stack of independently labeled 2D masks into a 3D
 *        label volume.
 *
 * Slices are processed strictly in order; slice k is matched against the
 * already relabeled slice k-1. Unmatched instances start a new ID, merges
 * inherit from the predecessor with the largest transported mass, and splits
 * keep one ID unless the fragment areas are discontinuous with the
 * predecessor, in which case only the largest fragment keeps it.
 *
 * Each stitcher owns its IdRegistry, so several stitchers can run
 * concurrently without shared state.
 */
class AxisStitcher {
public:
    explicit AxisStitcher(Axis axis,
                          MatchParams match = {},
                          SplitParams split = {},
                          VoteParams votes = {});

    // Volume-frame input and output.
    LabelVolume stitch(const LabelVolume& volume);

    // As above, with the raw stacks of the other two axes (volume frame) as
    // stitching votes. Votes are only used when VoteParams::enabled is set.
    LabelVolume stitch(const LabelVolume& volume,
                       const LabelVolume& orthogonalA,
                       const LabelVolume& orthogonalB);

    // Slice-major input; every slice must be rows x cols or ShapeMismatch is
    // thrown with the offending slice index. Output is slice-major.
    LabelVolume stitchSlices(const std::vector<LabelMask>& slices,
                             std::size_t rows,
                             std::size_t cols,
                             const OrthogonalVotes* votes = nullptr);

    Axis axis() const { return axis_; }
    const StitchStats& stats() const { return stats_; }
    const IdRegistry& registry() const { return registry_; }

private:
    LabelMask relabelFirst(const LabelMask& cur);
    LabelMask relabelNext(const LabelMask& prev,
                          const LabelMask& cur,
                          std::size_t k,
                          const OrthogonalVotes* votes);

    Axis axis_;
    SliceMatcher matcher_;
    SplitParams split_;
    VoteParams votes_;
    IdRegistry registry_;
    StitchStats stats_;
};

} // namespace cst
