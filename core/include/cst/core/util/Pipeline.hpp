#pragma once

#include <array>
#include <optional>

#include "cst/core/types/LabelVolume.hpp"
#include "cst/core/util/AxisStitcher.hpp"
#include "cst/core/util/ConsensusFuser.hpp"
#include "cst/core/util/IouStitcher.hpp"
#include "cst/core/util/StitchConfig.hpp"

namespace cst {

struct PostprocessStats {
    std::size_t smallRemoved = 0;
    std::size_t holeVoxelsFilled = 0;
    std::size_t nucleiRemoved = 0;
    std::size_t oversegmentsCorrected = 0;
};

struct PipelineStats {
    std::array<StitchStats, 3> axes;    // kAllAxes order, transport method only
    IouStitchStats iou;                 // iou method only
    FusionStats fusion;
    PostprocessStats postprocess;
    std::size_t instances = 0;
};

struct PipelineResult {
    LabelVolume volume;
    // Stitched per-axis volumes (volume frame), kept on request
    std::optional<std::array<LabelVolume, 3>> axisVolumes;
    PipelineStats stats;
};

/**
 * @brief End-to-end 3D stitching of three orthogonal 2D segmentations.
 *
 * All inputs are in the volume frame [z, y, x] and must share one shape.
 * The output has the same shape with dense IDs 1..K; empty input gives an
 * all-background volume. Identical inputs and configuration give identical
 * output regardless of the thread count.
 */
class Pipeline {
public:
    // The configuration is validated here (std::invalid_argument).
    explicit Pipeline(StitchConfig config);

    PipelineResult run(const LabelVolume& xy,
                       const LabelVolume& yz,
                       const LabelVolume& xz,
                       const LabelVolume* nuclei = nullptr) const;

    const StitchConfig& config() const { return config_; }

private:
    std::array<LabelVolume, 3> stitchAxes(const LabelVolume& xy,
                                          const LabelVolume& yz,
                                          const LabelVolume& xz,
                                          PipelineStats& stats) const;

    void postprocess(LabelVolume& volume, const LabelVolume* nuclei, PostprocessStats& stats) const;

    StitchConfig config_;
};

} // namespace cst
