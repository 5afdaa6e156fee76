#include "cst/core/util/Pipeline.hpp"

#include <exception>
#include <string>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "cst/core/types/ShapeMismatch.hpp"
#include "cst/core/util/Logging.hpp"
#include "cst/core/util/Postprocess.hpp"

namespace cst {

namespace {

std::string shapeString(const LabelVolume::shape_type& s)
{
    return std::to_string(s[0]) + "x" + std::to_string(s[1]) + "x" + std::to_string(s[2]);
}

#ifdef _OPENMP
// Applies a thread count for one run and restores the caller's setting.
class ThreadCountScope {
public:
    explicit ThreadCountScope(int threads)
        : previous_(omp_get_max_threads()), active_(threads > 0)
    {
        if (active_)
            omp_set_num_threads(threads);
    }

    ~ThreadCountScope()
    {
        if (active_)
            omp_set_num_threads(previous_);
    }

    ThreadCountScope(const ThreadCountScope&) = delete;
    ThreadCountScope& operator=(const ThreadCountScope&) = delete;

private:
    int previous_;
    bool active_;
};
#endif

} // namespace

Pipeline::Pipeline(StitchConfig config) : config_(std::move(config))
{
    config_.validate();
}

std::array<LabelVolume, 3> Pipeline::stitchAxes(const LabelVolume& xy,
                                                const LabelVolume& yz,
                                                const LabelVolume& xz,
                                                PipelineStats& stats) const
{
    const std::array<const LabelVolume*, 3> raw{&xy, &yz, &xz};
    std::array<LabelVolume, 3> stitched;
    std::array<std::exception_ptr, 3> errors;

    // One task per axis; each stitcher owns its registry.
    #pragma omp parallel for schedule(static, 1) num_threads(3)
    for (int a = 0; a < 3; ++a) {
        try {
            AxisStitcher stitcher(kAllAxes[a], config_.match, config_.split, config_.votes);
            const LabelVolume& other1 = *raw[(a + 1) % 3];
            const LabelVolume& other2 = *raw[(a + 2) % 3];
            stitched[a] = stitcher.stitch(*raw[a], other1, other2);
            stats.axes[a] = stitcher.stats();
        } catch (...) {
            errors[a] = std::current_exception();
        }
    }

    for (const auto& e : errors)
        if (e)
            std::rethrow_exception(e);
    return stitched;
}

void Pipeline::postprocess(LabelVolume& volume, const LabelVolume* nuclei, PostprocessStats& stats) const
{
    const PostprocessParams& p = config_.postprocess;
    stats.smallRemoved = removeSmallMasks(volume, p.min_size);
    if (p.fill_holes)
        stats.holeVoxelsFilled = fillHolesPerSlice(volume);
    if (nuclei)
        stats.nucleiRemoved = filterByNuclei(volume, *nuclei);
    if (p.correct_oversegmentation)
        stats.oversegmentsCorrected = correctOversegmentation(volume);
}

PipelineResult Pipeline::run(const LabelVolume& xy,
                             const LabelVolume& yz,
                             const LabelVolume& xz,
                             const LabelVolume* nuclei) const
{
    if (yz.shape() != xy.shape())
        throw ShapeMismatch(axisName(Axis::YZ), -1, shapeString(yz.shape()) + " vs xy " + shapeString(xy.shape()));
    if (xz.shape() != xy.shape())
        throw ShapeMismatch(axisName(Axis::XZ), -1, shapeString(xz.shape()) + " vs xy " + shapeString(xy.shape()));
    if (nuclei && nuclei->shape() != xy.shape())
        throw ShapeMismatch("nuclei", -1, shapeString(nuclei->shape()) + " vs xy " + shapeString(xy.shape()));

#ifdef _OPENMP
    const ThreadCountScope threadScope(config_.threads);
#endif

    Logger()->info("stitching {} volume with method {}", shapeString(xy.shape()),
                   stitchMethodName(config_.method));

    PipelineResult result;
    if (config_.method == StitchMethod::IoU) {
        // The xy stack is already slice-major in the volume frame.
        result.volume = stitchIoU(xy, config_.iou_threshold, &result.stats.iou);
    } else {
        auto stitched = stitchAxes(xy, yz, xz, result.stats);
        ConsensusFuser fuser(config_.fusion);
        result.volume = fuser.fuse(stitched[0], stitched[1], stitched[2]);
        result.stats.fusion = fuser.stats();
        if (config_.keep_axis_volumes)
            result.axisVolumes = std::move(stitched);
    }

    postprocess(result.volume, nuclei, result.stats.postprocess);
    result.stats.instances = relabelSequential(result.volume);

    Logger()->info("done: {} instances", result.stats.instances);
    return result;
}

} // namespace cst
