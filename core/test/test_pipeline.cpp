#include "test.hpp"

#include "cst/core/types/ShapeMismatch.hpp"
#include "cst/core/util/Pipeline.hpp"

#include <map>

#ifdef _OPENMP
#include <omp.h>
#endif

using namespace cst;

namespace {

constexpr std::size_t kSize = 12;

struct Cube {
    std::size_t lo, hi;   // [lo, hi) along every dimension
};

const Cube kCubeA{1, 5};
const Cube kCubeB{7, 11};

bool inside(const Cube& c, std::size_t z, std::size_t y, std::size_t x)
{
    return z >= c.lo && z < c.hi && y >= c.lo && y < c.hi && x >= c.lo && x < c.hi;
}

// Independent 2D labels per slice of the given axis, as a 2D segmenter would
// produce them.
LabelVolume sliceLabels(Axis axis)
{
    LabelVolume v(kSize, kSize, kSize);
    const std::size_t d = sliceDim(axis);
    for (std::size_t z = 0; z < kSize; ++z) {
        for (std::size_t y = 0; y < kSize; ++y) {
            for (std::size_t x = 0; x < kSize; ++x) {
                const std::size_t idx[3]{z, y, x};
                const Label k = static_cast<Label>(idx[d]);
                if (inside(kCubeA, z, y, x))
                    v(z, y, x) = 2 * k + 2;
                else if (inside(kCubeB, z, y, x))
                    v(z, y, x) = 2 * k + 1;
            }
        }
    }
    return v;
}

std::map<Label, std::size_t> histogram(const LabelVolume& v)
{
    std::map<Label, std::size_t> h;
    for (std::size_t i = 0; i < v.size(); ++i)
        ++h[v.data()[i]];
    return h;
}

} // namespace

TEST(Pipeline, TwoCubesBecomeTwoInstances)
{
    Pipeline p{StitchConfig{}};
    PipelineResult r = p.run(sliceLabels(Axis::XY), sliceLabels(Axis::YZ), sliceLabels(Axis::XZ));

    auto h = histogram(r.volume);
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h[1], 64u);
    EXPECT_EQ(h[2], 64u);
    EXPECT_EQ(r.volume(2, 2, 2), 1u);
    EXPECT_EQ(r.volume(8, 8, 8), 2u);
    EXPECT_EQ(r.volume(6, 6, 6), 0u);
    EXPECT_EQ(r.stats.instances, 2u);
    EXPECT_FALSE(r.axisVolumes.has_value());
}

TEST(Pipeline, OutputIsDeterministic)
{
    Pipeline p{StitchConfig{}};
    const LabelVolume xy = sliceLabels(Axis::XY);
    const LabelVolume yz = sliceLabels(Axis::YZ);
    const LabelVolume xz = sliceLabels(Axis::XZ);
    EXPECT_EQ(p.run(xy, yz, xz).volume, p.run(xy, yz, xz).volume);

    StitchConfig single;
    single.threads = 1;
    EXPECT_EQ(Pipeline(single).run(xy, yz, xz).volume, p.run(xy, yz, xz).volume);
}

TEST(Pipeline, EmptyInputGivesBackground)
{
    LabelVolume empty(4, 5, 6);
    PipelineResult r = Pipeline(StitchConfig{}).run(empty, empty, empty);
    EXPECT_EQ(r.volume.shape(), empty.shape());
    EXPECT_EQ(r.volume.max(), 0u);
    EXPECT_EQ(r.stats.instances, 0u);
}

TEST(Pipeline, ShapeMismatchIsReportedPerAxis)
{
    Pipeline p{StitchConfig{}};
    bool thrown = false;
    try {
        p.run(LabelVolume(4, 4, 4), LabelVolume(4, 4, 4), LabelVolume(4, 4, 5));
    } catch (const ShapeMismatch& e) {
        thrown = true;
        EXPECT_EQ(e.axis(), std::string("xz"));
    }
    EXPECT_TRUE(thrown);

    LabelVolume v(4, 4, 4);
    LabelVolume nuclei(4, 5, 4);
    EXPECT_THROW(p.run(v, v, v, &nuclei), ShapeMismatch);
}

TEST(Pipeline, IouMethodUsesXyOnly)
{
    StitchConfig cfg;
    cfg.method = StitchMethod::IoU;
    LabelVolume empty(kSize, kSize, kSize);
    PipelineResult r = Pipeline(cfg).run(sliceLabels(Axis::XY), empty, empty);

    auto h = histogram(r.volume);
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(r.volume(2, 2, 2), 1u);
    EXPECT_EQ(r.volume(8, 8, 8), 2u);
}

TEST(Pipeline, NucleiFilterRemovesCellsWithoutNucleus)
{
    LabelVolume nuclei(kSize, kSize, kSize);
    nuclei(9, 9, 9) = 1;

    StitchConfig cfg;
    cfg.keep_axis_volumes = true;
    const LabelVolume xy = sliceLabels(Axis::XY);
    PipelineResult r = Pipeline(cfg).run(xy, sliceLabels(Axis::YZ), sliceLabels(Axis::XZ), &nuclei);

    EXPECT_EQ(r.volume(2, 2, 2), 0u);
    EXPECT_EQ(r.volume(8, 8, 8), 1u);
    EXPECT_EQ(r.stats.instances, 1u);
    ASSERT_TRUE(r.axisVolumes.has_value());
    EXPECT_EQ((*r.axisVolumes)[0].shape(), xy.shape());
}

TEST(Pipeline, InvalidConfigIsRejected)
{
    StitchConfig cfg;
    cfg.fusion.overlap_threshold = 2.0;
    EXPECT_THROW(Pipeline{cfg}, std::invalid_argument);
}

#ifdef _OPENMP
TEST(Pipeline, ThreadCountIsRestoredAfterRun)
{
    const int before = omp_get_max_threads();
    StitchConfig cfg;
    cfg.threads = before + 1;
    Pipeline(cfg).run(sliceLabels(Axis::XY), sliceLabels(Axis::YZ), sliceLabels(Axis::XZ));
    EXPECT_EQ(omp_get_max_threads(), before);
}
#endif
