#include "test.hpp"

#include "cst/core/types/ShapeMismatch.hpp"
#include "cst/core/util/AxisStitcher.hpp"

#include <set>

using namespace cst;

static void box(LabelMask& m, std::size_t r0, std::size_t c0, std::size_t r1, std::size_t c1, Label l)
{
    for (std::size_t r = r0; r < r1; ++r)
        for (std::size_t c = c0; c < c1; ++c)
            m(r, c) = l;
}

static std::set<Label> labelsIn(const LabelVolume& v, std::size_t k)
{
    std::set<Label> out;
    const auto& s = v.shape();
    for (std::size_t r = 0; r < s[1]; ++r)
        for (std::size_t c = 0; c < s[2]; ++c)
            if (v(k, r, c) != 0)
                out.insert(v(k, r, c));
    return out;
}

TEST(AxisStitcher, CylinderKeepsOneId)
{
    std::vector<LabelMask> slices(3, LabelMask(8, 8));
    box(slices[0], 2, 2, 6, 6, 5);
    box(slices[1], 2, 2, 6, 6, 7);
    box(slices[2], 2, 2, 6, 6, 9);

    AxisStitcher st(Axis::XY);
    LabelVolume out = st.stitchSlices(slices, 8, 8);

    for (std::size_t k = 0; k < 3; ++k) {
        EXPECT_EQ(out(k, 3, 3), 1u);
        EXPECT_EQ(out(k, 0, 0), 0u);
        EXPECT_EQ(labelsIn(out, k).size(), 1u);
    }
    EXPECT_EQ(st.registry().last(), 1u);
    EXPECT_EQ(st.stats().inherited, 2u);
    EXPECT_EQ(st.stats().freshIds, 1u);
}

TEST(AxisStitcher, FirstSliceIdsFollowLabelOrder)
{
    std::vector<LabelMask> slices(2, LabelMask(8, 8));
    box(slices[0], 0, 0, 3, 3, 40);
    box(slices[0], 5, 5, 8, 8, 3);
    // Raw labels swap between slices
    box(slices[1], 0, 0, 3, 3, 3);
    box(slices[1], 5, 5, 8, 8, 40);

    AxisStitcher st(Axis::XY);
    LabelVolume out = st.stitchSlices(slices, 8, 8);
    EXPECT_EQ(out(0, 6, 6), 1u);
    EXPECT_EQ(out(0, 1, 1), 2u);
    EXPECT_EQ(out(1, 6, 6), 1u);
    EXPECT_EQ(out(1, 1, 1), 2u);
}

TEST(AxisStitcher, MergeKeepsLargerLineage)
{
    std::vector<LabelMask> slices(2, LabelMask(6, 8));
    box(slices[0], 1, 0, 5, 4, 1);   // area 16
    box(slices[0], 1, 4, 5, 6, 2);   // area 8
    box(slices[1], 1, 0, 5, 6, 3);

    AxisStitcher st(Axis::XY);
    LabelVolume out = st.stitchSlices(slices, 6, 8);
    EXPECT_EQ(out(1, 2, 1), 1u);
    EXPECT_EQ(out(1, 2, 5), 1u);
    EXPECT_EQ(labelsIn(out, 1).size(), 1u);
    EXPECT_EQ(st.stats().merges, 1u);
    EXPECT_EQ(st.registry().last(), 2u);
}

TEST(AxisStitcher, MinorityOverlapStartsNewId)
{
    std::vector<LabelMask> slices(2, LabelMask(32, 32));
    box(slices[0], 0, 0, 10, 10, 1);
    box(slices[1], 0, 8, 10, 18, 1);   // 20 of 100 pixels shared

    AxisStitcher st(Axis::XY);
    LabelVolume out = st.stitchSlices(slices, 32, 32);
    EXPECT_EQ(out(0, 0, 0), 1u);
    EXPECT_EQ(out(1, 0, 17), 2u);
    EXPECT_EQ(st.stats().inherited, 0u);
    EXPECT_EQ(st.stats().degenerateMatches, 1u);
}

TEST(AxisStitcher, DiscontinuousSplitGivesFreshIdToSmallerFragment)
{
    std::vector<LabelMask> slices(2, LabelMask(8, 8));
    box(slices[0], 1, 1, 7, 7, 1);   // area 36
    box(slices[1], 1, 1, 7, 3, 4);   // area 12
    box(slices[1], 1, 5, 7, 7, 8);   // area 12, gap in between

    AxisStitcher st(Axis::XY);
    LabelVolume out = st.stitchSlices(slices, 8, 8);
    EXPECT_EQ(out(1, 3, 1), 1u);     // equal areas: lower raw label keeps the ID
    EXPECT_EQ(out(1, 3, 6), 2u);
    EXPECT_EQ(st.stats().splits, 1u);
    EXPECT_EQ(st.stats().splitFreshIds, 1u);
}

TEST(AxisStitcher, ContinuousSplitKeepsAncestorId)
{
    std::vector<LabelMask> slices(2, LabelMask(8, 8));
    box(slices[0], 1, 1, 7, 7, 1);
    box(slices[1], 1, 1, 7, 4, 4);
    box(slices[1], 1, 4, 7, 7, 8);

    AxisStitcher st(Axis::XY);
    LabelVolume out = st.stitchSlices(slices, 8, 8);
    EXPECT_EQ(out(1, 3, 1), 1u);
    EXPECT_EQ(out(1, 3, 6), 1u);
    EXPECT_EQ(st.stats().splits, 1u);
    EXPECT_EQ(st.stats().splitFreshIds, 0u);
}

TEST(AxisStitcher, EmptySliceIsCountedAndNotBridged)
{
    std::vector<LabelMask> slices(3, LabelMask(6, 6));
    box(slices[0], 1, 1, 5, 5, 2);
    box(slices[2], 1, 1, 5, 5, 2);

    AxisStitcher st(Axis::XY);
    LabelVolume out = st.stitchSlices(slices, 6, 6);
    EXPECT_TRUE(labelsIn(out, 1).empty());
    EXPECT_EQ(out(0, 2, 2), 1u);
    EXPECT_EQ(out(2, 2, 2), 2u);
    EXPECT_EQ(st.stats().emptySlices, 1u);
}

TEST(AxisStitcher, AllEmptyStackStaysEmpty)
{
    std::vector<LabelMask> slices(4, LabelMask(3, 3));
    AxisStitcher st(Axis::XZ);
    LabelVolume out = st.stitchSlices(slices, 3, 3);
    EXPECT_EQ(out.max(), 0u);
    EXPECT_EQ(st.stats().emptySlices, 4u);
    EXPECT_EQ(st.registry().last(), 0u);
}

TEST(AxisStitcher, ShapeMismatchNamesSlice)
{
    std::vector<LabelMask> slices{LabelMask(4, 4), LabelMask(4, 4), LabelMask(3, 4)};
    AxisStitcher st(Axis::XY);
    bool thrown = false;
    try {
        st.stitchSlices(slices, 4, 4);
    } catch (const ShapeMismatch& e) {
        thrown = true;
        EXPECT_EQ(e.axis(), std::string("xy"));
        EXPECT_EQ(e.sliceIndex(), 2);
    }
    EXPECT_TRUE(thrown);
}

TEST(AxisStitcher, RunsAreIndependent)
{
    std::vector<LabelMask> slices(2, LabelMask(6, 6));
    box(slices[0], 1, 1, 4, 4, 3);
    box(slices[1], 1, 1, 4, 4, 3);

    AxisStitcher st(Axis::XY);
    LabelVolume first = st.stitchSlices(slices, 6, 6);
    LabelVolume second = st.stitchSlices(slices, 6, 6);
    EXPECT_EQ(first, second);
}

TEST(AxisStitcher, YzStitchesAlongX)
{
    // Block at z, y, x in [1, 4); every x-slice labeled on its own.
    LabelVolume v(5, 5, 5);
    for (std::size_t z = 1; z < 4; ++z)
        for (std::size_t y = 1; y < 4; ++y)
            for (std::size_t x = 1; x < 4; ++x)
                v(z, y, x) = static_cast<Label>(10 + x);

    AxisStitcher st(Axis::YZ);
    LabelVolume out = st.stitch(v);
    ASSERT_EQ(out.shape(), v.shape());
    EXPECT_EQ(out(1, 1, 1), 1u);
    EXPECT_EQ(out(3, 3, 3), 1u);
    EXPECT_EQ(out(0, 0, 0), 0u);
    EXPECT_EQ(out.max(), 1u);
}

TEST(AxisStitcher, OrthogonalVotesVetoInheritance)
{
    LabelVolume xy(2, 6, 6);
    LabelVolume other(2, 6, 6);
    for (std::size_t r = 1; r < 5; ++r) {
        for (std::size_t c = 1; c < 5; ++c) {
            xy(0, r, c) = 1;
            xy(1, r, c) = 1;
            other(0, r, c) = 1;
            other(1, r, c) = 2;   // separated between the slices
        }
    }

    VoteParams votes;
    votes.enabled = true;
    AxisStitcher veto(Axis::XY, {}, {}, votes);
    LabelVolume vetoed = veto.stitch(xy, other, other);
    EXPECT_EQ(vetoed(0, 2, 2), 1u);
    EXPECT_EQ(vetoed(1, 2, 2), 2u);
    EXPECT_EQ(veto.stats().vetoed, 1u);

    AxisStitcher plain(Axis::XY);
    LabelVolume kept = plain.stitch(xy, other, other);
    EXPECT_EQ(kept(1, 2, 2), 1u);
}

TEST(AxisStitcher, VoteStacksMustMatch)
{
    VoteParams votes;
    votes.enabled = true;
    AxisStitcher st(Axis::XY, {}, {}, votes);
    EXPECT_THROW(st.stitch(LabelVolume(2, 4, 4), LabelVolume(2, 4, 4), LabelVolume(2, 4, 5)),
                 ShapeMismatch);
}
