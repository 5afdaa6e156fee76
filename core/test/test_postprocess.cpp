#include "test.hpp"

#include "cst/core/types/ShapeMismatch.hpp"
#include "cst/core/util/Postprocess.hpp"

using namespace cst;

static void block(LabelVolume& v, std::size_t z0, std::size_t y0, std::size_t x0,
                  std::size_t z1, std::size_t y1, std::size_t x1, Label l)
{
    for (std::size_t z = z0; z < z1; ++z)
        for (std::size_t y = y0; y < y1; ++y)
            for (std::size_t x = x0; x < x1; ++x)
                v(z, y, x) = l;
}

TEST(RemoveSmallMasks, DropsLabelsBelowMinimum)
{
    LabelVolume v(2, 6, 6);
    block(v, 0, 0, 0, 1, 1, 3, 4);   // 3 voxels
    block(v, 0, 2, 0, 2, 6, 5, 7);   // 40 voxels

    EXPECT_EQ(removeSmallMasks(v, 15), 1u);
    EXPECT_EQ(v(0, 0, 0), 0u);
    EXPECT_EQ(v(1, 3, 3), 7u);
}

TEST(RemoveSmallMasks, NonPositiveMinimumIsNoOp)
{
    LabelVolume v(1, 2, 2);
    v(0, 0, 0) = 1;
    EXPECT_EQ(removeSmallMasks(v, 0), 0u);
    EXPECT_EQ(removeSmallMasks(v, -1), 0u);
    EXPECT_EQ(v(0, 0, 0), 1u);
}

TEST(FillHoles, FillsEnclosedBackgroundOnly)
{
    LabelVolume v(1, 9, 9);
    block(v, 0, 1, 1, 1, 6, 6, 5);   // 5x5 square at rows/cols 1..5
    v(0, 3, 3) = 0;                  // enclosed hole
    v(0, 2, 2) = 8;                  // other instance inside, kept
    block(v, 0, 1, 7, 1, 4, 9, 6);   // C-shape open to the border
    v(0, 2, 8) = 0;

    EXPECT_EQ(fillHolesPerSlice(v), 1u);
    EXPECT_EQ(v(0, 3, 3), 5u);
    EXPECT_EQ(v(0, 2, 2), 8u);
    EXPECT_EQ(v(0, 2, 8), 0u);
    EXPECT_EQ(v(0, 0, 0), 0u);
}

TEST(FilterByNuclei, KeepsLabelsTouchingNuclei)
{
    LabelVolume v(1, 4, 4);
    LabelVolume nuclei(1, 4, 4);
    block(v, 0, 0, 0, 1, 2, 4, 1);
    block(v, 0, 2, 0, 1, 4, 4, 2);
    nuclei(0, 3, 3) = 9;

    EXPECT_EQ(filterByNuclei(v, nuclei), 1u);
    EXPECT_EQ(v(0, 0, 0), 0u);
    EXPECT_EQ(v(0, 3, 0), 2u);
}

TEST(FilterByNuclei, ShapeMismatchThrows)
{
    LabelVolume v(1, 4, 4);
    EXPECT_THROW(filterByNuclei(v, LabelVolume(2, 4, 4)), ShapeMismatch);
}

TEST(CorrectOversegmentation, SingleSliceLabelsJoinReference)
{
    LabelVolume v(3, 6, 6);
    block(v, 0, 1, 1, 3, 5, 5, 1);
    block(v, 1, 1, 1, 2, 3, 5, 9);   // fragment of 1 in slice 1 only
    v(0, 0, 5) = 7;                  // speck in slice 0, background below

    EXPECT_EQ(correctOversegmentation(v), 2u);
    EXPECT_EQ(v(1, 1, 1), 1u);
    EXPECT_EQ(v(0, 0, 5), 0u);
    EXPECT_EQ(v(2, 2, 2), 1u);
}

TEST(CorrectOversegmentation, SingleSliceVolumeIsUntouched)
{
    LabelVolume v(1, 3, 3);
    v(0, 1, 1) = 4;
    EXPECT_EQ(correctOversegmentation(v), 0u);
    EXPECT_EQ(v(0, 1, 1), 4u);
}

TEST(RelabelSequential, KeepsOrderAndCompacts)
{
    LabelVolume v(1, 1, 4);
    v(0, 0, 0) = 100;
    v(0, 0, 1) = 5;
    v(0, 0, 3) = 9;

    EXPECT_EQ(relabelSequential(v), 3u);
    EXPECT_EQ(v(0, 0, 0), 3u);
    EXPECT_EQ(v(0, 0, 1), 1u);
    EXPECT_EQ(v(0, 0, 2), 0u);
    EXPECT_EQ(v(0, 0, 3), 2u);
}
