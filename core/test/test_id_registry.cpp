#include "test.hpp"

#include "cst/core/util/IdRegistry.hpp"

#include <algorithm>
#include <vector>

using cst::IdRegistry;
using cst::Label;

TEST(IdRegistry, StartsAtOne)
{
    IdRegistry r;
    EXPECT_EQ(r.last(), 0u);
    EXPECT_EQ(r.next_id(), 1u);
    EXPECT_EQ(r.next_id(), 2u);
    EXPECT_EQ(r.last(), 2u);
}

TEST(IdRegistry, ResetRestarts)
{
    IdRegistry r;
    r.next_id();
    r.next_id();
    r.reset();
    EXPECT_EQ(r.last(), 0u);
    EXPECT_EQ(r.next_id(), 1u);
}

TEST(IdRegistry, ConcurrentCallersNeverCollide)
{
    IdRegistry r;
    constexpr int kPerThread = 1000;
    constexpr int kThreads = 4;
    std::vector<Label> ids(kPerThread * kThreads);

    #pragma omp parallel for num_threads(kThreads)
    for (int i = 0; i < kPerThread * kThreads; ++i)
        ids[i] = r.next_id();

    std::sort(ids.begin(), ids.end());
    EXPECT_TRUE(std::adjacent_find(ids.begin(), ids.end()) == ids.end());
    EXPECT_EQ(ids.front(), 1u);
    EXPECT_EQ(ids.back(), static_cast<Label>(kPerThread * kThreads));
    EXPECT_EQ(r.last(), static_cast<Label>(kPerThread * kThreads));
}
