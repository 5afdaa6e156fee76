#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "cst/core/types/LabelVolume.hpp"

namespace cst {

struct OverlapEntry {
    Label a;
    Label b;
    std::uint64_t count;
};

// Sparse pixel contingency table of two masks of equal shape. Background (0)
// is counted like any other label so that rows and columns sum to the areas.
struct OverlapTable {
    std::vector<OverlapEntry> entries;      // sorted by (a, b), count > 0
    std::map<Label, std::uint64_t> areasA;  // includes background if present
    std::map<Label, std::uint64_t> areasB;
    std::uint64_t total = 0;

    std::uint64_t areaA(Label l) const;
    std::uint64_t areaB(Label l) const;
};

// Throws ShapeMismatch if the masks differ in shape.
OverlapTable computeOverlap(const LabelMask& a, const LabelMask& b);

// Pixel count per nonzero label.
std::map<Label, std::uint64_t> labelAreas(const LabelMask& mask);

double intersectionOverUnion(std::uint64_t overlap, std::uint64_t areaA, std::uint64_t areaB);

} // namespace cst
