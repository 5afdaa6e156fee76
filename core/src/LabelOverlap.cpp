#include "cst/core/util/LabelOverlap.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>

#include "cst/core/types/ShapeMismatch.hpp"
#include "cst/core/util/HashFunctions.hpp"

namespace cst {

std::uint64_t OverlapTable::areaA(Label l) const
{
    auto it = areasA.find(l);
    return it == areasA.end() ? 0 : it->second;
}

std::uint64_t OverlapTable::areaB(Label l) const
{
    auto it = areasB.find(l);
    return it == areasB.end() ? 0 : it->second;
}

OverlapTable computeOverlap(const LabelMask& a, const LabelMask& b)
{
    if (a.rows != b.rows || a.cols != b.cols) {
        throw ShapeMismatch("pair", -1,
            std::to_string(a.rows) + "x" + std::to_string(a.cols) + " vs " +
            std::to_string(b.rows) + "x" + std::to_string(b.cols));
    }

    std::unordered_map<std::pair<Label, Label>, std::uint64_t, label_pair_hash> counts;
    const Label* pa = a.data();
    const Label* pb = b.data();
    const std::size_t n = a.size();

    // Runs of identical pairs are common in label images.
    std::size_t i = 0;
    while (i < n) {
        const Label la = pa[i];
        const Label lb = pb[i];
        std::size_t j = i + 1;
        while (j < n && pa[j] == la && pb[j] == lb)
            ++j;
        counts[{la, lb}] += j - i;
        i = j;
    }

    OverlapTable table;
    table.total = n;
    table.entries.reserve(counts.size());
    for (const auto& [key, count] : counts) {
        table.entries.push_back({key.first, key.second, count});
        table.areasA[key.first] += count;
        table.areasB[key.second] += count;
    }
    std::sort(table.entries.begin(), table.entries.end(),
              [](const OverlapEntry& l, const OverlapEntry& r) {
                  return l.a != r.a ? l.a < r.a : l.b < r.b;
              });
    return table;
}

std::map<Label, std::uint64_t> labelAreas(const LabelMask& mask)
{
    std::unordered_map<Label, std::uint64_t> counts;
    for (Label l : mask.storage) {
        if (l != 0)
            ++counts[l];
    }
    return {counts.begin(), counts.end()};
}

double intersectionOverUnion(std::uint64_t overlap, std::uint64_t areaA, std::uint64_t areaB)
{
    const std::uint64_t uni = areaA + areaB - overlap;
    if (uni == 0)
        return 0.0;
    return static_cast<double>(overlap) / static_cast<double>(uni);
}

} // namespace cst
