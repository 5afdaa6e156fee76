#include "cst/core/util/Postprocess.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include "cst/core/types/ShapeMismatch.hpp"
#include "cst/core/util/IdRegistry.hpp"
#include "cst/core/util/Logging.hpp"

namespace cst {

namespace {

std::unordered_map<Label, std::uint64_t> voxelCounts(const LabelVolume& volume)
{
    std::unordered_map<Label, std::uint64_t> counts;
    const Label* p = volume.data();
    for (std::size_t i = 0; i < volume.size(); ++i)
        if (p[i] != 0)
            ++counts[p[i]];
    return counts;
}

// Rewrites every voxel through the map; labels not in it are kept.
void applyMapping(LabelVolume& volume, const std::unordered_map<Label, Label>& mapping)
{
    if (mapping.empty())
        return;
    Label* p = volume.data();
    const long n = static_cast<long>(volume.size());
    #pragma omp parallel for
    for (long i = 0; i < n; ++i) {
        if (p[i] == 0)
            continue;
        auto it = mapping.find(p[i]);
        if (it != mapping.end())
            p[i] = it->second;
    }
}

struct Box {
    int r0 = 0, c0 = 0, r1 = -1, c1 = -1;
};

} // namespace

std::size_t removeSmallMasks(LabelVolume& volume, int minSize)
{
    if (minSize <= 0)
        return 0;

    std::unordered_map<Label, Label> mapping;
    for (const auto& [l, n] : voxelCounts(volume))
        if (n < static_cast<std::uint64_t>(minSize))
            mapping[l] = 0;
    applyMapping(volume, mapping);

    Logger()->info("removed {} masks smaller than {} voxels", mapping.size(), minSize);
    return mapping.size();
}

std::size_t fillHolesPerSlice(LabelVolume& volume)
{
    const auto& s = volume.shape();
    const int rows = static_cast<int>(s[1]);
    const int cols = static_cast<int>(s[2]);
    const long depth = static_cast<long>(s[0]);
    std::size_t filled = 0;

    #pragma omp parallel for schedule(dynamic, 1) reduction(+:filled)
    for (long z = 0; z < depth; ++z) {
        std::map<Label, Box> boxes;
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                const Label l = volume(z, r, c);
                if (l == 0)
                    continue;
                auto [it, inserted] = boxes.try_emplace(l, Box{r, c, r, c});
                Box& b = it->second;
                b.r0 = std::min(b.r0, r);
                b.c0 = std::min(b.c0, c);
                b.r1 = std::max(b.r1, r);
                b.c1 = std::max(b.c1, c);
            }
        }

        for (const auto& [l, b] : boxes) {
            // One pixel of padding so the flood reaches around the mask.
            const int h = b.r1 - b.r0 + 3;
            const int w = b.c1 - b.c0 + 3;
            cv::Mat_<uint8_t> mask(h, w, static_cast<uint8_t>(0));
            for (int r = b.r0; r <= b.r1; ++r)
                for (int c = b.c0; c <= b.c1; ++c)
                    if (volume(z, r, c) == l)
                        mask(r - b.r0 + 1, c - b.c0 + 1) = 255;

            cv::floodFill(mask, cv::Point(0, 0), cv::Scalar(128));

            for (int r = b.r0; r <= b.r1; ++r) {
                for (int c = b.c0; c <= b.c1; ++c) {
                    if (mask(r - b.r0 + 1, c - b.c0 + 1) == 0 && volume(z, r, c) == 0) {
                        volume(z, r, c) = l;
                        ++filled;
                    }
                }
            }
        }
    }

    Logger()->info("filled {} hole voxels", filled);
    return filled;
}

std::size_t filterByNuclei(LabelVolume& volume, const LabelVolume& nuclei)
{
    if (nuclei.shape() != volume.shape()) {
        const auto& a = volume.shape();
        const auto& b = nuclei.shape();
        throw ShapeMismatch("nuclei", -1,
            std::to_string(b[0]) + "x" + std::to_string(b[1]) + "x" + std::to_string(b[2]) +
            " vs " + std::to_string(a[0]) + "x" + std::to_string(a[1]) + "x" + std::to_string(a[2]));
    }

    std::set<Label> keep;
    const Label* p = volume.data();
    const Label* q = nuclei.data();
    for (std::size_t i = 0; i < volume.size(); ++i)
        if (p[i] != 0 && q[i] != 0)
            keep.insert(p[i]);

    std::unordered_map<Label, Label> mapping;
    for (const auto& [l, n] : voxelCounts(volume))
        if (keep.count(l) == 0)
            mapping[l] = 0;
    applyMapping(volume, mapping);

    Logger()->info("nuclei filter: kept {}, removed {} labels", keep.size(), mapping.size());
    return mapping.size();
}

std::size_t correctOversegmentation(LabelVolume& volume)
{
    const auto& s = volume.shape();
    if (s[0] < 2)
        return 0;

    // Label -> (first slice, number of slices)
    std::map<Label, std::pair<std::size_t, std::size_t>> extent;
    for (std::size_t z = 0; z < s[0]; ++z) {
        std::set<Label> present;
        for (std::size_t r = 0; r < s[1]; ++r)
            for (std::size_t c = 0; c < s[2]; ++c)
                if (volume(z, r, c) != 0)
                    present.insert(volume(z, r, c));
        for (Label l : present) {
            auto [it, inserted] = extent.try_emplace(l, z, 0);
            ++it->second.second;
        }
    }

    std::map<std::size_t, std::vector<Label>> byLayer;
    for (const auto& [l, e] : extent)
        if (e.second == 1)
            byLayer[e.first].push_back(l);

    std::size_t changed = 0;
    for (const auto& [z, labels] : byLayer) {
        const std::size_t ref = z == 0 ? 1 : z - 1;

        // overlap[label][reference label]
        std::map<Label, std::map<Label, std::uint64_t>> overlap;
        for (Label l : labels)
            overlap[l];
        for (std::size_t r = 0; r < s[1]; ++r) {
            for (std::size_t c = 0; c < s[2]; ++c) {
                auto it = overlap.find(volume(z, r, c));
                if (it != overlap.end())
                    ++it->second[volume(ref, r, c)];
            }
        }

        std::unordered_map<Label, Label> target;
        for (const auto& [l, counts] : overlap) {
            Label bestLabel = 0;
            std::uint64_t bestCount = 0;
            for (const auto& [ref_l, n] : counts) {
                if (n > bestCount) {
                    bestLabel = ref_l;
                    bestCount = n;
                }
            }
            target[l] = bestLabel;
        }

        for (std::size_t r = 0; r < s[1]; ++r) {
            for (std::size_t c = 0; c < s[2]; ++c) {
                auto it = target.find(volume(z, r, c));
                if (it != target.end())
                    volume(z, r, c) = it->second;
            }
        }
        changed += labels.size();
        Logger()->debug("oversegmentation: relabeled {} single-slice labels in slice {}", labels.size(), z);
    }

    Logger()->info("oversegmentation: relabeled {} single-slice labels", changed);
    return changed;
}

std::size_t relabelSequential(LabelVolume& volume)
{
    std::vector<Label> labels;
    for (const auto& [l, n] : voxelCounts(volume))
        labels.push_back(l);
    std::sort(labels.begin(), labels.end());

    IdRegistry registry;
    std::unordered_map<Label, Label> mapping;
    for (Label l : labels) {
        const Label id = registry.next_id();
        if (id != l)
            mapping[l] = id;
    }
    applyMapping(volume, mapping);
    return registry.last();
}

} // namespace cst
