#include "cst/core/util/IouStitcher.hpp"

#include <map>
#include <stdexcept>
#include <string>

#include "cst/core/util/IdRegistry.hpp"
#include "cst/core/util/LabelOverlap.hpp"
#include "cst/core/util/Logging.hpp"

namespace cst {

namespace {

struct Link {
    Label a;
    double iou;
};

} // namespace

LabelVolume stitchIoU(const LabelVolume& stack, double threshold, IouStitchStats* stats)
{
    if (!(threshold > 0.0 && threshold <= 1.0))
        throw std::invalid_argument("iou threshold must be in (0, 1], got " + std::to_string(threshold));

    const auto& s = stack.shape();
    LabelVolume out(s);
    IouStitchStats local;
    local.slices = s[0];

    IdRegistry registry;
    LabelMask prev;
    for (std::size_t k = 0; k < s[0]; ++k) {
        const LabelMask cur = extractSlice(stack, k);
        const auto areas = labelAreas(cur);
        LabelMask relabeled(s[1], s[2]);
        if (areas.empty()) {
            ++local.emptySlices;
            Logger()->debug("iou stitch: slice {} is empty", k);
            prev = std::move(relabeled);
            continue;
        }

        std::map<Label, Label> ids;
        if (k > 0 && hasInstances(prev)) {
            const OverlapTable table = computeOverlap(prev, cur);
            // Every previous instance keeps only its best current partners;
            // each current instance then takes its best remaining predecessor.
            std::map<Label, double> bestOfA;
            for (const auto& e : table.entries) {
                if (e.a == 0 || e.b == 0)
                    continue;
                const double iou = intersectionOverUnion(e.count, table.areaA(e.a), table.areaB(e.b));
                if (iou >= threshold && iou > bestOfA[e.a])
                    bestOfA[e.a] = iou;
            }

            std::map<Label, Link> chosen;
            for (const auto& e : table.entries) {
                if (e.a == 0 || e.b == 0)
                    continue;
                const double iou = intersectionOverUnion(e.count, table.areaA(e.a), table.areaB(e.b));
                if (iou < threshold || iou < bestOfA[e.a])
                    continue;
                // Entries come in ascending a, so ties keep the lower label.
                auto it = chosen.find(e.b);
                if (it == chosen.end() || iou > it->second.iou)
                    chosen[e.b] = {e.a, iou};
            }
            for (const auto& [b, link] : chosen)
                ids[b] = link.a;
        }

        for (const auto& [b, area] : areas) {
            if (ids.count(b)) {
                ++local.inherited;
            } else {
                ids[b] = registry.next_id();
                ++local.freshIds;
            }
        }
        for (std::size_t i = 0; i < cur.size(); ++i) {
            if (cur.storage[i] != 0)
                relabeled.storage[i] = ids[cur.storage[i]];
        }
        insertSlice(out, k, relabeled);
        prev = std::move(relabeled);
    }

    Logger()->info("iou stitch: {} slices ({} empty), {} ids, {} inherited",
                   local.slices, local.emptySlices, registry.last(), local.inherited);
    if (stats)
        *stats = local;
    return out;
}

} // namespace cst
