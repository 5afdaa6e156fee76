#include "cst/core/util/AxisStitcher.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <utility>

#include "cst/core/types/ShapeMismatch.hpp"
#include "cst/core/util/LabelOverlap.hpp"
#include "cst/core/util/Logging.hpp"

namespace cst {

namespace {

std::string shapeString(std::size_t r, std::size_t c)
{
    return std::to_string(r) + "x" + std::to_string(c);
}

std::string shapeString(const LabelVolume::shape_type& s)
{
    return std::to_string(s[0]) + "x" + std::to_string(s[1]) + "x" + std::to_string(s[2]);
}

// Pixels where an orthogonal stack separates slice k-1 from slice k.
inline int notStitched(const LabelVolume& o, std::size_t k, std::size_t r, std::size_t c)
{
    const Label before = o(k - 1, r, c);
    const Label after = o(k, r, c);
    return (before != 0 && after != 0 && before != after) ? 1 : 0;
}

} // namespace

AxisStitcher::AxisStitcher(Axis axis, MatchParams match, SplitParams split, VoteParams votes)
    : axis_(axis)
    , matcher_(match)
    , split_(split)
    , votes_(votes)
{
}

LabelVolume AxisStitcher::stitch(const LabelVolume& volume)
{
    const LabelVolume stack = toSliceFrame(volume, axis_);
    const auto& s = stack.shape();

    std::vector<LabelMask> slices;
    slices.reserve(s[0]);
    for (std::size_t k = 0; k < s[0]; ++k)
        slices.push_back(extractSlice(stack, k));

    return toVolumeFrame(stitchSlices(slices, s[1], s[2]), axis_);
}

LabelVolume AxisStitcher::stitch(const LabelVolume& volume,
                                 const LabelVolume& orthogonalA,
                                 const LabelVolume& orthogonalB)
{
    if (!votes_.enabled)
        return stitch(volume);

    if (orthogonalA.shape() != volume.shape() || orthogonalB.shape() != volume.shape()) {
        throw ShapeMismatch(axisName(axis_), -1,
            "orthogonal vote stacks " + shapeString(orthogonalA.shape()) + " / " +
            shapeString(orthogonalB.shape()) + " vs " + shapeString(volume.shape()));
    }

    const LabelVolume stack = toSliceFrame(volume, axis_);
    const LabelVolume first = toSliceFrame(orthogonalA, axis_);
    const LabelVolume second = toSliceFrame(orthogonalB, axis_);
    const auto& s = stack.shape();

    std::vector<LabelMask> slices;
    slices.reserve(s[0]);
    for (std::size_t k = 0; k < s[0]; ++k)
        slices.push_back(extractSlice(stack, k));

    OrthogonalVotes votes{&first, &second};
    return toVolumeFrame(stitchSlices(slices, s[1], s[2], &votes), axis_);
}

LabelVolume AxisStitcher::stitchSlices(const std::vector<LabelMask>& slices,
                                       std::size_t rows,
                                       std::size_t cols,
                                       const OrthogonalVotes* votes)
{
    for (std::size_t k = 0; k < slices.size(); ++k) {
        if (slices[k].rows != rows || slices[k].cols != cols) {
            throw ShapeMismatch(axisName(axis_), static_cast<long>(k),
                "slice is " + shapeString(slices[k].rows, slices[k].cols) +
                ", stack is " + shapeString(rows, cols));
        }
    }

    registry_.reset();
    stats_ = StitchStats{};
    stats_.slices = slices.size();

    LabelVolume out(slices.size(), rows, cols);
    if (slices.empty())
        return out;

    if (votes && (!votes_.enabled || !votes->first || !votes->second))
        votes = nullptr;
    if (votes) {
        const LabelVolume::shape_type expected{slices.size(), rows, cols};
        if (votes->first->shape() != expected || votes->second->shape() != expected) {
            throw ShapeMismatch(axisName(axis_), -1,
                "orthogonal vote stacks do not match " + shapeString(expected));
        }
    }

    LabelMask prev = relabelFirst(slices[0]);
    insertSlice(out, 0, prev);

    for (std::size_t k = 1; k < slices.size(); ++k) {
        LabelMask cur = relabelNext(prev, slices[k], k, votes);
        insertSlice(out, k, cur);
        prev = std::move(cur);
    }

    Logger()->info("axis {}: {} slices ({} empty), {} ids, {} inherited, {} merges, {} splits",
                   axisName(axis_), stats_.slices, stats_.emptySlices, registry_.last(),
                   stats_.inherited, stats_.merges, stats_.splits);
    return out;
}

LabelMask AxisStitcher::relabelFirst(const LabelMask& cur)
{
    LabelMask out(cur.rows, cur.cols);
    const auto labels = uniqueLabels(cur);
    if (labels.empty()) {
        ++stats_.emptySlices;
        Logger()->debug("axis {}: slice 0 is empty", axisName(axis_));
        return out;
    }

    std::map<Label, Label> ids;
    for (Label l : labels) {
        ids[l] = registry_.next_id();
        ++stats_.freshIds;
    }
    for (std::size_t i = 0; i < cur.size(); ++i) {
        if (cur.storage[i] != 0)
            out.storage[i] = ids[cur.storage[i]];
    }
    return out;
}

LabelMask AxisStitcher::relabelNext(const LabelMask& prev,
                                    const LabelMask& cur,
                                    std::size_t k,
                                    const OrthogonalVotes* votes)
{
    LabelMask out(cur.rows, cur.cols);
    const auto areas = labelAreas(cur);
    if (areas.empty()) {
        ++stats_.emptySlices;
        Logger()->debug("axis {}: slice {} is empty", axisName(axis_), k);
        return out;
    }

    const CorrespondenceMap cm = matcher_.match(prev, cur);
    if (cm.degenerate)
        ++stats_.degenerateMatches;

    // Predecessor per current instance; merges keep the largest supported mass.
    std::map<Label, Correspondence> chosen;
    for (const auto& c : cm.matches) {
        auto it = chosen.find(c.b);
        if (it == chosen.end()) {
            chosen.emplace(c.b, c);
            continue;
        }
        Correspondence& best = it->second;
        const std::uint64_t mass = c.supportedMass();
        if (mass > best.supportedMass() ||
            (mass == best.supportedMass() && preferCorrespondence(c, best, true)))
            best = c;
    }
    for (const auto& [b, c] : chosen) {
        if (cm.predecessorsOf(b).size() > 1) {
            ++stats_.merges;
            Logger()->debug("axis {}: slice {} label {} merges into id {}",
                            axisName(axis_), k, b, c.a);
        }
    }

    if (votes && !chosen.empty()) {
        std::map<Label, std::uint64_t> against;
        for (std::size_t r = 0; r < cur.rows; ++r) {
            for (std::size_t c = 0; c < cur.cols; ++c) {
                const Label b = cur(r, c);
                if (b == 0 || chosen.count(b) == 0)
                    continue;
                against[b] += notStitched(*votes->first, k, r, c) +
                              notStitched(*votes->second, k, r, c);
            }
        }
        const double tolerance = 1.0 - votes_.p_stitching_votes;
        for (const auto& [b, n] : against) {
            if (static_cast<double>(n) / 2.0 > tolerance * static_cast<double>(areas.at(b))) {
                chosen.erase(b);
                ++stats_.vetoed;
            }
        }
    }

    // Splits: several current instances inheriting one predecessor.
    std::map<Label, std::vector<Label>> fragments;
    for (const auto& [b, c] : chosen)
        fragments[c.a].push_back(b);

    const auto prevAreas = labelAreas(prev);
    for (const auto& [a, frags] : fragments) {
        if (frags.size() < 2)
            continue;
        ++stats_.splits;

        std::uint64_t combined = 0;
        for (Label b : frags)
            combined += areas.at(b);
        const double ratio = static_cast<double>(combined) / static_cast<double>(prevAreas.at(a));
        if (std::abs(ratio - 1.0) <= split_.sensitivity)
            continue;

        // frags is ascending, so the first largest is the lowest label.
        Label keep = frags.front();
        for (Label b : frags) {
            if (areas.at(b) > areas.at(keep))
                keep = b;
        }
        for (Label b : frags) {
            if (b != keep) {
                chosen.erase(b);
                ++stats_.splitFreshIds;
            }
        }
        Logger()->debug("axis {}: slice {} splits id {} into {} fragments (area ratio {})",
                        axisName(axis_), k, a, frags.size(), ratio);
    }

    std::map<Label, Label> ids;
    for (const auto& [b, area] : areas) {
        auto it = chosen.find(b);
        if (it != chosen.end()) {
            ids[b] = it->second.a;
            ++stats_.inherited;
        } else {
            ids[b] = registry_.next_id();
            ++stats_.freshIds;
        }
    }
    for (std::size_t i = 0; i < cur.size(); ++i) {
        if (cur.storage[i] != 0)
            out.storage[i] = ids[cur.storage[i]];
    }
    return out;
}

} // namespace cst
