#include "cst/core/util/ConsensusFuser.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <numeric>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cst/core/types/ShapeMismatch.hpp"
#include "cst/core/util/HashFunctions.hpp"
#include "cst/core/util/IdRegistry.hpp"
#include "cst/core/util/LabelOverlap.hpp"
#include "cst/core/util/Logging.hpp"

namespace cst {

namespace {

using Triple = std::array<Label, 3>;

constexpr int kBackground = -1;
constexpr int kPending = -2;
constexpr Label kAbsent = std::numeric_limits<Label>::max();

std::string shapeString(const LabelVolume::shape_type& s)
{
    return std::to_string(s[0]) + "x" + std::to_string(s[1]) + "x" + std::to_string(s[2]);
}

// Sparse (l_xy, l_yz, l_xz) -> voxel count, sorted by triple.
std::vector<std::pair<Triple, std::uint64_t>> countTriples(const LabelVolume& xy,
                                                           const LabelVolume& yz,
                                                           const LabelVolume& xz)
{
    const auto& s = xy.shape();
    const std::size_t slab = s[1] * s[2];
    const long depth = static_cast<long>(s[0]);

    std::map<Triple, std::uint64_t> merged;

    #pragma omp parallel
    {
        std::unordered_map<Triple, std::uint64_t, label_triple_hash> local;
        #pragma omp for schedule(dynamic, 1) nowait
        for (long z = 0; z < depth; ++z) {
            const std::size_t begin = static_cast<std::size_t>(z) * slab;
            for (std::size_t i = begin; i < begin + slab; ++i)
                ++local[{xy.data()[i], yz.data()[i], xz.data()[i]}];
        }

        #pragma omp critical
        {
            for (const auto& [t, n] : local)
                merged[t] += n;
        }
    }

    return {merged.begin(), merged.end()};
}

class UnionFind {
public:
    explicit UnionFind(std::size_t n) : parent_(n)
    {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    std::size_t find(std::size_t x)
    {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];
            x = parent_[x];
        }
        return x;
    }

    // The smaller root wins so the result does not depend on edge order.
    void unite(std::size_t a, std::size_t b)
    {
        a = find(a);
        b = find(b);
        if (a == b)
            return;
        if (b < a)
            std::swap(a, b);
        parent_[b] = a;
    }

private:
    std::vector<std::size_t> parent_;
};

struct Component {
    std::size_t axis;
    Label label;
    std::uint64_t size = 0;
};

struct Partner {
    int node = -1;
    double iou = 0.0;
    std::uint64_t overlap = 0;
};

struct Group {
    std::vector<int> members;
    Triple key{kAbsent, kAbsent, kAbsent};  // smallest label per axis
    std::size_t axes = 0;
};

} // namespace

ConsensusFuser::ConsensusFuser(FusionParams params) : params_(params) {}

LabelVolume ConsensusFuser::fuse(const LabelVolume& xy, const LabelVolume& yz, const LabelVolume& xz)
{
    if (yz.shape() != xy.shape())
        throw ShapeMismatch(axisName(Axis::YZ), -1, shapeString(yz.shape()) + " vs xy " + shapeString(xy.shape()));
    if (xz.shape() != xy.shape())
        throw ShapeMismatch(axisName(Axis::XZ), -1, shapeString(xz.shape()) + " vs xy " + shapeString(xy.shape()));

    stats_ = FusionStats{};
    LabelVolume out(xy.shape());
    if (xy.size() == 0)
        return out;

    const std::array<const LabelVolume*, 3> volumes{&xy, &yz, &xz};
    const auto triples = countTriples(xy, yz, xz);

    // Components, ordered by axis then label.
    std::array<std::map<Label, std::uint64_t>, 3> sizes;
    for (const auto& [t, n] : triples)
        for (std::size_t a = 0; a < 3; ++a)
            if (t[a] != 0)
                sizes[a][t[a]] += n;

    std::vector<Component> nodes;
    std::array<std::unordered_map<Label, int>, 3> nodeOf;
    for (std::size_t a = 0; a < 3; ++a) {
        stats_.components[a] = sizes[a].size();
        for (const auto& [l, n] : sizes[a]) {
            nodeOf[a][l] = static_cast<int>(nodes.size());
            nodes.push_back({a, l, n});
        }
    }

    // Best IoU partner of every component on each other axis.
    std::vector<std::array<Partner, 3>> best(nodes.size());
    for (std::size_t i = 0; i < 3; ++i) {
        for (std::size_t j = i + 1; j < 3; ++j) {
            std::map<std::pair<Label, Label>, std::uint64_t> pairs;
            for (const auto& [t, n] : triples)
                if (t[i] != 0 && t[j] != 0)
                    pairs[{t[i], t[j]}] += n;

            for (const auto& entry : pairs) {
                const std::uint64_t overlap = entry.second;
                const int ni = nodeOf[i].at(entry.first.first);
                const int nj = nodeOf[j].at(entry.first.second);
                const double iou = intersectionOverUnion(overlap, nodes[ni].size, nodes[nj].size);

                auto offer = [&](int from, std::size_t axis, int to) {
                    Partner& cur = best[from][axis];
                    if (cur.node < 0 || iou > cur.iou ||
                        (iou == cur.iou && (overlap > cur.overlap ||
                                            (overlap == cur.overlap && to < cur.node))))
                        cur = {to, iou, overlap};
                };
                offer(ni, j, nj);
                offer(nj, i, ni);
            }
        }
    }

    UnionFind uf(nodes.size());
    for (std::size_t n = 0; n < nodes.size(); ++n) {
        for (std::size_t a = 0; a < 3; ++a) {
            const Partner& p = best[n][a];
            if (p.node < 0 || p.iou < params_.overlap_threshold)
                continue;
            if (best[p.node][nodes[n].axis].node == static_cast<int>(n))
                uf.unite(n, static_cast<std::size_t>(p.node));
        }
    }

    std::map<std::size_t, Group> byRoot;
    for (std::size_t n = 0; n < nodes.size(); ++n) {
        Group& g = byRoot[uf.find(n)];
        g.members.push_back(static_cast<int>(n));
        g.key[nodes[n].axis] = std::min(g.key[nodes[n].axis], nodes[n].label);
    }

    std::vector<Group> groups;
    for (auto& [root, g] : byRoot) {
        for (std::size_t a = 0; a < 3; ++a)
            if (g.key[a] != kAbsent)
                ++g.axes;
        ++stats_.groups;
        if (static_cast<int>(g.axes) >= params_.min_agreeing_axes)
            groups.push_back(std::move(g));
    }
    std::sort(groups.begin(), groups.end(),
              [](const Group& l, const Group& r) { return l.key < r.key; });
    stats_.acceptedGroups = groups.size();

    std::vector<int> groupOf(nodes.size(), -1);
    for (std::size_t g = 0; g < groups.size(); ++g)
        for (int n : groups[g].members)
            groupOf[n] = static_cast<int>(g);

    Logger()->info("fusion: {} / {} / {} components, {} groups, {} accepted",
                   stats_.components[0], stats_.components[1], stats_.components[2],
                   stats_.groups, stats_.acceptedGroups);

    const auto& s = xy.shape();
    const std::size_t slab = s[1] * s[2];
    const long depth = static_cast<long>(s[0]);
    const int quorum = params_.min_agreeing_axes;

    auto nodeAt = [&](std::size_t a, std::size_t i) -> int {
        const Label l = volumes[a]->data()[i];
        return l == 0 ? -1 : nodeOf[a].at(l);
    };

    // Pass 1: majority over the axes.
    std::vector<int> assigned(xy.size(), kPending);
    std::vector<std::uint64_t> coreOfNode(nodes.size(), 0);
    std::vector<std::uint64_t> coreOfGroup(groups.size(), 0);
    std::size_t agreed = 0;

    #pragma omp parallel reduction(+:agreed)
    {
        std::vector<std::uint64_t> localNode(nodes.size(), 0);
        std::vector<std::uint64_t> localGroup(groups.size(), 0);

        #pragma omp for schedule(dynamic, 1) nowait
        for (long z = 0; z < depth; ++z) {
            const std::size_t begin = static_cast<std::size_t>(z) * slab;
            for (std::size_t i = begin; i < begin + slab; ++i) {
                std::array<int, 3> node{};
                std::array<int, 3> group{};
                int background = 0;
                for (std::size_t a = 0; a < 3; ++a) {
                    node[a] = nodeAt(a, i);
                    group[a] = node[a] < 0 ? -1 : groupOf[node[a]];
                    if (node[a] < 0)
                        ++background;
                }

                int winner = -1;
                int votes = 0;
                bool tied = false;
                for (std::size_t a = 0; a < 3; ++a) {
                    if (group[a] < 0)
                        continue;
                    const int g = group[a];
                    const int v = static_cast<int>(std::count(group.begin(), group.end(), g));
                    if (v > votes) {
                        winner = g;
                        votes = v;
                        tied = false;
                    } else if (v == votes && g != winner) {
                        tied = true;
                    }
                }

                if (winner >= 0 && !tied && votes >= quorum && votes >= background) {
                    assigned[i] = winner;
                    ++localGroup[winner];
                    for (std::size_t a = 0; a < 3; ++a)
                        if (group[a] == winner)
                            ++localNode[node[a]];
                    ++agreed;
                } else if (background >= quorum && background > votes) {
                    assigned[i] = kBackground;
                }
            }
        }

        #pragma omp critical
        {
            for (std::size_t n = 0; n < localNode.size(); ++n)
                coreOfNode[n] += localNode[n];
            for (std::size_t g = 0; g < localGroup.size(); ++g)
                coreOfGroup[g] += localGroup[g];
        }
    }

    // Pass 2: disagreements go to the candidate with the highest core fraction.
    std::size_t resolved = 0;
    std::size_t ambiguous = 0;
    std::size_t dropped = 0;

    #pragma omp parallel for schedule(dynamic, 1) reduction(+:resolved, ambiguous, dropped)
    for (long z = 0; z < depth; ++z) {
        const std::size_t begin = static_cast<std::size_t>(z) * slab;
        for (std::size_t i = begin; i < begin + slab; ++i) {
            if (assigned[i] != kPending)
                continue;

            int winner = -1;
            double winnerFraction = -1.0;
            bool several = false;
            for (std::size_t a = 0; a < 3; ++a) {
                const int n = nodeAt(a, i);
                if (n < 0 || groupOf[n] < 0)
                    continue;
                const int g = groupOf[n];
                const double fraction = static_cast<double>(coreOfNode[n]) /
                                        static_cast<double>(nodes[n].size);
                if (winner >= 0 && g != winner)
                    several = true;
                if (winner < 0 || fraction > winnerFraction ||
                    (fraction == winnerFraction &&
                     (coreOfGroup[g] > coreOfGroup[winner] ||
                      (coreOfGroup[g] == coreOfGroup[winner] && g < winner)))) {
                    winner = g;
                    winnerFraction = fraction;
                }
            }

            if (winner < 0) {
                assigned[i] = kBackground;
                ++dropped;
            } else {
                assigned[i] = winner;
                ++resolved;
                if (several)
                    ++ambiguous;
            }
        }
    }

    stats_.agreedVoxels = agreed;
    stats_.resolvedVoxels = resolved;
    stats_.ambiguousVoxels = ambiguous;
    stats_.droppedVoxels = dropped;

    // Dense IDs in canonical group order, skipping groups that got no voxel.
    std::vector<std::uint8_t> used(groups.size(), 0);
    for (int g : assigned)
        if (g >= 0)
            used[g] = 1;

    IdRegistry registry;
    std::vector<Label> idOf(groups.size(), 0);
    for (std::size_t g = 0; g < groups.size(); ++g)
        if (used[g])
            idOf[g] = registry.next_id();
    stats_.instances = registry.last();

    Label* dst = out.data();
    for (std::size_t i = 0; i < assigned.size(); ++i)
        dst[i] = assigned[i] >= 0 ? idOf[assigned[i]] : 0;

    Logger()->info("fusion: {} agreed, {} resolved ({} ambiguous), {} dropped voxels, {} instances",
                   stats_.agreedVoxels, stats_.resolvedVoxels, stats_.ambiguousVoxels,
                   stats_.droppedVoxels, stats_.instances);
    return out;
}

} // namespace cst
