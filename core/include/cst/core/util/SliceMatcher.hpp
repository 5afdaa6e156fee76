#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

#include "cst/core/types/LabelVolume.hpp"
#include "cst/core/util/LabelOverlap.hpp"
#include "cst/core/util/StitchConfig.hpp"

namespace cst {

// One accepted link between label a of slice k and label b of slice k+1.
struct Correspondence {
    Label a;
    Label b;
    std::uint64_t overlap;  // shared pixels
    std::uint64_t mass;     // pixels transported from a to b
    double cost;            // 1 - IoU(a, b)

    // Transported mass backed by shared pixels. Background slack can move
    // more than the overlap onto a pair.
    std::uint64_t supportedMass() const { return std::min(mass, overlap); }
};

struct CorrespondenceMap {
    std::vector<Correspondence> matches;  // sorted by (a, b)
    std::vector<Label> appeared;          // labels of B without predecessor
    std::vector<Label> disappeared;       // labels of A without successor
    bool degenerate = false;              // both sides non-empty, nothing accepted

    bool empty() const { return matches.empty(); }

    std::vector<Correspondence> predecessorsOf(Label b) const;
    std::vector<Correspondence> successorsOf(Label a) const;
};

// Transported mass on one edge of the overlap graph. Background included.
struct TransportFlow {
    Label a;
    Label b;
    std::uint64_t overlap;
    std::uint64_t mass;
    double cost;

    std::uint64_t supportedMass() const { return std::min(mass, overlap); }
};

// Preference among competing partners: lower cost, then larger overlap,
// then the lower label on the opposite side.
bool preferCorrespondence(const Correspondence& l, const Correspondence& r, bool compareA);

/**
 * @brief Matches instance labels of two adjacent slices.
 *
 * The label areas of both slices (background included) are treated as mass
 * distributions and transported over the pairs that overlap in at least one
 * pixel, at cost 1 - IoU. The optimal plan lets one instance spread its mass
 * over several partners, which expresses splits and merges directly.
 */
class SliceMatcher {
public:
    explicit SliceMatcher(MatchParams params = {});

    // Throws ShapeMismatch if the masks differ in shape.
    CorrespondenceMap match(const LabelMask& a, const LabelMask& b) const;

    // Exact min-cost transport over the sparse overlap edges, sorted by (a, b).
    static std::vector<TransportFlow> solveTransport(const OverlapTable& table);

    const MatchParams& params() const { return params_; }

private:
    bool accept(const TransportFlow& f, const OverlapTable& table) const;

    MatchParams params_;
};

} // namespace cst
