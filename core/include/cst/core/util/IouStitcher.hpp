#pragma once

#include <cstddef>

#include "cst/core/types/LabelVolume.hpp"

namespace cst {

struct IouStitchStats {
    std::size_t slices = 0;
    std::size_t emptySlices = 0;
    std::size_t inherited = 0;
    std::size_t freshIds = 0;
};

/**
 * @brief Greedy IoU stitching of one slice-major stack.
 *
 * IoUs below threshold are ignored. Each label a of the relabeled slice k-1
 * then keeps only its best partners in slice k, and each label b of slice k
 * inherits the ID of its best remaining a (ties: lower ID). Labels with no
 * remaining partner get a fresh ID. IDs start at 1.
 *
 * @throws std::invalid_argument if threshold is outside (0, 1]
 */
LabelVolume stitchIoU(const LabelVolume& stack,
                      double threshold = 0.25,
                      IouStitchStats* stats = nullptr);

} // namespace cst
