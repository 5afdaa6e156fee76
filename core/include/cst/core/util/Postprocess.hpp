#pragma once

#include <cstddef>

#include "cst/core/types/LabelVolume.hpp"

namespace cst {

// All functions work in place on a volume-frame label volume and return the
// number of labels (or voxels, for hole filling) they changed.

// Labels with fewer than minSize voxels become background. minSize <= 0 is a
// no-op.
std::size_t removeSmallMasks(LabelVolume& volume, int minSize);

// Per z-slice and label, background pixels enclosed by the label are
// assigned to it.
std::size_t fillHolesPerSlice(LabelVolume& volume);

// Keeps the labels touching at least one nonzero nuclei voxel.
// @throws ShapeMismatch if the shapes differ
std::size_t filterByNuclei(LabelVolume& volume, const LabelVolume& nuclei);

// A label present in exactly one z-slice takes the label it overlaps most in
// the slice above (the slice below for z = 0). Background counts, so an
// isolated fragment over background disappears. Ties go to the lower label.
std::size_t correctOversegmentation(LabelVolume& volume);

// Maps labels to 1..K in ascending order of the original label.
std::size_t relabelSequential(LabelVolume& volume);

} // namespace cst
