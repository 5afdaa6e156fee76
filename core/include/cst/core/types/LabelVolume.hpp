#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "cst/core/types/Tensor3D.hpp"

namespace cst {

// 0 is background, positive values are instances.
using Label = std::uint32_t;

// Volume frame is [z, y, x]; a slice-major stack is [slice, row, col].
using LabelVolume = Tensor3D<Label>;

// ============================================================================
// LabelMask: one 2D slice, row-major
// ============================================================================

struct LabelMask {
    std::vector<Label> storage;
    std::size_t rows = 0, cols = 0;

    LabelMask() = default;
    LabelMask(std::size_t r, std::size_t c)
        : storage(r * c, 0), rows(r), cols(c) {}
    LabelMask(std::size_t r, std::size_t c, Label fill)
        : storage(r * c, fill), rows(r), cols(c) {}

    Label& operator()(std::size_t r, std::size_t c)
        { return storage[r * cols + c]; }
    const Label& operator()(std::size_t r, std::size_t c) const
        { return storage[r * cols + c]; }

    Label* data() { return storage.data(); }
    const Label* data() const { return storage.data(); }
    std::size_t size() const { return storage.size(); }
    std::array<std::size_t, 2> shape() const { return {rows, cols}; }

    bool operator==(const LabelMask& o) const
        { return rows == o.rows && cols == o.cols && storage == o.storage; }
};

// Sorted nonzero labels present in the mask.
std::vector<Label> uniqueLabels(const LabelMask& mask);

bool hasInstances(const LabelMask& mask);

// ============================================================================
// Axis: the direction a 2D stack was sliced along
// ============================================================================

enum class Axis { XY, YZ, XZ };

constexpr std::array<Axis, 3> kAllAxes{Axis::XY, Axis::YZ, Axis::XZ};

const char* axisName(Axis axis);

// Volume-frame dimension the axis slices along: XY -> z, XZ -> y, YZ -> x.
std::size_t sliceDim(Axis axis);

// Slice-major dimension i maps to volume-frame dimension permutation(axis)[i].
// XY = (z, y, x), YZ = (x, z, y), XZ = (y, z, x).
std::array<std::size_t, 3> slicePermutation(Axis axis);

LabelVolume toSliceFrame(const LabelVolume& volume, Axis axis);
LabelVolume toVolumeFrame(const LabelVolume& stack, Axis axis);

// Slice-major helpers
LabelMask extractSlice(const LabelVolume& stack, std::size_t k);
void insertSlice(LabelVolume& stack, std::size_t k, const LabelMask& mask);

} // namespace cst
