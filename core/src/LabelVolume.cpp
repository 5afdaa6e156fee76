#include "cst/core/types/LabelVolume.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

namespace cst {

std::vector<Label> uniqueLabels(const LabelMask& mask)
{
    std::vector<Label> labels;
    labels.reserve(64);
    for (Label l : mask.storage) {
        if (l != 0)
            labels.push_back(l);
    }
    std::sort(labels.begin(), labels.end());
    labels.erase(std::unique(labels.begin(), labels.end()), labels.end());
    return labels;
}

bool hasInstances(const LabelMask& mask)
{
    return std::any_of(mask.storage.begin(), mask.storage.end(),
                       [](Label l) { return l != 0; });
}

const char* axisName(Axis axis)
{
    switch (axis) {
        case Axis::XY: return "xy";
        case Axis::YZ: return "yz";
        case Axis::XZ: return "xz";
    }
    return "?";
}

std::size_t sliceDim(Axis axis)
{
    return slicePermutation(axis)[0];
}

std::array<std::size_t, 3> slicePermutation(Axis axis)
{
    switch (axis) {
        case Axis::XY: return {0, 1, 2};
        case Axis::YZ: return {2, 0, 1};
        case Axis::XZ: return {1, 0, 2};
    }
    throw std::invalid_argument("unknown axis");
}

LabelVolume toSliceFrame(const LabelVolume& volume, Axis axis)
{
    if (axis == Axis::XY)
        return volume;

    const auto p = slicePermutation(axis);
    const auto& vs = volume.shape();
    LabelVolume out(vs[p[0]], vs[p[1]], vs[p[2]]);

    std::array<std::size_t, 3> idx{};
    for (std::size_t a = 0; a < out.shape()[0]; ++a) {
        idx[p[0]] = a;
        for (std::size_t b = 0; b < out.shape()[1]; ++b) {
            idx[p[1]] = b;
            for (std::size_t c = 0; c < out.shape()[2]; ++c) {
                idx[p[2]] = c;
                out(a, b, c) = volume(idx[0], idx[1], idx[2]);
            }
        }
    }
    return out;
}

LabelVolume toVolumeFrame(const LabelVolume& stack, Axis axis)
{
    if (axis == Axis::XY)
        return stack;

    const auto p = slicePermutation(axis);
    const auto& ss = stack.shape();
    LabelVolume::shape_type vs{};
    vs[p[0]] = ss[0];
    vs[p[1]] = ss[1];
    vs[p[2]] = ss[2];
    LabelVolume out(vs);

    std::array<std::size_t, 3> idx{};
    for (idx[0] = 0; idx[0] < vs[0]; ++idx[0]) {
        for (idx[1] = 0; idx[1] < vs[1]; ++idx[1]) {
            for (idx[2] = 0; idx[2] < vs[2]; ++idx[2]) {
                out(idx[0], idx[1], idx[2]) = stack(idx[p[0]], idx[p[1]], idx[p[2]]);
            }
        }
    }
    return out;
}

LabelMask extractSlice(const LabelVolume& stack, std::size_t k)
{
    const auto& s = stack.shape();
    if (k >= s[0])
        throw std::out_of_range("extractSlice: slice " + std::to_string(k) +
                                " of " + std::to_string(s[0]));
    LabelMask mask(s[1], s[2]);
    if (mask.size() > 0)
        std::memcpy(mask.data(), &stack(k, 0, 0), mask.size() * sizeof(Label));
    return mask;
}

void insertSlice(LabelVolume& stack, std::size_t k, const LabelMask& mask)
{
    const auto& s = stack.shape();
    if (k >= s[0] || mask.rows != s[1] || mask.cols != s[2])
        throw std::out_of_range("insertSlice: slice " + std::to_string(k) +
                                " does not fit the stack");
    if (mask.size() > 0)
        std::memcpy(&stack(k, 0, 0), mask.data(), mask.size() * sizeof(Label));
}

} // namespace cst
