#pragma once

#include <filesystem>

#include "cst/core/types/LabelVolume.hpp"

namespace cst {
namespace tiff {

// Options for writing label stacks
struct WriteOptions {
    enum class Compression { NONE, LZW, DEFLATE };

    Compression compression = Compression::LZW;
    uint32_t rowsPerStrip = 64;
};

// Read a multi-page label TIFF, one page per slice, into a slice-major stack.
// Pages must be single-channel unsigned 8/16/32-bit and share one size.
// Stripped and tiled pages are both accepted.
// @throws std::runtime_error naming the file on any problem
LabelVolume readLabelStack(const std::filesystem::path& path);

// Write a slice-major stack as a multi-page TIFF. Pages are 16-bit when the
// largest label fits, 32-bit otherwise.
void writeLabelStack(const std::filesystem::path& path,
                     const LabelVolume& stack,
                     const WriteOptions& opts = {});

} // namespace tiff
} // namespace cst
