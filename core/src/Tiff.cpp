#include "cst/core/util/Tiff.hpp"

#include <tiffio.h>
#include <opencv2/core.hpp>

#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cst/core/util/Logging.hpp"

namespace cst {
namespace tiff {

namespace {

struct TiffCloser {
    void operator()(TIFF* tf) const { TIFFClose(tf); }
};
using TiffHandle = std::unique_ptr<TIFF, TiffCloser>;

struct PageInfo {
    uint32_t width = 0;
    uint32_t height = 0;
    uint16_t bps = 0;
};

PageInfo readPageInfo(TIFF* tf, const std::filesystem::path& path, std::size_t page)
{
    PageInfo info;
    uint16_t spp = 1;
    uint16_t format = SAMPLEFORMAT_UINT;
    TIFFGetField(tf, TIFFTAG_IMAGEWIDTH, &info.width);
    TIFFGetField(tf, TIFFTAG_IMAGELENGTH, &info.height);
    TIFFGetFieldDefaulted(tf, TIFFTAG_BITSPERSAMPLE, &info.bps);
    TIFFGetFieldDefaulted(tf, TIFFTAG_SAMPLESPERPIXEL, &spp);
    TIFFGetFieldDefaulted(tf, TIFFTAG_SAMPLEFORMAT, &format);

    const std::string where = path.string() + " page " + std::to_string(page);
    if (spp != 1)
        throw std::runtime_error("expected single-channel labels in " + where);
    if (format != SAMPLEFORMAT_UINT)
        throw std::runtime_error("expected unsigned integer labels in " + where);
    if (info.bps != 8 && info.bps != 16 && info.bps != 32)
        throw std::runtime_error("unsupported bits per sample " + std::to_string(info.bps) + " in " + where);
    return info;
}

int cvTypeFor(uint16_t bps)
{
    switch (bps) {
        case 8: return CV_8UC1;
        case 16: return CV_16UC1;
        default: return CV_32SC1;   // bit pattern only, converted as uint32
    }
}

// Raw page pixels in a matrix of the page's sample width.
cv::Mat readPage(TIFF* tf, const PageInfo& info, const std::filesystem::path& path)
{
    const int type = cvTypeFor(info.bps);
    cv::Mat img = cv::Mat::zeros(static_cast<int>(info.height), static_cast<int>(info.width), type);
    const std::size_t elemSize = CV_ELEM_SIZE(type);

    if (TIFFIsTiled(tf)) {
        uint32_t tileW = 0, tileH = 0;
        TIFFGetField(tf, TIFFTAG_TILEWIDTH, &tileW);
        TIFFGetField(tf, TIFFTAG_TILELENGTH, &tileH);
        std::vector<uint8_t> buf(TIFFTileSize(tf));
        for (uint32_t y = 0; y < info.height; y += tileH) {
            for (uint32_t x = 0; x < info.width; x += tileW) {
                if (TIFFReadTile(tf, buf.data(), x, y, 0, 0) < 0)
                    throw std::runtime_error("TIFFReadTile failed in " + path.string());
                const uint32_t copyW = std::min(tileW, info.width - x);
                const uint32_t copyH = std::min(tileH, info.height - y);
                for (uint32_t row = 0; row < copyH; ++row) {
                    std::memcpy(img.ptr(static_cast<int>(y + row)) + x * elemSize,
                                buf.data() + row * tileW * elemSize,
                                copyW * elemSize);
                }
            }
        }
    } else {
        for (uint32_t y = 0; y < info.height; ++y) {
            if (TIFFReadScanline(tf, img.ptr(static_cast<int>(y)), y, 0) < 0)
                throw std::runtime_error("TIFFReadScanline failed in " + path.string());
        }
    }
    return img;
}

template <typename T>
void copyPage(const cv::Mat& img, LabelVolume& stack, std::size_t k)
{
    for (int r = 0; r < img.rows; ++r) {
        const T* src = img.ptr<T>(r);
        for (int c = 0; c < img.cols; ++c)
            stack(k, r, c) = static_cast<Label>(src[c]);
    }
}

} // namespace

LabelVolume readLabelStack(const std::filesystem::path& path)
{
    TiffHandle tf(TIFFOpen(path.string().c_str(), "r"));
    if (!tf)
        throw std::runtime_error("Failed to open TIFF: " + path.string());

    const auto pages = static_cast<std::size_t>(TIFFNumberOfDirectories(tf.get()));
    if (pages == 0)
        throw std::runtime_error("no pages in " + path.string());

    const PageInfo first = readPageInfo(tf.get(), path, 0);
    LabelVolume stack(pages, first.height, first.width);

    // Pages are visited in file order, so no directory index is involved.
    for (std::size_t k = 0; k < pages; ++k) {
        if (k > 0 && !TIFFReadDirectory(tf.get()))
            throw std::runtime_error("cannot read page " + std::to_string(k) + " of " + path.string());

        const PageInfo info = readPageInfo(tf.get(), path, k);
        if (info.width != first.width || info.height != first.height) {
            throw std::runtime_error("page " + std::to_string(k) + " of " + path.string() +
                                     " is " + std::to_string(info.height) + "x" + std::to_string(info.width) +
                                     ", page 0 is " + std::to_string(first.height) + "x" + std::to_string(first.width));
        }

        const cv::Mat img = readPage(tf.get(), info, path);
        switch (info.bps) {
            case 8: copyPage<uint8_t>(img, stack, k); break;
            case 16: copyPage<uint16_t>(img, stack, k); break;
            default: copyPage<uint32_t>(img, stack, k); break;
        }
    }

    Logger()->info("read {} ({} pages, {}x{}, {}-bit)", path.string(), pages,
                   first.height, first.width, first.bps);
    return stack;
}

void writeLabelStack(const std::filesystem::path& path,
                     const LabelVolume& stack,
                     const WriteOptions& opts)
{
    const auto& s = stack.shape();
    if (s[0] == 0 || s[1] == 0 || s[2] == 0)
        throw std::runtime_error("empty label stack for " + path.string());

    const uint16_t bps = stack.max() <= 65535 ? 16 : 32;

    TiffHandle tf(TIFFOpen(path.string().c_str(), stack.nbytes() > (std::size_t{1} << 31) ? "w8" : "w"));
    if (!tf)
        throw std::runtime_error("Failed to open TIFF for writing: " + path.string());

    const uint32_t W = static_cast<uint32_t>(s[2]);
    const uint32_t H = static_cast<uint32_t>(s[1]);
    std::vector<uint8_t> row(static_cast<std::size_t>(W) * bps / 8);

    for (std::size_t k = 0; k < s[0]; ++k) {
        TIFF* t = tf.get();
        TIFFSetField(t, TIFFTAG_IMAGEWIDTH,      W);
        TIFFSetField(t, TIFFTAG_IMAGELENGTH,     H);
        TIFFSetField(t, TIFFTAG_SAMPLESPERPIXEL, 1);
        TIFFSetField(t, TIFFTAG_BITSPERSAMPLE,   bps);
        TIFFSetField(t, TIFFTAG_SAMPLEFORMAT,    SAMPLEFORMAT_UINT);
        TIFFSetField(t, TIFFTAG_PHOTOMETRIC,     PHOTOMETRIC_MINISBLACK);
        TIFFSetField(t, TIFFTAG_ORIENTATION,     ORIENTATION_TOPLEFT);
        TIFFSetField(t, TIFFTAG_PLANARCONFIG,    PLANARCONFIG_CONTIG);
        TIFFSetField(t, TIFFTAG_ROWSPERSTRIP,    std::min(opts.rowsPerStrip, H));
        TIFFSetField(t, TIFFTAG_SUBFILETYPE,     FILETYPE_PAGE);
        // PAGENUMBER is a pair of SHORTs; longer stacks go without it.
        if (s[0] <= std::numeric_limits<uint16_t>::max())
            TIFFSetField(t, TIFFTAG_PAGENUMBER,  static_cast<uint16_t>(k), static_cast<uint16_t>(s[0]));

        switch (opts.compression) {
            case WriteOptions::Compression::NONE:
                TIFFSetField(t, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
                break;
            case WriteOptions::Compression::LZW:
                TIFFSetField(t, TIFFTAG_COMPRESSION, COMPRESSION_LZW);
                TIFFSetField(t, TIFFTAG_PREDICTOR, PREDICTOR_HORIZONTAL);
                break;
            case WriteOptions::Compression::DEFLATE:
                TIFFSetField(t, TIFFTAG_COMPRESSION, COMPRESSION_DEFLATE);
                TIFFSetField(t, TIFFTAG_PREDICTOR, PREDICTOR_HORIZONTAL);
                break;
        }

        for (uint32_t y = 0; y < H; ++y) {
            if (bps == 16) {
                auto* dst = reinterpret_cast<uint16_t*>(row.data());
                for (uint32_t x = 0; x < W; ++x)
                    dst[x] = static_cast<uint16_t>(stack(k, y, x));
            } else {
                std::memcpy(row.data(), &stack(k, y, 0), row.size());
            }
            if (TIFFWriteScanline(t, row.data(), y, 0) < 0)
                throw std::runtime_error("TIFFWriteScanline failed at page " + std::to_string(k) +
                                         " row " + std::to_string(y) + " in " + path.string());
        }

        if (!TIFFWriteDirectory(t))
            throw std::runtime_error("TIFFWriteDirectory failed for " + path.string());
    }

    Logger()->info("wrote {} ({} pages, {}-bit)", path.string(), s[0], bps);
}

} // namespace tiff
} // namespace cst
