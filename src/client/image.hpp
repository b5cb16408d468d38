#pragma once
#include <cstdint>
#include <system_error>
#include <vector>
#include "protocol.hpp"

namespace photolink {

// JPEG bytes as they travel on the wire.
using ImageBuffer = std::vector<uint8_t>;

// Decoded 8-bit RGB, rows packed without padding.
struct Bitmap {
    int width{0};
    int height{0};
    std::vector<uint8_t> rgb;

    bool empty() const { return width <= 0 || height <= 0; }
    void release() { width = height = 0; std::vector<uint8_t>().swap(rgb); }
};

struct NormalizeOptions {
    int max_width{kMaxImageWidth};
    int quality{kJpegQuality};
};

std::error_code decode_jpeg(const std::vector<uint8_t>& data, Bitmap& out);
std::error_code encode_jpeg(const Bitmap& bmp, int quality, ImageBuffer& out);

// Bilinear resample to `width`, height follows the aspect ratio (truncated, at least 1).
Bitmap scale_to_width(const Bitmap& src, int width);

// Bounds the width and re-encodes. `bmp` is consumed and released before return.
std::error_code normalize_bitmap(Bitmap&& bmp, ImageBuffer& out,
                                 const NormalizeOptions& opts = NormalizeOptions());

// Decode, then normalize_bitmap. Unreadable input yields decode_error.
std::error_code normalize_image(const std::vector<uint8_t>& source, ImageBuffer& out,
                                const NormalizeOptions& opts = NormalizeOptions());

} // namespace photolink
