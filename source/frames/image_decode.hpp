#ifndef FRAMESYNC_IMAGE_DECODE_HPP
#define FRAMESYNC_IMAGE_DECODE_HPP

// Decoding of captured JPEG / PNG payloads into 8-bit RGBA rasters.
// JPEG uses libjpeg, PNG uses the libpng simplified API.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace image_decode {

struct RasterImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgba; // width * height * 4 bytes, row-major, no padding
};

enum class ImageFormat {
    Unknown,
    Jpeg,
    Png
};

// Sniffs the magic bytes.
ImageFormat detect_format(const uint8_t *data, size_t size);

// Decodes into out_image. On failure returns false and fills error_detail.
bool decode(const uint8_t *data, size_t size, RasterImage &out_image, std::string &error_detail);

bool decode(const std::vector<uint8_t> &encoded, RasterImage &out_image, std::string &error_detail);

} // namespace image_decode

#endif // FRAMESYNC_IMAGE_DECODE_HPP
