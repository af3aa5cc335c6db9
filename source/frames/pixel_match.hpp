#ifndef FRAMESYNC_PIXEL_MATCH_HPP
#define FRAMESYNC_PIXEL_MATCH_HPP

// Perceptual per-pixel comparison of two equally sized RGBA rasters.
// Colour distance is measured in YIQ space; pixels whose difference looks like
// anti-aliasing (a soft edge shifted by a sub-pixel) can be excluded from the count.

#include <cstdint>

namespace pixel_match {

struct MatchOptions {
    // Fraction (0..1) of the maximum YIQ distance a pixel may differ by and still match.
    double color_threshold = 0.1;
    // When false, anti-aliased pixels are not counted as differences.
    bool include_anti_aliasing = false;
};

// Number of pixels that differ. Both buffers hold width * height * 4 bytes.
int64_t count_different_pixels(const uint8_t *first_image, const uint8_t *second_image,
                               int width, int height, const MatchOptions &options);

// Squared YIQ distance between two pixels, sign encodes which one is brighter.
// With luminance_only the plain Y difference is returned.
double color_delta(const uint8_t *first_image, const uint8_t *second_image,
                   int64_t first_offset, int64_t second_offset, bool luminance_only);

} // namespace pixel_match

#endif // FRAMESYNC_PIXEL_MATCH_HPP
