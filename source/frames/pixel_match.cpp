#include "frames/pixel_match.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace pixel_match {

// Largest possible value of the weighted YIQ distance (black vs. white).
static constexpr double MAX_YIQ_DELTA = 35215.0;

static double rgb_to_y(double red, double green, double blue) {
    return red * 0.29889531 + green * 0.58662247 + blue * 0.11448223;
}

static double rgb_to_i(double red, double green, double blue) {
    return red * 0.59597799 - green * 0.27417610 - blue * 0.32180189;
}

static double rgb_to_q(double red, double green, double blue) {
    return red * 0.21147017 - green * 0.52261711 + blue * 0.31114694;
}

// Composite a channel over a white background.
static double blend_over_white(double channel, double alpha) {
    return 255.0 + (channel - 255.0) * alpha;
}

double color_delta(const uint8_t *first_image, const uint8_t *second_image,
                   int64_t first_offset, int64_t second_offset, bool luminance_only) {
    double red1 = first_image[first_offset];
    double green1 = first_image[first_offset + 1];
    double blue1 = first_image[first_offset + 2];
    double alpha1 = first_image[first_offset + 3];

    double red2 = second_image[second_offset];
    double green2 = second_image[second_offset + 1];
    double blue2 = second_image[second_offset + 2];
    double alpha2 = second_image[second_offset + 3];

    if (alpha1 == alpha2 && red1 == red2 && green1 == green2 && blue1 == blue2) {
        return 0;
    }

    if (alpha1 < 255) {
        alpha1 /= 255.0;
        red1 = blend_over_white(red1, alpha1);
        green1 = blend_over_white(green1, alpha1);
        blue1 = blend_over_white(blue1, alpha1);
    }
    if (alpha2 < 255) {
        alpha2 /= 255.0;
        red2 = blend_over_white(red2, alpha2);
        green2 = blend_over_white(green2, alpha2);
        blue2 = blend_over_white(blue2, alpha2);
    }

    double luminance1 = rgb_to_y(red1, green1, blue1);
    double luminance2 = rgb_to_y(red2, green2, blue2);
    double luminance_delta = luminance1 - luminance2;

    if (luminance_only) {
        return luminance_delta;
    }

    double in_phase_delta = rgb_to_i(red1, green1, blue1) - rgb_to_i(red2, green2, blue2);
    double quadrature_delta = rgb_to_q(red1, green1, blue1) - rgb_to_q(red2, green2, blue2);

    double delta = 0.5053 * luminance_delta * luminance_delta +
                   0.299 * in_phase_delta * in_phase_delta +
                   0.1957 * quadrature_delta * quadrature_delta;

    return luminance1 > luminance2 ? -delta : delta;
}

// True if more than two of the 8 neighbours have exactly the same colour.
static bool has_many_siblings(const uint8_t *image, int x1, int y1, int width, int height) {
    const int x0 = std::max(x1 - 1, 0);
    const int y0 = std::max(y1 - 1, 0);
    const int x2 = std::min(x1 + 1, width - 1);
    const int y2 = std::min(y1 + 1, height - 1);
    const int64_t position = (static_cast<int64_t>(y1) * width + x1) * 4;
    int zeroes = (x1 == x0 || x1 == x2 || y1 == y0 || y1 == y2) ? 1 : 0;

    for (int x = x0; x <= x2; x++) {
        for (int y = y0; y <= y2; y++) {
            if (x == x1 && y == y1) {
                continue;
            }
            const int64_t neighbour = (static_cast<int64_t>(y) * width + x) * 4;
            if (std::memcmp(image + position, image + neighbour, 4) == 0) {
                zeroes++;
            }
            if (zeroes > 2) {
                return true;
            }
        }
    }
    return false;
}

// A pixel is treated as anti-aliasing when it sits between a darkest and a
// brightest neighbour that both belong to flat regions in both images.
static bool is_anti_aliased(const uint8_t *image, int x1, int y1, int width, int height,
                            const uint8_t *other_image) {
    const int x0 = std::max(x1 - 1, 0);
    const int y0 = std::max(y1 - 1, 0);
    const int x2 = std::min(x1 + 1, width - 1);
    const int y2 = std::min(y1 + 1, height - 1);
    const int64_t position = (static_cast<int64_t>(y1) * width + x1) * 4;
    int zeroes = (x1 == x0 || x1 == x2 || y1 == y0 || y1 == y2) ? 1 : 0;

    double min_delta = 0;
    double max_delta = 0;
    int min_x = 0;
    int min_y = 0;
    int max_x = 0;
    int max_y = 0;

    for (int x = x0; x <= x2; x++) {
        for (int y = y0; y <= y2; y++) {
            if (x == x1 && y == y1) {
                continue;
            }
            const int64_t neighbour = (static_cast<int64_t>(y) * width + x) * 4;
            double delta = color_delta(image, image, position, neighbour, true);
            if (delta == 0) {
                zeroes++;
                if (zeroes > 2) {
                    return false;
                }
            } else if (delta < min_delta) {
                min_delta = delta;
                min_x = x;
                min_y = y;
            } else if (delta > max_delta) {
                max_delta = delta;
                max_x = x;
                max_y = y;
            }
        }
    }

    if (min_delta == 0 || max_delta == 0) {
        return false;
    }

    return (has_many_siblings(image, min_x, min_y, width, height) &&
            has_many_siblings(other_image, min_x, min_y, width, height)) ||
           (has_many_siblings(image, max_x, max_y, width, height) &&
            has_many_siblings(other_image, max_x, max_y, width, height));
}

int64_t count_different_pixels(const uint8_t *first_image, const uint8_t *second_image,
                               int width, int height, const MatchOptions &options) {
    if (width <= 0 || height <= 0) {
        return 0;
    }
    const size_t byte_count = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    if (std::memcmp(first_image, second_image, byte_count) == 0) {
        return 0;
    }

    const double max_delta = MAX_YIQ_DELTA * options.color_threshold * options.color_threshold;
    int64_t different_pixels = 0;

    for (int y = 0; y < height; y++) {
        for (int x = 0; x < width; x++) {
            const int64_t position = (static_cast<int64_t>(y) * width + x) * 4;
            double delta = color_delta(first_image, second_image, position, position, false);
            if (std::fabs(delta) <= max_delta) {
                continue;
            }
            if (!options.include_anti_aliasing &&
                (is_anti_aliased(first_image, x, y, width, height, second_image) ||
                 is_anti_aliased(second_image, x, y, width, height, first_image))) {
                continue;
            }
            different_pixels++;
        }
    }
    return different_pixels;
}

} // namespace pixel_match
