#ifndef FRAMESYNC_DELTA_DETECTOR_HPP
#define FRAMESYNC_DELTA_DETECTOR_HPP

// Decides whether a captured frame differs meaningfully from the previous capture.
// Failures never propagate: anything that cannot be compared counts as a full change.

#include "frames/frame_types.hpp"
#include "frames/image_decode.hpp"
#include "frames/pixel_match.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace delta_detector {

constexpr double DEFAULT_DELTA_THRESHOLD_PERCENT = 2.0;

struct DeltaResult {
    bool changed = true;
    double delta_percent = 100.0;
    int64_t diff_pixel_count = 0;
    int64_t total_pixels = 0;
    bool dimension_mismatch = false;
    std::string error_detail; // set when decoding failed (result is then a forced change)
};

class DeltaDetector {
public:
    explicit DeltaDetector(double delta_threshold_percent = DEFAULT_DELTA_THRESHOLD_PERCENT,
                           pixel_match::MatchOptions match_options = pixel_match::MatchOptions());

    // previous may be null (first frame or forced recapture).
    DeltaResult compare(const frames::EncodedImagePtr &previous, const frames::EncodedImagePtr &current) const;

    // Same verdict on already decoded rasters.
    DeltaResult compare_rasters(const image_decode::RasterImage &previous,
                                const image_decode::RasterImage &current) const;

    // Safe to call while comparisons run on other threads.
    void set_delta_threshold(double delta_threshold_percent);
    double delta_threshold() const { return threshold_percent.load(); }

private:
    std::atomic<double> threshold_percent;
    pixel_match::MatchOptions options;
};

} // namespace delta_detector

#endif // FRAMESYNC_DELTA_DETECTOR_HPP
