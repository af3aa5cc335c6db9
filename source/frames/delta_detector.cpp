#include "frames/delta_detector.hpp"

#include "utils/debug_log.hpp"

namespace delta_detector {

static DeltaResult full_change() {
    DeltaResult result;
    result.changed = true;
    result.delta_percent = 100.0;
    return result;
}

DeltaDetector::DeltaDetector(double delta_threshold_percent, pixel_match::MatchOptions match_options)
    : threshold_percent(delta_threshold_percent), options(match_options) {}

void DeltaDetector::set_delta_threshold(double delta_threshold_percent) {
    threshold_percent.store(delta_threshold_percent);
}

DeltaResult DeltaDetector::compare(const frames::EncodedImagePtr &previous,
                                   const frames::EncodedImagePtr &current) const {
    if (!previous || !current) {
        return full_change();
    }

    image_decode::RasterImage previous_raster;
    image_decode::RasterImage current_raster;
    std::string decode_error;
    if (!image_decode::decode(*previous, previous_raster, decode_error) ||
        !image_decode::decode(*current, current_raster, decode_error)) {
        debug_log::log("delta: " + decode_error + ", treating frame as changed");
        DeltaResult result = full_change();
        result.error_detail = decode_error;
        return result;
    }
    return compare_rasters(previous_raster, current_raster);
}

DeltaResult DeltaDetector::compare_rasters(const image_decode::RasterImage &previous,
                                           const image_decode::RasterImage &current) const {
    DeltaResult result;
    result.total_pixels = static_cast<int64_t>(current.width) * current.height;

    if (previous.width != current.width || previous.height != current.height) {
        result.changed = true;
        result.delta_percent = 100.0;
        result.diff_pixel_count = result.total_pixels;
        result.dimension_mismatch = true;
        return result;
    }

    const size_t expected_bytes = static_cast<size_t>(result.total_pixels) * 4;
    if (result.total_pixels <= 0 || previous.rgba.size() != expected_bytes ||
        current.rgba.size() != expected_bytes) {
        DeltaResult failed = full_change();
        failed.total_pixels = result.total_pixels;
        failed.error_detail = "raster buffer size does not match its dimensions";
        return failed;
    }

    result.diff_pixel_count = pixel_match::count_different_pixels(
        previous.rgba.data(), current.rgba.data(), current.width, current.height, options);
    result.delta_percent =
        static_cast<double>(result.diff_pixel_count) / static_cast<double>(result.total_pixels) * 100.0;
    result.changed = result.delta_percent >= threshold_percent.load();
    return result;
}

} // namespace delta_detector
