// Tests for image decoding and the pixel delta verdict.
// Images are synthesized and encoded in-process with libpng / libjpeg.

#include "frames/delta_detector.hpp"
#include "frames/image_decode.hpp"
#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <string>

using test_support::check;

namespace test_delta_detector {

static bool test_detect_format() {
    frames::EncodedImagePtr png = test_support::encode_png(test_support::solid_raster(8, 8, 0, 0, 0));
    frames::EncodedImagePtr jpeg = test_support::encode_jpeg(test_support::solid_raster(8, 8, 0, 0, 0), 80);
    const uint8_t garbage[] = {'G', 'I', 'F', '8', '9', 'a'};

    bool success = true;
    success &= check(image_decode::detect_format(png->data(), png->size()) == image_decode::ImageFormat::Png,
                     "PNG magic bytes detected");
    success &= check(image_decode::detect_format(jpeg->data(), jpeg->size()) == image_decode::ImageFormat::Jpeg,
                     "JPEG magic bytes detected");
    success &= check(image_decode::detect_format(garbage, sizeof(garbage)) == image_decode::ImageFormat::Unknown,
                     "Other formats are reported as unknown");
    return success;
}

static bool test_decode_jpeg_dimensions() {
    frames::EncodedImagePtr jpeg = test_support::encode_jpeg(test_support::solid_raster(40, 24, 200, 30, 30), 90);
    image_decode::RasterImage raster;
    std::string error_detail;
    bool decoded = image_decode::decode(*jpeg, raster, error_detail);

    bool success = check(decoded, "JPEG decodes (" + error_detail + ")");
    success &= check(raster.width == 40 && raster.height == 24, "JPEG raster has the encoded dimensions");
    success &= check(raster.rgba.size() == 40u * 24u * 4u, "JPEG raster is expanded to RGBA");
    // Lossy, but a flat colour survives closely.
    success &= check(!raster.rgba.empty() && std::abs(static_cast<int>(raster.rgba[0]) - 200) < 8 &&
                     raster.rgba[3] == 255, "JPEG pixel colour is preserved and opaque");
    return success;
}

static bool test_decode_rejects_garbage() {
    frames::EncodedImage garbage = {0x89, 'P', 'N', 'G', 0x00, 0x01, 0x02};
    image_decode::RasterImage raster;
    std::string error_detail;
    bool decoded = image_decode::decode(garbage, raster, error_detail);
    return check(!decoded && !error_detail.empty(), "Truncated PNG fails with an error detail");
}

static bool test_identical_images_have_zero_delta() {
    delta_detector::DeltaDetector detector(2.0);
    image_decode::RasterImage image = test_support::solid_raster(64, 64, 255, 255, 255);
    test_support::fill_rect(image, 10, 10, 20, 5, 0, 0, 0);
    frames::EncodedImagePtr first = test_support::encode_png(image);
    frames::EncodedImagePtr second = test_support::encode_png(image);

    delta_detector::DeltaResult result = detector.compare(first, second);
    bool success = check(result.delta_percent == 0.0, "Identical images give a 0% delta");
    success &= check(!result.changed, "Identical images are not a change");
    success &= check(result.total_pixels == 64 * 64, "Total pixel count is width * height");
    return success;
}

static bool test_fully_different_images_have_full_delta() {
    delta_detector::DeltaDetector detector(2.0);
    frames::EncodedImagePtr white = test_support::encode_png(test_support::solid_raster(32, 32, 255, 255, 255));
    frames::EncodedImagePtr black = test_support::encode_png(test_support::solid_raster(32, 32, 0, 0, 0));

    delta_detector::DeltaResult result = detector.compare(white, black);
    bool success = check(std::fabs(result.delta_percent - 100.0) < 1e-9, "White vs black gives a 100% delta");
    success &= check(result.changed, "White vs black is a change");
    return success;
}

static bool test_threshold_decides_change() {
    image_decode::RasterImage before = test_support::solid_raster(64, 64, 255, 255, 255);
    image_decode::RasterImage small_change = before;
    test_support::fill_rect(small_change, 30, 30, 4, 4, 0, 0, 0); // 16 of 4096 pixels
    image_decode::RasterImage large_change = before;
    test_support::fill_rect(large_change, 0, 0, 32, 32, 0, 0, 0); // a quarter

    delta_detector::DeltaDetector detector(2.0);
    delta_detector::DeltaResult small = detector.compare_rasters(before, small_change);
    delta_detector::DeltaResult large = detector.compare_rasters(before, large_change);

    bool success = check(small.diff_pixel_count == 16, "Small change counts 16 differing pixels");
    success &= check(!small.changed, "0.39% delta stays below a 2% threshold");
    success &= check(std::fabs(large.delta_percent - 25.0) < 1e-9, "Quarter-image change is a 25% delta");
    success &= check(large.changed, "25% delta exceeds a 2% threshold");

    detector.set_delta_threshold(0.1);
    success &= check(detector.compare_rasters(before, small_change).changed,
                     "Lowering the threshold turns the small change into a change");
    return success;
}

static bool test_dimension_mismatch_is_full_change() {
    delta_detector::DeltaDetector detector(2.0);
    delta_detector::DeltaResult result = detector.compare_rasters(test_support::solid_raster(32, 32, 10, 10, 10),
                                                                  test_support::solid_raster(32, 16, 10, 10, 10));
    bool success = check(result.dimension_mismatch, "Different sizes are flagged as a dimension mismatch");
    success &= check(result.changed && result.delta_percent == 100.0, "Dimension mismatch is a 100% change");
    return success;
}

static bool test_missing_or_undecodable_previous_is_full_change() {
    delta_detector::DeltaDetector detector(2.0);
    frames::EncodedImagePtr image = test_support::encode_png(test_support::solid_raster(16, 16, 1, 2, 3));
    frames::EncodedImagePtr garbage = std::make_shared<frames::EncodedImage>(frames::EncodedImage{1, 2, 3, 4});

    delta_detector::DeltaResult first = detector.compare(nullptr, image);
    delta_detector::DeltaResult broken = detector.compare(garbage, image);
    bool success = check(first.changed && first.delta_percent == 100.0, "First frame (no baseline) is a full change");
    success &= check(broken.changed && broken.delta_percent == 100.0 && !broken.error_detail.empty(),
                     "Undecodable baseline is a full change with an error detail");
    return success;
}

static bool test_jpeg_noise_below_threshold() {
    // Re-encoding the same picture must not look like motion.
    image_decode::RasterImage image = test_support::solid_raster(64, 48, 240, 240, 240);
    test_support::fill_rect(image, 8, 8, 24, 12, 20, 60, 160);
    delta_detector::DeltaDetector detector(2.0);
    delta_detector::DeltaResult result =
        detector.compare(test_support::encode_jpeg(image, 80), test_support::encode_jpeg(image, 80));
    return check(!result.changed, "Identical JPEG encodes are not a change");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_detect_format();
    all_passed &= test_decode_jpeg_dimensions();
    all_passed &= test_decode_rejects_garbage();
    all_passed &= test_identical_images_have_zero_delta();
    all_passed &= test_fully_different_images_have_full_delta();
    all_passed &= test_threshold_decides_change();
    all_passed &= test_dimension_mismatch_is_full_change();
    all_passed &= test_missing_or_undecodable_previous_is_full_change();
    all_passed &= test_jpeg_noise_below_threshold();
    return all_passed;
}

} // namespace test_delta_detector
