#include "test_support.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>
#include <vector>

#include <jpeglib.h>
#include <png.h>

namespace test_support {

bool check(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

image_decode::RasterImage solid_raster(int width, int height, uint8_t red, uint8_t green, uint8_t blue) {
    image_decode::RasterImage image;
    image.width = width;
    image.height = height;
    image.rgba.resize(static_cast<size_t>(width) * height * 4);
    for (size_t offset = 0; offset < image.rgba.size(); offset += 4) {
        image.rgba[offset] = red;
        image.rgba[offset + 1] = green;
        image.rgba[offset + 2] = blue;
        image.rgba[offset + 3] = 255;
    }
    return image;
}

void fill_rect(image_decode::RasterImage &image, int x, int y, int width, int height,
               uint8_t red, uint8_t green, uint8_t blue) {
    for (int row = y; row < y + height && row < image.height; row++) {
        for (int column = x; column < x + width && column < image.width; column++) {
            size_t offset = (static_cast<size_t>(row) * image.width + column) * 4;
            image.rgba[offset] = red;
            image.rgba[offset + 1] = green;
            image.rgba[offset + 2] = blue;
            image.rgba[offset + 3] = 255;
        }
    }
}

frames::EncodedImagePtr encode_png(const image_decode::RasterImage &image) {
    std::shared_ptr<frames::EncodedImage> encoded = std::make_shared<frames::EncodedImage>();

    png_image png;
    std::memset(&png, 0, sizeof(png));
    png.version = PNG_IMAGE_VERSION;
    png.width = static_cast<png_uint_32>(image.width);
    png.height = static_cast<png_uint_32>(image.height);
    png.format = PNG_FORMAT_RGBA;

    png_alloc_size_t size = 0;
    if (!png_image_write_to_memory(&png, nullptr, &size, 0, image.rgba.data(), 0, nullptr)) {
        std::cout << "  (png size query failed: " << png.message << ")" << std::endl;
        png_image_free(&png);
        return encoded;
    }
    encoded->resize(size);
    if (!png_image_write_to_memory(&png, encoded->data(), &size, 0, image.rgba.data(), 0, nullptr)) {
        std::cout << "  (png encode failed: " << png.message << ")" << std::endl;
        encoded->clear();
        png_image_free(&png);
        return encoded;
    }
    encoded->resize(size);
    return encoded;
}

frames::EncodedImagePtr encode_jpeg(const image_decode::RasterImage &image, int quality) {
    jpeg_compress_struct compressor;
    jpeg_error_mgr error_manager;
    compressor.err = jpeg_std_error(&error_manager);
    jpeg_create_compress(&compressor);

    unsigned char *output = nullptr;
    unsigned long output_size = 0;
    jpeg_mem_dest(&compressor, &output, &output_size);

    compressor.image_width = static_cast<JDIMENSION>(image.width);
    compressor.image_height = static_cast<JDIMENSION>(image.height);
    compressor.input_components = 3;
    compressor.in_color_space = JCS_RGB;
    jpeg_set_defaults(&compressor);
    jpeg_set_quality(&compressor, quality, TRUE);
    jpeg_start_compress(&compressor, TRUE);

    std::vector<unsigned char> row(static_cast<size_t>(image.width) * 3);
    while (compressor.next_scanline < compressor.image_height) {
        const uint8_t *source = image.rgba.data() + static_cast<size_t>(compressor.next_scanline) * image.width * 4;
        for (int column = 0; column < image.width; column++) {
            row[column * 3] = source[column * 4];
            row[column * 3 + 1] = source[column * 4 + 1];
            row[column * 3 + 2] = source[column * 4 + 2];
        }
        JSAMPROW row_pointer = row.data();
        jpeg_write_scanlines(&compressor, &row_pointer, 1);
    }
    jpeg_finish_compress(&compressor);
    jpeg_destroy_compress(&compressor);

    std::shared_ptr<frames::EncodedImage> encoded =
        std::make_shared<frames::EncodedImage>(output, output + output_size);
    std::free(output);
    return encoded;
}

frames::RawFrame raw_frame(const frames::EncodedImagePtr &image, const std::string &mime_type) {
    frames::RawFrame frame;
    frame.encoded_image = image;
    frame.mime_type = mime_type;
    frame.capture_timestamp_ms = frames::now_epoch_ms();
    return frame;
}

frames::FramePtr make_frame(int64_t id, bool changed, double delta_percent, bool keep_alive) {
    std::shared_ptr<frames::Frame> frame = std::make_shared<frames::Frame>();
    frame->id = id;
    frame->captured_at_ms = frames::now_epoch_ms();
    frame->pixels = std::make_shared<frames::EncodedImage>(frames::EncodedImage{1, 2, 3});
    frame->changed = changed;
    frame->delta_percent = delta_percent;
    frame->keep_alive = keep_alive;
    return frame;
}

bool wait_until(const std::function<bool()> &predicate, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

void FakeFrameSource::set_frame_handler(frame_source::FrameHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex);
    frame_handler = std::move(handler);
}

browser_driver::DriverResult FakeFrameSource::start_capture(const browser_driver::ScreencastOptions &options) {
    (void)options;
    capturing = true;
    browser_driver::DriverResult result;
    result.success = true;
    return result;
}

void FakeFrameSource::stop_capture() {
    capturing = false;
}

frame_source::OnDemandCaptureResult FakeFrameSource::capture_on_demand() {
    frame_source::OnDemandCaptureResult result;
    on_demand_captures++;
    std::lock_guard<std::mutex> lock(image_mutex);
    if (!on_demand_image) {
        result.error_detail = "no on-demand image configured";
        return result;
    }
    result.raw_frame = raw_frame(on_demand_image);
    result.success = true;
    return result;
}

bool FakeFrameSource::push(const frames::EncodedImagePtr &image) {
    std::lock_guard<std::mutex> lock(handler_mutex);
    if (!frame_handler) {
        return false;
    }
    frame_handler(raw_frame(image));
    return true;
}

void FakeFrameSource::set_on_demand_image(const frames::EncodedImagePtr &image) {
    std::lock_guard<std::mutex> lock(image_mutex);
    on_demand_image = image;
}

} // namespace test_support
