#ifndef FRAMESYNC_TEST_SUPPORT_HPP
#define FRAMESYNC_TEST_SUPPORT_HPP

// Helpers shared by the test suites: OK/FAIL reporting, synthetic images and
// a scripted FrameSource.

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

#include "frames/frame_source.hpp"
#include "frames/frame_types.hpp"
#include "frames/image_decode.hpp"

namespace test_support {

// Prints "  OK: <description>" or "  FAIL: <description>" and returns condition.
bool check(bool condition, const std::string &description);

image_decode::RasterImage solid_raster(int width, int height, uint8_t red, uint8_t green, uint8_t blue);
void fill_rect(image_decode::RasterImage &image, int x, int y, int width, int height,
               uint8_t red, uint8_t green, uint8_t blue);

// Encoded with libpng / libjpeg. Never null; empty on encoder failure.
frames::EncodedImagePtr encode_png(const image_decode::RasterImage &image);
frames::EncodedImagePtr encode_jpeg(const image_decode::RasterImage &image, int quality);

frames::RawFrame raw_frame(const frames::EncodedImagePtr &image, const std::string &mime_type = "image/png");

// A forwarded frame as the sampler would produce it.
frames::FramePtr make_frame(int64_t id, bool changed, double delta_percent, bool keep_alive = false);

// Polls predicate every few milliseconds until it holds or timeout_ms passes.
bool wait_until(const std::function<bool()> &predicate, int timeout_ms);

// FrameSource driven by the test: push() delivers to the handler like the
// screencast would, capture_on_demand() returns the configured image.
class FakeFrameSource : public frame_source::FrameSource {
public:
    void set_frame_handler(frame_source::FrameHandler handler) override;
    browser_driver::DriverResult start_capture(const browser_driver::ScreencastOptions &options) override;
    void stop_capture() override;
    frame_source::OnDemandCaptureResult capture_on_demand() override;

    // Returns false when no handler is attached.
    bool push(const frames::EncodedImagePtr &image);

    void set_on_demand_image(const frames::EncodedImagePtr &image);
    int on_demand_count() const { return on_demand_captures.load(); }
    bool is_capturing() const { return capturing.load(); }

private:
    std::mutex handler_mutex;
    frame_source::FrameHandler frame_handler;
    std::mutex image_mutex;
    frames::EncodedImagePtr on_demand_image;
    std::atomic<int> on_demand_captures{0};
    std::atomic<bool> capturing{false};
};

} // namespace test_support

#endif // FRAMESYNC_TEST_SUPPORT_HPP
