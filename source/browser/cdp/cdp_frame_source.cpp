#include "browser/cdp/cdp_frame_source.hpp"
#include "browser/cdp/cdp_driver.hpp"
#include "utils/base64.hpp"
#include "utils/debug_log.hpp"

#include <cmath>
#include <memory>
#include <vector>

namespace cdp_frame_source {

using json = nlohmann::json;

static const char SCREENCAST_FRAME_EVENT[] = "Page.screencastFrame";

static std::string mime_type_for_format(const std::string &image_format) {
    return image_format == "png" ? "image/png" : "image/jpeg";
}

bool parse_screencast_frame(const json &params, const std::string &image_format,
                            frames::RawFrame &out_frame, int &out_ack_session_id, std::string &error_detail) {
    out_ack_session_id = params.value("sessionId", 0);

    if (!params.contains("data") || !params["data"].is_string()) {
        error_detail = "screencast frame without image data";
        return false;
    }
    std::shared_ptr<frames::EncodedImage> image_bytes = std::make_shared<frames::EncodedImage>();
    if (!base64::decode(params["data"].get<std::string>(), *image_bytes) || image_bytes->empty()) {
        error_detail = "screencast frame data is not valid base64";
        return false;
    }

    out_frame.encoded_image = image_bytes;
    out_frame.mime_type = mime_type_for_format(image_format);
    out_frame.capture_timestamp_ms = frames::now_epoch_ms();

    if (params.contains("metadata") && params["metadata"].is_object()) {
        const json &metadata = params["metadata"];
        frames::ViewMetadata &view = out_frame.view_metadata;
        view.page_scale_factor = metadata.value("pageScaleFactor", 1.0);
        view.offset_top = metadata.value("offsetTop", 0.0);
        view.scroll_offset_x = metadata.value("scrollOffsetX", 0.0);
        view.scroll_offset_y = metadata.value("scrollOffsetY", 0.0);
        view.device_width = static_cast<int>(metadata.value("deviceWidth", 0.0));
        view.device_height = static_cast<int>(metadata.value("deviceHeight", 0.0));
        // Seconds since epoch, fractional.
        double timestamp_seconds = metadata.value("timestamp", 0.0);
        if (timestamp_seconds > 0) {
            out_frame.capture_timestamp_ms = static_cast<int64_t>(std::llround(timestamp_seconds * 1000.0));
        }
    }
    return true;
}

CdpFrameSource::~CdpFrameSource() {
    stop_capture();
    set_frame_handler(nullptr);
}

void CdpFrameSource::set_frame_handler(frame_source::FrameHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex);
    frame_handler = std::move(handler);
}

browser_driver::DriverResult CdpFrameSource::start_capture(const browser_driver::ScreencastOptions &options) {
    {
        std::lock_guard<std::mutex> lock(options_mutex);
        screencast_options = options;
    }
    cdp_driver::set_event_handler(SCREENCAST_FRAME_EVENT, [this](const json &params) { on_screencast_frame(params); });

    browser_driver::DriverResult result = cdp_driver::start_screencast(options);
    if (!result.success) {
        cdp_driver::set_event_handler(SCREENCAST_FRAME_EVENT, nullptr);
        return result;
    }
    capturing = true;
    debug_log::log("screencast: started (" + options.format + ", quality " + std::to_string(options.quality) +
                   ", " + std::to_string(options.max_width) + "x" + std::to_string(options.max_height) + ")");
    return result;
}

void CdpFrameSource::stop_capture() {
    if (!capturing.exchange(false)) {
        return;
    }
    cdp_driver::set_event_handler(SCREENCAST_FRAME_EVENT, nullptr);
    if (cdp_driver::is_connected()) {
        browser_driver::DriverResult result = cdp_driver::stop_screencast();
        if (!result.success) {
            debug_log::log("screencast: stop failed: " + result.error_detail);
        }
    }
    debug_log::log("screencast: stopped");
}

void CdpFrameSource::on_screencast_frame(const json &params) {
    std::string image_format;
    {
        std::lock_guard<std::mutex> lock(options_mutex);
        image_format = screencast_options.format;
    }

    frames::RawFrame raw_frame;
    int ack_session_id = 0;
    std::string error_detail;
    bool parsed = parse_screencast_frame(params, image_format, raw_frame, ack_session_id, error_detail);

    // Chrome throttles the stream until each frame is acknowledged.
    cdp_driver::acknowledge_screencast_frame(ack_session_id);

    if (!parsed) {
        debug_log::warn("screencast: " + error_detail);
        return;
    }
    std::lock_guard<std::mutex> lock(handler_mutex);
    if (frame_handler) {
        frame_handler(std::move(raw_frame));
    }
}

frame_source::OnDemandCaptureResult CdpFrameSource::capture_on_demand() {
    frame_source::OnDemandCaptureResult result;

    browser_driver::CaptureScreenshotOptions capture_options;
    {
        std::lock_guard<std::mutex> lock(options_mutex);
        capture_options.format = screencast_options.format;
        capture_options.quality = screencast_options.quality;
    }

    browser_driver::CaptureScreenshotResult screenshot = cdp_driver::capture_screenshot(capture_options);
    if (!screenshot.success) {
        result.error_detail = screenshot.error_detail;
        return result;
    }

    std::shared_ptr<frames::EncodedImage> image_bytes = std::make_shared<frames::EncodedImage>();
    if (!base64::decode(screenshot.image_base64, *image_bytes) || image_bytes->empty()) {
        result.error_detail = "screenshot data is not valid base64";
        return result;
    }
    result.raw_frame.encoded_image = image_bytes;
    result.raw_frame.mime_type = screenshot.mime_type;
    result.raw_frame.capture_timestamp_ms = frames::now_epoch_ms();
    result.success = true;
    return result;
}

} // namespace cdp_frame_source
