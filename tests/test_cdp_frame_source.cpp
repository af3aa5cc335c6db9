// Tests for screencast payload parsing, CDP error detection and DevTools URL
// handling, without opening a WebSocket or browser.

#include "browser/cdp/cdp_driver.hpp"
#include "browser/cdp/cdp_frame_source.hpp"
#include "test_support.hpp"
#include "utils/base64.hpp"

#include <iostream>
#include <string>

using json = nlohmann::json;
using test_support::check;

namespace test_cdp_frame_source {

static bool test_parse_screencast_frame() {
    frames::EncodedImagePtr jpeg = test_support::encode_jpeg(test_support::solid_raster(16, 8, 10, 20, 30), 70);
    json params;
    params["data"] = base64::encode(*jpeg);
    params["sessionId"] = 7;
    params["metadata"] = {{"pageScaleFactor", 1.5}, {"offsetTop", 0}, {"scrollOffsetX", 0},
                          {"scrollOffsetY", 240}, {"deviceWidth", 1280}, {"deviceHeight", 800},
                          {"timestamp", 1700000000.25}};

    frames::RawFrame frame;
    int ack_session_id = 0;
    std::string error_detail;
    bool parsed = cdp_frame_source::parse_screencast_frame(params, "jpeg", frame, ack_session_id, error_detail);

    bool success = check(parsed && ack_session_id == 7, "Frame parses and yields the ack session id");
    success &= check(frame.encoded_image && *frame.encoded_image == *jpeg, "Image bytes are base64-decoded");
    success &= check(frame.mime_type == "image/jpeg", "MIME type follows the screencast format");
    success &= check(frame.capture_timestamp_ms == 1700000000250, "Metadata timestamp (seconds) becomes epoch ms");
    success &= check(frame.view_metadata.scroll_offset_y == 240 && frame.view_metadata.device_width == 1280 &&
                     frame.view_metadata.page_scale_factor == 1.5, "View metadata is passed through");
    return success;
}

static bool test_parse_screencast_frame_rejects_bad_data() {
    frames::RawFrame frame;
    int ack_session_id = 0;
    std::string error_detail;
    bool missing = !cdp_frame_source::parse_screencast_frame(json{{"sessionId", 3}}, "jpeg", frame,
                                                             ack_session_id, error_detail);
    bool success = check(missing && ack_session_id == 3 && !error_detail.empty(),
                         "Frame without data fails but still yields the ack id");

    error_detail.clear();
    bool garbage = !cdp_frame_source::parse_screencast_frame(json{{"sessionId", 4}, {"data", "@@@"}}, "png", frame,
                                                             ack_session_id, error_detail);
    success &= check(garbage && ack_session_id == 4 && !error_detail.empty(), "Invalid base64 is rejected");
    return success;
}

static bool test_command_failed() {
    std::string error_detail;
    bool success = check(!cdp_driver::command_failed(json{{"id", 1}, {"result", json::object()}}, error_detail),
                         "A result response is not a failure");
    success &= check(cdp_driver::command_failed(json{{"error", "timeout"}}, error_detail) && error_detail == "timeout",
                     "Transport error string is reported");
    success &= check(cdp_driver::command_failed(json{{"id", 2}, {"error", {{"code", -32000},
                                                                           {"message", "Cannot navigate"}}}},
                                                error_detail) && error_detail == "Cannot navigate",
                     "CDP error object message is reported");
    return success;
}

static bool test_parse_websocket_url() {
    cdp_driver::WebSocketEndpoint endpoint;
    bool success = check(cdp_driver::parse_websocket_url("ws://127.0.0.1:9333/devtools/browser/abc", endpoint) &&
                             endpoint.host == "127.0.0.1" && endpoint.port == 9333 &&
                             endpoint.path == "/devtools/browser/abc",
                         "Host, port and path are split");
    success &= check(cdp_driver::parse_websocket_url("ws://localhost:9222", endpoint) && endpoint.path == "/",
                     "Missing path defaults to /");
    success &= check(!cdp_driver::parse_websocket_url("http://127.0.0.1:9222/x", endpoint), "Other schemes are rejected");
    success &= check(!cdp_driver::parse_websocket_url("ws://127.0.0.1/x", endpoint), "Missing port is rejected");
    success &= check(!cdp_driver::parse_websocket_url("ws://127.0.0.1:92x2/x", endpoint), "Non-numeric port is rejected");
    success &= check(!cdp_driver::parse_websocket_url("ws://:9222/x", endpoint), "Empty host is rejected");
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_parse_screencast_frame();
    all_passed &= test_parse_screencast_frame_rejects_bad_data();
    all_passed &= test_command_failed();
    all_passed &= test_parse_websocket_url();
    return all_passed;
}

} // namespace test_cdp_frame_source
