#include "tool_handlers/tool_handlers.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/base64.hpp"

#include <cstdio>
#include <stdexcept>

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_browser_start { void register_tool(); }
namespace tool_browser_action { void register_tool(); }
namespace tool_browser_stop { void register_tool(); }
namespace tool_browser_status { void register_tool(); }
namespace tool_browser_recover { void register_tool(); }
namespace tool_get_latest_frame { void register_tool(); }
namespace tool_get_frame { void register_tool(); }
namespace tool_get_frames_since { void register_tool(); }
namespace tool_wait_for_next_frame { void register_tool(); }
namespace tool_wait_for_stable_frame { void register_tool(); }
namespace tool_capture_frame { void register_tool(); }
namespace tool_update_stream_config { void register_tool(); }

namespace tool_handlers {

static stream_controller::StreamController *registered_controller = nullptr;

void register_all_tools(stream_controller::StreamController &controller) {
    registered_controller = &controller;

    tool_browser_start::register_tool();
    tool_browser_action::register_tool();
    tool_browser_stop::register_tool();
    tool_browser_status::register_tool();
    tool_browser_recover::register_tool();
    tool_get_latest_frame::register_tool();
    tool_get_frame::register_tool();
    tool_get_frames_since::register_tool();
    tool_wait_for_next_frame::register_tool();
    tool_wait_for_stable_frame::register_tool();
    tool_capture_frame::register_tool();
    tool_update_stream_config::register_tool();
}

stream_controller::StreamController &controller() {
    if (registered_controller == nullptr) {
        throw std::logic_error("tool handlers used before register_all_tools()");
    }
    return *registered_controller;
}

std::string frame_summary(const frames::FramePtr &frame) {
    char delta_text[32];
    std::snprintf(delta_text, sizeof(delta_text), "%.2f", frame->delta_percent);
    return "Frame " + std::to_string(frame->id) +
           " | changed: " + (frame->changed ? "yes" : "no") +
           " | delta: " + delta_text + "%" +
           " | keep-alive: " + (frame->keep_alive ? "yes" : "no") +
           " | captured_at_ms: " + std::to_string(frame->captured_at_ms);
}

json image_content(const frames::FramePtr &frame) {
    json image;
    image["type"] = "image";
    image["data"] = frame->pixels ? base64::encode(*frame->pixels) : std::string();
    image["mimeType"] = frame->mime_type;
    return image;
}

json frame_result(const frames::FramePtr &frame, const std::string &leading_text) {
    json content = json::array();
    if (!leading_text.empty()) {
        content.push_back({{"type", "text"}, {"text", leading_text}});
    }
    content.push_back({{"type", "text"}, {"text", frame_summary(frame)}});
    content.push_back(image_content(frame));

    json result;
    result["content"] = content;
    result["isError"] = false;
    return result;
}

json application_error(int error_code, const std::string &message) {
    json error_content;
    error_content["type"] = "text";
    error_content["text"] = "[" + std::to_string(error_code) + "] " +
                            json_rpc::application_error_name(error_code) + ": " + message;

    json result;
    result["content"] = json::array({error_content});
    result["isError"] = true;
    return result;
}

json no_active_session_error() {
    return application_error(json_rpc::NO_ACTIVE_SESSION, "No active browser session. Use browser_start first.");
}

int64_t integer_argument(const json &arguments, const char *name, int64_t default_value) {
    if (!arguments.contains(name) || arguments[name].is_null()) {
        return default_value;
    }
    if (!arguments[name].is_number_integer()) {
        throw std::invalid_argument(std::string("'") + name + "' must be an integer");
    }
    return arguments[name].get<int64_t>();
}

} // namespace tool_handlers
