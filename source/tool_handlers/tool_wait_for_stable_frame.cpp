#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

static const int64_t DEFAULT_DURATION_MS = 500;
static const int64_t DEFAULT_TIMEOUT_MS = 5000;
static const int64_t MAX_TIMEOUT_MS = 60000;

static json handle_wait_for_stable_frame(const json &arguments) {
    int64_t duration_ms = tool_handlers::integer_argument(arguments, "duration_ms", DEFAULT_DURATION_MS);
    int64_t timeout_ms = tool_handlers::integer_argument(arguments, "timeout_ms", DEFAULT_TIMEOUT_MS);
    duration_ms = std::max<int64_t>(0, std::min(duration_ms, MAX_TIMEOUT_MS));
    timeout_ms = std::max<int64_t>(0, std::min(timeout_ms, MAX_TIMEOUT_MS));

    std::shared_ptr<stream_controller::Session> session = tool_handlers::controller().active_session();
    if (!session) {
        return tool_handlers::no_active_session_error();
    }
    frame_buffer::FrameWaitResult wait_result =
        session->buffer->wait_for_stable_frame(static_cast<int>(duration_ms), static_cast<int>(timeout_ms));
    if (wait_result.status == frame_buffer::WaitStatus::Cancelled) {
        return tool_handlers::application_error(json_rpc::CANCELLED, wait_result.error_detail);
    }
    if (!wait_result.success) {
        return tool_handlers::application_error(json_rpc::NO_FRAME_AVAILABLE, wait_result.error_detail);
    }
    std::string text = wait_result.status == frame_buffer::WaitStatus::Ok
                           ? "Page stable for " + std::to_string(duration_ms) + " ms."
                           : "Page still changing after " + std::to_string(timeout_ms) + " ms; newest frame returned.";
    return tool_handlers::frame_result(wait_result.frame, text);
}

namespace tool_wait_for_stable_frame {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["duration_ms"] = {
        {"type", "integer"},
        {"description", "How long the page must show no significant change (default 500)."}
    };
    input_schema["properties"]["timeout_ms"] = {
        {"type", "integer"},
        {"description", "Maximum wait in milliseconds (default 5000, at most 60000)."}
    };
    input_schema["required"] = json::array();

    mcp_tools::register_tool({
        "wait_for_stable_frame",
        "Block until the page has not changed significantly for duration_ms and return the newest frame. "
        "On timeout the newest frame is returned anyway.",
        input_schema,
        handle_wait_for_stable_frame
    });
}

} // namespace tool_wait_for_stable_frame
