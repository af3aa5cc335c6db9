#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "capture_frame".
// Takes a screenshot now and forwards it through the sampler, so it gets the
// next frame id and lands in the buffer like any other frame.

static json handle_capture_frame(const json &arguments) {
    (void)arguments;

    if (!tool_handlers::controller().is_active()) {
        return tool_handlers::no_active_session_error();
    }
    frame_sampler::CaptureNowResult capture = tool_handlers::controller().capture_screenshot();
    if (!capture.success) {
        return mcp_tools::text_result("Capture failed: " + capture.error_detail, true);
    }
    return tool_handlers::frame_result(capture.frame);
}

namespace tool_capture_frame {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    mcp_tools::register_tool({
        "capture_frame",
        "Capture the viewport immediately, even when nothing changed, and return it as a new frame.",
        input_schema,
        handle_capture_frame
    });
}

} // namespace tool_capture_frame
