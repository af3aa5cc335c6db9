#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_recover".
// Restarts the session at the URL it was last on, for a browser that crashed
// or stopped producing frames.

static json handle_browser_recover(const json &arguments) {
    (void)arguments;

    debug_log::log("browser_recover invoked");
    stream_controller::StartResult start_result = tool_handlers::controller().recover();
    if (!start_result.success) {
        std::string text = "Recovery failed: " + start_result.message;
        if (!start_result.error_detail.empty()) {
            text += " Detail: " + start_result.error_detail;
        }
        return mcp_tools::text_result(text, true);
    }
    std::string text = "Session recovered at " + start_result.url + ".";
    if (!start_result.first_frame) {
        return mcp_tools::text_result(text, false);
    }
    return tool_handlers::frame_result(start_result.first_frame, text);
}

namespace tool_browser_recover {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    mcp_tools::register_tool({
        "browser_recover",
        "Stop the current browser session (if any) and start a new one at the last known URL. "
        "Frame ids restart from 1.",
        input_schema,
        handle_browser_recover
    });
}

} // namespace tool_browser_recover
