#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "browser_start".
// Launches Chrome with the server's stream configuration (headless and the
// viewport can be overridden per session), starts the screencast and returns
// the first frame.

static json handle_browser_start(const json &arguments) {
    stream_config::StreamConfig session_config = tool_handlers::controller().config();
    if (arguments.contains("headless") && arguments["headless"].is_boolean()) {
        session_config.headless = arguments["headless"].get<bool>();
    }
    session_config.viewport_width = static_cast<int>(
        tool_handlers::integer_argument(arguments, "viewport_width", session_config.viewport_width));
    session_config.viewport_height = static_cast<int>(
        tool_handlers::integer_argument(arguments, "viewport_height", session_config.viewport_height));

    std::string url;
    if (arguments.contains("url") && arguments["url"].is_string()) {
        url = arguments["url"].get<std::string>();
    }

    debug_log::log("browser_start invoked url=" + url);
    stream_controller::StartResult start_result = tool_handlers::controller().start(url, session_config);
    if (!start_result.success) {
        std::string text = start_result.message;
        if (!start_result.error_detail.empty()) {
            text += " Detail: " + start_result.error_detail;
        }
        return mcp_tools::text_result(text, true);
    }
    if (!start_result.first_frame) {
        return mcp_tools::text_result(start_result.message + " No frame has been captured yet.", false);
    }
    return tool_handlers::frame_result(start_result.first_frame, start_result.message);
}

namespace tool_browser_start {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["url"] = {
        {"type", "string"},
        {"description", "Initial URL to navigate to (default about:blank)."}
    };
    input_schema["properties"]["headless"] = {
        {"type", "boolean"},
        {"description", "Run Chrome headless. Defaults to the server configuration."}
    };
    input_schema["properties"]["viewport_width"] = {
        {"type", "integer"},
        {"description", "Viewport width in CSS pixels for this session."}
    };
    input_schema["properties"]["viewport_height"] = {
        {"type", "integer"},
        {"description", "Viewport height in CSS pixels for this session."}
    };
    input_schema["required"] = json::array();

    mcp_tools::register_tool({
        "browser_start",
        "Start a browser session with an optional URL and begin streaming frames. "
        "Returns the initial frame. Only one session can be active; call browser_stop first to start another.",
        input_schema,
        handle_browser_start
    });
}

} // namespace tool_browser_start
