#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "update_stream_config".
// delta_threshold_percent and keep_alive_ms apply to the running session;
// other stream settings are kept for the next browser_start. "paused"
// pauses or resumes the screencast without closing the browser.

static json handle_update_stream_config(const json &arguments) {
    json changes = arguments;
    json paused = nullptr;
    if (changes.contains("paused")) {
        paused = changes["paused"];
        changes.erase("paused");
        if (!paused.is_boolean()) {
            return mcp_tools::text_result("'paused' must be a boolean.", true);
        }
    }

    std::string text;
    if (!changes.empty()) {
        stream_controller::ControlResult update = tool_handlers::controller().update_config(changes);
        if (!update.success) {
            return mcp_tools::text_result(update.message + " " + update.error_detail, true);
        }
        text = update.message;
    }

    if (paused.is_boolean()) {
        stream_controller::ControlResult toggle = paused.get<bool>() ? tool_handlers::controller().pause_streaming()
                                                                     : tool_handlers::controller().resume_streaming();
        if (!toggle.success) {
            if (!tool_handlers::controller().is_active()) {
                return tool_handlers::no_active_session_error();
            }
            return mcp_tools::text_result("Could not change streaming state: " + toggle.error_detail, true);
        }
        text += (text.empty() ? "" : " ") + toggle.message;
    }

    if (text.empty()) {
        text = "Nothing to update.";
    }
    debug_log::log("update_stream_config: " + text);
    return mcp_tools::text_result(text, false);
}

namespace tool_update_stream_config {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["delta_threshold_percent"] = {
        {"type", "number"},
        {"description", "Percent of changed pixels (0-100) at which a frame counts as changed. Applies immediately."}
    };
    input_schema["properties"]["keep_alive_ms"] = {
        {"type", "integer"},
        {"description", "Forward a frame at least this often even without changes. Applies immediately."}
    };
    input_schema["properties"]["jpeg_quality"] = {
        {"type", "integer"},
        {"description", "Screencast JPEG quality 1-100 (next session)."}
    };
    input_schema["properties"]["max_buffer_size"] = {
        {"type", "integer"},
        {"description", "Frames kept in the buffer (next session)."}
    };
    input_schema["properties"]["stability_wait_ms"] = {
        {"type", "integer"},
        {"description", "Settle time before a post-action frame is accepted (next session)."}
    };
    input_schema["properties"]["max_wait_ms"] = {
        {"type", "integer"},
        {"description", "Upper bound on the post-action wait (next session)."}
    };
    input_schema["properties"]["paused"] = {
        {"type", "boolean"},
        {"description", "true pauses the screencast, false resumes it. The browser stays open."}
    };
    input_schema["required"] = json::array();

    mcp_tools::register_tool({
        "update_stream_config",
        "Change stream settings. delta_threshold_percent and keep_alive_ms take effect on the running session; "
        "other settings apply from the next browser_start. Also pauses or resumes streaming.",
        input_schema,
        handle_update_stream_config
    });
}

} // namespace tool_update_stream_config
