#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <set>

using json = nlohmann::json;
using browser_action::ActionType;

// Tool handler for "browser_action".
// Runs one Computer Use style action and answers with the frame that settled
// after it (or the newest frame when nothing settled within max_wait_ms).

// Frames older than this are reported as stale when an action names them.
static const int64_t STALE_FRAME_AGE_MS = 10000;

static bool read_coordinate(const json &arguments, const char *name, const char *alias,
                            browser_action::Coordinate &out_coordinate, std::string &error_detail) {
    const char *key = arguments.contains(name) ? name : (alias != nullptr && arguments.contains(alias) ? alias : nullptr);
    if (key == nullptr) {
        error_detail = std::string("'") + name + "' is required";
        return false;
    }
    const json &value = arguments[key];
    if (!value.is_array() || value.size() != 2 || !value[0].is_number() || !value[1].is_number()) {
        error_detail = std::string("'") + name + "' must be [x, y]";
        return false;
    }
    out_coordinate.x = value[0].get<double>();
    out_coordinate.y = value[1].get<double>();
    return true;
}

static bool read_string(const json &arguments, const char *name, bool required, std::string &out_value,
                        std::string &error_detail) {
    if (!arguments.contains(name) || arguments[name].is_null()) {
        if (required) {
            error_detail = std::string("'") + name + "' is required";
        }
        return !required;
    }
    if (!arguments[name].is_string()) {
        error_detail = std::string("'") + name + "' must be a string";
        return false;
    }
    out_value = arguments[name].get<std::string>();
    if (required && out_value.empty()) {
        error_detail = std::string("'") + name + "' must not be empty";
        return false;
    }
    return true;
}

static bool read_seconds(const json &arguments, double &out_seconds, std::string &error_detail) {
    if (!arguments.contains("duration") || !arguments["duration"].is_number()) {
        error_detail = "'duration' (seconds) is required";
        return false;
    }
    out_seconds = arguments["duration"].get<double>();
    if (out_seconds < 0) {
        error_detail = "'duration' must not be negative";
        return false;
    }
    return true;
}

static bool read_click_modifier(const json &arguments, std::string &out_modifier, std::string &error_detail) {
    static const std::set<std::string> MODIFIERS = {"shift", "ctrl", "alt", "super", "meta"};
    if (!read_string(arguments, "text", false, out_modifier, error_detail)) {
        return false;
    }
    if (!out_modifier.empty() && MODIFIERS.count(out_modifier) == 0) {
        error_detail = "modifier must be one of shift, ctrl, alt, super, meta";
        return false;
    }
    return true;
}

namespace tool_browser_action {

bool parse_action_arguments(const json &arguments, browser_action::BrowserAction &out_action,
                            std::string &error_detail) {
    std::string action_name;
    if (!read_string(arguments, "action", true, action_name, error_detail)) {
        return false;
    }
    browser_action::BrowserAction action;
    if (!browser_action::parse_action_type(action_name, action.type)) {
        error_detail = "unknown action '" + action_name + "'";
        return false;
    }

    if (arguments.contains("based_on_frame_id") && arguments["based_on_frame_id"].is_number_integer()) {
        action.based_on_frame_id = arguments["based_on_frame_id"].get<int64_t>();
    }

    bool ok = true;
    switch (action.type) {
    case ActionType::Screenshot:
        break;
    case ActionType::LeftClick:
    case ActionType::RightClick:
        ok = read_coordinate(arguments, "coordinate", nullptr, action.coordinate, error_detail) &&
             read_click_modifier(arguments, action.text, error_detail);
        break;
    case ActionType::MiddleClick:
    case ActionType::DoubleClick:
    case ActionType::TripleClick:
    case ActionType::MouseMove:
    case ActionType::LeftMouseDown:
    case ActionType::LeftMouseUp:
        ok = read_coordinate(arguments, "coordinate", nullptr, action.coordinate, error_detail);
        break;
    case ActionType::LeftClickDrag:
        // The end point is "coordinate" in Computer Use, "end_coordinate" elsewhere.
        ok = read_coordinate(arguments, "start_coordinate", "startCoordinate", action.start_coordinate, error_detail) &&
             (arguments.contains("coordinate")
                  ? read_coordinate(arguments, "coordinate", nullptr, action.end_coordinate, error_detail)
                  : read_coordinate(arguments, "end_coordinate", "endCoordinate", action.end_coordinate, error_detail));
        break;
    case ActionType::Type:
    case ActionType::Key:
        ok = read_string(arguments, "text", true, action.text, error_detail);
        break;
    case ActionType::Scroll: {
        std::string direction;
        ok = read_coordinate(arguments, "coordinate", nullptr, action.coordinate, error_detail) &&
             read_string(arguments, "scroll_direction", true, direction, error_detail) &&
             read_click_modifier(arguments, action.text, error_detail);
        if (ok && !browser_action::parse_scroll_direction(direction, action.scroll_direction)) {
            error_detail = "scroll_direction must be up, down, left or right";
            ok = false;
        }
        if (ok && (!arguments.contains("scroll_amount") || !arguments["scroll_amount"].is_number() ||
                   arguments["scroll_amount"].get<double>() <= 0)) {
            error_detail = "'scroll_amount' must be a positive number";
            ok = false;
        }
        if (ok) {
            action.scroll_amount = static_cast<int>(arguments["scroll_amount"].get<double>());
            if (action.scroll_amount < 1) {
                action.scroll_amount = 1;
            }
        }
        break;
    }
    case ActionType::HoldKey:
        ok = read_string(arguments, "key", true, action.key, error_detail) &&
             read_seconds(arguments, action.duration_seconds, error_detail);
        break;
    case ActionType::Wait:
        ok = read_seconds(arguments, action.duration_seconds, error_detail);
        break;
    case ActionType::Navigate:
        ok = read_string(arguments, "url", true, action.url, error_detail);
        break;
    case ActionType::Zoom: {
        const json region = arguments.value("region", json());
        ok = region.is_array() && region.size() == 4;
        for (size_t index = 0; ok && index < 4; index++) {
            ok = region[index].is_number();
        }
        if (!ok) {
            error_detail = "'region' must be [x1, y1, x2, y2]";
            break;
        }
        for (size_t index = 0; index < 4; index++) {
            action.region.push_back(region[index].get<double>());
        }
        break;
    }
    }
    if (!ok) {
        error_detail = action_name + ": " + error_detail;
        return false;
    }
    out_action = action;
    return true;
}

} // namespace tool_browser_action

static json handle_browser_action(const json &arguments) {
    std::shared_ptr<stream_controller::Session> session = tool_handlers::controller().active_session();
    if (!session) {
        return tool_handlers::no_active_session_error();
    }

    browser_action::BrowserAction action;
    std::string error_detail;
    if (!tool_browser_action::parse_action_arguments(arguments, action, error_detail)) {
        return mcp_tools::text_result("Invalid action: " + error_detail, true);
    }

    std::string stale_note;
    if (action.based_on_frame_id > 0 && session->buffer->is_frame_stale(action.based_on_frame_id, STALE_FRAME_AGE_MS)) {
        stale_note = " Note: frame " + std::to_string(action.based_on_frame_id) +
                     " was stale when the action ran; check the frame below.";
    }

    frame_buffer::FrameActionResult result = tool_handlers::controller().execute_action(action);
    std::string action_name = browser_action::action_type_name(action.type);

    switch (result.outcome) {
    case frame_buffer::ActionOutcome::ActionFailed:
        return mcp_tools::text_result("Action failed: " + result.error_detail, true);
    case frame_buffer::ActionOutcome::NoFrameAvailable:
        return tool_handlers::application_error(json_rpc::NO_FRAME_AVAILABLE, result.error_detail);
    case frame_buffer::ActionOutcome::Cancelled:
        return tool_handlers::application_error(json_rpc::CANCELLED, result.error_detail);
    default:
        break;
    }

    std::string text = "Action \"" + action_name + "\" completed (" + frame_buffer::outcome_name(result.outcome) +
                       ", " + std::to_string(result.latency_ms) + " ms). Visual change: " +
                       (result.caused_change ? "Yes" : "No") + "." + stale_note;

    // The screenshot action carries its own capture.
    if (action.type == ActionType::Screenshot && !result.action_result.screenshot_base64.empty()) {
        json content = json::array();
        content.push_back({{"type", "text"}, {"text", text}});
        if (result.after_frame) {
            content.push_back({{"type", "text"}, {"text", tool_handlers::frame_summary(result.after_frame)}});
        }
        content.push_back({{"type", "image"},
                           {"data", result.action_result.screenshot_base64},
                           {"mimeType", result.action_result.screenshot_mime_type}});
        return json{{"content", content}, {"isError", false}};
    }
    if (!result.has_after_frame()) {
        return mcp_tools::text_result(text, false);
    }
    return tool_handlers::frame_result(result.after_frame, text);
}

namespace tool_browser_action {

void register_tool() {
    json coordinate_schema = {
        {"type", "array"},
        {"items", {{"type", "number"}}},
        {"minItems", 2},
        {"maxItems", 2}
    };

    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["action"] = {
        {"type", "string"},
        {"enum", json::array({"screenshot", "left_click", "right_click", "middle_click", "double_click",
                              "triple_click", "mouse_move", "left_mouse_down", "left_mouse_up",
                              "left_click_drag", "type", "key", "scroll", "hold_key", "wait", "navigate",
                              "zoom"})},
        {"description", "The action to perform."}
    };
    input_schema["properties"]["coordinate"] = coordinate_schema;
    input_schema["properties"]["coordinate"]["description"] =
        "Viewport coordinates [x, y] for clicks, mouse moves and scroll; end point for left_click_drag.";
    input_schema["properties"]["start_coordinate"] = coordinate_schema;
    input_schema["properties"]["start_coordinate"]["description"] = "Start point for left_click_drag.";
    input_schema["properties"]["text"] = {
        {"type", "string"},
        {"description", "Text to type, key combination for key (e.g. ctrl+shift+p), or a modifier "
                        "(shift, ctrl, alt, super, meta) held during clicks and scroll."}
    };
    input_schema["properties"]["scroll_direction"] = {
        {"type", "string"},
        {"enum", json::array({"up", "down", "left", "right"})}
    };
    input_schema["properties"]["scroll_amount"] = {
        {"type", "number"},
        {"description", "Scroll distance in units of 100 px."}
    };
    input_schema["properties"]["key"] = {
        {"type", "string"},
        {"description", "Key to hold for hold_key."}
    };
    input_schema["properties"]["duration"] = {
        {"type", "number"},
        {"description", "Seconds, for wait and hold_key."}
    };
    input_schema["properties"]["url"] = {
        {"type", "string"},
        {"description", "URL for navigate."}
    };
    input_schema["properties"]["region"] = {
        {"type", "array"},
        {"items", {{"type", "number"}}},
        {"minItems", 4},
        {"maxItems", 4},
        {"description", "[x1, y1, x2, y2] for zoom."}
    };
    input_schema["properties"]["based_on_frame_id"] = {
        {"type", "integer"},
        {"description", "Id of the frame the action was decided on; a stale frame is reported."}
    };
    input_schema["required"] = json::array({"action"});

    mcp_tools::register_tool({
        "browser_action",
        "Perform an action in the browser (Computer Use action names). "
        "Waits until the page settles after the action and returns that frame with its id "
        "and whether the action caused a visual change. "
        "A browser session must be active (call browser_start first).",
        input_schema,
        handle_browser_action
    });
}

} // namespace tool_browser_action
