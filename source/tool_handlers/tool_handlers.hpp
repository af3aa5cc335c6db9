#ifndef FRAMESYNC_TOOL_HANDLERS_HPP
#define FRAMESYNC_TOOL_HANDLERS_HPP

// Tool handler registration and the helpers the tool_*.cpp files share.
// Each tool_*.cpp file provides a register function that is called during startup.

#include <nlohmann/json.hpp>
#include <string>

#include "browser/browser_action.hpp"
#include "frames/frame_types.hpp"
#include "session/stream_controller.hpp"

namespace tool_handlers {

using json = nlohmann::json;

// Register all available tool handlers with the MCP tool registry. The
// controller must outlive the registry.
void register_all_tools(stream_controller::StreamController &controller);

// The controller passed to register_all_tools. Throws std::logic_error before that.
stream_controller::StreamController &controller();

// "Frame 12 | changed: yes | delta: 4.21% | keep-alive: no | captured_at_ms: ..."
std::string frame_summary(const frames::FramePtr &frame);

// MCP image content item for the frame.
json image_content(const frames::FramePtr &frame);

// Tool result: the summary line (after an optional leading text) plus the image.
json frame_result(const frames::FramePtr &frame, const std::string &leading_text = "");

// isError result "[-32003] no_active_session: <message>".
json application_error(int error_code, const std::string &message);
json no_active_session_error();

// Integer argument, or default_value when absent. Throws std::invalid_argument
// when present but not an integer.
int64_t integer_argument(const json &arguments, const char *name, int64_t default_value);

} // namespace tool_handlers

namespace tool_browser_action {

// Maps browser_action tool arguments (Computer Use shape: "action",
// "coordinate": [x, y], "text", "scroll_direction", ...) onto a BrowserAction.
// Returns false with error_detail for unknown actions or missing fields.
bool parse_action_arguments(const nlohmann::json &arguments, browser_action::BrowserAction &out_action,
                            std::string &error_detail);

} // namespace tool_browser_action

#endif // FRAMESYNC_TOOL_HANDLERS_HPP
