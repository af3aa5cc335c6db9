#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_browser_status(const json &arguments) {
    (void)arguments;
    return mcp_tools::text_result(tool_handlers::controller().status_json().dump(2), false);
}

namespace tool_browser_status {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    mcp_tools::register_tool({
        "browser_status",
        "Get the browser session status as JSON: whether a session is active and streaming, the current URL, "
        "the stream configuration, sampler statistics (captured, forwarded and dropped frames, average "
        "forward interval, current frame id) and buffer statistics.",
        input_schema,
        handle_browser_status
    });
}

} // namespace tool_browser_status
