#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_browser_stop(const json &arguments) {
    (void)arguments;

    if (!tool_handlers::controller().is_active()) {
        return mcp_tools::text_result("No active browser session.", false);
    }
    debug_log::log("browser_stop invoked");
    tool_handlers::controller().stop();
    return mcp_tools::text_result("Browser session stopped.", false);
}

namespace tool_browser_stop {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    mcp_tools::register_tool({
        "browser_stop",
        "Stop the browser session: pending waits are cancelled, streaming stops and the Chrome process "
        "is terminated. Call browser_start again for a fresh session.",
        input_schema,
        handle_browser_stop
    });
}

} // namespace tool_browser_stop
