#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_get_latest_frame(const json &arguments) {
    (void)arguments;

    std::shared_ptr<stream_controller::Session> session = tool_handlers::controller().active_session();
    if (!session) {
        return tool_handlers::no_active_session_error();
    }
    frames::FramePtr frame = session->buffer->latest();
    if (!frame) {
        return tool_handlers::application_error(json_rpc::NO_FRAME_AVAILABLE, "no frame has been captured yet");
    }
    return tool_handlers::frame_result(frame);
}

namespace tool_get_latest_frame {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    mcp_tools::register_tool({
        "get_latest_frame",
        "Return the newest buffered frame (image plus id, change flag and delta) without waiting.",
        input_schema,
        handle_get_latest_frame
    });
}

} // namespace tool_get_latest_frame
