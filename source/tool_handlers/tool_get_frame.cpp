#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static json handle_get_frame(const json &arguments) {
    if (!arguments.contains("frame_id") || !arguments["frame_id"].is_number_integer()) {
        return mcp_tools::text_result("Missing required parameter 'frame_id' (integer).", true);
    }
    int64_t frame_id = arguments["frame_id"].get<int64_t>();

    std::shared_ptr<stream_controller::Session> session = tool_handlers::controller().active_session();
    if (!session) {
        return tool_handlers::no_active_session_error();
    }
    frames::FramePtr frame = session->buffer->by_id(frame_id);
    if (!frame) {
        return tool_handlers::application_error(json_rpc::NO_FRAME_AVAILABLE,
                                                "frame " + std::to_string(frame_id) + " is not buffered");
    }
    return tool_handlers::frame_result(frame);
}

namespace tool_get_frame {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["frame_id"] = {
        {"type", "integer"},
        {"description", "Id of a frame that is still in the buffer."}
    };
    input_schema["required"] = json::array({"frame_id"});

    mcp_tools::register_tool({
        "get_frame",
        "Return a buffered frame by id. Only the most recent frames are kept; older ids are reported as unavailable.",
        input_schema,
        handle_get_frame
    });
}

} // namespace tool_get_frame
