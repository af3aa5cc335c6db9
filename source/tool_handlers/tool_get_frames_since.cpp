#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Tool handler for "get_frames_since".
// Lists buffered frames newer than an id; images are attached only on request
// since a full buffer is a lot of payload.

static json handle_get_frames_since(const json &arguments) {
    int64_t frame_id = tool_handlers::integer_argument(arguments, "frame_id", 0);
    bool include_images = arguments.contains("include_images") && arguments["include_images"].is_boolean() &&
                          arguments["include_images"].get<bool>();

    std::shared_ptr<stream_controller::Session> session = tool_handlers::controller().active_session();
    if (!session) {
        return tool_handlers::no_active_session_error();
    }
    std::vector<frames::FramePtr> newer = session->buffer->since(frame_id);

    json content = json::array();
    content.push_back({{"type", "text"},
                       {"text", std::to_string(newer.size()) + " frame(s) newer than " + std::to_string(frame_id) + "."}});
    for (const frames::FramePtr &frame : newer) {
        content.push_back({{"type", "text"}, {"text", tool_handlers::frame_summary(frame)}});
        if (include_images) {
            content.push_back(tool_handlers::image_content(frame));
        }
    }

    json result;
    result["content"] = content;
    result["isError"] = false;
    return result;
}

namespace tool_get_frames_since {

void register_tool() {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["frame_id"] = {
        {"type", "integer"},
        {"description", "Exclusive lower bound; 0 lists the whole buffer."}
    };
    input_schema["properties"]["include_images"] = {
        {"type", "boolean"},
        {"description", "Attach each frame's image (default false)."}
    };
    input_schema["required"] = json::array();

    mcp_tools::register_tool({
        "get_frames_since",
        "List the buffered frames with ids greater than frame_id, oldest first.",
        input_schema,
        handle_get_frames_since
    });
}

} // namespace tool_get_frames_since
