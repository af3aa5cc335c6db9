#include "mcp/mcp_dispatch.hpp"

#include <algorithm>
#include <mutex>

#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

namespace mcp_dispatch {

static const std::string SERVER_NAME = "framesync";
static const std::string SERVER_VERSION = "0.1.0";
static const std::string SERVER_INSTRUCTIONS =
    "Streams a live Chrome viewport as sampled frames and synchronizes agent "
    "actions with the frames they cause. Start with browser_start, act with "
    "browser_action (Computer Use action names), and read frames with "
    "get_latest_frame, wait_for_next_frame or wait_for_stable_frame. Every "
    "frame has an id; pass it as based_on_frame_id to be told when it was stale.";

static std::mutex state_mutex;
static bool initialized = false;
static std::string negotiated_version;

const std::vector<std::string> &supported_protocol_versions() {
    static const std::vector<std::string> VERSIONS = {"2024-11-05", "2025-03-26", "2025-06-18"};
    return VERSIONS;
}

static json handle_initialize(const json &request_id, const json &params) {
    const std::vector<std::string> &versions = supported_protocol_versions();
    std::string version = versions.back();
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string()) {
        std::string requested = params["protocolVersion"].get<std::string>();
        if (std::find(versions.begin(), versions.end(), requested) != versions.end()) {
            version = requested;
        } else {
            debug_log::warn("client asked for protocol " + requested + ", answering with " + version);
        }
    }
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        debug_log::log("client: " + params["clientInfo"].value("name", std::string("?")) + " " +
                       params["clientInfo"].value("version", std::string("")));
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        initialized = true;
        negotiated_version = version;
    }

    json result;
    result["protocolVersion"] = version;
    result["capabilities"] = {{"tools", {{"listChanged", false}}}};
    result["serverInfo"] = {{"name", SERVER_NAME}, {"version", SERVER_VERSION}};
    result["instructions"] = SERVER_INSTRUCTIONS;
    return json_rpc::build_response(request_id, result);
}

static json handle_tools_call(const json &request_id, const json &params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "tools/call needs a string 'name'");
    }
    std::string tool_name = params["name"].get<std::string>();

    json arguments = json::object();
    if (params.contains("arguments")) {
        if (!params["arguments"].is_object() && !params["arguments"].is_null()) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                  "'arguments' must be an object");
        }
        if (params["arguments"].is_object()) {
            arguments = params["arguments"];
        }
    }
    if (!mcp_tools::has_tool(tool_name)) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, "Unknown tool: " + tool_name);
    }
    return json_rpc::build_response(request_id, mcp_tools::dispatch_tool_call(tool_name, arguments));
}

static void handle_notification(const std::string &method, const json &params) {
    if (method == "notifications/initialized") {
        debug_log::log("client finished initialization");
    } else if (method == "notifications/cancelled") {
        // Tool calls run to completion; every wait they do is bounded.
        debug_log::log("client cancelled request " + params.value("requestId", json()).dump());
    } else {
        debug_log::log("ignoring notification " + method);
    }
}

static json dispatch_single(const json &message) {
    json_rpc::EnvelopeCheck check = json_rpc::check_envelope(message);
    switch (check.kind) {
    case json_rpc::MessageKind::Invalid:
        return json_rpc::build_error_response(json_rpc::get_id(message), json_rpc::INVALID_REQUEST,
                                              "Invalid request: " + check.error_detail);
    case json_rpc::MessageKind::Response:
        debug_log::log("ignoring client response for id " + message["id"].dump());
        return nullptr;
    case json_rpc::MessageKind::Notification:
        handle_notification(json_rpc::get_method(message), json_rpc::get_params(message));
        return nullptr;
    case json_rpc::MessageKind::Request:
        break;
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }
    if (!is_initialized()) {
        debug_log::warn(method + " before initialize");
    }
    if (method == "tools/list") {
        return json_rpc::build_response(request_id, mcp_tools::build_tools_list_response());
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }
    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND, "Unknown method: " + method);
}

json dispatch_message(const json &message) {
    if (!message.is_array()) {
        return dispatch_single(message);
    }
    if (message.empty()) {
        return json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST, "Invalid request: empty batch");
    }
    json responses = json::array();
    for (const json &entry : message) {
        json response = dispatch_single(entry);
        if (!response.is_null()) {
            responses.push_back(response);
        }
    }
    if (responses.empty()) {
        return nullptr;
    }
    return responses;
}

json dispatch_text(const std::string &raw_message) {
    json parsed;
    try {
        parsed = json::parse(raw_message);
    } catch (const json::parse_error &error) {
        debug_log::warn("failed to parse incoming JSON: " + std::string(error.what()));
        return json_rpc::build_parse_error_response(error.what());
    }
    return dispatch_message(parsed);
}

bool is_initialized() {
    std::lock_guard<std::mutex> lock(state_mutex);
    return initialized;
}

std::string protocol_version() {
    std::lock_guard<std::mutex> lock(state_mutex);
    return negotiated_version;
}

void reset() {
    std::lock_guard<std::mutex> lock(state_mutex);
    initialized = false;
    negotiated_version.clear();
}

} // namespace mcp_dispatch
