#include "protocol/json_rpc.hpp"

namespace json_rpc {

std::string application_error_name(int error_code) {
    switch (error_code) {
    case NO_FRAME_AVAILABLE:
        return "no_frame_available";
    case CANCELLED:
        return "cancelled";
    case NO_ACTIVE_SESSION:
        return "no_active_session";
    default:
        return "";
    }
}

static bool valid_id(const json &id) {
    return id.is_string() || id.is_number_integer() || id.is_null();
}

EnvelopeCheck check_envelope(const json &message) {
    EnvelopeCheck check;
    if (!message.is_object()) {
        check.error_detail = "message must be a JSON object";
        return check;
    }
    if (!message.contains("jsonrpc") || message["jsonrpc"] != VERSION) {
        check.error_detail = "\"jsonrpc\" must be \"2.0\"";
        return check;
    }
    if (!message.contains("method")) {
        if (message.contains("id") && (message.contains("result") || message.contains("error"))) {
            check.kind = MessageKind::Response;
        } else {
            check.error_detail = "missing \"method\"";
        }
        return check;
    }
    if (!message["method"].is_string() || message["method"].get<std::string>().empty()) {
        check.error_detail = "\"method\" must be a non-empty string";
        return check;
    }
    if (message.contains("params") && !message["params"].is_object() && !message["params"].is_array()) {
        check.error_detail = "\"params\" must be an object or an array";
        return check;
    }
    if (!message.contains("id")) {
        check.kind = MessageKind::Notification;
        return check;
    }
    if (!valid_id(message["id"])) {
        check.error_detail = "\"id\" must be a string, an integer or null";
        return check;
    }
    check.kind = MessageKind::Request;
    return check;
}

json build_response(const json &request_id, const json &result_payload) {
    return json{{"jsonrpc", VERSION}, {"id", request_id}, {"result", result_payload}};
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json error;
    error["code"] = error_code;
    error["message"] = error_message;
    return json{{"jsonrpc", VERSION}, {"id", request_id}, {"error", error}};
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    response["error"]["data"] = error_data;
    return response;
}

json build_parse_error_response(const std::string &detail) {
    return build_error_response(nullptr, PARSE_ERROR, "Parse error", json{{"detail", detail}});
}

std::string get_method(const json &message) {
    if (message.is_object() && message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.is_object() && message.contains("id") && valid_id(message["id"])) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.is_object() && message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return message.is_object() && !message.contains("id");
}

} // namespace json_rpc
