#ifndef FRAMESYNC_JSON_RPC_HPP
#define FRAMESYNC_JSON_RPC_HPP

// JSON-RPC 2.0 message handling for the MCP stdio server: envelope checks,
// field access and response construction (nlohmann/json).

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

constexpr const char *VERSION = "2.0";

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Application error codes, reported inside tool error text ("[-32003] ...").
constexpr int NO_FRAME_AVAILABLE = -32001;
constexpr int CANCELLED = -32002;
constexpr int NO_ACTIVE_SESSION = -32003;

// "no_frame_available" etc.; empty for codes outside the application range.
std::string application_error_name(int error_code);

enum class MessageKind {
    Request,
    Notification,
    Response,
    Invalid
};

struct EnvelopeCheck {
    MessageKind kind = MessageKind::Invalid;
    std::string error_detail; // set when kind == Invalid
};

// Classifies one message. A request needs "jsonrpc": "2.0", a string method and
// a string, integer or null id; a notification is the same without "id". Objects
// carrying "result" or "error" are responses (a client answering us).
EnvelopeCheck check_envelope(const json &message);

json build_response(const json &request_id, const json &result_payload);
json build_error_response(const json &request_id, int error_code, const std::string &error_message);
json build_error_response(const json &request_id, int error_code, const std::string &error_message,
                          const json &error_data);

// Parse error for input that could not be parsed at all (id is null).
json build_parse_error_response(const std::string &detail);

// Method name, or empty if missing.
std::string get_method(const json &message);

// The id, or a null json when missing.
json get_id(const json &message);

// The params object, or an empty object when missing or not an object.
json get_params(const json &message);

bool is_notification(const json &message);

} // namespace json_rpc

#endif // FRAMESYNC_JSON_RPC_HPP
