#ifndef FRAMESYNC_MCP_DISPATCH_HPP
#define FRAMESYNC_MCP_DISPATCH_HPP

// MCP method routing: initialize, ping, tools/list, tools/call.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace mcp_dispatch {

using json = nlohmann::json;

// Protocol revisions this server speaks, oldest first. initialize answers with
// the client's revision when it is listed, otherwise with the newest.
const std::vector<std::string> &supported_protocol_versions();

// Handles one message or a JSON-RPC batch (array). Returns the response, an
// array of responses for a batch, or a null json when nothing is to be sent
// (notifications, client responses, batches of notifications).
json dispatch_message(const json &message);

// Parses raw text and dispatches it; unparseable text yields a parse error response.
json dispatch_text(const std::string &raw_message);

// True once initialize succeeded; protocol_version() is then the negotiated revision.
bool is_initialized();
std::string protocol_version();

// Forgets the handshake (tests).
void reset();

} // namespace mcp_dispatch

#endif // FRAMESYNC_MCP_DISPATCH_HPP
