#ifndef FRAMESYNC_MCP_STDIO_HPP
#define FRAMESYNC_MCP_STDIO_HPP

// MCP stdio transport. Messages are newline-delimited JSON on stdin/stdout;
// a message pretty-printed over several lines is accepted as well. stderr is
// left for logs.

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace mcp_stdio {

// Messages larger than this are discarded (a screenshot-sized request is far below).
constexpr size_t MAX_MESSAGE_BYTES = 16 * 1024 * 1024;

// Splits an input stream into JSON texts. Lines are joined until the braces and
// brackets opened outside string literals are balanced.
class MessageReader {
public:
    explicit MessageReader(std::istream &input) : input(input) {}

    // Next complete message, or false on end of input. A truncated message at
    // end of input is returned as-is so the caller can answer with a parse error.
    bool next(std::string &out_message);

    size_t discarded_count() const { return discarded; }

private:
    std::istream &input;
    size_t discarded = 0;
};

// Net nesting depth change of one line, tracking string state across lines.
int nesting_delta(const std::string &line, bool &inside_string, bool &escape_next);

// Reads the next message from stdin. Empty on EOF.
std::string read_message();

// Writes one message and a newline to stdout, then flushes. Safe to call from
// several threads.
void write_message(const std::string &json_string);
void write_message(std::ostream &output, const std::string &json_string);

// "[framesync] <message>" on stderr.
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // FRAMESYNC_MCP_STDIO_HPP
