#include "mcp/mcp_stdio.hpp"

#include <iostream>
#include <mutex>

#include "utils/debug_log.hpp"

namespace mcp_stdio {

static std::mutex output_mutex;

int nesting_delta(const std::string &line, bool &inside_string, bool &escape_next) {
    int delta = 0;
    for (char character : line) {
        if (escape_next) {
            escape_next = false;
            continue;
        }
        if (inside_string) {
            if (character == '\\') {
                escape_next = true;
            } else if (character == '"') {
                inside_string = false;
            }
            continue;
        }
        switch (character) {
        case '"':
            inside_string = true;
            break;
        case '{':
        case '[':
            delta++;
            break;
        case '}':
        case ']':
            delta--;
            break;
        default:
            break;
        }
    }
    return delta;
}

static bool blank(const std::string &line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

bool MessageReader::next(std::string &out_message) {
    std::string message;
    std::string line;
    int depth = 0;
    bool inside_string = false;
    bool escape_next = false;
    bool oversized = false;

    while (std::getline(input, line)) {
        if (message.empty() && blank(line)) {
            continue;
        }
        depth += nesting_delta(line, inside_string, escape_next);
        if (!oversized) {
            if (!message.empty()) {
                message += '\n';
            }
            message += line;
            if (message.size() > MAX_MESSAGE_BYTES) {
                oversized = true;
                message.clear();
                message.shrink_to_fit();
            }
        }
        if (depth > 0 || inside_string) {
            continue;
        }
        if (oversized) {
            discarded++;
            debug_log::warn("discarded an incoming message larger than " + std::to_string(MAX_MESSAGE_BYTES) +
                            " bytes");
            depth = 0;
            inside_string = false;
            escape_next = false;
            oversized = false;
            continue;
        }
        out_message = message;
        return true;
    }

    if (!message.empty()) {
        out_message = message;
        return true;
    }
    return false;
}

std::string read_message() {
    static MessageReader stdin_reader(std::cin);
    std::string message;
    if (!stdin_reader.next(message)) {
        return "";
    }
    return message;
}

void write_message(std::ostream &output, const std::string &json_string) {
    std::lock_guard<std::mutex> lock(output_mutex);
    output << json_string << '\n';
    output.flush();
}

void write_message(const std::string &json_string) {
    write_message(std::cout, json_string);
}

void log_message(const std::string &message) {
    std::cerr << "[framesync] " << message << std::endl;
}

} // namespace mcp_stdio
