#include "mcp/mcp_tools.hpp"

#include "utils/debug_log.hpp"

#include <algorithm>

namespace mcp_tools {

static std::vector<ToolDefinition> registered_tools;

static std::vector<ToolDefinition>::iterator find_tool(const std::string &tool_name) {
    return std::find_if(registered_tools.begin(), registered_tools.end(),
                        [&tool_name](const ToolDefinition &tool) { return tool.name == tool_name; });
}

void register_tool(const ToolDefinition &definition) {
    auto existing = find_tool(definition.name);
    if (existing != registered_tools.end()) {
        debug_log::warn("tool " + definition.name + " registered twice, keeping the newer handler");
        *existing = definition;
        return;
    }
    registered_tools.push_back(definition);
}

bool has_tool(const std::string &tool_name) {
    return find_tool(tool_name) != registered_tools.end();
}

json build_tools_list_response() {
    json tools_array = json::array();
    for (const auto &tool : registered_tools) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json dispatch_tool_call(const std::string &tool_name, const json &arguments) {
    auto found = find_tool(tool_name);
    if (found == registered_tools.end()) {
        return text_result("Unknown tool: " + tool_name, true);
    }

    debug_log::log("tools/call " + tool_name);
    try {
        return found->handler(arguments);
    } catch (const json::exception &error) {
        return text_result("Invalid arguments for " + tool_name + ": " + error.what(), true);
    } catch (const std::exception &error) {
        debug_log::error(tool_name + " failed: " + error.what());
        return text_result("Error: " + std::string(error.what()), true);
    }
}

json text_result(const std::string &text, bool is_error) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text;

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = is_error;
    return result;
}

void clear_registered_tools() {
    registered_tools.clear();
}

const std::vector<ToolDefinition> &get_registered_tools() {
    return registered_tools;
}

} // namespace mcp_tools
