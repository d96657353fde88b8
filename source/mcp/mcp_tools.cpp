#include "mcp/mcp_tools.hpp"

#include <utility>

namespace mcp_tools {

ToolResult ToolResult::ok(json payload) {
    ToolResult result;
    result.success = true;
    result.payload = std::move(payload);
    return result;
}

ToolResult ToolResult::failure(const std::string &message, json context) {
    ToolResult result;
    result.success = false;
    result.payload = context.is_object() ? std::move(context) : json::object();
    result.payload["error"] = message;
    result.payload["success"] = false;
    return result;
}

std::string ToolResult::error_message() const {
    if (success || !payload.contains("error") || !payload["error"].is_string()) {
        return "";
    }
    return payload["error"].get<std::string>();
}

std::string ToolResult::to_text() const {
    return payload.dump(2, ' ', false, json::error_handler_t::replace);
}

bool ToolRegistry::register_tool(ToolDefinition definition) {
    if (resolve(definition.name) != nullptr) {
        return false;
    }
    tools_.push_back(std::move(definition));
    return true;
}

json ToolRegistry::build_tools_list() const {
    json tools_array = json::array();
    for (const auto &tool : tools_) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }
    return tools_array;
}

const ToolDefinition *ToolRegistry::resolve(const std::string &tool_name) const {
    for (const auto &tool : tools_) {
        if (tool.name == tool_name) {
            return &tool;
        }
    }
    return nullptr;
}

ToolResult ToolRegistry::invoke(const std::string &tool_name, const json &arguments) const {
    const ToolDefinition *tool = resolve(tool_name);
    if (tool == nullptr) {
        return ToolResult::failure("Unknown tool: " + tool_name);
    }
    return tool->handler(arguments);
}

json build_call_result(const ToolResult &result) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = result.to_text();

    json call_result;
    call_result["content"] = json::array({text_content});
    call_result["isError"] = false;
    return call_result;
}

} // namespace mcp_tools
