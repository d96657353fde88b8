#ifndef TOOLGATE_MCP_TOOLS_HPP
#define TOOLGATE_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and invocation of tools.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// Outcome of a single tool invocation. Either a success payload or a failure
// payload that always carries "error" and "success": false. Both are delivered
// to the client as one text content block inside a normal tools/call result.
struct ToolResult {
    bool success = true;
    json payload = json::object();

    static ToolResult ok(json payload);

    // context holds extra fields echoed next to the error (e.g. the command).
    static ToolResult failure(const std::string &message, json context = json::object());

    // The "error" member of a failure payload; empty for successes.
    std::string error_message() const;

    // Payload rendered as 2-space indented JSON.
    std::string to_text() const;
};

// A tool handler function: receives the arguments object, returns the outcome.
// Handlers report bad input and expected runtime problems as failures; an
// exception escaping a handler is treated as an unexpected fault by the caller.
using ToolHandler = std::function<ToolResult(const json &arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

// Ordered set of tools. Populated during startup, read-only while serving;
// the registration order is the listing order.
class ToolRegistry {
public:
    // Register a tool. Returns false (and ignores the definition) if the name is taken.
    bool register_tool(ToolDefinition definition);

    // [{name, description, inputSchema}, ...] in registration order.
    json build_tools_list() const;

    // The tool with this name, or nullptr.
    const ToolDefinition *resolve(const std::string &tool_name) const;

    // Run a tool by name. An unknown name yields a failure result.
    ToolResult invoke(const std::string &tool_name, const json &arguments) const;

    const std::vector<ToolDefinition> &registered_tools() const { return tools_; }

private:
    std::vector<ToolDefinition> tools_;
};

// Build the tools/call result payload for an invocation outcome:
// {"content": [{"type": "text", "text": ...}], "isError": false}.
json build_call_result(const ToolResult &result);

} // namespace mcp_tools

#endif // TOOLGATE_MCP_TOOLS_HPP
