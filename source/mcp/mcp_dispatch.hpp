#ifndef TOOLGATE_MCP_DISPATCH_HPP
#define TOOLGATE_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch.
// Routes validated envelopes to the method handlers, decides the HTTP status
// for the transport the envelope arrived on, and mirrors responses onto the
// matching SSE session when the envelope came through the SSE POST path.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

#include "mcp/mcp_sessions.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"

namespace mcp_dispatch {

using json = nlohmann::json;

// The path an envelope arrived on.
enum class Transport {
    kDirectHttp,  // POST /mcp/call: answered synchronously, never touches sessions.
    kSsePost,     // POST /sse or /message: answered synchronously and mirrored.
};

struct DispatchOutcome {
    int http_status = 200;
    // False for notification acknowledgements, which carry no body.
    bool has_body = false;
    json body;
    // True when the response was also pushed onto an SSE session queue.
    bool mirrored = false;
};

// One completed tool invocation, reported to the observer (request log).
struct ToolCallRecord {
    std::string tool_name;
    json arguments;
    mcp_tools::ToolResult result;
    std::string started_at;
    std::string finished_at;
};

using ToolCallObserver = std::function<void(const ToolCallRecord &record)>;

class Dispatcher {
public:
    Dispatcher(const mcp_tools::ToolRegistry &tools, mcp_sessions::SessionRegistry &sessions);

    // Called after every tool invocation made through call_tool.
    void set_tool_call_observer(ToolCallObserver observer);

    // Parse, classify and dispatch a raw request body.
    DispatchOutcome dispatch_body(const std::string &raw_body, Transport transport,
                                  const std::string &connection_id);

    // Dispatch an already classified envelope (invalid ones become error responses).
    DispatchOutcome dispatch_envelope(const json_rpc::EnvelopeCheck &envelope, Transport transport,
                                      const std::string &connection_id);

    // Invoke a tool by name and notify the observer. Exceptions from the tool
    // propagate to the caller.
    mcp_tools::ToolResult call_tool(const std::string &tool_name, const json &arguments);

private:
    json handle_initialize(const json &request_id, const json &params);
    json handle_tools_list(const json &request_id, const json &params);
    json handle_tools_call(const json &request_id, const json &params);

    DispatchOutcome route(const json_rpc::EnvelopeCheck &envelope, Transport transport);

    const mcp_tools::ToolRegistry &tools_;
    mcp_sessions::SessionRegistry &sessions_;
    ToolCallObserver tool_call_observer_;
};

} // namespace mcp_dispatch

#endif // TOOLGATE_MCP_DISPATCH_HPP
