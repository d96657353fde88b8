#include "mcp/mcp_dispatch.hpp"

#include <exception>
#include <utility>

#include "config/server_config.hpp"
#include "utils/debug_log.hpp"
#include "utils/time_format.hpp"

namespace mcp_dispatch {

static const std::string NOTIFICATION_PREFIX = "notifications/";

static DispatchOutcome respond(int http_status, json body) {
    DispatchOutcome outcome;
    outcome.http_status = http_status;
    outcome.has_body = true;
    outcome.body = std::move(body);
    return outcome;
}

Dispatcher::Dispatcher(const mcp_tools::ToolRegistry &tools, mcp_sessions::SessionRegistry &sessions)
    : tools_(tools), sessions_(sessions) {}

void Dispatcher::set_tool_call_observer(ToolCallObserver observer) {
    tool_call_observer_ = std::move(observer);
}

// Handle the "initialize" request.
json Dispatcher::handle_initialize(const json &request_id, const json &params) {
    (void)params; // Any client capabilities are accepted.

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = config::SERVER_NAME;
    server_info["version"] = config::SERVER_VERSION;

    json result;
    result["protocolVersion"] = config::PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/list" request.
json Dispatcher::handle_tools_list(const json &request_id, const json &params) {
    (void)params;
    json result;
    result["tools"] = tools_.build_tools_list();
    return json_rpc::build_response(request_id, result);
}

// Handle the "tools/call" request. Tool-level failures are ordinary results;
// only a fault escaping the tool becomes a JSON-RPC error.
json Dispatcher::handle_tools_call(const json &request_id, const json &params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string() ||
        params["name"].get_ref<const std::string &>().empty()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, "Tool name is required");
    }
    std::string tool_name = params["name"].get<std::string>();

    json arguments = json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                                  "Tool arguments must be an object");
        }
        arguments = params["arguments"];
    }

    try {
        mcp_tools::ToolResult tool_result = call_tool(tool_name, arguments);
        return json_rpc::build_response(request_id, mcp_tools::build_call_result(tool_result));
    } catch (const std::exception &error) {
        debug_log::notice("Tool " + tool_name + " raised: " + error.what());
        return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                              std::string("Tool execution error: ") + error.what());
    }
}

mcp_tools::ToolResult Dispatcher::call_tool(const std::string &tool_name, const json &arguments) {
    ToolCallRecord record;
    record.tool_name = tool_name;
    record.arguments = arguments;
    record.started_at = time_format::iso8601_utc_now();

    debug_log::log("tools/call " + tool_name);
    record.result = tools_.invoke(tool_name, arguments);
    record.finished_at = time_format::iso8601_utc_now();

    if (tool_call_observer_) {
        tool_call_observer_(record);
    }
    return record.result;
}

DispatchOutcome Dispatcher::route(const json_rpc::EnvelopeCheck &envelope, Transport transport) {
    if (envelope.kind == json_rpc::EnvelopeKind::kInvalid) {
        return respond(400, json_rpc::build_error_response(envelope.id, envelope.error_code,
                                                           envelope.error_message));
    }

    // Notifications (including unknown methods and every notifications/*
    // method) are acknowledged without a response body.
    if (envelope.kind == json_rpc::EnvelopeKind::kNotification) {
        if (envelope.method.compare(0, NOTIFICATION_PREFIX.size(), NOTIFICATION_PREFIX) != 0) {
            debug_log::log("Acknowledging notification for unhandled method: " + envelope.method);
        }
        DispatchOutcome outcome;
        outcome.http_status = 200;
        return outcome;
    }

    if (envelope.method == "initialize") {
        return respond(200, handle_initialize(envelope.id, envelope.params));
    }
    if (envelope.method == "tools/list") {
        return respond(200, handle_tools_list(envelope.id, envelope.params));
    }
    if (envelope.method == "tools/call") {
        return respond(200, handle_tools_call(envelope.id, envelope.params));
    }

    // Unknown method on a request.
    int status = (transport == Transport::kSsePost) ? 404 : 200;
    return respond(status, json_rpc::build_error_response(envelope.id, json_rpc::METHOD_NOT_FOUND,
                                                          "Method not found: " + envelope.method));
}

DispatchOutcome Dispatcher::dispatch_envelope(const json_rpc::EnvelopeCheck &envelope, Transport transport,
                                              const std::string &connection_id) {
    DispatchOutcome outcome;
    try {
        outcome = route(envelope, transport);
    } catch (const std::exception &error) {
        debug_log::notice(std::string("Internal error while dispatching: ") + error.what());
        outcome = respond(500, json_rpc::build_error_response(envelope.id, json_rpc::INTERNAL_ERROR,
                                                              std::string("Internal error: ") + error.what()));
    }

    // Mirror onto the SSE session. A parse error has no request identity and
    // is only ever returned to the sender.
    bool is_parse_error = (envelope.kind == json_rpc::EnvelopeKind::kInvalid &&
                           envelope.error_code == json_rpc::PARSE_ERROR);
    if (transport == Transport::kSsePost && outcome.has_body && !is_parse_error) {
        outcome.mirrored = sessions_.push_if_present(connection_id, outcome.body);
    }
    return outcome;
}

DispatchOutcome Dispatcher::dispatch_body(const std::string &raw_body, Transport transport,
                                          const std::string &connection_id) {
    return dispatch_envelope(json_rpc::parse_envelope(raw_body), transport, connection_id);
}

} // namespace mcp_dispatch
