#include "http/gateway_routes.hpp"

#include <exception>

#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/time_format.hpp"

namespace http {

static const std::string OAUTH_DISCOVERY_PATH = "/.well-known/oauth-authorization-server";

struct RouteEntry {
    const char *path;
    const char *methods; // Space separated.
};

static const RouteEntry ROUTE_TABLE[] = {
    {"/", "GET"},
    {"/health", "GET"},
    {"/mcp/tools", "GET"},
    {"/mcp/call", "POST"},
    {"/sse", "GET POST"},
    {"/message", "POST"},
    {"/.well-known/oauth-authorization-server", "GET"},
};

static const RouteEntry *find_route(const std::string &path) {
    for (const RouteEntry &entry : ROUTE_TABLE) {
        if (path == entry.path) {
            return &entry;
        }
    }
    return nullptr;
}

static bool route_accepts(const RouteEntry &entry, const std::string &method) {
    std::string methods = std::string(" ") + entry.methods + " ";
    return methods.find(" " + method + " ") != std::string::npos;
}

GatewayRoutes::GatewayRoutes(const config::ServerConfig &server_config, const mcp_tools::ToolRegistry &tools,
                             mcp_sessions::SessionRegistry &sessions, mcp_dispatch::Dispatcher &dispatcher,
                             request_log::RequestLog &request_log)
    : sessions_(sessions),
      tools_(tools),
      dispatcher_(dispatcher),
      request_log_(request_log),
      api_key_guard_(server_config),
      cors_policy_(server_config.cors_origins) {}

std::string GatewayRoutes::connection_id_of(const HttpRequest &request) {
    std::string connection_id = request.header("x-connection-id");
    if (connection_id.find_first_not_of(" \t") == std::string::npos) {
        return mcp_sessions::DEFAULT_CONNECTION_ID;
    }
    return connection_id;
}

RouteAction GatewayRoutes::classify(const HttpRequest &request) const {
    if (request.method == "GET" && request.path == "/sse" && api_key_guard_.check(request.headers)) {
        return RouteAction::kEventStream;
    }
    return RouteAction::kRespond;
}

HttpResponse GatewayRoutes::handle(const HttpRequest &request) {
    HttpResponse response;
    try {
        response = route(request);
    } catch (const std::exception &error) {
        debug_log::notice("Unhandled error on " + request.method + " " + request.path + ": " + error.what());
        response = HttpResponse::with_detail(500, std::string("Internal server error: ") + error.what());
    }
    cors_policy_.apply(request, response);
    return response;
}

HttpResponse GatewayRoutes::route(const HttpRequest &request) {
    if (request.method == "OPTIONS") {
        return cors_policy_.preflight(request);
    }

    const RouteEntry *entry = find_route(request.path);
    if (entry == nullptr) {
        return HttpResponse::with_detail(404, "Not Found");
    }
    if (!route_accepts(*entry, request.method)) {
        HttpResponse response = HttpResponse::with_detail(405, "Method Not Allowed");
        std::string allowed = entry->methods;
        for (char &character : allowed) {
            if (character == ' ') {
                character = ',';
            }
        }
        response.set_header("Allow", allowed);
        return response;
    }

    // Discovery is probed by clients before they hold any credentials.
    if (request.path == OAUTH_DISCOVERY_PATH) {
        return HttpResponse::with_detail(404, "OAuth not supported");
    }

    if (!api_key_guard_.check(request.headers)) {
        debug_log::log("Rejected " + request.method + " " + request.path + ": bad API key");
        return auth::ApiKeyGuard::reject();
    }

    if (request.path == "/") {
        log_request(request);
        return handle_root();
    }
    if (request.path == "/health") {
        log_request(request);
        return handle_health();
    }
    if (request.path == "/mcp/tools") {
        log_request(request);
        return handle_list_tools();
    }
    if (request.path == "/mcp/call") {
        return handle_mcp_call(request);
    }
    if (request.path == "/sse" && request.method == "GET") {
        // Streams are opened by the server through open_event_stream.
        return HttpResponse::with_detail(500, "Event stream requested through the wrong handler");
    }
    return handle_json_rpc(request, mcp_dispatch::Transport::kSsePost);
}

HttpResponse GatewayRoutes::handle_root() {
    json document;
    document["status"] = "ok";
    document["server"] = config::SERVER_NAME;
    document["message"] = "MCP Server is running";
    return HttpResponse::with_json(200, document);
}

HttpResponse GatewayRoutes::handle_health() {
    json document;
    document["status"] = "healthy";
    document["timestamp"] = time_format::iso8601_utc_now();
    return HttpResponse::with_json(200, document);
}

HttpResponse GatewayRoutes::handle_list_tools() {
    json document;
    document["tools"] = tools_.build_tools_list();
    return HttpResponse::with_json(200, document);
}

// POST /mcp/call serves two request shapes: a JSON-RPC envelope (recognized
// by its "jsonrpc" member) and the plain {tool, arguments} call.
HttpResponse GatewayRoutes::handle_mcp_call(const HttpRequest &request) {
    json body = json::parse(request.body, nullptr, false);
    if (body.is_discarded()) {
        log_request(request);
        return HttpResponse::with_detail(400, "Invalid JSON body");
    }
    if (body.is_object() && body.contains("jsonrpc")) {
        return handle_json_rpc(request, mcp_dispatch::Transport::kDirectHttp);
    }

    json extra;
    if (body.is_object() && body.contains("tool")) {
        extra["tool"] = body["tool"];
    }
    log_request(request, extra);
    return handle_legacy_call(body);
}

HttpResponse GatewayRoutes::handle_legacy_call(const json &body) {
    if (!body.is_object()) {
        return HttpResponse::with_detail(400, "Request body must be a JSON object");
    }
    if (!body.contains("tool") || !body["tool"].is_string() || body["tool"].get_ref<const std::string &>().empty()) {
        return HttpResponse::with_detail(400, "Tool name is required");
    }
    std::string tool_name = body["tool"].get<std::string>();

    json arguments = json::object();
    if (body.contains("arguments") && !body["arguments"].is_null()) {
        if (!body["arguments"].is_object()) {
            return HttpResponse::with_detail(400, "Tool arguments must be an object");
        }
        arguments = body["arguments"];
    }

    mcp_tools::ToolResult result;
    try {
        result = dispatcher_.call_tool(tool_name, arguments);
    } catch (const std::exception &error) {
        debug_log::notice("Tool " + tool_name + " raised: " + error.what());
        return HttpResponse::with_detail(500, std::string("Tool execution error: ") + error.what());
    }

    json document;
    document["result"] = result.to_text();
    return HttpResponse::with_json(200, document);
}

HttpResponse GatewayRoutes::handle_json_rpc(const HttpRequest &request, mcp_dispatch::Transport transport) {
    json_rpc::EnvelopeCheck envelope = json_rpc::parse_envelope(request.body);

    json extra;
    if (envelope.kind != json_rpc::EnvelopeKind::kInvalid) {
        extra["jsonrpc_method"] = envelope.method;
        extra["params"] = envelope.params;
    }
    log_request(request, extra);

    std::string connection_id = connection_id_of(request);
    mcp_dispatch::DispatchOutcome outcome = dispatcher_.dispatch_envelope(envelope, transport, connection_id);
    if (outcome.mirrored) {
        debug_log::log("Response mirrored to SSE session " + connection_id);
    }

    if (!outcome.has_body) {
        return HttpResponse::empty(outcome.http_status);
    }
    return HttpResponse::with_json(outcome.http_status, outcome.body);
}

EventStream GatewayRoutes::open_event_stream(const HttpRequest &request) {
    log_request(request);

    EventStream stream;
    stream.connection_id = connection_id_of(request);
    stream.queue = sessions_.get_or_create(stream.connection_id);

    stream.head.status = 200;
    stream.head.content_type = "text/event-stream";
    stream.head.set_header("Cache-Control", "no-cache");
    stream.head.set_header("Connection", "keep-alive");
    stream.head.set_header("X-Accel-Buffering", "no");
    cors_policy_.apply(request, stream.head);

    debug_log::notice("SSE stream opened for connection " + stream.connection_id);
    return stream;
}

void GatewayRoutes::log_request(const HttpRequest &request, const json &extra) {
    if (!request_log_.is_enabled()) {
        return;
    }
    json client_info;
    client_info["ip_address"] = request.peer_address;
    client_info["user_agent"] = request.header("user-agent");
    client_info["accept"] = request.header("accept");
    client_info["content_type"] = request.header("content-type");
    client_info["host"] = request.header("host");
    client_info["origin"] = request.header("origin");
    request_log_.log_http_request(request.path, request.method, client_info, extra);
}

} // namespace http
