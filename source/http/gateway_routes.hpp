#ifndef TOOLGATE_GATEWAY_ROUTES_HPP
#define TOOLGATE_GATEWAY_ROUTES_HPP

// The gateway's HTTP surface, independent of the socket layer.
//
//   GET  /                      liveness
//   GET  /health                health with timestamp
//   GET  /mcp/tools             tool catalogue
//   POST /mcp/call              JSON-RPC (direct transport) or legacy {tool, arguments}
//   POST /sse, POST /message    JSON-RPC, mirrored onto the caller's SSE session
//   GET  /sse                   event stream (opened by the server through open_event_stream)
//   GET  /.well-known/oauth-authorization-server   404, OAuth is not offered
//
// Every response passes through the CORS policy. Everything except OPTIONS
// preflight and OAuth discovery requires the API key when one is configured.

#include <string>

#include "auth/api_key_guard.hpp"
#include "config/server_config.hpp"
#include "http/cors_policy.hpp"
#include "http/http_types.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_sessions.hpp"
#include "mcp/mcp_tools.hpp"
#include "utils/request_log.hpp"

namespace http {

enum class RouteAction {
    kRespond,      // Answer with handle().
    kEventStream,  // Authorized GET /sse: answer with open_event_stream().
};

struct EventStream {
    std::string connection_id;
    mcp_sessions::QueueHandle queue;
    // Status line and headers for the stream; the body is the frame sequence.
    HttpResponse head;
};

class GatewayRoutes {
public:
    GatewayRoutes(const config::ServerConfig &server_config, const mcp_tools::ToolRegistry &tools,
                  mcp_sessions::SessionRegistry &sessions, mcp_dispatch::Dispatcher &dispatcher,
                  request_log::RequestLog &request_log);

    RouteAction classify(const HttpRequest &request) const;

    // Produce the complete response for a request classified kRespond.
    // May block for as long as a tool runs.
    HttpResponse handle(const HttpRequest &request);

    // Subscribe the caller's connection id (get or create its session).
    EventStream open_event_stream(const HttpRequest &request);

    // X-Connection-ID, or the default id when absent or blank.
    static std::string connection_id_of(const HttpRequest &request);

private:
    HttpResponse route(const HttpRequest &request);
    HttpResponse handle_root();
    HttpResponse handle_health();
    HttpResponse handle_list_tools();
    HttpResponse handle_mcp_call(const HttpRequest &request);
    HttpResponse handle_legacy_call(const json &body);
    HttpResponse handle_json_rpc(const HttpRequest &request, mcp_dispatch::Transport transport);

    // Access log entry, with JSON-RPC method and params when known.
    void log_request(const HttpRequest &request, const json &extra = json::object());

    mcp_sessions::SessionRegistry &sessions_;
    const mcp_tools::ToolRegistry &tools_;
    mcp_dispatch::Dispatcher &dispatcher_;
    request_log::RequestLog &request_log_;
    auth::ApiKeyGuard api_key_guard_;
    CorsPolicy cors_policy_;
};

} // namespace http

#endif // TOOLGATE_GATEWAY_ROUTES_HPP
