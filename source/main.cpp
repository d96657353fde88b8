// toolgate – MCP tool gateway over HTTP and Server-Sent Events.
// Entry point: load configuration, register tools, serve until SIGINT/SIGTERM.
//
// Logs go to stderr; request details go to the request log file.

#include <csignal>
#include <iostream>
#include <string>

#include "config/server_config.hpp"
#include "http/gateway_routes.hpp"
#include "http/http_server.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_sessions.hpp"
#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/request_log.hpp"
#include "utils/time_format.hpp"

// Exit status for unusable configuration.
constexpr int EXIT_CONFIG_ERROR = 2;

// Server instance the signal handler stops.
static http::HttpServer *running_server = nullptr;

static void signal_handler(int signal_number) {
    (void)signal_number;
    if (running_server != nullptr) {
        running_server->request_stop();
    }
}

int main() {
    std::cerr << "[toolgate] toolgate – MCP tool gateway " << config::SERVER_VERSION << ", build " << __DATE__
              << " " << __TIME__ << std::endl;

    config::ServerConfig server_config;
    try {
        server_config = config::load_from_environment();
    } catch (const config::ConfigError &error) {
        std::cerr << "[toolgate] Configuration error: " << error.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    // Read every environment-derived setting now; once requests are served,
    // only the timezone tool touches the environment (see time_format).
    debug_log::is_debug_enabled();
    time_format::zoneinfo_directory();
    platform::capture_environment();

    if (server_config.api_key.empty()) {
        debug_log::notice("MCP_API_KEY is not set; requests are not authenticated.");
    }

    mcp_tools::ToolRegistry tools;
    tool_handlers::register_all_tools(tools, server_config);

    mcp_sessions::SessionRegistry sessions;
    request_log::RequestLog request_log(server_config.log_file);

    mcp_dispatch::Dispatcher dispatcher(tools, sessions);
    dispatcher.set_tool_call_observer(
        [&request_log](const mcp_dispatch::ToolCallRecord &record) { request_log.log_tool_call(record); });

    http::GatewayRoutes routes(server_config, tools, sessions, dispatcher, request_log);
    http::HttpServer server(server_config, routes, sessions);

    if (!server.start()) {
        return 1;
    }

    running_server = &server;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // A client vanishing mid-write must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    debug_log::notice(std::to_string(tools.registered_tools().size()) + " tools available. Waiting for requests.");
    server.run();

    running_server = nullptr;
    return 0;
}
