#ifndef TOOLGATE_TOOL_HANDLERS_HPP
#define TOOLGATE_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"

namespace tool_handlers {

// Register every tool with the registry, in listing order.
void register_all_tools(mcp_tools::ToolRegistry &registry, const config::ServerConfig &server_config);

} // namespace tool_handlers

#endif // TOOLGATE_TOOL_HANDLERS_HPP
