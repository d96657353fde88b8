#include "tool_handlers/tool_handlers.hpp"

#include "utils/debug_log.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_get_current_time { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_get_current_date { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_calculate { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_get_timezone_info { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_generate_random_number {
void register_tool(mcp_tools::ToolRegistry &registry, const config::ServerConfig &server_config);
}
namespace tool_format_number { void register_tool(mcp_tools::ToolRegistry &registry); }
namespace tool_execute_command {
void register_tool(mcp_tools::ToolRegistry &registry, const config::ServerConfig &server_config);
}

namespace tool_handlers {

void register_all_tools(mcp_tools::ToolRegistry &registry, const config::ServerConfig &server_config) {
    tool_get_current_time::register_tool(registry);
    tool_get_current_date::register_tool(registry);
    tool_calculate::register_tool(registry);
    tool_get_timezone_info::register_tool(registry);
    tool_generate_random_number::register_tool(registry, server_config);
    tool_format_number::register_tool(registry);
    tool_execute_command::register_tool(registry, server_config);

    debug_log::log("Registered " + std::to_string(registry.registered_tools().size()) + " tools");
}

} // namespace tool_handlers
