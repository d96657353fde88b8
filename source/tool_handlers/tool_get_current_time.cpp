#include "mcp/mcp_tools.hpp"
#include "utils/debug_log.hpp"
#include "utils/time_format.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>

using json = nlohmann::json;

// Tool handler for "get_current_time".
// Reports the same instant as UTC, server-local wall time, epoch seconds and ISO 8601.

static mcp_tools::ToolResult handle_get_current_time(const json &arguments) {
    (void)arguments;
    debug_log::log("get_current_time invoked");

    std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    json payload;
    payload["utc_time"] = time_format::format_tm(time_format::utc_tm(seconds), "%Y-%m-%d %H:%M:%S UTC");
    payload["local_time"] = time_format::format_tm(time_format::local_tm(seconds), "%Y-%m-%d %H:%M:%S");
    payload["unix_timestamp"] = static_cast<int64_t>(seconds);
    payload["iso_format"] = time_format::iso8601_utc(now);
    return mcp_tools::ToolResult::ok(payload);
}

namespace tool_get_current_time {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["required"] = json::array();

    registry.register_tool({
        "get_current_time",
        "Get the current time in UTC and local timezone",
        input_schema,
        handle_get_current_time
    });
}

} // namespace tool_get_current_time
