#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "utils/debug_log.hpp"
#include "utils/time_format.hpp"

#include <nlohmann/json.hpp>
#include <ctime>
#include <string>

using json = nlohmann::json;

// Tool handler for "get_timezone_info".
// Looks the zone up in the system zoneinfo database and reports the current reading there.

static mcp_tools::ToolResult handle_get_timezone_info(const json &arguments) {
    std::string zone_name = "UTC";
    std::string argument_error;
    if (!tool_arguments::optional_string(arguments, "timezone", zone_name, argument_error)) {
        return mcp_tools::ToolResult::failure(argument_error);
    }

    debug_log::log("get_timezone_info invoked for " + zone_name);

    time_format::ZoneTime reading;
    if (!time_format::zone_time(std::time(nullptr), zone_name, reading)) {
        json context;
        context["available_timezones"] =
            "Use an IANA time zone name such as 'UTC', 'America/New_York' or 'Europe/London'";
        return mcp_tools::ToolResult::failure("Unknown timezone: " + zone_name, context);
    }

    json payload;
    payload["timezone"] = zone_name;
    payload["current_time"] = reading.current_time;
    payload["utc_offset"] = reading.utc_offset;
    payload["is_dst"] = reading.is_dst;
    return mcp_tools::ToolResult::ok(payload);
}

namespace tool_get_timezone_info {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["timezone"] = {
        {"type", "string"},
        {"description", "Timezone name (e.g., 'UTC', 'America/New_York', 'Europe/London')"},
        {"default", "UTC"}
    };
    input_schema["required"] = json::array();

    registry.register_tool({
        "get_timezone_info",
        "Get information about a timezone",
        input_schema,
        handle_get_timezone_info
    });
}

} // namespace tool_get_timezone_info
