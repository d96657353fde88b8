#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "utils/debug_log.hpp"
#include "utils/time_format.hpp"

#include <nlohmann/json.hpp>
#include <ctime>
#include <string>

using json = nlohmann::json;

// Tool handler for "get_current_date".
// Formats today's date (server-local) in the requested style and lists every style.

static mcp_tools::ToolResult handle_get_current_date(const json &arguments) {
    std::string format_name = "iso";
    std::string argument_error;
    if (!tool_arguments::optional_string(arguments, "format", format_name, argument_error)) {
        return mcp_tools::ToolResult::failure(argument_error);
    }

    debug_log::log("get_current_date invoked with format " + format_name);

    std::time_t seconds = std::time(nullptr);
    std::tm local = time_format::local_tm(seconds);

    json all_formats;
    all_formats["iso"] = time_format::format_tm(local, "%Y-%m-%d");
    all_formats["us"] = time_format::format_tm(local, "%m/%d/%Y");
    all_formats["european"] = time_format::format_tm(local, "%d/%m/%Y");
    all_formats["unix"] = std::to_string(static_cast<long long>(seconds));

    if (!all_formats.contains(format_name)) {
        json context;
        context["format"] = format_name;
        return mcp_tools::ToolResult::failure(
            "Invalid format: " + format_name + ". Use one of: iso, us, european, unix", context);
    }

    json payload;
    payload["date"] = all_formats[format_name];
    payload["format"] = format_name;
    payload["all_formats"] = all_formats;
    payload["day_of_week"] = time_format::format_tm(local, "%A");
    payload["day_of_year"] = local.tm_yday + 1;
    payload["unix_timestamp"] = static_cast<int64_t>(seconds);
    payload["iso_format"] = all_formats["iso"];
    return mcp_tools::ToolResult::ok(payload);
}

namespace tool_get_current_date {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["format"] = {
        {"type", "string"},
        {"description", "Date format: 'iso', 'us', 'european', or 'unix'"},
        {"enum", json::array({"iso", "us", "european", "unix"})},
        {"default", "iso"}
    };
    input_schema["required"] = json::array();

    registry.register_tool({
        "get_current_date",
        "Get the current date in various formats",
        input_schema,
        handle_get_current_date
    });
}

} // namespace tool_get_current_date
