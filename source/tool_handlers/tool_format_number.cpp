#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <cstdio>
#include <string>

using json = nlohmann::json;

// Tool handler for "format_number".
// Fixed-point or scientific rendering of a number with a chosen precision.

constexpr int64_t MAX_DECIMALS = 20;

static std::string render_number(double number, int decimals, bool scientific) {
    // Largest fixed rendering: 309 integral digits, sign, point, 20 decimals.
    char buffer[400];
    int written = std::snprintf(buffer, sizeof(buffer), scientific ? "%.*e" : "%.*f", decimals, number);
    if (written < 0) {
        return "";
    }
    return std::string(buffer, static_cast<size_t>(written) < sizeof(buffer) ? written : sizeof(buffer) - 1);
}

static mcp_tools::ToolResult handle_format_number(const json &arguments) {
    if (!tool_arguments::is_present(arguments, "number") || !arguments["number"].is_number()) {
        return mcp_tools::ToolResult::failure("number is required and must be a number");
    }
    double number = arguments["number"].get<double>();

    int64_t decimals = 2;
    bool scientific = false;
    std::string argument_error;
    if (!tool_arguments::optional_integer(arguments, "decimals", decimals, argument_error) ||
        decimals < 0 || decimals > MAX_DECIMALS) {
        return mcp_tools::ToolResult::failure("decimals must be an integer between 0 and " +
                                              std::to_string(MAX_DECIMALS));
    }
    if (!tool_arguments::optional_boolean(arguments, "scientific", scientific, argument_error)) {
        return mcp_tools::ToolResult::failure(argument_error);
    }

    debug_log::log("format_number invoked");

    json payload;
    payload["original"] = arguments["number"];
    payload["formatted"] = render_number(number, static_cast<int>(decimals), scientific);
    payload["decimals"] = decimals;
    payload["scientific_notation"] = scientific;
    return mcp_tools::ToolResult::ok(payload);
}

namespace tool_format_number {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["number"] = {
        {"type", "number"},
        {"description", "The number to format"}
    };
    input_schema["properties"]["decimals"] = {
        {"type", "integer"},
        {"description", "Digits after the decimal point"},
        {"default", 2},
        {"minimum", 0},
        {"maximum", MAX_DECIMALS}
    };
    input_schema["properties"]["scientific"] = {
        {"type", "boolean"},
        {"description", "Use scientific notation"},
        {"default", false}
    };
    input_schema["required"] = json::array({"number"});

    registry.register_tool({
        "format_number",
        "Format a number with a fixed number of decimals or in scientific notation",
        input_schema,
        handle_format_number
    });
}

} // namespace tool_format_number
