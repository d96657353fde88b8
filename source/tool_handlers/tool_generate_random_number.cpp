#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "utils/debug_log.hpp"

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

using json = nlohmann::json;

// Tool handler for "generate_random_number".
// Draws count independent uniform floats from [min_value, max_value].
// Not suitable for anything that needs unpredictable numbers.

static std::mutex g_generator_mutex;

static std::mt19937_64 &generator() {
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

static double draw_uniform(double min_value, double max_value) {
    std::lock_guard<std::mutex> lock(g_generator_mutex);
    std::uniform_real_distribution<double> distribution(min_value, max_value);
    return distribution(generator());
}

// Echo a bound as the caller sent it, keeping integers integral.
static json echo_bound(const json &arguments, const char *name, double fallback) {
    if (tool_arguments::is_present(arguments, name)) {
        return arguments[name];
    }
    return static_cast<int64_t>(fallback);
}

static mcp_tools::ToolResult handle_generate_random_number(const json &arguments, int64_t max_count) {
    double min_value = 1;
    double max_value = 100;
    int64_t count = 1;
    std::string argument_error;

    if (!tool_arguments::optional_number(arguments, "min_value", min_value, argument_error) ||
        !tool_arguments::optional_number(arguments, "max_value", max_value, argument_error)) {
        return mcp_tools::ToolResult::failure(argument_error);
    }
    if (!(min_value < max_value)) {
        return mcp_tools::ToolResult::failure("min_value must be less than max_value");
    }
    if (!std::isfinite(max_value - min_value)) {
        return mcp_tools::ToolResult::failure("range between min_value and max_value is too large");
    }

    std::string count_error = "count must be an integer between 1 and " + std::to_string(max_count);
    if (!tool_arguments::optional_integer(arguments, "count", count, argument_error) ||
        count < 1 || count > max_count) {
        return mcp_tools::ToolResult::failure(count_error);
    }

    debug_log::log("generate_random_number invoked, count " + std::to_string(count));

    json payload;
    if (count == 1) {
        payload["random_number"] = draw_uniform(min_value, max_value);
        payload["min_value"] = echo_bound(arguments, "min_value", 1);
        payload["max_value"] = echo_bound(arguments, "max_value", 100);
        payload["type"] = "single";
        return mcp_tools::ToolResult::ok(payload);
    }

    json random_numbers = json::array();
    for (int64_t index = 0; index < count; ++index) {
        random_numbers.push_back(draw_uniform(min_value, max_value));
    }
    payload["random_numbers"] = random_numbers;
    payload["count"] = count;
    payload["min_value"] = echo_bound(arguments, "min_value", 1);
    payload["max_value"] = echo_bound(arguments, "max_value", 100);
    payload["type"] = "multiple";
    return mcp_tools::ToolResult::ok(payload);
}

namespace tool_generate_random_number {

void register_tool(mcp_tools::ToolRegistry &registry, const config::ServerConfig &server_config) {
    int64_t max_count = server_config.max_random_numbers;

    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["min_value"] = {
        {"type", "number"},
        {"description", "Minimum value (inclusive)"},
        {"default", 1}
    };
    input_schema["properties"]["max_value"] = {
        {"type", "number"},
        {"description", "Maximum value (inclusive)"},
        {"default", 100}
    };
    input_schema["properties"]["count"] = {
        {"type", "integer"},
        {"description", "Number of random numbers to generate"},
        {"default", 1},
        {"minimum", 1},
        {"maximum", max_count}
    };
    input_schema["required"] = json::array();

    registry.register_tool({
        "generate_random_number",
        "Generate a random number within a specified range",
        input_schema,
        [max_count](const json &arguments) { return handle_generate_random_number(arguments, max_count); }
    });
}

} // namespace tool_generate_random_number
