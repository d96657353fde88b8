// Tests for the computational tools, called through the registry the way
// tools/call reaches them.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_handlers.hpp"

using json = nlohmann::json;

namespace test_tools {

static const mcp_tools::ToolRegistry &shared_registry() {
    static mcp_tools::ToolRegistry registry;
    static bool registered = false;
    if (!registered) {
        config::ServerConfig server_config;
        tool_handlers::register_all_tools(registry, server_config);
        registered = true;
    }
    return registry;
}

static mcp_tools::ToolResult call(const std::string &tool_name, const json &arguments) {
    return shared_registry().invoke(tool_name, arguments);
}

// Test: Every tool is registered, in catalogue order.
static bool test_catalogue_order() {
    std::vector<std::string> expected = {
        "get_current_time", "get_current_date", "calculate", "get_timezone_info",
        "generate_random_number", "format_number", "execute_command",
    };
    json tools = shared_registry().build_tools_list();
    bool success = tools.size() == expected.size();
    for (size_t index = 0; success && index < expected.size(); ++index) {
        success = tools[index]["name"] == expected[index];
    }

    if (success) {
        std::cout << "  OK: " << expected.size() << " tools registered in catalogue order" << std::endl;
    } else {
        std::cout << "  FAIL: Catalogue was: " << tools.dump() << std::endl;
    }
    return success;
}

// Test: get_current_time reports every representation.
static bool test_current_time() {
    mcp_tools::ToolResult result = call("get_current_time", json::object());
    const json &payload = result.payload;
    bool success = result.success && payload["unix_timestamp"].is_number_integer() &&
                   payload["utc_time"].is_string() &&
                   payload["utc_time"].get<std::string>().size() == 23 &&
                   payload["utc_time"].get<std::string>().compare(19, 4, " UTC") == 0 &&
                   payload["local_time"].get<std::string>().size() == 19 &&
                   payload["iso_format"].get<std::string>().size() == 32;

    if (success) {
        std::cout << "  OK: get_current_time payload: " << payload["utc_time"] << std::endl;
    } else {
        std::cout << "  FAIL: get_current_time payload: " << payload.dump() << std::endl;
    }
    return success;
}

// Test: get_current_date formats and rejects unknown formats.
static bool test_current_date() {
    mcp_tools::ToolResult iso = call("get_current_date", json::object());
    json us_arguments;
    us_arguments["format"] = "us";
    mcp_tools::ToolResult us = call("get_current_date", us_arguments);
    json bad_arguments;
    bad_arguments["format"] = "klingon";
    mcp_tools::ToolResult bad = call("get_current_date", bad_arguments);

    std::string iso_date = iso.payload.value("date", "");
    std::string us_date = us.payload.value("date", "");
    bool success = iso.success && iso.payload["format"] == "iso" && iso_date.size() == 10 &&
                   iso_date[4] == '-' && iso_date[7] == '-' && us.success && us_date.size() == 10 &&
                   us_date[2] == '/' && us_date[5] == '/' &&
                   us.payload["all_formats"]["iso"] == us.payload["iso_format"] &&
                   us.payload["unix_timestamp"].is_number_integer() && !bad.success;

    if (success) {
        std::cout << "  OK: get_current_date iso " << iso_date << ", us " << us_date << std::endl;
    } else {
        std::cout << "  FAIL: get_current_date: " << iso.payload.dump() << " / " << bad.payload.dump() << std::endl;
    }
    return success;
}

// Test: calculate returns value and type, and wraps evaluator errors.
static bool test_calculate() {
    json sqrt_arguments;
    sqrt_arguments["expression"] = "sqrt(16)";
    mcp_tools::ToolResult sqrt_result = call("calculate", sqrt_arguments);

    json integer_arguments;
    integer_arguments["expression"] = "2 + 3";
    mcp_tools::ToolResult integer_result = call("calculate", integer_arguments);

    json hostile_arguments;
    hostile_arguments["expression"] = "__import__('os').system('true')";
    mcp_tools::ToolResult hostile_result = call("calculate", hostile_arguments);

    json blank_arguments;
    blank_arguments["expression"] = "   ";
    mcp_tools::ToolResult blank_result = call("calculate", blank_arguments);

    bool success = sqrt_result.success && sqrt_result.payload["result"] == 4.0 &&
                   sqrt_result.payload["type"] == "float" && integer_result.payload["result"] == 5 &&
                   integer_result.payload["type"] == "int" && !hostile_result.success &&
                   hostile_result.error_message().rfind("Calculation error: ", 0) == 0 &&
                   hostile_result.payload["expression"] == hostile_arguments["expression"] &&
                   !blank_result.success && blank_result.error_message() == "Expression is required";

    if (success) {
        std::cout << "  OK: calculate sqrt(16) = 4.0, hostile input rejected" << std::endl;
    } else {
        std::cout << "  FAIL: calculate: " << sqrt_result.payload.dump() << " / "
                  << hostile_result.payload.dump() << std::endl;
    }
    return success;
}

// Test: get_timezone_info knows UTC and rejects invented zones.
static bool test_timezone_info() {
    mcp_tools::ToolResult utc = call("get_timezone_info", json::object());
    json unknown_arguments;
    unknown_arguments["timezone"] = "Mars/Olympus_Mons";
    mcp_tools::ToolResult unknown = call("get_timezone_info", unknown_arguments);

    bool success = utc.success && utc.payload["timezone"] == "UTC" && utc.payload["utc_offset"] == "+0000" &&
                   utc.payload["is_dst"] == false && !unknown.success &&
                   unknown.error_message() == "Unknown timezone: Mars/Olympus_Mons";

    if (success) {
        std::cout << "  OK: get_timezone_info UTC " << utc.payload["current_time"] << std::endl;
    } else {
        std::cout << "  FAIL: get_timezone_info: " << utc.payload.dump() << " / " << unknown.payload.dump()
                  << std::endl;
    }
    return success;
}

// Test: min_value must be strictly below max_value.
static bool test_random_rejects_empty_range() {
    json arguments;
    arguments["min_value"] = 1;
    arguments["max_value"] = 1;
    mcp_tools::ToolResult result = call("generate_random_number", arguments);
    bool success = !result.success && result.error_message() == "min_value must be less than max_value";

    if (success) {
        std::cout << "  OK: generate_random_number rejects min_value == max_value" << std::endl;
    } else {
        std::cout << "  FAIL: generate_random_number accepted an empty range: " << result.payload.dump()
                  << std::endl;
    }
    return success;
}

// Test: count 5 yields exactly five draws inside the range.
static bool test_random_multiple() {
    json arguments;
    arguments["min_value"] = 0;
    arguments["max_value"] = 10;
    arguments["count"] = 5;
    mcp_tools::ToolResult result = call("generate_random_number", arguments);

    bool success = result.success && result.payload["type"] == "multiple" && result.payload["count"] == 5 &&
                   result.payload["random_numbers"].size() == 5;
    if (success) {
        for (const auto &number : result.payload["random_numbers"]) {
            double value = number.get<double>();
            success = success && value >= 0.0 && value <= 10.0;
        }
    }

    if (success) {
        std::cout << "  OK: generate_random_number count 5 within [0, 10]" << std::endl;
    } else {
        std::cout << "  FAIL: generate_random_number: " << result.payload.dump() << std::endl;
    }
    return success;
}

// Test: count must be an integer within the configured ceiling.
static bool test_random_count_validation() {
    json zero;
    zero["count"] = 0;
    json fractional;
    fractional["count"] = 2.5;
    json too_many;
    too_many["count"] = 101;
    json single;
    single["min_value"] = -1.5;
    single["max_value"] = 1.5;

    mcp_tools::ToolResult single_result = call("generate_random_number", single);
    bool success = !call("generate_random_number", zero).success &&
                   !call("generate_random_number", fractional).success &&
                   !call("generate_random_number", too_many).success && single_result.success &&
                   single_result.payload["type"] == "single" && single_result.payload["min_value"] == -1.5 &&
                   single_result.payload["random_number"].get<double>() >= -1.5;

    if (success) {
        std::cout << "  OK: generate_random_number validates count" << std::endl;
    } else {
        std::cout << "  FAIL: generate_random_number count validation" << std::endl;
    }
    return success;
}

// Test: format_number fixed and scientific renderings.
static bool test_format_number() {
    json fixed;
    fixed["number"] = 3.14159;
    json scientific;
    scientific["number"] = 12345.678;
    scientific["decimals"] = 3;
    scientific["scientific"] = true;
    json out_of_range;
    out_of_range["number"] = 1;
    out_of_range["decimals"] = 21;

    mcp_tools::ToolResult fixed_result = call("format_number", fixed);
    mcp_tools::ToolResult scientific_result = call("format_number", scientific);
    bool success = fixed_result.success && fixed_result.payload["formatted"] == "3.14" &&
                   fixed_result.payload["decimals"] == 2 && fixed_result.payload["scientific_notation"] == false &&
                   scientific_result.payload["formatted"] == "1.235e+04" &&
                   !call("format_number", out_of_range).success &&
                   !call("format_number", json::object()).success;

    if (success) {
        std::cout << "  OK: format_number 3.14 and 1.235e+04" << std::endl;
    } else {
        std::cout << "  FAIL: format_number: " << fixed_result.payload.dump() << " / "
                  << scientific_result.payload.dump() << std::endl;
    }
    return success;
}

// Test: Wrongly typed arguments are failures, not exceptions.
static bool test_argument_types() {
    json bad_expression;
    bad_expression["expression"] = 42;
    json bad_zone;
    bad_zone["timezone"] = json::array();
    json bad_bound;
    bad_bound["min_value"] = "low";

    bool success = !call("calculate", bad_expression).success && !call("get_timezone_info", bad_zone).success &&
                   call("generate_random_number", bad_bound).error_message() == "min_value must be a number";

    if (success) {
        std::cout << "  OK: Wrong argument types are reported as failures" << std::endl;
    } else {
        std::cout << "  FAIL: Wrong argument types slipped through" << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_catalogue_order();
    all_passed &= test_current_time();
    all_passed &= test_current_date();
    all_passed &= test_calculate();
    all_passed &= test_timezone_info();
    all_passed &= test_random_rejects_empty_range();
    all_passed &= test_random_multiple();
    all_passed &= test_random_count_validation();
    all_passed &= test_format_number();
    all_passed &= test_argument_types();
    return all_passed;
}

} // namespace test_tools
