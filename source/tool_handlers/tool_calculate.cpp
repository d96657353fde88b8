#include "mcp/mcp_tools.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "utils/debug_log.hpp"
#include "utils/expression_eval.hpp"

#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Tool handler for "calculate".
// Evaluates an arithmetic expression with the restricted evaluator; nothing
// in the expression can reach anything outside its function table.

static mcp_tools::ToolResult handle_calculate(const json &arguments) {
    std::string expression;
    std::string argument_error;
    if (!tool_arguments::optional_string(arguments, "expression", expression, argument_error)) {
        return mcp_tools::ToolResult::failure(argument_error);
    }
    if (!tool_arguments::has_content(expression)) {
        return mcp_tools::ToolResult::failure("Expression is required");
    }

    debug_log::log("calculate invoked: " + expression);
    expression_eval::EvaluationResult evaluation = expression_eval::evaluate(expression);

    json context;
    context["expression"] = expression;
    if (!evaluation.success) {
        return mcp_tools::ToolResult::failure("Calculation error: " + evaluation.error_message, context);
    }

    json payload = context;
    if (evaluation.value.is_integer) {
        payload["result"] = evaluation.value.integer_value;
    } else {
        payload["result"] = evaluation.value.float_value;
    }
    payload["type"] = evaluation.value.type_name();
    return mcp_tools::ToolResult::ok(payload);
}

namespace tool_calculate {

void register_tool(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["expression"] = {
        {"type", "string"},
        {"description", "Mathematical expression to evaluate (e.g., '2 + 2', 'sqrt(16)', 'sin(pi/2)')"}
    };
    input_schema["required"] = json::array({"expression"});

    registry.register_tool({
        "calculate",
        "Perform basic mathematical calculations",
        input_schema,
        handle_calculate
    });
}

} // namespace tool_calculate
