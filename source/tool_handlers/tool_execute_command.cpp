#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "tool_handlers/tool_arguments.hpp"
#include "utils/command_line_split.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>

using json = nlohmann::json;

// Tool handler for "execute_command".
// Splits the command into words (no shell), runs it under a deadline and
// reports exactly one outcome: completion, timeout, missing program, or error.

// Upper bound on a caller-supplied timeout, one day.
constexpr int64_t MAX_TIMEOUT_SECONDS = 86400;

static mcp_tools::ToolResult handle_execute_command(const json &arguments, int64_t default_timeout_seconds) {
    std::string command;
    std::string working_directory;
    int64_t timeout_seconds = default_timeout_seconds;
    std::string argument_error;

    if (!tool_arguments::optional_string(arguments, "command", command, argument_error)) {
        return mcp_tools::ToolResult::failure(argument_error);
    }
    if (!tool_arguments::has_content(command)) {
        return mcp_tools::ToolResult::failure("Command is required");
    }

    json context;
    context["command"] = command;

    if (!tool_arguments::optional_string(arguments, "working_directory", working_directory, argument_error)) {
        return mcp_tools::ToolResult::failure(argument_error, context);
    }
    if (!tool_arguments::optional_integer(arguments, "timeout", timeout_seconds, argument_error) ||
        timeout_seconds < 1 || timeout_seconds > MAX_TIMEOUT_SECONDS) {
        return mcp_tools::ToolResult::failure(
            "timeout must be an integer between 1 and " + std::to_string(MAX_TIMEOUT_SECONDS), context);
    }

    command_line_split::SplitResult split = command_line_split::split_command(command);
    if (split.words.empty()) {
        return mcp_tools::ToolResult::failure("Command is required", context);
    }
    if (split.used_fallback) {
        debug_log::log("execute_command: malformed quoting, split on whitespace");
    }

    platform::ProcessRequest request;
    request.arguments = split.words;
    request.working_directory = working_directory;
    request.timeout = std::chrono::seconds(timeout_seconds);

    debug_log::log("execute_command invoked: " + split.words[0] + " (" +
                   std::to_string(split.words.size()) + " words, timeout " +
                   std::to_string(timeout_seconds) + "s)");
    platform::ProcessResult process = platform::run_process(request);

    switch (process.outcome) {
    case platform::ProcessOutcome::kExited: {
        json payload = context;
        payload["return_code"] = process.return_code;
        payload["stdout"] = utf8_sanitize::decode_lossy(process.stdout_bytes);
        payload["stderr"] = utf8_sanitize::decode_lossy(process.stderr_bytes);
        payload["success"] = process.return_code == 0;
        payload["working_directory"] = working_directory.empty() ? "current directory" : working_directory;
        payload["timeout_used"] = timeout_seconds;
        // A non-zero exit is still a completed run, reported through return_code.
        return mcp_tools::ToolResult::ok(payload);
    }
    case platform::ProcessOutcome::kTimedOut:
        debug_log::notice("Command timed out after " + std::to_string(timeout_seconds) +
                          "s, process group " + std::to_string(process.process_id) + " killed");
        context["timeout"] = timeout_seconds;
        return mcp_tools::ToolResult::failure(
            "Command timed out after " + std::to_string(timeout_seconds) + " seconds", context);
    case platform::ProcessOutcome::kExecutableNotFound:
        return mcp_tools::ToolResult::failure("Command not found: " + split.words[0], context);
    case platform::ProcessOutcome::kWorkingDirectoryMissing:
        context["working_directory"] = working_directory;
        return mcp_tools::ToolResult::failure("Working directory not found: " + working_directory, context);
    case platform::ProcessOutcome::kSpawnFailed:
        break;
    }
    return mcp_tools::ToolResult::failure("Command execution error: " + process.error_message, context);
}

namespace tool_execute_command {

void register_tool(mcp_tools::ToolRegistry &registry, const config::ServerConfig &server_config) {
    int64_t default_timeout_seconds = server_config.command_timeout_seconds;

    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["command"] = {
        {"type", "string"},
        {"description", "Command to execute (e.g., 'ls -la', 'echo hello', 'python3 --version'). "
                        "Quoting is honoured; no shell expansion is performed."}
    };
    input_schema["properties"]["working_directory"] = {
        {"type", "string"},
        {"description", "Working directory for the command (optional, defaults to current directory)"}
    };
    input_schema["properties"]["timeout"] = {
        {"type", "integer"},
        {"description", "Timeout in seconds (optional, defaults to " +
                        std::to_string(default_timeout_seconds) + " seconds)"},
        {"default", default_timeout_seconds},
        {"minimum", 1}
    };
    input_schema["required"] = json::array({"command"});

    registry.register_tool({
        "execute_command",
        "Execute a command and return the output. WARNING: Use with caution as this can execute "
        "arbitrary commands.",
        input_schema,
        [default_timeout_seconds](const json &arguments) {
            return handle_execute_command(arguments, default_timeout_seconds);
        }
    });
}

} // namespace tool_execute_command
