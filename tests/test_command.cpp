// Tests for command tokenization, supervised process execution and the
// execute_command tool built on them. Runs real programs from the base system
// (echo, sleep, sh, printf, pwd).

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "config/server_config.hpp"
#include "mcp/mcp_tools.hpp"
#include "platform/platform_abi.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/command_line_split.hpp"
#include "utils/time_format.hpp"
#include "utils/utf8_sanitize.hpp"

using json = nlohmann::json;

namespace test_command {

static std::string join_words(const std::vector<std::string> &words) {
    std::string joined;
    for (const auto &word : words) {
        joined += "[" + word + "]";
    }
    return joined;
}

// Test: Quotes group words and backslashes escape, with no expansion.
static bool test_split_quoting() {
    command_line_split::SplitResult split =
        command_line_split::split_command("echo \"a b\" 'c $HOME' e\\ f \"x\\\"y\" ''");
    std::vector<std::string> expected = {"echo", "a b", "c $HOME", "e f", "x\"y", ""};
    bool success = !split.used_fallback && split.words == expected;

    if (success) {
        std::cout << "  OK: Quote-aware split " << join_words(split.words) << std::endl;
    } else {
        std::cout << "  FAIL: Quote-aware split gave " << join_words(split.words) << std::endl;
    }
    return success;
}

// Test: Unterminated quoting falls back to plain whitespace splitting.
static bool test_split_fallback() {
    command_line_split::SplitResult split = command_line_split::split_command("echo \"unterminated  value");
    std::vector<std::string> expected = {"echo", "\"unterminated", "value"};
    bool success = split.used_fallback && split.words == expected;

    if (success) {
        std::cout << "  OK: Malformed quoting falls back to whitespace split" << std::endl;
    } else {
        std::cout << "  FAIL: Fallback split gave " << join_words(split.words) << std::endl;
    }
    return success;
}

// Test: A short command runs to completion with its output captured.
static bool test_run_echo() {
    platform::ProcessRequest request;
    request.arguments = {"echo", "hi"};
    request.timeout = std::chrono::seconds(5);
    platform::ProcessResult result = platform::run_process(request);

    bool success = result.outcome == platform::ProcessOutcome::kExited && result.return_code == 0 &&
                   result.stdout_bytes == "hi\n" && result.stderr_bytes.empty();

    if (success) {
        std::cout << "  OK: echo hi exited 0 with stdout 'hi\\n'" << std::endl;
    } else {
        std::cout << "  FAIL: echo hi: return code " << result.return_code << ", stdout '" << result.stdout_bytes
                  << "', error " << result.error_message << std::endl;
    }
    return success;
}

// Test: A timed-out process is killed and reaped before run_process returns.
static bool test_run_timeout_kills_child() {
    platform::ProcessRequest request;
    request.arguments = {"sleep", "5"};
    request.timeout = std::chrono::seconds(1);

    auto start_time = std::chrono::steady_clock::now();
    platform::ProcessResult result = platform::run_process(request);
    auto elapsed = std::chrono::steady_clock::now() - start_time;
    long elapsed_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

    bool success = result.outcome == platform::ProcessOutcome::kTimedOut && result.process_id > 0 &&
                   !platform::process_exists(result.process_id) && elapsed_milliseconds < 4000;

    if (success) {
        std::cout << "  OK: sleep 5 timed out after " << elapsed_milliseconds << " ms and left no process"
                  << std::endl;
    } else {
        std::cout << "  FAIL: sleep 5 with 1 s timeout: outcome " << static_cast<int>(result.outcome)
                  << ", elapsed " << elapsed_milliseconds << " ms, process alive "
                  << platform::process_exists(result.process_id) << std::endl;
    }
    return success;
}

// Test: A missing program is reported as not found.
static bool test_run_not_found() {
    platform::ProcessRequest request;
    request.arguments = {"toolgate-no-such-program-31337"};
    platform::ProcessResult result = platform::run_process(request);
    bool success = result.outcome == platform::ProcessOutcome::kExecutableNotFound;

    if (success) {
        std::cout << "  OK: Missing program reported as not found" << std::endl;
    } else {
        std::cout << "  FAIL: Missing program outcome " << static_cast<int>(result.outcome) << std::endl;
    }
    return success;
}

// Test: Exit codes pass through and a signal death reports minus the signal.
static bool test_run_exit_status() {
    platform::ProcessRequest exit_request;
    exit_request.arguments = {"sh", "-c", "exit 3"};
    platform::ProcessResult exit_result = platform::run_process(exit_request);

    platform::ProcessRequest signal_request;
    signal_request.arguments = {"sh", "-c", "kill -9 $$"};
    platform::ProcessResult signal_result = platform::run_process(signal_request);

    bool success = exit_result.outcome == platform::ProcessOutcome::kExited && exit_result.return_code == 3 &&
                   signal_result.outcome == platform::ProcessOutcome::kExited && signal_result.return_code == -9;

    if (success) {
        std::cout << "  OK: exit 3 -> 3, SIGKILL -> -9" << std::endl;
    } else {
        std::cout << "  FAIL: return codes " << exit_result.return_code << " / " << signal_result.return_code
                  << std::endl;
    }
    return success;
}

// Test: Working directory is honoured, and a missing one is reported.
static bool test_run_working_directory() {
    platform::ProcessRequest request;
    request.arguments = {"pwd"};
    request.working_directory = "/tmp";
    platform::ProcessResult result = platform::run_process(request);

    platform::ProcessRequest missing_request;
    missing_request.arguments = {"pwd"};
    missing_request.working_directory = "/toolgate/does/not/exist";
    platform::ProcessResult missing_result = platform::run_process(missing_request);

    bool success = result.outcome == platform::ProcessOutcome::kExited && result.stdout_bytes == "/tmp\n" &&
                   missing_result.outcome == platform::ProcessOutcome::kWorkingDirectoryMissing;

    if (success) {
        std::cout << "  OK: pwd in /tmp, missing directory reported" << std::endl;
    } else {
        std::cout << "  FAIL: working directory: '" << result.stdout_bytes << "', outcome "
                  << static_cast<int>(missing_result.outcome) << std::endl;
    }
    return success;
}

// Test: Invalid UTF-8 output is decoded with replacement characters.
static bool test_output_decoding() {
    std::string replacement = "\xEF\xBF\xBD";
    bool decoder_ok = utf8_sanitize::decode_lossy(std::string("a\xFF" "b")) == "a" + replacement + "b" &&
                      utf8_sanitize::decode_lossy(std::string("\xC3\xA9")) == "\xC3\xA9" &&
                      utf8_sanitize::decode_lossy(std::string("\xE2\x82")) == replacement &&
                      utf8_sanitize::decode_lossy(std::string("\xED\xA0\x80")) ==
                          replacement + replacement + replacement;

    platform::ProcessRequest request;
    request.arguments = {"printf", "ok\\377"};
    platform::ProcessResult result = platform::run_process(request);
    bool process_ok = utf8_sanitize::decode_lossy(result.stdout_bytes) == "ok" + replacement;

    bool success = decoder_ok && process_ok;
    if (success) {
        std::cout << "  OK: Invalid UTF-8 replaced with U+FFFD" << std::endl;
    } else {
        std::cout << "  FAIL: UTF-8 decoding (decoder " << decoder_ok << ", process " << process_ok << ")"
                  << std::endl;
    }
    return success;
}

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

// Test: execute_command reports a completed run.
static bool test_tool_success() {
    json arguments;
    arguments["command"] = "echo hi";
    mcp_tools::ToolResult result = shared_registry().invoke("execute_command", arguments);
    const json &payload = result.payload;

    bool success = result.success && payload["command"] == "echo hi" && payload["return_code"] == 0 &&
                   payload["stdout"] == "hi\n" && payload["stderr"] == "" && payload["success"] == true &&
                   payload["working_directory"] == "current directory" && payload["timeout_used"] == 30;

    if (success) {
        std::cout << "  OK: execute_command echo hi" << std::endl;
    } else {
        std::cout << "  FAIL: execute_command echo hi: " << payload.dump() << std::endl;
    }
    return success;
}

// Test: execute_command timeout and not-found failures.
static bool test_tool_failures() {
    json timeout_arguments;
    timeout_arguments["command"] = "sleep 5";
    timeout_arguments["timeout"] = 1;
    mcp_tools::ToolResult timed_out = shared_registry().invoke("execute_command", timeout_arguments);

    json missing_arguments;
    missing_arguments["command"] = "toolgate-no-such-program-31337 --flag";
    mcp_tools::ToolResult missing = shared_registry().invoke("execute_command", missing_arguments);

    json bad_timeout;
    bad_timeout["command"] = "echo hi";
    bad_timeout["timeout"] = 0;

    json no_shell;
    no_shell["command"] = "echo $HOME; echo second";
    mcp_tools::ToolResult literal = shared_registry().invoke("execute_command", no_shell);

    bool success = !timed_out.success && timed_out.error_message() == "Command timed out after 1 seconds" &&
                   timed_out.payload["timeout"] == 1 && !missing.success &&
                   missing.error_message() == "Command not found: toolgate-no-such-program-31337" &&
                   !shared_registry().invoke("execute_command", bad_timeout).success &&
                   literal.success && literal.payload["stdout"] == "$HOME; echo second\n";

    if (success) {
        std::cout << "  OK: execute_command timeout, not found, no shell expansion" << std::endl;
    } else {
        std::cout << "  FAIL: execute_command failures: " << timed_out.payload.dump() << " / "
                  << missing.payload.dump() << " / " << literal.payload.dump() << std::endl;
    }
    return success;
}

// Test: Children inherit the environment captured at startup, and zone
// lookups switching TZ on another thread never leak into them.
static bool test_children_use_captured_environment() {
    setenv("TOOLGATE_CHILD_MARKER", "captured", 1);
    platform::capture_environment();
    unsetenv("TOOLGATE_CHILD_MARKER");

    std::atomic<bool> stop{false};
    std::thread zone_switcher([&stop]() {
        time_format::ZoneTime reading;
        while (!stop.load()) {
            time_format::zone_time(std::time(nullptr), "Europe/London", reading);
        }
    });

    bool all_clean = true;
    std::string last_output;
    for (int attempt = 0; attempt < 10 && all_clean; ++attempt) {
        platform::ProcessRequest request;
        request.arguments = {"sh", "-c", "printf '%s|%s' \"$TOOLGATE_CHILD_MARKER\" \"$TZ\""};
        request.timeout = std::chrono::seconds(5);
        platform::ProcessResult result = platform::run_process(request);
        last_output = result.stdout_bytes;
        all_clean = result.outcome == platform::ProcessOutcome::kExited &&
                    last_output.compare(0, 9, "captured|") == 0 &&
                    last_output.find("Europe/London") == std::string::npos;
    }

    stop.store(true);
    zone_switcher.join();
    platform::capture_environment();

    if (all_clean) {
        std::cout << "  OK: Children see the captured environment only" << std::endl;
    } else {
        std::cout << "  FAIL: Child environment was '" << last_output << "'" << std::endl;
    }
    return all_clean;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_split_quoting();
    all_passed &= test_split_fallback();
    all_passed &= test_run_echo();
    all_passed &= test_run_timeout_kills_child();
    all_passed &= test_run_not_found();
    all_passed &= test_run_exit_status();
    all_passed &= test_run_working_directory();
    all_passed &= test_output_decoding();
    all_passed &= test_tool_success();
    all_passed &= test_tool_failures();
    all_passed &= test_children_use_captured_environment();
    return all_passed;
}

} // namespace test_command
