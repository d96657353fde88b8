// Tests for JSON-RPC method dispatch, HTTP status selection per transport and
// mirroring of responses onto SSE sessions.

#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_sessions.hpp"
#include "mcp/mcp_tools.hpp"

using json = nlohmann::json;
using namespace std::chrono_literals;

namespace test_dispatch {

using mcp_dispatch::Transport;

// Registry with an echoing tool and a tool that throws.
static void register_test_tools(mcp_tools::ToolRegistry &registry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    registry.register_tool({"echo", "Echo the arguments", input_schema, [](const json &arguments) {
                                json payload;
                                payload["echo"] = arguments;
                                return mcp_tools::ToolResult::ok(payload);
                            }});
    registry.register_tool({"explode", "Always throws", input_schema, [](const json &) -> mcp_tools::ToolResult {
                                throw std::runtime_error("kaboom");
                            }});
}

struct Fixture {
    mcp_tools::ToolRegistry tools;
    mcp_sessions::SessionRegistry sessions;
    mcp_dispatch::Dispatcher dispatcher;

    Fixture() : dispatcher(tools, sessions) { register_test_tools(tools); }

    mcp_dispatch::DispatchOutcome send(const json &message, Transport transport = Transport::kDirectHttp,
                                       const std::string &connection_id = "default") {
        return dispatcher.dispatch_body(message.dump(), transport, connection_id);
    }
};

static json request(const json &id, const std::string &method, const json &params = json::object()) {
    json message;
    message["jsonrpc"] = "2.0";
    message["id"] = id;
    message["method"] = method;
    message["params"] = params;
    return message;
}

// Test: initialize reports the protocol version, capabilities and server identity.
static bool test_initialize() {
    Fixture fixture;
    mcp_dispatch::DispatchOutcome outcome = fixture.send(request("init-1", "initialize"));
    const json &result = outcome.body["result"];

    bool success = outcome.http_status == 200 && outcome.body["id"] == "init-1" &&
                   result["protocolVersion"] == "2024-11-05" && result["capabilities"]["tools"].is_object() &&
                   result["serverInfo"]["name"] == "toolgate" && result["serverInfo"]["version"] == "1.0.0";

    if (success) {
        std::cout << "  OK: initialize result" << std::endl;
    } else {
        std::cout << "  FAIL: initialize returned " << outcome.body.dump() << std::endl;
    }
    return success;
}

// Test: tools/list lists the registry.
static bool test_tools_list() {
    Fixture fixture;
    mcp_dispatch::DispatchOutcome outcome = fixture.send(request(2, "tools/list"));
    const json &tools = outcome.body["result"]["tools"];
    bool success = outcome.http_status == 200 && tools.size() == 2 && tools[0]["name"] == "echo";

    if (success) {
        std::cout << "  OK: tools/list" << std::endl;
    } else {
        std::cout << "  FAIL: tools/list returned " << outcome.body.dump() << std::endl;
    }
    return success;
}

// Test: tools/call wraps the tool payload in a text block.
static bool test_tools_call() {
    Fixture fixture;
    std::vector<std::string> observed;
    fixture.dispatcher.set_tool_call_observer(
        [&observed](const mcp_dispatch::ToolCallRecord &record) { observed.push_back(record.tool_name); });

    json params;
    params["name"] = "echo";
    params["arguments"]["word"] = "hello";
    mcp_dispatch::DispatchOutcome outcome = fixture.send(request(3, "tools/call", params));
    const json &result = outcome.body["result"];
    json payload = json::parse(result["content"][0]["text"].get<std::string>());

    bool success = outcome.http_status == 200 && result["isError"] == false && payload["echo"]["word"] == "hello" &&
                   observed.size() == 1 && observed[0] == "echo";

    if (success) {
        std::cout << "  OK: tools/call echo round trip, observer notified" << std::endl;
    } else {
        std::cout << "  FAIL: tools/call returned " << outcome.body.dump() << std::endl;
    }
    return success;
}

// Test: Notifications get an empty acknowledgement and nothing is mirrored.
static bool test_notification_ack() {
    Fixture fixture;
    mcp_sessions::QueueHandle queue = fixture.sessions.get_or_create("default");

    json notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = "notifications/initialized";
    mcp_dispatch::DispatchOutcome direct = fixture.send(notification);
    mcp_dispatch::DispatchOutcome via_sse = fixture.send(notification, Transport::kSsePost);

    json unknown = notification;
    unknown["method"] = "something/else";
    mcp_dispatch::DispatchOutcome unknown_outcome = fixture.send(unknown, Transport::kSsePost);

    bool success = direct.http_status == 200 && !direct.has_body && via_sse.http_status == 200 && !via_sse.has_body &&
                   unknown_outcome.http_status == 200 && !unknown_outcome.has_body && queue->size() == 0;

    if (success) {
        std::cout << "  OK: Notifications acknowledged with no body" << std::endl;
    } else {
        std::cout << "  FAIL: Notification acknowledgement" << std::endl;
    }
    return success;
}

// Test: Unknown methods are 200 on the direct path and 404 on the SSE path.
static bool test_method_not_found_status() {
    Fixture fixture;
    mcp_dispatch::DispatchOutcome direct = fixture.send(request(4, "resources/list"));
    mcp_dispatch::DispatchOutcome via_sse = fixture.send(request(4, "resources/list"), Transport::kSsePost);

    bool success = direct.http_status == 200 && direct.body["error"]["code"] == -32601 &&
                   direct.body["error"]["message"] == "Method not found: resources/list" &&
                   via_sse.http_status == 404 && via_sse.body["error"]["code"] == -32601;

    if (success) {
        std::cout << "  OK: Method not found status per transport" << std::endl;
    } else {
        std::cout << "  FAIL: Method not found: " << direct.http_status << " / " << via_sse.http_status << std::endl;
    }
    return success;
}

// Test: Parse errors and invalid envelopes are 400 and parse errors are never mirrored.
static bool test_bad_envelopes() {
    Fixture fixture;
    mcp_sessions::QueueHandle queue = fixture.sessions.get_or_create("default");

    mcp_dispatch::DispatchOutcome parse_error = fixture.dispatcher.dispatch_body("{oops", Transport::kSsePost, "default");
    mcp_dispatch::DispatchOutcome invalid =
        fixture.dispatcher.dispatch_body(R"({"jsonrpc":"2.0","id":"q"})", Transport::kSsePost, "default");

    bool success = parse_error.http_status == 400 && parse_error.body["error"]["code"] == -32700 &&
                   parse_error.body["id"].is_null() && !parse_error.mirrored && invalid.http_status == 400 &&
                   invalid.body["error"]["code"] == -32600 && invalid.body["id"] == "q" && invalid.mirrored &&
                   queue->size() == 1;

    if (success) {
        std::cout << "  OK: Parse error 400 not mirrored, invalid request 400 mirrored" << std::endl;
    } else {
        std::cout << "  FAIL: Bad envelopes: " << parse_error.body.dump() << " / " << invalid.body.dump() << std::endl;
    }
    return success;
}

// Test: tools/call parameter validation and tool faults.
static bool test_tools_call_errors() {
    Fixture fixture;
    mcp_dispatch::DispatchOutcome no_name = fixture.send(request(5, "tools/call"));

    json bad_arguments;
    bad_arguments["name"] = "echo";
    bad_arguments["arguments"] = json::array({1, 2});
    mcp_dispatch::DispatchOutcome not_object = fixture.send(request(6, "tools/call", bad_arguments));

    json explode;
    explode["name"] = "explode";
    mcp_dispatch::DispatchOutcome fault = fixture.send(request(7, "tools/call", explode));

    json unknown;
    unknown["name"] = "nope";
    mcp_dispatch::DispatchOutcome unknown_outcome = fixture.send(request(8, "tools/call", unknown));
    std::string unknown_text = unknown_outcome.body["result"]["content"][0].value("text", "");

    bool success = no_name.body["error"]["code"] == -32602 &&
                   no_name.body["error"]["message"] == "Tool name is required" &&
                   not_object.body["error"]["code"] == -32602 && fault.http_status == 200 &&
                   fault.body["error"]["code"] == -32603 &&
                   fault.body["error"]["message"] == "Tool execution error: kaboom" && fault.body["id"] == 7 &&
                   unknown_outcome.body.contains("result") &&
                   unknown_text.find("Unknown tool: nope") != std::string::npos;

    if (success) {
        std::cout << "  OK: tools/call errors (-32602, -32603, unknown tool result)" << std::endl;
    } else {
        std::cout << "  FAIL: tools/call errors: " << no_name.body.dump() << " / " << fault.body.dump() << std::endl;
    }
    return success;
}

// Test: SSE-path responses reach the named session only when it exists, and
// the POST path never creates one.
static bool test_mirroring_targets_named_session() {
    Fixture fixture;
    mcp_sessions::QueueHandle queue_b = fixture.sessions.get_or_create("B");

    mcp_dispatch::DispatchOutcome to_a = fixture.send(request(9, "tools/list"), Transport::kSsePost, "A");
    mcp_dispatch::DispatchOutcome to_b = fixture.send(request(10, "tools/list"), Transport::kSsePost, "B");
    mcp_dispatch::DispatchOutcome direct = fixture.send(request(11, "tools/list"), Transport::kDirectHttp, "B");

    json delivered;
    bool got_b = queue_b->wait_pop(delivered, 10ms) == mcp_sessions::WaitStatus::kMessage;
    bool success = !to_a.mirrored && !fixture.sessions.contains("A") && to_b.mirrored && !direct.mirrored &&
                   got_b && delivered["id"] == 10 && queue_b->size() == 0 && to_b.http_status == 200;

    if (success) {
        std::cout << "  OK: Mirroring goes to the named existing session only" << std::endl;
    } else {
        std::cout << "  FAIL: Mirroring: A mirrored " << to_a.mirrored << ", A exists "
                  << fixture.sessions.contains("A") << ", B mirrored " << to_b.mirrored << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_initialize();
    all_passed &= test_tools_list();
    all_passed &= test_tools_call();
    all_passed &= test_notification_ack();
    all_passed &= test_method_not_found_status();
    all_passed &= test_bad_envelopes();
    all_passed &= test_tools_call_errors();
    all_passed &= test_mirroring_targets_named_session();
    return all_passed;
}

} // namespace test_dispatch
