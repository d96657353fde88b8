// Tests for JSON-RPC envelope validation and response construction.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>

#include "protocol/json_rpc.hpp"

using json = nlohmann::json;

namespace test_json_rpc {

// Test: A request keeps its id verbatim, including the JSON type.
static bool test_request_id_type_preserved() {
    json_rpc::EnvelopeCheck string_id =
        json_rpc::parse_envelope(R"({"jsonrpc":"2.0","id":"abc-1","method":"tools/list"})");
    json_rpc::EnvelopeCheck number_id =
        json_rpc::parse_envelope(R"({"jsonrpc":"2.0","id":42,"method":"tools/list"})");

    bool success = string_id.kind == json_rpc::EnvelopeKind::kRequest && string_id.id.is_string() &&
                   string_id.id == "abc-1" && number_id.kind == json_rpc::EnvelopeKind::kRequest &&
                   number_id.id.is_number_integer() && number_id.id == 42;

    json response = json_rpc::build_response(string_id.id, json::object());
    success = success && response["id"].is_string() && response["id"] == "abc-1";

    if (success) {
        std::cout << "  OK: Request ids keep their type (string and integer)" << std::endl;
    } else {
        std::cout << "  FAIL: Request id type changed: " << string_id.id << " / " << number_id.id << std::endl;
    }
    return success;
}

// Test: No id, or a null id, makes a notification.
static bool test_notification_classification() {
    json_rpc::EnvelopeCheck absent =
        json_rpc::parse_envelope(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    json_rpc::EnvelopeCheck null_id =
        json_rpc::parse_envelope(R"({"jsonrpc":"2.0","id":null,"method":"tools/list"})");

    bool success = absent.kind == json_rpc::EnvelopeKind::kNotification &&
                   null_id.kind == json_rpc::EnvelopeKind::kNotification &&
                   absent.method == "notifications/initialized";

    if (success) {
        std::cout << "  OK: Missing and null ids classify as notifications" << std::endl;
    } else {
        std::cout << "  FAIL: Notification classification is wrong" << std::endl;
    }
    return success;
}

// Test: Unparseable text is a parse error with a null id.
static bool test_parse_error() {
    json_rpc::EnvelopeCheck check = json_rpc::parse_envelope("{not json");
    bool success = check.kind == json_rpc::EnvelopeKind::kInvalid &&
                   check.error_code == json_rpc::PARSE_ERROR && check.id.is_null() &&
                   check.error_message == "Parse error";

    if (success) {
        std::cout << "  OK: Malformed JSON yields -32700 Parse error" << std::endl;
    } else {
        std::cout << "  FAIL: Parse error check gave code " << check.error_code << std::endl;
    }
    return success;
}

// Test: Structural problems are invalid requests that keep a best-effort id.
static bool test_invalid_requests() {
    json_rpc::EnvelopeCheck not_object = json_rpc::parse_envelope("[1, 2, 3]");
    json_rpc::EnvelopeCheck wrong_version =
        json_rpc::parse_envelope(R"({"jsonrpc":"1.0","id":9,"method":"tools/list"})");
    json_rpc::EnvelopeCheck missing_method = json_rpc::parse_envelope(R"({"jsonrpc":"2.0","id":"x"})");
    json_rpc::EnvelopeCheck empty_method =
        json_rpc::parse_envelope(R"({"jsonrpc":"2.0","id":1,"method":""})");

    bool success = not_object.error_code == json_rpc::INVALID_REQUEST && not_object.id.is_null() &&
                   wrong_version.error_code == json_rpc::INVALID_REQUEST && wrong_version.id == 9 &&
                   missing_method.error_code == json_rpc::INVALID_REQUEST && missing_method.id == "x" &&
                   empty_method.kind == json_rpc::EnvelopeKind::kInvalid;

    if (success) {
        std::cout << "  OK: Invalid envelopes report -32600 with the best-effort id" << std::endl;
    } else {
        std::cout << "  FAIL: Invalid envelope handling is wrong" << std::endl;
    }
    return success;
}

// Test: Absent or null params become an empty object; present params are kept.
static bool test_params_default() {
    json_rpc::EnvelopeCheck absent = json_rpc::parse_envelope(R"({"jsonrpc":"2.0","id":1,"method":"m"})");
    json_rpc::EnvelopeCheck given =
        json_rpc::parse_envelope(R"({"jsonrpc":"2.0","id":1,"method":"m","params":{"a":[1,2]}})");

    bool success = absent.params.is_object() && absent.params.empty() && given.params["a"] == json::array({1, 2});

    if (success) {
        std::cout << "  OK: params default to {} and are otherwise passed through" << std::endl;
    } else {
        std::cout << "  FAIL: params handling: " << absent.params << " / " << given.params << std::endl;
    }
    return success;
}

// Test: Error responses and notifications have the JSON-RPC 2.0 shape.
static bool test_builders() {
    json error = json_rpc::build_error_response(7, json_rpc::METHOD_NOT_FOUND, "Method not found: x");
    json notification = json_rpc::build_notification("ping", json::object());

    bool success = error["jsonrpc"] == "2.0" && error["id"] == 7 && error["error"]["code"] == -32601 &&
                   error["error"]["message"] == "Method not found: x" && !error.contains("result") &&
                   notification["method"] == "ping" && !notification.contains("id");

    if (success) {
        std::cout << "  OK: Error response and notification builders" << std::endl;
    } else {
        std::cout << "  FAIL: Builders produced " << error.dump() << " / " << notification.dump() << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_request_id_type_preserved();
    all_passed &= test_notification_classification();
    all_passed &= test_parse_error();
    all_passed &= test_invalid_requests();
    all_passed &= test_params_default();
    all_passed &= test_builders();
    return all_passed;
}

} // namespace test_json_rpc
