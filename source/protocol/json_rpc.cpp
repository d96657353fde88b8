#include "protocol/json_rpc.hpp"

namespace json_rpc {

static EnvelopeCheck invalid_envelope(const json &request_id, int error_code, const std::string &error_message) {
    EnvelopeCheck check;
    check.kind = EnvelopeKind::kInvalid;
    check.id = request_id;
    check.error_code = error_code;
    check.error_message = error_message;
    return check;
}

EnvelopeCheck parse_envelope(const std::string &raw_body) {
    json message;
    try {
        message = json::parse(raw_body);
    } catch (const json::parse_error &error) {
        (void)error;
        return invalid_envelope(nullptr, PARSE_ERROR, "Parse error");
    }
    return classify_envelope(message);
}

EnvelopeCheck classify_envelope(const json &message) {
    if (!message.is_object()) {
        return invalid_envelope(nullptr, INVALID_REQUEST, "Invalid Request: body must be an object");
    }

    json request_id = nullptr;
    if (message.contains("id")) {
        request_id = message["id"];
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        return invalid_envelope(request_id, INVALID_REQUEST, "Invalid Request: jsonrpc must be '2.0'");
    }

    if (!message.contains("method") || !message["method"].is_string() ||
        message["method"].get_ref<const std::string &>().empty()) {
        return invalid_envelope(request_id, INVALID_REQUEST, "Invalid Request: method is required");
    }

    EnvelopeCheck check;
    check.method = message["method"].get<std::string>();
    check.id = request_id;
    if (message.contains("params") && !message["params"].is_null()) {
        check.params = message["params"];
    }
    check.kind = request_id.is_null() ? EnvelopeKind::kNotification : EnvelopeKind::kRequest;
    return check;
}

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_notification(const std::string &method, const json &params) {
    json notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    notification["params"] = params;
    return notification;
}

} // namespace json_rpc
