#ifndef TOOLGATE_JSON_RPC_HPP
#define TOOLGATE_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for MCP protocol communication.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Classification of an inbound message.
enum class EnvelopeKind {
    kRequest,       // Has a non-null id; exactly one response is owed.
    kNotification,  // No id (or a null id); no response is owed.
    kInvalid,       // Not a usable envelope; error_code/error_message say why.
};

// Outcome of validating an inbound message.
struct EnvelopeCheck {
    EnvelopeKind kind = EnvelopeKind::kInvalid;
    std::string method;
    // Verbatim id of a request (type preserved); best-effort id for invalid
    // envelopes; null for notifications and unparseable bodies.
    json id = nullptr;
    // The params member, or an empty object when absent or null.
    json params = json::object();
    int error_code = 0;
    std::string error_message;
};

// Parse a raw body and classify it. Rules, in order:
//   1. body is not JSON               -> PARSE_ERROR
//   2. top-level value is not object  -> INVALID_REQUEST
//   3. jsonrpc != "2.0"               -> INVALID_REQUEST
//   4. method missing or empty        -> INVALID_REQUEST
//   5. id absent/null -> notification, otherwise request.
EnvelopeCheck parse_envelope(const std::string &raw_body);

// Steps 2-5 of parse_envelope for an already decoded value.
EnvelopeCheck classify_envelope(const json &message);

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 notification (no id member).
json build_notification(const std::string &method, const json &params);

} // namespace json_rpc

#endif // TOOLGATE_JSON_RPC_HPP
