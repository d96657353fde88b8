#ifndef TOOLGATE_REQUEST_LOG_HPP
#define TOOLGATE_REQUEST_LOG_HPP

// Append-only request/response log file.
// Every HTTP request and every tool call becomes one framed entry holding the
// details as indented JSON. Write failures are reported on stderr and never
// reach the caller.

#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

#include "mcp/mcp_dispatch.hpp"

namespace request_log {

using json = nlohmann::json;

// Random RFC 4122 version 4 identifier, lowercase hex with dashes.
std::string generate_uuid_v4();

// Render one complete entry (leading blank line through the closing rule).
std::string format_entry(const std::string &entry_id, const std::string &timestamp, const json &details);

class RequestLog {
public:
    // An empty path disables the log.
    explicit RequestLog(std::string log_path);

    bool is_enabled() const { return !log_path_.empty(); }
    const std::string &path() const { return log_path_; }

    // client_info: ip_address, user_agent, accept, content_type, host, origin.
    // extra members (e.g. JSON-RPC method and params) are merged into the entry.
    void log_http_request(const std::string &endpoint, const std::string &http_method,
                          const json &client_info, const json &extra = json::object());

    void log_tool_call(const mcp_dispatch::ToolCallRecord &record);

    // Append a raw details object as one entry.
    void append(const json &details);

private:
    std::string log_path_;
    std::mutex write_mutex_;
};

} // namespace request_log

#endif // TOOLGATE_REQUEST_LOG_HPP
