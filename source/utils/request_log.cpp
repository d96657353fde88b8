#include "utils/request_log.hpp"

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <system_error>
#include <utility>

#include "config/server_config.hpp"
#include "utils/debug_log.hpp"
#include "utils/time_format.hpp"

namespace request_log {

static const std::string RULE(80, '=');

std::string generate_uuid_v4() {
    static std::mutex generator_mutex;
    static std::mt19937_64 generator{std::random_device{}()};

    uint64_t high;
    uint64_t low;
    {
        std::lock_guard<std::mutex> lock(generator_mutex);
        high = generator();
        low = generator();
    }
    // Version 4 in the high nibble of time_hi, variant 10 in clock_seq_hi.
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buffer[37];
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(high >> 32), static_cast<unsigned>((high >> 16) & 0xFFFF),
                  static_cast<unsigned>(high & 0xFFFF), static_cast<unsigned>(low >> 48),
                  static_cast<unsigned long long>(low & 0xFFFFFFFFFFFFULL));
    return buffer;
}

std::string format_entry(const std::string &entry_id, const std::string &timestamp, const json &details) {
    std::string entry;
    entry += "\n";
    entry += RULE + "\n";
    entry += "REQUEST LOG ENTRY - " + entry_id + "\n";
    entry += "Timestamp: " + timestamp + "\n";
    entry += RULE + "\n";
    entry += "\n";
    entry += "REQUEST INFORMATION:\n";
    entry += details.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
    entry += "\n";
    entry += RULE + "\n";
    entry += "END OF ENTRY\n";
    entry += RULE + "\n";
    entry += "\n";
    return entry;
}

static json server_info() {
    json info;
    info["server_name"] = config::SERVER_NAME;
    info["server_version"] = config::SERVER_VERSION;
    info["request_id"] = generate_uuid_v4();
    return info;
}

RequestLog::RequestLog(std::string log_path) : log_path_(std::move(log_path)) {}

void RequestLog::log_http_request(const std::string &endpoint, const std::string &http_method,
                                  const json &client_info, const json &extra) {
    if (!is_enabled()) {
        return;
    }
    json details;
    details["request_type"] = "http_request";
    details["endpoint"] = endpoint;
    details["method"] = http_method;
    details["client_info"] = client_info;
    details["server_info"] = server_info();
    details["timestamp"] = time_format::iso8601_utc_now();
    if (extra.is_object()) {
        details.update(extra);
    }
    append(details);
}

void RequestLog::log_tool_call(const mcp_dispatch::ToolCallRecord &record) {
    if (!is_enabled()) {
        return;
    }
    json details;
    details["request_type"] = "tool_call";
    details["tool_name"] = record.tool_name;
    details["arguments"] = record.arguments;
    details["server_info"] = server_info();
    details["timestamp_start"] = record.started_at;
    details["timestamp_end"] = record.finished_at;
    details["response"] = record.result.payload;
    details["success"] = record.result.success;
    if (!record.result.success) {
        details["error"] = record.result.error_message();
    }
    append(details);
}

void RequestLog::append(const json &details) {
    if (!is_enabled()) {
        return;
    }
    std::time_t now = std::time(nullptr);
    std::string timestamp = time_format::format_tm(time_format::utc_tm(now), "%Y-%m-%d %H:%M:%S UTC");
    std::string entry = format_entry(generate_uuid_v4(), timestamp, details);

    std::lock_guard<std::mutex> lock(write_mutex_);

    std::filesystem::path parent = std::filesystem::path(log_path_).parent_path();
    if (!parent.empty()) {
        std::error_code directory_error;
        std::filesystem::create_directories(parent, directory_error);
        if (directory_error) {
            debug_log::notice("Logging error: cannot create " + parent.string() + ": " +
                              directory_error.message());
            return;
        }
    }

    std::ofstream output(log_path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!output) {
        debug_log::notice("Logging error: cannot open " + log_path_);
        return;
    }
    output << entry;
    if (!output.flush()) {
        debug_log::notice("Logging error: write to " + log_path_ + " failed");
    }
}

} // namespace request_log
