#ifndef TOOLGATE_SERVER_CONFIG_HPP
#define TOOLGATE_SERVER_CONFIG_HPP

// Static server configuration, read once from the environment at startup and
// passed by reference to the components that need it.

#include <stdexcept>
#include <string>
#include <vector>

namespace config {

// Fixed server identity reported by initialize and the liveness endpoint.
constexpr const char *SERVER_NAME = "toolgate";
constexpr const char *SERVER_VERSION = "1.0.0";
constexpr const char *PROTOCOL_VERSION = "2024-11-05";

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;

    // Shared secret; an empty key disables the API-key check.
    std::string api_key;
    std::string api_key_header = "X-API-Key";

    // "*" in the list allows any origin.
    std::vector<std::string> cors_origins = {"http://localhost:8000", "http://127.0.0.1:8000"};

    int command_timeout_seconds = 30;
    int max_random_numbers = 100;

    // Request log file; empty disables it.
    std::string log_file = "logs/requests_log.txt";

    int sse_keepalive_seconds = 30;
};

// Thrown when an environment variable holds a value that cannot be used.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};

// Build a configuration from HOST, PORT, MCP_API_KEY, API_KEY_NAME, CORS_ORIGINS,
// COMMAND_TIMEOUT, MAX_RANDOM_NUMBERS, LOG_FILE and SSE_KEEPALIVE_SECONDS.
// Unset variables keep their defaults. Throws ConfigError on malformed values.
ServerConfig load_from_environment();

// Split a comma-separated list, trimming blanks and dropping empty entries.
std::vector<std::string> split_list(const std::string &text);

} // namespace config

#endif // TOOLGATE_SERVER_CONFIG_HPP
