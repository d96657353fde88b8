#include "config/server_config.hpp"

#include <cstdlib>
#include <cerrno>

namespace config {

static const char *read_variable(const char *name) {
    const char *value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return nullptr;
    }
    return value;
}

static std::string trim(const std::string &text) {
    const char *blanks = " \t\r\n";
    size_t first = text.find_first_not_of(blanks);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(blanks);
    return text.substr(first, last - first + 1);
}

// Parse a whole-string decimal integer within [minimum, maximum].
static int read_integer(const char *name, int fallback, int minimum, int maximum) {
    const char *value = read_variable(name);
    if (value == nullptr) {
        return fallback;
    }
    char *end = nullptr;
    errno = 0;
    long parsed = std::strtol(value, &end, 10);
    if (errno != 0 || end == value || *end != '\0' || parsed < minimum || parsed > maximum) {
        throw ConfigError(std::string(name) + " must be an integer between " + std::to_string(minimum) +
                          " and " + std::to_string(maximum) + ", got '" + value + "'");
    }
    return static_cast<int>(parsed);
}

std::vector<std::string> split_list(const std::string &text) {
    std::vector<std::string> entries;
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) {
            comma = text.size();
        }
        std::string entry = trim(text.substr(start, comma - start));
        if (!entry.empty()) {
            entries.push_back(entry);
        }
        start = comma + 1;
    }
    return entries;
}

ServerConfig load_from_environment() {
    ServerConfig server_config;

    if (const char *host = read_variable("HOST")) {
        server_config.host = host;
    }
    server_config.port = read_integer("PORT", server_config.port, 1, 65535);

    if (const char *api_key = read_variable("MCP_API_KEY")) {
        server_config.api_key = api_key;
    }
    if (const char *header_name = read_variable("API_KEY_NAME")) {
        server_config.api_key_header = header_name;
    }

    if (const char *origins = read_variable("CORS_ORIGINS")) {
        server_config.cors_origins = split_list(origins);
    }

    server_config.command_timeout_seconds =
        read_integer("COMMAND_TIMEOUT", server_config.command_timeout_seconds, 1, 86400);
    server_config.max_random_numbers =
        read_integer("MAX_RANDOM_NUMBERS", server_config.max_random_numbers, 1, 1000000);
    server_config.sse_keepalive_seconds =
        read_integer("SSE_KEEPALIVE_SECONDS", server_config.sse_keepalive_seconds, 1, 3600);

    // LOG_FILE may be set to an empty string on purpose to disable the file log.
    if (const char *log_file = std::getenv("LOG_FILE")) {
        server_config.log_file = log_file;
    }

    return server_config;
}

} // namespace config
