#include "auth/api_key_guard.hpp"

namespace auth {

ApiKeyGuard::ApiKeyGuard(const config::ServerConfig &server_config)
    : api_key_(server_config.api_key), header_name_(http::to_lower(server_config.api_key_header)) {}

// Touches every presented byte, so timing does not depend on where the first mismatch is.
static bool keys_equal(const std::string &presented, const std::string &expected) {
    unsigned char difference = presented.size() == expected.size() ? 0 : 1;
    for (size_t index = 0; index < presented.size(); ++index) {
        unsigned char expected_byte = index < expected.size() ? static_cast<unsigned char>(expected[index]) : 0;
        difference |= static_cast<unsigned char>(presented[index]) ^ expected_byte;
    }
    return difference == 0;
}

bool ApiKeyGuard::check(const http::HeaderMap &headers) const {
    if (!is_enabled()) {
        return true;
    }
    auto found = headers.find(header_name_);
    if (found == headers.end()) {
        return false;
    }
    return keys_equal(found->second, api_key_);
}

http::HttpResponse ApiKeyGuard::reject() {
    return http::HttpResponse::with_detail(401, "Invalid or missing API key");
}

} // namespace auth
