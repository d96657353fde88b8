#ifndef TOOLGATE_API_KEY_GUARD_HPP
#define TOOLGATE_API_KEY_GUARD_HPP

// Shared-secret check on a configurable request header.

#include <string>

#include "config/server_config.hpp"
#include "http/http_types.hpp"

namespace auth {

class ApiKeyGuard {
public:
    explicit ApiKeyGuard(const config::ServerConfig &server_config);

    // False when no key is configured; every request then passes.
    bool is_enabled() const { return !api_key_.empty(); }

    // True if the key header carries exactly the configured key.
    bool check(const http::HeaderMap &headers) const;

    // 401 {"detail": "Invalid or missing API key"}
    static http::HttpResponse reject();

private:
    std::string api_key_;
    std::string header_name_;
};

} // namespace auth

#endif // TOOLGATE_API_KEY_GUARD_HPP
