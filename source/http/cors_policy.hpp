#ifndef TOOLGATE_CORS_POLICY_HPP
#define TOOLGATE_CORS_POLICY_HPP

// Cross-origin allow-list applied to every response.

#include <string>
#include <vector>

#include "http/http_types.hpp"

namespace http {

class CorsPolicy {
public:
    explicit CorsPolicy(std::vector<std::string> allowed_origins);

    // True if origin is listed or the list contains "*".
    bool allows(const std::string &origin) const;

    // Add the allow headers to response when the request's Origin is allowed.
    void apply(const HttpRequest &request, HttpResponse &response) const;

    // 204 answer to an OPTIONS preflight.
    HttpResponse preflight(const HttpRequest &request) const;

private:
    std::vector<std::string> allowed_origins_;
};

} // namespace http

#endif // TOOLGATE_CORS_POLICY_HPP
