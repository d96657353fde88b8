#include "http/cors_policy.hpp"

#include <algorithm>
#include <utility>

namespace http {

CorsPolicy::CorsPolicy(std::vector<std::string> allowed_origins) : allowed_origins_(std::move(allowed_origins)) {}

bool CorsPolicy::allows(const std::string &origin) const {
    if (origin.empty()) {
        return false;
    }
    return std::any_of(allowed_origins_.begin(), allowed_origins_.end(),
                       [&origin](const std::string &allowed) { return allowed == "*" || allowed == origin; });
}

void CorsPolicy::apply(const HttpRequest &request, HttpResponse &response) const {
    std::string origin = request.header("origin");
    if (!allows(origin)) {
        return;
    }
    response.set_header("Access-Control-Allow-Origin", origin);
    response.set_header("Access-Control-Allow-Credentials", "true");
    response.set_header("Vary", "Origin");
}

HttpResponse CorsPolicy::preflight(const HttpRequest &request) const {
    HttpResponse response = HttpResponse::empty(204);
    response.content_type = "text/plain";
    apply(request, response);

    std::string requested_headers = request.header("access-control-request-headers");
    response.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    response.set_header("Access-Control-Allow-Headers", requested_headers.empty() ? "*" : requested_headers);
    response.set_header("Access-Control-Max-Age", "600");
    return response;
}

} // namespace http
