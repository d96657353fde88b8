#ifndef TOOLGATE_HTTP_TYPES_HPP
#define TOOLGATE_HTTP_TYPES_HPP

// Transport-neutral HTTP request and response values.
// The libwebsockets glue fills an HttpRequest and writes an HttpResponse;
// everything between works on these plain values.

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace http {

using json = nlohmann::json;

// Header names are stored lowercased.
using HeaderMap = std::map<std::string, std::string>;

std::string to_lower(std::string text);

// Value of a header (case-insensitive name), or "" when absent.
std::string find_header(const HeaderMap &headers, const std::string &name);

struct HttpRequest {
    std::string method;  // "GET", "POST", "OPTIONS", ...
    std::string path;    // Without the query string.
    std::string body;
    HeaderMap headers;
    std::string peer_address;

    std::string header(const std::string &name) const { return find_header(headers, name); }
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;
    // Extra response headers in emission order.
    std::vector<std::pair<std::string, std::string>> headers;

    void set_header(const std::string &name, const std::string &value);

    // body = document serialized compactly.
    static HttpResponse with_json(int status, const json &document);

    // FastAPI-style error body: {"detail": message}.
    static HttpResponse with_detail(int status, const std::string &message);

    // No body (e.g. 204 preflight or a notification acknowledgement).
    static HttpResponse empty(int status);
};

} // namespace http

#endif // TOOLGATE_HTTP_TYPES_HPP
