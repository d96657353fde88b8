#include "http/http_types.hpp"

#include <algorithm>
#include <cctype>

namespace http {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return text;
}

std::string find_header(const HeaderMap &headers, const std::string &name) {
    auto found = headers.find(to_lower(name));
    if (found == headers.end()) {
        return "";
    }
    return found->second;
}

void HttpResponse::set_header(const std::string &name, const std::string &value) {
    for (auto &existing : headers) {
        if (to_lower(existing.first) == to_lower(name)) {
            existing.second = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

HttpResponse HttpResponse::with_json(int status, const json &document) {
    HttpResponse response;
    response.status = status;
    response.body = document.dump(-1, ' ', false, json::error_handler_t::replace);
    return response;
}

HttpResponse HttpResponse::with_detail(int status, const std::string &message) {
    json document;
    document["detail"] = message;
    return with_json(status, document);
}

HttpResponse HttpResponse::empty(int status) {
    HttpResponse response;
    response.status = status;
    return response;
}

} // namespace http
