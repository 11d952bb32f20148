#pragma once

#include <string>
#include <unordered_map>

namespace protocol {

enum class HttpMethod {
    GET,
    PUT,
    POST,
    DELETE,
    HEAD,
    OTHER
};

// What a request asks the relay to do, decided from method + path.
enum class RouteType {
    DASHBOARD,      // GET /
    STATUS,         // GET /status
    ISSUE_TOKEN,    // POST /token
    REVOKE_TOKEN,   // DELETE /token/{id}
    UPLOAD,         // PUT /{token}/{file} or PUT /{file}
    DOWNLOAD,       // GET /{token}/{file} or GET /{file}
    INVALID
};

struct Route {
    RouteType type{RouteType::INVALID};
    std::string token;
    std::string file_name;
};

inline HttpMethod stringToHttpMethod(const std::string& method_str) {
    static const std::unordered_map<std::string, HttpMethod> method_map = {
        {"GET", HttpMethod::GET},
        {"PUT", HttpMethod::PUT},
        {"POST", HttpMethod::POST},
        {"DELETE", HttpMethod::DELETE},
        {"HEAD", HttpMethod::HEAD}
    };

    auto it = method_map.find(method_str);
    return (it != method_map.end()) ? it->second : HttpMethod::OTHER;
}

} // namespace protocol
