#pragma once

#include <string>
#include <unordered_map>
#include <optional>
#include <vector>
#include <cstdint>

#include "commands.h"
#include "types/enums.h"

namespace protocol {

struct HttpRequest {
    std::string method_str;
    HttpMethod method{HttpMethod::OTHER};
    std::string target;     // raw request target
    std::string path;       // target without the query string, still encoded
    std::string query;
    std::string version;
    std::unordered_map<std::string, std::string> headers; // lower-case names

    // "" when absent.
    std::string header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? std::string() : it->second;
    }

    bool hasHeader(const std::string& lower_name) const {
        return headers.find(lower_name) != headers.end();
    }

    bool chunked() const;
    bool expectContinue() const;
    std::optional<uint64_t> contentLength() const;
};

// Parses an HTTP/1.x request head and maps it onto a relay route.
class RequestParser {
public:
    static constexpr size_t MAX_HEAD_SIZE = 16 * 1024;
    static constexpr size_t MAX_FILENAME = 255;

    RequestParser() = default;
    ~RequestParser() = default;

    // `head` is everything before the blank line that ends the header block.
    std::optional<HttpRequest> parse(const std::string& head);

    // INVALID with a message in error() when the path is malformed.
    Route route(const HttpRequest& request, AuthMode mode);

    const std::string& error() const { return error_; }

    static std::optional<std::string> percentDecode(const std::string& in);
    static std::vector<std::string> splitPath(const std::string& path);
    static bool validFileName(const std::string& name);

private:
    inline void reset() {
        error_.clear();
    }

    std::string error_;
};

} // namespace protocol
