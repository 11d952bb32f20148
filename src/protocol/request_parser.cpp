#include "request_parser.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "common/debug.h"

namespace protocol {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool HttpRequest::chunked() const {
    return toLower(header("transfer-encoding")).find("chunked") != std::string::npos;
}

bool HttpRequest::expectContinue() const {
    return toLower(header("expect")) == "100-continue";
}

std::optional<uint64_t> HttpRequest::contentLength() const {
    auto it = headers.find("content-length");
    if (it == headers.end() || it->second.empty()) return std::nullopt;
    uint64_t value = 0;
    for (char c : it->second) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        uint64_t next = value * 10 + static_cast<uint64_t>(c - '0');
        if (next < value) return std::nullopt;
        value = next;
    }
    return value;
}

std::optional<HttpRequest> RequestParser::parse(const std::string& head) {
    reset();
    if (head.size() > MAX_HEAD_SIZE) {
        error_ = "request head too large";
        return std::nullopt;
    }

    HttpRequest req;
    std::istringstream in(head);
    std::string line;
    if (!std::getline(in, line)) {
        error_ = "empty request";
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream request_line(line);
    if (!(request_line >> req.method_str >> req.target >> req.version)) {
        error_ = "malformed request line";
        return std::nullopt;
    }
    if (req.version != "HTTP/1.1" && req.version != "HTTP/1.0") {
        error_ = "unsupported HTTP version " + req.version;
        return std::nullopt;
    }
    if (req.target.empty() || req.target[0] != '/') {
        error_ = "request target must be an absolute path";
        return std::nullopt;
    }
    req.method = stringToHttpMethod(req.method_str);

    auto qpos = req.target.find('?');
    req.path = req.target.substr(0, qpos);
    if (qpos != std::string::npos) req.query = req.target.substr(qpos + 1);

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;
        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            error_ = "malformed header line";
            return std::nullopt;
        }
        std::string name = toLower(trim(line.substr(0, colon)));
        std::string value = trim(line.substr(colon + 1));
        auto [it, inserted] = req.headers.emplace(name, value);
        if (!inserted) {
            if (name == "content-length" && it->second != value) {
                error_ = "conflicting Content-Length headers";
                return std::nullopt;
            }
            it->second += ", " + value;
        }
    }

    if (req.chunked() && req.hasHeader("content-length")) {
        // RFC 9112 6.3: Transfer-Encoding wins, drop the length
        req.headers.erase("content-length");
    } else if (req.hasHeader("content-length") && !req.contentLength()) {
        error_ = "invalid Content-Length";
        return std::nullopt;
    }

    log_cpp20("[RequestParser] " + req.method_str + " " + req.target);
    return req;
}

Route RequestParser::route(const HttpRequest& request, AuthMode mode) {
    reset();
    Route r;
    auto raw_segments = splitPath(request.path);
    std::vector<std::string> segments;
    for (const auto& raw : raw_segments) {
        auto decoded = percentDecode(raw);
        if (!decoded) {
            error_ = "malformed percent-encoding in path";
            return r;
        }
        segments.push_back(std::move(*decoded));
    }

    const auto method = request.method;
    if (segments.empty()) {
        if (method == HttpMethod::GET || method == HttpMethod::HEAD) r.type = RouteType::DASHBOARD;
        else error_ = "method not allowed";
        return r;
    }
    if (segments.size() == 1 && segments[0] == "status" && method == HttpMethod::GET) {
        r.type = RouteType::STATUS;
        return r;
    }
    if (segments[0] == "token" && (method == HttpMethod::POST || method == HttpMethod::DELETE)) {
        if (method == HttpMethod::POST && segments.size() == 1) {
            r.type = RouteType::ISSUE_TOKEN;
        } else if (method == HttpMethod::DELETE && segments.size() == 2 && !segments[1].empty()) {
            r.type = RouteType::REVOKE_TOKEN;
            r.token = segments[1];
        } else {
            error_ = "not found";
        }
        return r;
    }

    if (method != HttpMethod::GET && method != HttpMethod::PUT) {
        error_ = "method not allowed";
        return r;
    }

    if (mode == AuthMode::TOKEN) {
        if (segments.size() == 1) {
            // a filename without a token
            r.type = method == HttpMethod::PUT ? RouteType::UPLOAD : RouteType::DOWNLOAD;
            r.file_name = segments[0];
        } else if (segments.size() == 2) {
            r.type = method == HttpMethod::PUT ? RouteType::UPLOAD : RouteType::DOWNLOAD;
            r.token = segments[0];
            r.file_name = segments[1];
        } else {
            error_ = "not found";
            return r;
        }
    } else {
        if (segments.size() != 1) {
            error_ = "not found";
            return r;
        }
        r.type = method == HttpMethod::PUT ? RouteType::UPLOAD : RouteType::DOWNLOAD;
        r.file_name = segments[0];
    }

    if (!validFileName(r.file_name)) {
        error_ = "invalid file name";
        r.type = RouteType::INVALID;
    }
    return r;
}

std::optional<std::string> RequestParser::percentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%') {
            if (i + 2 >= in.size()) return std::nullopt;
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            out.push_back(in[i]);
        }
    }
    return out;
}

std::vector<std::string> RequestParser::splitPath(const std::string& path) {
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos < path.size()) {
        if (path[pos] == '/') {
            ++pos;
            continue;
        }
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        segments.push_back(path.substr(pos, next - pos));
        pos = next;
    }
    return segments;
}

bool RequestParser::validFileName(const std::string& name) {
    if (name.empty() || name.size() > MAX_FILENAME) return false;
    if (name == "." || name == "..") return false;
    for (unsigned char c : name) {
        if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f || c == '"') return false;
    }
    return true;
}

} // namespace protocol
