#include "response_builder.h"

#include <sstream>
#include <string>

#include "common/debug.h"

namespace protocol {

namespace {

std::string formatDuration(std::chrono::milliseconds ms) {
    auto total = std::chrono::duration_cast<std::chrono::seconds>(ms).count();
    std::ostringstream oss;
    if (total >= 3600) oss << total / 3600 << "h ";
    if (total >= 60) oss << (total % 3600) / 60 << "m ";
    oss << total % 60 << "s";
    return oss.str();
}

} // namespace

json ResponseBuilder::build(const std::string& response) {
    json resp = {
        {"status", "ok"},
        {"responseMessage", response}
    };
    return resp;
}

json ResponseBuilder::buildErrorResponse(int errorCode, const std::string& errorMessage) {
    json resp = {
        {"status", "error"},
        {"errorCode", errorCode},
        {"errorMessage", errorMessage}
    };
    return resp;
}

json ResponseBuilder::buildTokenResponse(const Token& token, std::chrono::seconds expires_in) {
    json resp = {
        {"token", token.id},
        {"expires_in", expires_in.count()}
    };
    return resp;
}

json ResponseBuilder::buildStatusResponse(const StatusView& view) {
    json streams = json::array();
    for (const auto& slot : view.slots) {
        streams.push_back({
            {"key", slot.key},
            {"state", toString(slot.state)},
            {"age_ms", slot.age.count()},
            {"bytes", slot.bytes}
        });
    }
    json tokens = json::array();
    for (const auto& token : view.tokens) {
        tokens.push_back({
            {"id_prefix", token.id_prefix},
            {"remaining_ms", token.remaining.count()},
            {"use_count", token.use_count}
        });
    }
    json resp = {
        {"auth_mode", toString(view.auth_mode)},
        {"uptime_s", view.uptime.count()},
        {"streams", streams},
        {"tokens", tokens}
    };
    return resp;
}

std::string ResponseBuilder::buildDashboardPage(const StatusView& view) {
    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html lang=\"en\">\n<head>\n"
         << "  <meta charset=\"utf-8\" />\n"
         << "  <meta http-equiv=\"refresh\" content=\"5\" />\n"
         << "  <title>Relay Dashboard</title>\n"
         << "  <style>\n"
         << "    body { font-family: sans-serif; margin: 2rem; max-width: 48rem; }\n"
         << "    table { border-collapse: collapse; width: 100%; }\n"
         << "    td, th { border-bottom: 1px solid #ddd; padding: 0.3rem 0.5rem; text-align: left; }\n"
         << "    code { background: #f4f4f4; padding: 0.2rem 0.4rem; border-radius: 3px; }\n"
         << "  </style>\n</head>\n<body>\n"
         << "  <h1>Relay Dashboard</h1>\n"
         << "  <p>Mode: <code>" << toString(view.auth_mode) << "</code>, up "
         << formatDuration(std::chrono::duration_cast<std::chrono::milliseconds>(view.uptime)) << "</p>\n";

    html << "  <section>\n    <h2>Active Streams (" << view.slots.size() << ")</h2>\n";
    if (view.slots.empty()) {
        html << "    <p>None.</p>\n";
    } else {
        html << "    <table>\n      <tr><th>Key</th><th>State</th><th>Age</th><th>Bytes</th></tr>\n";
        for (const auto& slot : view.slots) {
            html << "      <tr><td>" << htmlEscape(slot.key) << "</td><td>" << toString(slot.state)
                 << "</td><td>" << formatDuration(slot.age) << "</td><td>" << slot.bytes << "</td></tr>\n";
        }
        html << "    </table>\n";
    }
    html << "  </section>\n";

    if (view.auth_mode == AuthMode::TOKEN) {
        html << "  <section>\n    <h2>Tokens (" << view.tokens.size() << ")</h2>\n";
        if (view.tokens.empty()) {
            html << "    <p>None.</p>\n";
        } else {
            html << "    <table>\n      <tr><th>Token</th><th>Remaining</th><th>Uses</th></tr>\n";
            for (const auto& token : view.tokens) {
                html << "      <tr><td><code>" << htmlEscape(token.id_prefix) << "&hellip;</code></td><td>"
                     << formatDuration(token.remaining) << "</td><td>" << token.use_count << "</td></tr>\n";
            }
            html << "    </table>\n";
        }
        html << "  </section>\n";
    }

    html << "  <section>\n    <h2>Usage</h2>\n    <ol>\n";
    if (view.auth_mode == AuthMode::TOKEN) {
        html << "      <li>Token: <code>curl -X POST http://HOST/token</code></li>\n"
             << "      <li>Upload: <code>curl -T file.zip http://HOST/TOKEN/file.zip</code></li>\n"
             << "      <li>Download: <code>curl http://HOST/TOKEN/file.zip -o file.zip</code></li>\n";
    } else {
        html << "      <li>Upload: <code>curl -T file.zip http://HOST/file.zip</code></li>\n"
             << "      <li>Download: <code>curl http://HOST/file.zip -o file.zip</code></li>\n";
    }
    html << "    </ol>\n  </section>\n</body>\n</html>\n";
    return html.str();
}

std::string ResponseBuilder::statusLine(HttpStatus status) {
    return "HTTP/1.1 " + std::to_string(static_cast<int>(status)) + " " + reasonPhrase(status) + "\r\n";
}

std::string ResponseBuilder::buildResponse(HttpStatus status, const std::string& content_type,
                                           const std::string& body, const HeaderList& extra) {
    std::string out = statusLine(status);
    out += "Content-Type: " + content_type + "\r\n";
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    for (const auto& [name, value] : extra) {
        out += name + ": " + value + "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

std::string ResponseBuilder::buildJsonResponse(HttpStatus status, const json& body, const HeaderList& extra) {
    return buildResponse(status, "application/json", body.dump() + "\n", extra);
}

std::string ResponseBuilder::buildEmptyResponse(HttpStatus status, const HeaderList& extra) {
    std::string out = statusLine(status);
    for (const auto& [name, value] : extra) {
        out += name + ": " + value + "\r\n";
    }
    if (status != HttpStatus::NO_CONTENT) out += "Content-Length: 0\r\n";
    out += "Connection: close\r\n\r\n";
    return out;
}

std::string ResponseBuilder::buildContinue() {
    return statusLine(HttpStatus::CONTINUE) + "\r\n";
}

std::string ResponseBuilder::buildDownloadHead(const std::string& file_name) {
    std::string out = statusLine(HttpStatus::OK);
    out += "Content-Type: application/octet-stream\r\n";
    out += "Content-Disposition: attachment; filename=\"" + file_name + "\"\r\n";
    out += "Transfer-Encoding: chunked\r\n";
    out += "Connection: close\r\n\r\n";
    return out;
}

std::string ResponseBuilder::htmlEscape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

} // namespace protocol
