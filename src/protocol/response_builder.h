#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "error_codes.h"
#include "stream/stream_registry.h"
#include "types/enums.h"
#include "types/token.h"

#include "nlohmann/json.hpp"

namespace protocol {

using nlohmann::json;

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Everything the dashboard shows, copied out of the registries.
struct StatusView {
    AuthMode auth_mode{AuthMode::TOKEN};
    std::chrono::seconds uptime{0};
    std::vector<stream::SlotInfo> slots;
    std::vector<TokenInfo> tokens;
};

class ResponseBuilder {
public:
    ResponseBuilder() = default;
    ~ResponseBuilder() = default;

    json build(const std::string& response);
    json buildErrorResponse(int errorCode, const std::string& errorMessage);
    json buildTokenResponse(const Token& token, std::chrono::seconds expires_in);
    json buildStatusResponse(const StatusView& view);
    std::string buildDashboardPage(const StatusView& view);

    // Complete response with a body. Always "Connection: close".
    static std::string buildResponse(HttpStatus status, const std::string& content_type,
                                     const std::string& body, const HeaderList& extra = {});
    static std::string buildJsonResponse(HttpStatus status, const json& body, const HeaderList& extra = {});
    static std::string buildEmptyResponse(HttpStatus status, const HeaderList& extra = {});
    static std::string buildContinue();
    // Head of a chunked attachment download.
    static std::string buildDownloadHead(const std::string& file_name);

    static std::string htmlEscape(const std::string& in);

private:
    static std::string statusLine(HttpStatus status);
};

} // namespace protocol
