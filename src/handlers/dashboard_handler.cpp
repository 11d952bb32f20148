#include "dashboard_handler.h"

#include <chrono>

#include "auth/token_authority.h"
#include "server/server_config.h"
#include "stream/stream_registry.h"

namespace handlers {

protocol::StatusView DashboardHandler::collect() const {
    protocol::StatusView view;
    view.auth_mode = server().config->auth_mode;
    view.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - server().started_at);
    view.slots = server().registry->snapshot();
    if (server().tokens) {
        view.tokens = server().tokens->snapshot();
    }
    return view;
}

void DashboardHandler::handle() {
    auto view = collect();
    if (route_.type == protocol::RouteType::STATUS) {
        onSuccess(HttpStatus::OK, responseBuilder.buildStatusResponse(view));
        return;
    }

    std::string response = ResponseBuilder::buildResponse(HttpStatus::OK, "text/html; charset=utf-8",
                                                          responseBuilder.buildDashboardPage(view));
    if (request_.method == protocol::HttpMethod::HEAD) {
        response.erase(response.find("\r\n\r\n") + 4);
    }
    sendResponse(response);
}

} // namespace handlers
