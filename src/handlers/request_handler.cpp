#include "request_handler.h"

#include <string>
#include <typeinfo>

#include "auth/auth_manager.h"
#include "net/connection.h"
#include "server/server_config.h"
#include "handlers/dashboard_handler.h"
#include "handlers/download_handler.h"
#include "handlers/token_handler.h"
#include "handlers/upload_handler.h"

namespace handlers {

void RequestHandler::recvRequest() {
    auto* conn = connection_context_->connection;
    if (!conn) {
        error_cpp20("Connection no longer exists");
        return;
    }

    std::string head;
    auto status = conn->readHead(head, RequestParser::MAX_HEAD_SIZE, server().config->header_timeout);
    switch (status) {
        case net::Connection::ReadStatus::OK:
            break;
        case net::Connection::ReadStatus::CLOSED:
            log_cpp20("[RequestHandler] connection " + std::to_string(connection_context_->connection_id) +
                      " closed before sending a request");
            return;
        case net::Connection::ReadStatus::TIMEOUT:
            onFailed(HttpStatus::REQUEST_TIMEOUT, "timed out waiting for the request head");
            return;
        case net::Connection::ReadStatus::TOO_LARGE:
            onFailed(HttpStatus::BAD_REQUEST, "request head too large");
            return;
        case net::Connection::ReadStatus::IO_ERROR:
            log_cpp20("[RequestHandler] read error on connection " +
                      std::to_string(connection_context_->connection_id) + ": " + strerror(errno));
            return;
    }

    auto ret = requestParser.parse(head);
    if (ret == std::nullopt) {
        error_cpp20("Failed to parse request from " + connection_context_->peer + ": " + requestParser.error());
        onFailed(HttpStatus::BAD_REQUEST, requestParser.error());
        return;
    }
    request_ = std::move(*ret);
    route_ = requestParser.route(request_, server().config->auth_mode);
    handle();
}

template <typename Handler>
void RequestHandler::switchTo() {
    auto handler = std::make_shared<Handler>(connection_context_);
    handler->request_ = std::move(request_);
    handler->route_ = std::move(route_);
    log_cpp20("[RequestHandler] " + handler->describe() + " -> " + typeid(Handler).name());
    handler->handle();
    responded_ = handler->responded();
}

void RequestHandler::handle() {
    switch (route_.type) {
        case protocol::RouteType::DASHBOARD:
        case protocol::RouteType::STATUS:
            switchTo<DashboardHandler>();
            break;
        case protocol::RouteType::ISSUE_TOKEN:
        case protocol::RouteType::REVOKE_TOKEN:
            switchTo<TokenHandler>();
            break;
        case protocol::RouteType::UPLOAD:
            switchTo<UploadHandler>();
            break;
        case protocol::RouteType::DOWNLOAD:
            switchTo<DownloadHandler>();
            break;
        case protocol::RouteType::INVALID: {
            const std::string& reason = requestParser.error();
            if (reason == "method not allowed") {
                onFailed(HttpStatus::METHOD_NOT_ALLOWED, reason);
            } else if (reason == "not found") {
                onFailed(HttpStatus::NOT_FOUND, reason);
            } else {
                onFailed(HttpStatus::BAD_REQUEST, reason.empty() ? "bad request" : reason);
            }
            break;
        }
    }
}

bool RequestHandler::sendResponse(const std::string& raw_response) {
    responded_ = true;
    return connection_context_->connection->sendData(raw_response);
}

void RequestHandler::onSuccess(HttpStatus status, const json& body) {
    jsonResponse = body;
    sendResponse(ResponseBuilder::buildJsonResponse(status, jsonResponse));
    log_cpp20("[RequestHandler] " + describe() + " -> " + std::to_string(static_cast<int>(status)));
}

void RequestHandler::onFailed(HttpStatus status, const std::string& error_message, const HeaderList& extra) {
    jsonResponse = responseBuilder.buildErrorResponse(static_cast<int>(status), error_message);
    sendResponse(ResponseBuilder::buildJsonResponse(status, jsonResponse, extra));
    log_cpp20("[RequestHandler] " + describe() + " failed with " + std::to_string(static_cast<int>(status)) +
              ": " + error_message);
}

void RequestHandler::onResult(const Result& result) {
    if (result.isOk()) {
        onSuccess(HttpStatus::OK, responseBuilder.build(result.message));
    } else {
        onFailed(protocol::toHttpStatus(result.code), result.message);
    }
}

bool RequestHandler::checkCredential() {
    const AuthManager* auth = server().auth_manager;
    if (!auth || !auth->enabled()) return true;

    std::string error_message;
    if (auth->authorize(request_.header("authorization"), &error_message)) {
        return true;
    }
    warn_cpp20("credential rejected for " + connection_context_->peer + ": " + error_message);
    onFailed(HttpStatus::UNAUTHORIZED, "invalid username or password",
             {{"WWW-Authenticate", "Basic realm=\"relay\""}});
    return false;
}

StreamKey RequestHandler::streamKey() const {
    if (server().config->auth_mode == AuthMode::OPEN) {
        return StreamKey(route_.file_name);
    }
    return StreamKey(route_.token, route_.file_name);
}

// Never logs a full token.
std::string RequestHandler::describe() const {
    std::string what;
    if (!route_.file_name.empty()) {
        what = streamKey().display();
    } else if (!route_.token.empty()) {
        what = "/token/" + route_.token.substr(0, 8);
    } else {
        what = request_.path;
    }
    return request_.method_str + " " + what + " from " + connection_context_->peer;
}

} // namespace handlers
