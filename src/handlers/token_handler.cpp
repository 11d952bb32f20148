#include "token_handler.h"

#include <chrono>

#include "auth/token_authority.h"

namespace handlers {

void TokenHandler::handle() {
    if (server().tokens == nullptr) {
        onFailed(HttpStatus::NOT_FOUND, "tokens are not used in open mode");
        return;
    }
    if (!checkCredential()) {
        return;
    }
    if (route_.type == protocol::RouteType::ISSUE_TOKEN) {
        issue();
    } else {
        revoke();
    }
}

void TokenHandler::issue() {
    auto& tokens = *server().tokens;
    Token token = tokens.issue();
    auto expires_in = std::chrono::ceil<std::chrono::seconds>(token.expires_at - tokens.now());
    log_cpp20("[TokenHandler] issued token " + token.id.substr(0, auth::TokenAuthority::kPrefixLength) +
              " to " + connection_context_->peer);
    onSuccess(HttpStatus::CREATED, responseBuilder.buildTokenResponse(token, expires_in));
}

void TokenHandler::revoke() {
    if (!server().tokens->revoke(route_.token)) {
        onFailed(HttpStatus::NOT_FOUND, "unknown token");
        return;
    }
    log_cpp20("[TokenHandler] revoked token " + route_.token.substr(0, auth::TokenAuthority::kPrefixLength));
    sendResponse(ResponseBuilder::buildEmptyResponse(HttpStatus::NO_CONTENT));
}

} // namespace handlers
