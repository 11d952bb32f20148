#pragma once

#include "request_handler.h"

namespace handlers {

// POST /token issues a token, DELETE /token/{id} revokes one.
class TokenHandler : public RequestHandler {
public:
    using RequestHandler::RequestHandler;
    ~TokenHandler() override = default;

    void handle() override;

private:
    void issue();
    void revoke();
};

} // namespace handlers
