#pragma once

#include "request_handler.h"

namespace handlers {

// GET / (HTML) and GET /status (JSON): read-only view of streams and tokens.
class DashboardHandler : public RequestHandler {
public:
    using RequestHandler::RequestHandler;
    ~DashboardHandler() override = default;

    void handle() override;

private:
    protocol::StatusView collect() const;
};

} // namespace handlers
