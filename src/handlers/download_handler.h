#pragma once

#include "request_handler.h"

namespace handlers {

// GET: the response body becomes the consumer side of a stream.
class DownloadHandler : public RequestHandler {
public:
    using RequestHandler::RequestHandler;
    ~DownloadHandler() override = default;

    void handle() override;
};

} // namespace handlers
