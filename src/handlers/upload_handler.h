#pragma once

#include "request_handler.h"

namespace handlers {

// PUT: the request body becomes the producer side of a stream.
class UploadHandler : public RequestHandler {
public:
    using RequestHandler::RequestHandler;
    ~UploadHandler() override = default;

    void handle() override;
};

} // namespace handlers
