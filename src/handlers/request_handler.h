#pragma once

#include <memory>
#include <string>

#include "protocol/request_parser.h"
#include "protocol/response_builder.h"
#include "types/context.h"
#include "types/result.h"
#include "types/stream_key.h"

#include "nlohmann/json.hpp"
#include "common/debug.h"

namespace net {
class Connection;
}

namespace handlers {

using json = nlohmann::json;
using protocol::HeaderList;
using protocol::HttpStatus;
using protocol::RequestParser;
using protocol::ResponseBuilder;

// Serves the single request of one connection: reads and parses the head,
// routes it and hands it to the handler for that route.
class RequestHandler : public std::enable_shared_from_this<RequestHandler> {
public:
    using Ptr = std::shared_ptr<RequestHandler>;

    explicit RequestHandler(ConnectionContext::Ptr connection_context)
        : connection_context_(std::move(connection_context)) {}
    virtual ~RequestHandler() {}

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    virtual void recvRequest();
    virtual void handle();

    virtual bool sendResponse(const std::string& raw_response);
    virtual void onSuccess(HttpStatus status, const json& body);
    virtual void onFailed(HttpStatus status, const std::string& error_message,
                          const HeaderList& extra = {});
    // Maps a coordinator result onto the response.
    void onResult(const Result& result);

    bool responded() const { return responded_; }

protected:
    // HTTP Basic gate. Answers 401 itself when it refuses.
    bool checkCredential();

    StreamKey streamKey() const;
    ServerContext& server() const { return *connection_context_->server_context; }
    net::Connection& connection() const { return *connection_context_->connection; }
    std::string describe() const;

    ConnectionContext::Ptr connection_context_{nullptr};

    protocol::HttpRequest request_;
    protocol::Route route_;
    RequestParser requestParser;
    ResponseBuilder responseBuilder;
    json jsonResponse;

    bool responded_{false};

private:
    template <typename Handler>
    void switchTo();
};

} // namespace handlers
