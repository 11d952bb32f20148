#include "upload_handler.h"

#include "net/connection.h"
#include "net/http_body.h"
#include "server/server_config.h"
#include "stream/upload_coordinator.h"

namespace handlers {

void UploadHandler::handle() {
    if (server().config->auth_mode == AuthMode::OPEN && !checkCredential()) {
        return;
    }

    net::HttpBodySource source(connection(), request_);
    Result result = server().uploads->upload(streamKey(), source);
    if (result.isOk()) {
        log_cpp20("[UploadHandler] " + describe() + " relayed " + std::to_string(source.consumed()) + " bytes");
        onSuccess(HttpStatus::OK, responseBuilder.build("upload completed successfully"));
        return;
    }
    onResult(result);
}

} // namespace handlers
