#include "download_handler.h"

#include "net/connection.h"
#include "net/http_body.h"
#include "server/server_config.h"
#include "stream/download_coordinator.h"

namespace handlers {

void DownloadHandler::handle() {
    if (server().config->auth_mode == AuthMode::OPEN && !checkCredential()) {
        return;
    }

    net::ChunkedResponseSink sink(connection(), route_.file_name);
    Result result = server().downloads->download(streamKey(), sink);
    if (sink.opened()) {
        responded_ = true;
        if (!result.isOk()) {
            // the status line is gone; dropping the connection without the
            // last chunk is how the client learns the transfer broke
            warn_cpp20("[DownloadHandler] " + describe() + " aborted after " +
                       std::to_string(sink.written()) + " bytes: " + result.message);
            connection().shutdown();
        } else {
            log_cpp20("[DownloadHandler] " + describe() + " relayed " + std::to_string(sink.written()) + " bytes");
        }
        return;
    }
    onResult(result);
}

} // namespace handlers
