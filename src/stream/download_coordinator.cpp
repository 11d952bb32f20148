#include "download_coordinator.h"

#include "common/debug.h"

namespace stream {

Result DownloadCoordinator::download(const StreamKey& key, ByteSink& sink) {
    if (authorize(key) != ResultCode::OK) {
        return Result(ResultCode::UNAUTHORIZED, "invalid or expired token");
    }

    StreamRegistry::Attachment att;
    auto rc = registry_.findOrCreate(key, StreamRole::CONSUMER, att, options_.wait_for_uploader);
    if (rc == ResultCode::CONFLICT) {
        return Result(rc, "a download is already in progress for this key");
    }
    if (rc == ResultCode::NOT_FOUND) {
        return Result(rc, "no active upload stream for this file");
    }
    if (rc != ResultCode::OK) {
        return Result(rc, "relay is shutting down");
    }

    if (att.created) {
        log_cpp20("[DownloadCoordinator] " + key.display() + " waiting for an upload");
        rc = awaitPeer(att.slot, [&sink] { return sink.peerAlive(); });
        if (rc == ResultCode::TIMEOUT) {
            return Result(rc, "timed out waiting for an upload");
        }
        if (rc == ResultCode::UNAUTHORIZED) {
            return Result(rc, "token revoked while waiting");
        }
        if (rc != ResultCode::OK) {
            return Result(rc, "stream closed before an upload attached");
        }
    }

    if (!sink.open()) {
        teardown(att.slot);
        return Result(ResultCode::PEER_DISCONNECTED, "download client disconnected");
    }
    log_cpp20("[DownloadCoordinator] " + key.display() + " download started");
    return drain(att.slot, sink);
}

Result DownloadCoordinator::drain(const StreamSlot::Ptr& slot, ByteSink& sink) {
    const auto& key = slot->key();
    Chunk chunk;
    for (;;) {
        switch (slot->channel().receive(chunk)) {
            case ChannelStatus::OK:
                break;
            case ChannelStatus::END_OF_STREAM:
                // the producer already released the slot
                if (!sink.finish()) {
                    return Result(ResultCode::PEER_DISCONNECTED, "download client disconnected");
                }
                log_cpp20("[DownloadCoordinator] " + key.display() + " download complete");
                return Result::ok("download completed");
            case ChannelStatus::BROKEN:
                registry_.release(slot);
                log_cpp20("[DownloadCoordinator] upload of " + key.display() + " aborted");
                return Result(ResultCode::PEER_DISCONNECTED, "upload client disconnected");
        }
        if (!sink.write(chunk.data(), chunk.size())) {
            log_cpp20("[DownloadCoordinator] download client of " + key.display() + " disconnected");
            teardown(slot);
            return Result(ResultCode::PEER_DISCONNECTED, "download client disconnected");
        }
        if (keepAlive(key) != ResultCode::OK) {
            teardown(slot);
            return Result(ResultCode::UNAUTHORIZED, "token revoked during transfer");
        }
    }
}

} // namespace stream
