#include "upload_coordinator.h"

#include "common/debug.h"

namespace stream {

Result UploadCoordinator::upload(const StreamKey& key, ByteSource& source) {
    if (authorize(key) != ResultCode::OK) {
        return Result(ResultCode::UNAUTHORIZED, "invalid or expired token");
    }

    StreamRegistry::Attachment att;
    auto rc = registry_.findOrCreate(key, StreamRole::PRODUCER, att);
    if (rc == ResultCode::CONFLICT) {
        return Result(rc, "an upload is already in progress for this key");
    }
    if (rc != ResultCode::OK) {
        return Result(rc, "relay is shutting down");
    }

    if (att.created) {
        log_cpp20("[UploadCoordinator] " + key.display() + " waiting for a download client");
        rc = awaitPeer(att.slot, [&source] { return source.peerAlive(); });
        if (rc == ResultCode::TIMEOUT) {
            return Result(rc, "timed out waiting for a download client");
        }
        if (rc == ResultCode::UNAUTHORIZED) {
            return Result(rc, "token revoked while waiting");
        }
        if (rc != ResultCode::OK) {
            return Result(rc, "stream closed before a download client attached");
        }
    }
    log_cpp20("[UploadCoordinator] " + key.display() + " download client connected");
    return pump(att.slot, source);
}

Result UploadCoordinator::pump(const StreamSlot::Ptr& slot, ByteSource& source) {
    const auto& key = slot->key();
    for (;;) {
        Chunk chunk(options_.chunk_size);
        ssize_t n = source.read(chunk.data(), chunk.size());
        if (n == 0) {
            break;
        }
        if (n < 0) {
            error_cpp20("[UploadCoordinator] reading upload for " + key.display() + " failed");
            teardown(slot);
            return Result(ResultCode::PEER_DISCONNECTED, "upload stream failed");
        }
        chunk.resize(static_cast<size_t>(n));
        if (slot->channel().send(std::move(chunk)) != ChannelStatus::OK) {
            log_cpp20("[UploadCoordinator] download client of " + key.display() + " disconnected");
            teardown(slot);
            return Result(ResultCode::PEER_DISCONNECTED, "download client disconnected");
        }
        slot->addBytes(static_cast<uint64_t>(n));
        if (keepAlive(key) != ResultCode::OK) {
            teardown(slot);
            return Result(ResultCode::UNAUTHORIZED, "token revoked during transfer");
        }
    }

    slot->channel().close();
    slot->finish();
    registry_.release(slot);
    log_cpp20("[UploadCoordinator] " + key.display() + " finished after " +
              std::to_string(slot->bytesTransferred()) + " bytes");
    return Result::ok("upload completed successfully");
}

} // namespace stream
