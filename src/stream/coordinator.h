#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

#include "stream_registry.h"
#include "types/enums.h"
#include "types/result.h"
#include "types/stream_key.h"

namespace auth {
class TokenAuthority;
}

namespace stream {

struct CoordinatorOptions {
    AuthMode auth_mode{AuthMode::TOKEN};
    size_t chunk_size{64 * 1024};
    // false: a download that finds no upload answers NOT_FOUND instead of waiting
    bool wait_for_uploader{true};
    // How often a waiting side checks that its client is still connected and
    // that its token was not revoked.
    std::chrono::milliseconds liveness_interval{250};
};

// Shared steps of the upload and download paths: token gate, slot
// acquisition and the wait for the other party.
class Coordinator {
public:
    // `tokens` may be null only in OPEN mode.
    Coordinator(StreamRegistry& registry, auth::TokenAuthority* tokens, CoordinatorOptions options);
    virtual ~Coordinator() = default;

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    const CoordinatorOptions& options() const { return options_; }

protected:
    // UNAUTHORIZED when the key's token is missing, unknown or expired.
    ResultCode authorize(const StreamKey& key);

    // Called for every chunk so that an active transfer keeps its token alive.
    ResultCode keepAlive(const StreamKey& key);

    using LivenessCheck = std::function<bool()>;

    // Waits for the other role in steps of liveness_interval. Between steps
    // `alive` is polled and the token is looked up again. On any result but OK
    // the slot is already closed and released:
    //  TIMEOUT (peer deadline or token ran out), UNAUTHORIZED (token revoked),
    //  PEER_DISCONNECTED (own client gone, or the slot was aborted).
    ResultCode awaitPeer(const StreamSlot::Ptr& slot, const LivenessCheck& alive);

    // AWAITING_PEER -> CLOSED(EXPIRED) and release. false if a peer attached
    // or the slot was aborted first.
    bool expireSlot(const StreamSlot::Ptr& slot);

    // Closes the slot with an error and drops it from the registry.
    void teardown(const StreamSlot::Ptr& slot);

    StreamRegistry& registry_;
    auth::TokenAuthority* tokens_;
    CoordinatorOptions options_;
};

} // namespace stream
