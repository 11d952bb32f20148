#include "coordinator.h"

#include <algorithm>
#include <optional>

#include "auth/token_authority.h"
#include "common/debug.h"

namespace stream {

Coordinator::Coordinator(StreamRegistry& registry, auth::TokenAuthority* tokens, CoordinatorOptions options)
    : registry_(registry), tokens_(tokens), options_(options) {
    if (options_.chunk_size == 0) options_.chunk_size = 64 * 1024;
    if (options_.auth_mode == AuthMode::TOKEN && !tokens_) {
        RUNTIME_ERROR("token mode without a token authority, every request will be rejected");
    }
}

ResultCode Coordinator::authorize(const StreamKey& key) {
    if (options_.auth_mode == AuthMode::OPEN) return ResultCode::OK;
    if (!tokens_ || key.token.empty()) return ResultCode::UNAUTHORIZED;
    auto status = tokens_->validate(key.token);
    if (status != TokenStatus::AUTHORIZED) {
        log_cpp20("[Coordinator] rejected " + key.display() +
                  (status == TokenStatus::EXPIRED ? ": token expired" : ": unknown token"));
        return ResultCode::UNAUTHORIZED;
    }
    return ResultCode::OK;
}

ResultCode Coordinator::keepAlive(const StreamKey& key) {
    return authorize(key);
}

ResultCode Coordinator::awaitPeer(const StreamSlot::Ptr& slot, const LivenessCheck& alive) {
    const auto& key = slot->key();
    const bool token_bound = options_.auth_mode == AuthMode::TOKEN && tokens_;
    for (;;) {
        std::optional<StreamSlot::TimePoint> until = slot->peerDeadline();
        if (token_bound) {
            // Waiting is not activity: the wait also ends when the token runs out.
            // If abandon() or expireSlot() lose to an attach, the wait below returns at once.
            auto token_expiry = tokens_->expiresAt(key.token);
            if (!token_expiry) {
                if (slot->abandon()) {
                    registry_.release(slot);
                    log_cpp20("[Coordinator] token of " + key.display() + " revoked while waiting");
                    return ResultCode::UNAUTHORIZED;
                }
            } else if (tokens_->now() >= *token_expiry) {
                if (expireSlot(slot)) return ResultCode::TIMEOUT;
            } else {
                until = until ? std::min(*until, *token_expiry) : *token_expiry;
            }
        }

        auto step = std::chrono::steady_clock::now() + options_.liveness_interval;
        bool bounded_by_step = !until || step < *until;
        switch (slot->waitForPeer(bounded_by_step ? step : *until)) {
            case PeerWait::ATTACHED:
                return ResultCode::OK;
            case PeerWait::CLOSED:
                registry_.release(slot);
                return slot->closeReason() == CloseReason::EXPIRED ? ResultCode::TIMEOUT
                                                                   : ResultCode::PEER_DISCONNECTED;
            case PeerWait::DEADLINE:
                break;
        }

        if (alive && !alive()) {
            if (slot->abandon()) {
                registry_.release(slot);
                log_cpp20("[Coordinator] client waiting on " + key.display() + " disconnected");
                return ResultCode::PEER_DISCONNECTED;
            }
            // a peer attached in the meantime, the next wait reports it
            continue;
        }

        auto deadline = slot->peerDeadline();
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            if (expireSlot(slot)) return ResultCode::TIMEOUT;
        }
        // token expiry, revocation or an extension by another request is
        // re-read at the top of the loop
    }
}

bool Coordinator::expireSlot(const StreamSlot::Ptr& slot) {
    if (!slot->expire()) {
        // lost the race against an attach or an abort, the next wait reports it
        return false;
    }
    registry_.release(slot);
    log_cpp20("[Coordinator] no peer for " + slot->key().display() + " before the deadline");
    return true;
}

void Coordinator::teardown(const StreamSlot::Ptr& slot) {
    slot->abort();
    registry_.release(slot);
}

} // namespace stream
