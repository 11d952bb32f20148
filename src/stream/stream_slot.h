#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "stream_channel.h"
#include "types/enums.h"
#include "types/stream_key.h"

namespace stream {

enum class CloseReason {
    NONE,
    FINISHED,   // producer reached end of stream
    EXPIRED,    // no peer before the deadline
    ABORTED     // a side disconnected, or server shutdown
};

enum class PeerWait {
    ATTACHED,
    DEADLINE,
    CLOSED
};

// Rendezvous for one producer and one consumer of a key.
// State and role bookkeeping are guarded by the slot mutex; the channel has
// its own lock. attach() is only called by StreamRegistry under its shard lock.
class StreamSlot {
public:
    using Ptr = std::shared_ptr<StreamSlot>;
    using TimePoint = std::chrono::steady_clock::time_point;

    StreamSlot(StreamKey key, StreamRole first, size_t channel_capacity,
               std::optional<TimePoint> peer_deadline);

    StreamSlot(const StreamSlot&) = delete;
    StreamSlot& operator=(const StreamSlot&) = delete;

    const StreamKey& key() const { return key_; }
    StreamChannel& channel() { return channel_; }

    SlotState state() const;
    CloseReason closeReason() const;
    bool hasRole(StreamRole role) const;
    TimePoint createdAt() const { return created_at_; }
    std::optional<TimePoint> peerDeadline() const { return peer_deadline_; }
    std::optional<TimePoint> streamingSince() const;

    // Attaches the missing role and switches to STREAMING. Fails when the role
    // is already present or the slot is closed.
    bool attach(StreamRole role);

    // Blocks until the slot streams, closes, or `until` passes.
    // std::nullopt waits without a deadline. ATTACHED once both roles are
    // present, even if the producer already finished: the channel still
    // holds its chunks.
    PeerWait waitForPeer(std::optional<TimePoint> until);

    // The waiting side went away: AWAITING_PEER -> CLOSED(ABORTED).
    // Returns false if a peer attached first.
    bool abandon();

    // AWAITING_PEER -> CLOSED(EXPIRED). Returns false if a peer attached first.
    bool expire();

    // Closes an AWAITING_PEER slot whose deadline is behind `now`.
    bool expireIfAbandoned(TimePoint now);

    // Normal end: the producer closed the channel.
    void finish();

    // Any side failed: closes the slot and breaks the channel.
    void abort();

    void addBytes(uint64_t n) { bytes_.fetch_add(n, std::memory_order_relaxed); }
    uint64_t bytesTransferred() const { return bytes_.load(std::memory_order_relaxed); }

private:
    void closeLocked(CloseReason reason);

    const StreamKey key_;
    const TimePoint created_at_;
    const std::optional<TimePoint> peer_deadline_;
    StreamChannel channel_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SlotState state_{SlotState::AWAITING_PEER};
    CloseReason close_reason_{CloseReason::NONE};
    bool producer_{false};
    bool consumer_{false};
    std::optional<TimePoint> streaming_since_;

    std::atomic<uint64_t> bytes_{0};
};

} // namespace stream
