#include "stream_slot.h"

#include "common/debug.h"

namespace stream {

StreamSlot::StreamSlot(StreamKey key, StreamRole first, size_t channel_capacity,
                       std::optional<TimePoint> peer_deadline)
    : key_(std::move(key)),
      created_at_(std::chrono::steady_clock::now()),
      peer_deadline_(peer_deadline),
      channel_(channel_capacity) {
    if (first == StreamRole::PRODUCER) producer_ = true;
    else consumer_ = true;
}

SlotState StreamSlot::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CloseReason StreamSlot::closeReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
}

bool StreamSlot::hasRole(StreamRole role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return role == StreamRole::PRODUCER ? producer_ : consumer_;
}

std::optional<StreamSlot::TimePoint> StreamSlot::streamingSince() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return streaming_since_;
}

bool StreamSlot::attach(StreamRole role) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SlotState::AWAITING_PEER) return false;
        bool& present = (role == StreamRole::PRODUCER) ? producer_ : consumer_;
        if (present) return false;
        present = true;
        state_ = SlotState::STREAMING;
        streaming_since_ = std::chrono::steady_clock::now();
    }
    cv_.notify_all();
    log_cpp20("[StreamSlot] " + key_.display() + " streaming, " + toString(role) + " attached");
    return true;
}

PeerWait StreamSlot::waitForPeer(std::optional<TimePoint> until) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return state_ != SlotState::AWAITING_PEER; };
    if (until) {
        if (!cv_.wait_until(lock, *until, ready)) return PeerWait::DEADLINE;
    } else {
        cv_.wait(lock, ready);
    }
    // A producer may attach, fill the channel and finish before the waiter
    // gets the lock back: the pairing, not the current state, decides.
    if (producer_ && consumer_ &&
        close_reason_ != CloseReason::EXPIRED && close_reason_ != CloseReason::ABORTED) {
        return PeerWait::ATTACHED;
    }
    return PeerWait::CLOSED;
}

bool StreamSlot::abandon() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SlotState::AWAITING_PEER) return false;
        closeLocked(CloseReason::ABORTED);
    }
    cv_.notify_all();
    channel_.abort();
    return true;
}

bool StreamSlot::expire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SlotState::AWAITING_PEER) return false;
        closeLocked(CloseReason::EXPIRED);
    }
    cv_.notify_all();
    channel_.abort();
    return true;
}

bool StreamSlot::expireIfAbandoned(TimePoint now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SlotState::AWAITING_PEER) return false;
        if (!peer_deadline_ || now < *peer_deadline_) return false;
        closeLocked(CloseReason::EXPIRED);
    }
    cv_.notify_all();
    channel_.abort();
    return true;
}

void StreamSlot::finish() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SlotState::CLOSED) return;
        closeLocked(CloseReason::FINISHED);
    }
    cv_.notify_all();
}

void StreamSlot::abort() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SlotState::CLOSED) closeLocked(CloseReason::ABORTED);
    }
    cv_.notify_all();
    channel_.abort();
}

void StreamSlot::closeLocked(CloseReason reason) {
    state_ = SlotState::CLOSED;
    close_reason_ = reason;
}

} // namespace stream
