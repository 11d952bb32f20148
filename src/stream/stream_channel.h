#pragma once

#include <cstdint>
#include <vector>

#include "lockfreequeue/array_mpmc_queue.hpp"
#include "lockfreequeue/blocking_queue.hpp"

namespace stream {

using Chunk = std::vector<uint8_t>;

enum class ChannelStatus {
    OK,
    END_OF_STREAM,  // producer closed and everything was drained
    BROKEN          // the other side aborted
};

// Bounded FIFO between one producer and one consumer of a slot.
// send() blocks while `capacity` chunks are queued; receive() blocks while empty.
class StreamChannel {
public:
    explicit StreamChannel(size_t capacity) : queue_(capacity) {}

    StreamChannel(const StreamChannel&) = delete;
    StreamChannel& operator=(const StreamChannel&) = delete;

    ChannelStatus send(Chunk chunk) {
        auto st = queue_.push(std::move(chunk));
        return st == lf::QueueStatus::OK ? ChannelStatus::OK : ChannelStatus::BROKEN;
    }

    ChannelStatus receive(Chunk& out) {
        switch (queue_.pop(out)) {
            case lf::QueueStatus::OK: return ChannelStatus::OK;
            case lf::QueueStatus::CLOSED: return ChannelStatus::END_OF_STREAM;
            default: return ChannelStatus::BROKEN;
        }
    }

    // End of stream from the producer.
    void close() { queue_.close(); }

    // Broken pipe: wakes both sides, queued chunks are released.
    bool abort() { return queue_.abort(); }

    bool broken() const { return queue_.aborted(); }
    size_t buffered() const { return queue_.size(); }
    size_t capacity() const { return queue_.limit(); }

    // Timed variants, used to observe backpressure without blocking forever.
    template <typename Rep, typename Period>
    lf::QueueStatus trySendFor(Chunk chunk, const std::chrono::duration<Rep, Period>& timeout) {
        return queue_.push_for(std::move(chunk), timeout);
    }

    template <typename Rep, typename Period>
    lf::QueueStatus tryReceiveFor(Chunk& out, const std::chrono::duration<Rep, Period>& timeout) {
        return queue_.pop_for(out, timeout);
    }

private:
    lf::BlockingQueue<lf::ArrayMPMCQueue<Chunk>> queue_;
};

} // namespace stream
