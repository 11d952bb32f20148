#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "stream_slot.h"
#include "types/enums.h"
#include "types/result.h"
#include "types/stream_key.h"

namespace stream {

struct SlotOptions {
    size_t channel_capacity{16};
    // How long the first party waits for the second. Zero waits forever.
    std::chrono::milliseconds peer_timeout{std::chrono::minutes(5)};
};

struct SlotInfo {
    std::string key;        // StreamKey::display(), token cut to a prefix
    SlotState state{SlotState::AWAITING_PEER};
    std::chrono::milliseconds age{0};
    uint64_t bytes{0};
};

// Concurrent key -> slot map. Keys are spread over shards, each with its own
// lock, so find-or-create on one key never blocks streams on another shard.
class StreamRegistry {
public:
    struct Attachment {
        StreamSlot::Ptr slot;
        bool created{false};
    };

    explicit StreamRegistry(SlotOptions options = SlotOptions{}, size_t shard_count = 16);

    StreamRegistry(const StreamRegistry&) = delete;
    StreamRegistry& operator=(const StreamRegistry&) = delete;

    // Atomic check-and-insert for `key`:
    //  - no live slot: create one in AWAITING_PEER holding `role` (created=true),
    //    unless `create` is false, then NOT_FOUND
    //  - live slot missing `role`: attach it, slot goes STREAMING (created=false)
    //  - live slot already holding `role`: CONFLICT
    //  - registry shut down by abortAll(): PEER_DISCONNECTED
    ResultCode findOrCreate(const StreamKey& key, StreamRole role, Attachment& out, bool create = true);

    StreamSlot::Ptr lookup(const StreamKey& key) const;

    // Idempotent.
    void remove(const StreamKey& key);

    // Removes the entry only if it still maps to `slot`.
    bool release(const StreamSlot::Ptr& slot);

    // Closes and drops AWAITING_PEER slots whose deadline passed.
    // STREAMING slots are never touched.
    size_t expireAbandoned(std::chrono::steady_clock::time_point now);

    // Shutdown: aborts and drops every slot, later findOrCreate calls fail.
    size_t abortAll();
    bool shutDown() const { return shut_down_.load(std::memory_order_acquire); }

    std::vector<SlotInfo> snapshot() const;
    size_t size() const;

    const SlotOptions& options() const { return options_; }

private:
    using SlotMap = std::unordered_map<StreamKey, StreamSlot::Ptr, StreamKeyHash>;

    struct Shard {
        mutable std::shared_mutex mutex;
        SlotMap slots;
    };

    Shard& shardFor(const StreamKey& key) const;

    SlotOptions options_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<bool> shut_down_{false};
};

} // namespace stream
