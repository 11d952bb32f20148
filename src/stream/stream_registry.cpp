#include "stream_registry.h"

#include <algorithm>
#include <mutex>

#include "common/debug.h"

namespace stream {

StreamRegistry::StreamRegistry(SlotOptions options, size_t shard_count)
    : options_(options) {
    if (options_.channel_capacity == 0) options_.channel_capacity = 1;
    if (shard_count == 0) shard_count = 1;
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

StreamRegistry::Shard& StreamRegistry::shardFor(const StreamKey& key) const {
    return *shards_[StreamKeyHash{}(key) % shards_.size()];
}

ResultCode StreamRegistry::findOrCreate(const StreamKey& key, StreamRole role, Attachment& out, bool create) {
    auto& shard = shardFor(key);
    std::unique_lock lock(shard.mutex);
    if (shut_down_.load(std::memory_order_acquire)) {
        return ResultCode::PEER_DISCONNECTED;
    }

    auto it = shard.slots.find(key);
    if (it != shard.slots.end()) {
        auto& slot = it->second;
        if (slot->state() != SlotState::CLOSED) {
            if (slot->hasRole(role)) {
                log_cpp20("[StreamRegistry] conflict on " + key.display() + " for " + toString(role));
                return ResultCode::CONFLICT;
            }
            if (slot->attach(role)) {
                out.slot = slot;
                out.created = false;
                return ResultCode::OK;
            }
        }
        // closed slot still waiting for its owner to release it: the key is free again
        shard.slots.erase(it);
    }

    if (!create) {
        return ResultCode::NOT_FOUND;
    }

    std::optional<StreamSlot::TimePoint> deadline;
    if (options_.peer_timeout.count() > 0) {
        deadline = std::chrono::steady_clock::now() + options_.peer_timeout;
    }
    auto slot = std::make_shared<StreamSlot>(key, role, options_.channel_capacity, deadline);
    shard.slots.emplace(key, slot);
    log_cpp20("[StreamRegistry] created slot " + key.display() + " by " + toString(role));
    out.slot = std::move(slot);
    out.created = true;
    return ResultCode::OK;
}

StreamSlot::Ptr StreamRegistry::lookup(const StreamKey& key) const {
    auto& shard = shardFor(key);
    std::shared_lock lock(shard.mutex);
    auto it = shard.slots.find(key);
    return it == shard.slots.end() ? nullptr : it->second;
}

void StreamRegistry::remove(const StreamKey& key) {
    auto& shard = shardFor(key);
    std::unique_lock lock(shard.mutex);
    shard.slots.erase(key);
}

bool StreamRegistry::release(const StreamSlot::Ptr& slot) {
    if (!slot) return false;
    auto& shard = shardFor(slot->key());
    std::unique_lock lock(shard.mutex);
    auto it = shard.slots.find(slot->key());
    if (it == shard.slots.end() || it->second != slot) return false;
    shard.slots.erase(it);
    log_cpp20("[StreamRegistry] released slot " + slot->key().display());
    return true;
}

size_t StreamRegistry::expireAbandoned(std::chrono::steady_clock::time_point now) {
    size_t expired = 0;
    for (auto& shard : shards_) {
        std::unique_lock lock(shard->mutex);
        for (auto it = shard->slots.begin(); it != shard->slots.end();) {
            auto& slot = it->second;
            if (slot->expireIfAbandoned(now)) {
                log_cpp20("[StreamRegistry] expired abandoned slot " + slot->key().display());
                it = shard->slots.erase(it);
                ++expired;
            } else if (slot->state() == SlotState::CLOSED && slot.use_count() == 1) {
                // owner is gone without releasing it
                it = shard->slots.erase(it);
            } else {
                ++it;
            }
        }
    }
    return expired;
}

size_t StreamRegistry::abortAll() {
    // set before draining: a shard already drained never takes a new slot
    shut_down_.store(true, std::memory_order_release);
    size_t aborted = 0;
    for (auto& shard : shards_) {
        SlotMap drained;
        {
            std::unique_lock lock(shard->mutex);
            drained.swap(shard->slots);
        }
        for (auto& [key, slot] : drained) {
            slot->abort();
            ++aborted;
        }
    }
    return aborted;
}

std::vector<SlotInfo> StreamRegistry::snapshot() const {
    auto now = std::chrono::steady_clock::now();
    std::vector<SlotInfo> out;
    for (auto& shard : shards_) {
        std::shared_lock lock(shard->mutex);
        for (const auto& [key, slot] : shard->slots) {
            SlotInfo info;
            info.key = key.display();
            info.state = slot->state();
            info.age = std::chrono::duration_cast<std::chrono::milliseconds>(now - slot->createdAt());
            info.bytes = slot->bytesTransferred();
            out.push_back(std::move(info));
        }
    }
    std::sort(out.begin(), out.end(), [](const SlotInfo& a, const SlotInfo& b) {
        return a.age > b.age;
    });
    return out;
}

size_t StreamRegistry::size() const {
    size_t total = 0;
    for (auto& shard : shards_) {
        std::shared_lock lock(shard->mutex);
        total += shard->slots.size();
    }
    return total;
}

} // namespace stream
