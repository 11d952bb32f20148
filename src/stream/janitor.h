#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

#include "concurrency/periodic_task.h"
#include "stream_registry.h"

namespace auth {
class TokenAuthority;
}

namespace stream {

// Background sweep: drops expired tokens and slots that never found a peer.
class Janitor {
public:
    struct SweepStats {
        size_t tokens_purged{0};
        size_t slots_expired{0};
    };

    // `tokens` may be null (open mode).
    Janitor(StreamRegistry& registry, auth::TokenAuthority* tokens,
            std::chrono::milliseconds interval = std::chrono::seconds(30));
    ~Janitor();

    Janitor(const Janitor&) = delete;
    Janitor& operator=(const Janitor&) = delete;

    void start();
    void stop();
    bool running() const { return task_.running(); }

    // Extra housekeeping run at the end of every sweep. Register before start().
    void onSweep(std::function<void()> hook) { hooks_.push_back(std::move(hook)); }

    SweepStats sweepOnce();

    uint64_t sweeps() const { return sweeps_.load(std::memory_order_relaxed); }

private:
    StreamRegistry& registry_;
    auth::TokenAuthority* tokens_;
    std::vector<std::function<void()>> hooks_;
    std::atomic<uint64_t> sweeps_{0};
    concurrency::PeriodicTask task_;
};

} // namespace stream
