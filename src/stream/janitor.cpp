#include "janitor.h"

#include "auth/token_authority.h"
#include "common/debug.h"

namespace stream {

Janitor::Janitor(StreamRegistry& registry, auth::TokenAuthority* tokens,
                 std::chrono::milliseconds interval)
    : registry_(registry), tokens_(tokens),
      task_(interval, [this] { sweepOnce(); }) {}

Janitor::~Janitor() {
    stop();
}

void Janitor::start() {
    if (task_.start()) {
        log_cpp20("[Janitor] started");
    }
}

void Janitor::stop() {
    task_.stop();
}

Janitor::SweepStats Janitor::sweepOnce() {
    SweepStats stats;
    if (tokens_) {
        stats.tokens_purged = tokens_->purgeExpired();
    }
    stats.slots_expired = registry_.expireAbandoned(std::chrono::steady_clock::now());
    for (auto& hook : hooks_) {
        hook();
    }
    sweeps_.fetch_add(1, std::memory_order_relaxed);
    if (stats.tokens_purged || stats.slots_expired) {
        log_cpp20("[Janitor] purged " + std::to_string(stats.tokens_purged) + " tokens, expired " +
                  std::to_string(stats.slots_expired) + " slots");
    }
    return stats;
}

} // namespace stream
