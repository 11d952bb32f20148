#include "token_authority.h"

#include <algorithm>

#include "utils/hash_utils.h"
#include "common/debug.h"

namespace auth {

TokenAuthority::TokenAuthority(TokenPolicy policy, Clock clock, size_t shard_count)
    : policy_(policy), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
    if (shard_count == 0) shard_count = 1;
    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

TokenAuthority::Shard& TokenAuthority::shardFor(const std::string& id) const {
    return *shards_[std::hash<std::string>{}(id) % shards_.size()];
}

TokenAuthority::TimePoint TokenAuthority::extendedExpiry(const Token& token, TimePoint now) const {
    TimePoint next = now + policy_.extension_window;
    if (policy_.max_lifetime.count() > 0) {
        next = std::min(next, token.issued_at + policy_.max_lifetime);
    }
    return next;
}

Token TokenAuthority::issue() {
    Token token;
    token.issued_at = clock_();
    token.expires_at = token.issued_at + policy_.initial_lifetime;
    if (policy_.max_lifetime.count() > 0) {
        token.expires_at = std::min(token.expires_at, token.issued_at + policy_.max_lifetime);
    }
    for (;;) {
        token.id = utils::HashUtils::randomHex(kTokenBytes);
        auto& shard = shardFor(token.id);
        std::lock_guard<std::mutex> lock(shard.mutex);
        // a 256-bit collision is not expected, but never hand out a live id twice
        if (shard.tokens.emplace(token.id, token).second) break;
    }
    log_cpp20("[TokenAuthority] issued token " + token.id.substr(0, kPrefixLength));
    return token;
}

TokenStatus TokenAuthority::validate(const std::string& id) {
    if (id.empty()) return TokenStatus::NOT_FOUND;
    auto& shard = shardFor(id);
    auto now = clock_();
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.tokens.find(id);
    if (it == shard.tokens.end()) {
        return TokenStatus::NOT_FOUND;
    }
    if (now >= it->second.expires_at) {
        log_cpp20("[TokenAuthority] token " + id.substr(0, kPrefixLength) + " expired");
        shard.tokens.erase(it);
        return TokenStatus::EXPIRED;
    }
    it->second.expires_at = extendedExpiry(it->second, now);
    ++it->second.use_count;
    return TokenStatus::AUTHORIZED;
}

bool TokenAuthority::revoke(const std::string& id) {
    auto& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    bool removed = shard.tokens.erase(id) > 0;
    if (removed) {
        log_cpp20("[TokenAuthority] revoked token " + id.substr(0, kPrefixLength));
    }
    return removed;
}

std::optional<TokenAuthority::TimePoint> TokenAuthority::expiresAt(const std::string& id) const {
    auto& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.tokens.find(id);
    if (it == shard.tokens.end()) return std::nullopt;
    return it->second.expires_at;
}

size_t TokenAuthority::purgeExpired() {
    auto now = clock_();
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->tokens.begin(); it != shard->tokens.end();) {
            if (now >= it->second.expires_at) {
                it = shard->tokens.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

std::vector<TokenInfo> TokenAuthority::snapshot() const {
    auto now = clock_();
    std::vector<TokenInfo> out;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (const auto& [id, token] : shard->tokens) {
            TokenInfo info;
            info.id_prefix = id.substr(0, kPrefixLength);
            info.remaining = token.expires_at > now
                ? std::chrono::duration_cast<std::chrono::milliseconds>(token.expires_at - now)
                : std::chrono::milliseconds(0);
            info.use_count = token.use_count;
            out.push_back(std::move(info));
        }
    }
    std::sort(out.begin(), out.end(), [](const TokenInfo& a, const TokenInfo& b) {
        return a.remaining > b.remaining;
    });
    return out;
}

size_t TokenAuthority::size() const {
    size_t total = 0;
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->tokens.size();
    }
    return total;
}

} // namespace auth
