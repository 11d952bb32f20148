#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "types/enums.h"
#include "types/token.h"

namespace auth {

struct TokenPolicy {
    std::chrono::milliseconds initial_lifetime{std::chrono::minutes(20)};
    std::chrono::milliseconds extension_window{std::chrono::minutes(20)};
    // Upper bound on issued_at -> expires_at. Zero disables the cap.
    std::chrono::milliseconds max_lifetime{std::chrono::hours(24)};
};

// In-memory issuer of access tokens.
//
// The map is split in shards, each guarded by its own mutex, so concurrent
// validations of different tokens never contend and every mutation of one
// token happens under exactly one lock.
class TokenAuthority {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    static constexpr size_t kTokenBytes = 32;
    static constexpr size_t kPrefixLength = 8;

    explicit TokenAuthority(TokenPolicy policy = TokenPolicy{},
                            Clock clock = nullptr,
                            size_t shard_count = 16);

    TokenAuthority(const TokenAuthority&) = delete;
    TokenAuthority& operator=(const TokenAuthority&) = delete;

    Token issue();

    // Extends the expiry of a live token. An expired token is removed.
    TokenStatus validate(const std::string& id);

    bool revoke(const std::string& id);

    // Read-only lookup, does not count as activity.
    std::optional<TimePoint> expiresAt(const std::string& id) const;

    size_t purgeExpired();

    std::vector<TokenInfo> snapshot() const;
    size_t size() const;

    const TokenPolicy& policy() const { return policy_; }
    TimePoint now() const { return clock_(); }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Token> tokens;
    };

    Shard& shardFor(const std::string& id) const;
    TimePoint extendedExpiry(const Token& token, TimePoint now) const;

    TokenPolicy policy_;
    Clock clock_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace auth
