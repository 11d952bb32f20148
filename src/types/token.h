#pragma once

#include <string>
#include <chrono>
#include <cstdint>

struct Token {
    std::string id;                                   // hex secret, also the map key
    std::chrono::steady_clock::time_point issued_at{};
    std::chrono::steady_clock::time_point expires_at{};
    uint64_t use_count{0};                            // successful validations

    bool extended() const { return use_count > 0; }
};

// Dashboard view of a token. Never carries the full id.
struct TokenInfo {
    std::string id_prefix;
    std::chrono::milliseconds remaining{0};
    uint64_t use_count{0};
};
