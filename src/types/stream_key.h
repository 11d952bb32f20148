#pragma once

#include <string>
#include <functional>

// Identifies one rendezvous. `token` is empty in open mode.
struct StreamKey {
    std::string token;
    std::string filename;

    StreamKey() = default;
    explicit StreamKey(std::string file) : filename(std::move(file)) {}
    StreamKey(std::string tok, std::string file)
        : token(std::move(tok)), filename(std::move(file)) {}

    bool operator==(const StreamKey& other) const {
        return token == other.token && filename == other.filename;
    }

    // Human-facing form: the token is cut down to its first 8 characters.
    std::string display() const {
        if (token.empty()) return filename;
        return token.substr(0, 8) + "/" + filename;
    }
};

struct StreamKeyHash {
    std::size_t operator()(const StreamKey& key) const noexcept {
        std::size_t h = std::hash<std::string>{}(key.token);
        // boost::hash_combine mixing
        h ^= std::hash<std::string>{}(key.filename) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};
