#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"
#include "types/enums.h"

class ConfigError : public std::runtime_error {
protected:
    std::string m_formatted_what;

public:
    ConfigError(const std::string& message)
        : std::runtime_error(message) {
        m_formatted_what = "[Config Error] " + message;
    }
    const char* what() const noexcept override {
        return m_formatted_what.c_str();
    }
};

// Everything the server can be told at startup. Durations are milliseconds
// in the JSON file ("peer_timeout_ms": 300000, ...).
struct ServerConfig {
    std::string address{"127.0.0.1"};
    uint16_t port{8080};                    // 0 picks an ephemeral port

    AuthMode auth_mode{AuthMode::TOKEN};
    // Optional Basic credential. Token mode: gates POST/DELETE /token.
    // Open mode: gates uploads and downloads.
    std::string username;
    std::string password;

    size_t channel_capacity{16};
    size_t chunk_size{64 * 1024};
    std::chrono::milliseconds peer_timeout{std::chrono::minutes(5)};        // 0 = wait forever
    bool wait_for_uploader{true};

    std::chrono::milliseconds token_lifetime{std::chrono::minutes(20)};
    std::chrono::milliseconds token_extension{std::chrono::minutes(20)};
    std::chrono::milliseconds token_max_lifetime{std::chrono::hours(24)};   // 0 = uncapped

    std::chrono::milliseconds janitor_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds header_timeout{std::chrono::seconds(30)};
    size_t max_connections{1024};

    bool verbose{false};

    // Missing keys keep their defaults, unknown keys are ignored.
    static ServerConfig fromJson(const nlohmann::json& j);
    static ServerConfig fromFile(const std::string& path);

    // "user:pass"
    void setCredential(const std::string& user_pass);

    // Throws ConfigError on the first inconsistent value.
    void validate() const;

    nlohmann::json toJson() const;
};

AuthMode parseAuthMode(const std::string& mode);
