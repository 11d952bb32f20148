#include "server_config.h"

#include <fstream>

#include "common/debug.h"

using nlohmann::json;

namespace {

template <typename T>
void readValue(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("bad value for \"") + key + "\": " + e.what());
    }
}

void readMillis(const json& j, const char* key, std::chrono::milliseconds& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number_integer() && !it->is_number_unsigned()) {
        throw ConfigError(std::string("\"") + key + "\" must be an integer number of milliseconds");
    }
    auto value = it->get<int64_t>();
    if (value < 0) {
        throw ConfigError(std::string("\"") + key + "\" must not be negative");
    }
    out = std::chrono::milliseconds(value);
}

} // namespace

AuthMode parseAuthMode(const std::string& mode) {
    if (mode == "token") return AuthMode::TOKEN;
    if (mode == "open") return AuthMode::OPEN;
    throw ConfigError("unknown auth mode \"" + mode + "\" (expected token or open)");
}

ServerConfig ServerConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }
    ServerConfig config;
    readValue(j, "address", config.address);
    readValue(j, "port", config.port);

    std::string mode;
    readValue(j, "auth_mode", mode);
    if (!mode.empty()) config.auth_mode = parseAuthMode(mode);
    readValue(j, "username", config.username);
    readValue(j, "password", config.password);

    readValue(j, "channel_capacity", config.channel_capacity);
    readValue(j, "chunk_size", config.chunk_size);
    readMillis(j, "peer_timeout_ms", config.peer_timeout);
    readValue(j, "wait_for_uploader", config.wait_for_uploader);

    readMillis(j, "token_lifetime_ms", config.token_lifetime);
    readMillis(j, "token_extension_ms", config.token_extension);
    readMillis(j, "token_max_lifetime_ms", config.token_max_lifetime);

    readMillis(j, "janitor_interval_ms", config.janitor_interval);
    readMillis(j, "header_timeout_ms", config.header_timeout);
    readValue(j, "max_connections", config.max_connections);

    readValue(j, "verbose", config.verbose);
    return config;
}

ServerConfig ServerConfig::fromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open configuration file " + path);
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    log_cpp20("configuration loaded from " + path);
    return fromJson(j);
}

void ServerConfig::setCredential(const std::string& user_pass) {
    auto colon = user_pass.find(':');
    if (colon == std::string::npos) {
        throw ConfigError("credential must look like user:password");
    }
    username = user_pass.substr(0, colon);
    password = user_pass.substr(colon + 1);
}

void ServerConfig::validate() const {
    if (address.empty()) throw ConfigError("address must not be empty");
    if (channel_capacity == 0) throw ConfigError("channel_capacity must be at least 1");
    if (chunk_size == 0) throw ConfigError("chunk_size must be at least 1");
    if (token_lifetime.count() == 0) throw ConfigError("token_lifetime_ms must be positive");
    if (token_extension.count() == 0) throw ConfigError("token_extension_ms must be positive");
    if (token_max_lifetime.count() != 0 && token_max_lifetime < token_lifetime) {
        throw ConfigError("token_max_lifetime_ms is shorter than token_lifetime_ms");
    }
    if (janitor_interval.count() == 0) throw ConfigError("janitor_interval_ms must be positive");
    if (header_timeout.count() == 0) throw ConfigError("header_timeout_ms must be positive");
    if (!username.empty() && password.empty()) {
        throw ConfigError("a username needs a non-empty password");
    }
    if (username.empty() && !password.empty()) {
        throw ConfigError("a password was given without a username");
    }
}

json ServerConfig::toJson() const {
    return json{
        {"address", address},
        {"port", port},
        {"auth_mode", toString(auth_mode)},
        {"credential", !username.empty()},
        {"channel_capacity", channel_capacity},
        {"chunk_size", chunk_size},
        {"peer_timeout_ms", peer_timeout.count()},
        {"wait_for_uploader", wait_for_uploader},
        {"token_lifetime_ms", token_lifetime.count()},
        {"token_extension_ms", token_extension.count()},
        {"token_max_lifetime_ms", token_max_lifetime.count()},
        {"janitor_interval_ms", janitor_interval.count()},
        {"header_timeout_ms", header_timeout.count()},
        {"max_connections", max_connections},
        {"verbose", verbose}
    };
}
