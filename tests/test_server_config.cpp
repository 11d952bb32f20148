#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <unistd.h>

#include "server/server_config.h"

using namespace std::chrono_literals;
using nlohmann::json;

TEST(ServerConfig, DefaultsAreValid) {
    ServerConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.auth_mode, AuthMode::TOKEN);
    EXPECT_EQ(config.channel_capacity, 16u);
    EXPECT_EQ(config.token_lifetime, 20min);
    EXPECT_TRUE(config.wait_for_uploader);
}

TEST(ServerConfig, JsonOverridesAndIgnoresUnknownKeys) {
    auto config = ServerConfig::fromJson(json{
        {"address", "0.0.0.0"},
        {"port", 0},
        {"auth_mode", "open"},
        {"channel_capacity", 4},
        {"peer_timeout_ms", 1500},
        {"wait_for_uploader", false},
        {"something_else", "ignored"}
    });
    EXPECT_EQ(config.address, "0.0.0.0");
    EXPECT_EQ(config.port, 0);
    EXPECT_EQ(config.auth_mode, AuthMode::OPEN);
    EXPECT_EQ(config.channel_capacity, 4u);
    EXPECT_EQ(config.peer_timeout, 1500ms);
    EXPECT_FALSE(config.wait_for_uploader);
    EXPECT_EQ(config.chunk_size, 64u * 1024);
    EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfig, RejectsBadValues) {
    EXPECT_THROW(ServerConfig::fromJson(json::array()), ConfigError);
    EXPECT_THROW(ServerConfig::fromJson(json{{"port", "eighty"}}), ConfigError);
    EXPECT_THROW(ServerConfig::fromJson(json{{"peer_timeout_ms", -1}}), ConfigError);
    EXPECT_THROW(ServerConfig::fromJson(json{{"peer_timeout_ms", 1.5}}), ConfigError);
    EXPECT_THROW(ServerConfig::fromJson(json{{"auth_mode", "anonymous"}}), ConfigError);
}

TEST(ServerConfig, ValidateCatchesInconsistencies) {
    ServerConfig config;
    config.channel_capacity = 0;
    EXPECT_THROW(config.validate(), ConfigError);

    config = ServerConfig{};
    config.token_max_lifetime = 1min;
    EXPECT_THROW(config.validate(), ConfigError);
    config.token_max_lifetime = 0ms;
    EXPECT_NO_THROW(config.validate());

    config = ServerConfig{};
    config.username = "alice";
    EXPECT_THROW(config.validate(), ConfigError);
    config.password = "pw";
    EXPECT_NO_THROW(config.validate());
}

TEST(ServerConfig, Credential) {
    ServerConfig config;
    config.setCredential("alice:pa:ss");
    EXPECT_EQ(config.username, "alice");
    EXPECT_EQ(config.password, "pa:ss");
    EXPECT_THROW(config.setCredential("nocolon"), ConfigError);
}

TEST(ServerConfig, FromFile) {
    EXPECT_THROW(ServerConfig::fromFile("/nonexistent/relay.json"), ConfigError);

    std::string path = "/tmp/relay_config_test_" + std::to_string(::getpid()) + ".json";
    {
        std::ofstream out(path);
        out << R"({"port": 9090, "token_lifetime_ms": 60000})";
    }
    auto config = ServerConfig::fromFile(path);
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.token_lifetime, 60s);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(ServerConfig::fromFile(path), ConfigError);
    std::remove(path.c_str());
}

TEST(ServerConfig, ErrorMessageIsPrefixed) {
    try {
        parseAuthMode("x");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("[Config Error] ", 0), 0u);
    }
}
