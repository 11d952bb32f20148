#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "server_config.h"
#include "types/context.h"

namespace auth {
class TokenAuthority;
}

namespace net {
class Acceptor;
class Connection;
class ConnectionManager;
}

namespace stream {
class StreamRegistry;
class UploadCoordinator;
class DownloadCoordinator;
class Janitor;
}

class AuthManager;

// Owns every component of the relay. Nothing is global: handlers reach the
// registry and the token authority through the ServerContext.
class Server {
public:
    // Throws ConfigError when `config` does not validate.
    explicit Server(ServerConfig config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds, then starts the janitor and the acceptor.
    // Throws std::runtime_error when the address cannot be bound.
    void start();

    // Stops accepting, aborts every live stream, joins every connection
    // worker and stops the janitor. Idempotent.
    void stop();

    bool running() const { return running_.load(std::memory_order_acquire); }
    uint16_t port() const;

    const ServerConfig& config() const { return config_; }
    auth::TokenAuthority* tokens() const { return tokens_.get(); }
    stream::StreamRegistry& registry() const { return *registry_; }
    stream::Janitor& janitor() const { return *janitor_; }

private:
    void onAccept(int fd, const std::string& peer);
    void serve(const std::shared_ptr<net::Connection>& connection);

    ServerConfig config_;

    std::unique_ptr<AuthManager> auth_manager_;
    std::unique_ptr<auth::TokenAuthority> tokens_;
    std::unique_ptr<stream::StreamRegistry> registry_;
    std::unique_ptr<stream::UploadCoordinator> uploads_;
    std::unique_ptr<stream::DownloadCoordinator> downloads_;
    std::unique_ptr<stream::Janitor> janitor_;
    std::unique_ptr<net::ConnectionManager> connections_;
    std::unique_ptr<net::Acceptor> acceptor_;

    ServerContext::Ptr server_context_{nullptr};

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
};
