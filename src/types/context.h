#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace auth {
    class TokenAuthority;
}

namespace stream {
    class StreamRegistry;
    class UploadCoordinator;
    class DownloadCoordinator;
}

namespace net {
    class Connection;
}

struct ServerConfig;
class AuthManager;


// Shared, server-owned state handed to every request handler.
// Nothing here is owned by the context.
struct ServerContext {
    using Ptr = std::shared_ptr<ServerContext>;

    ServerContext() = default;

    const ServerConfig* config{nullptr};
    auth::TokenAuthority* tokens{nullptr};       // null in open mode
    stream::StreamRegistry* registry{nullptr};
    const AuthManager* auth_manager{nullptr};
    stream::UploadCoordinator* uploads{nullptr};
    stream::DownloadCoordinator* downloads{nullptr};

    std::chrono::steady_clock::time_point started_at{std::chrono::steady_clock::now()};
};


struct ConnectionContext {
    using Ptr = std::shared_ptr<ConnectionContext>;

    ConnectionContext() = default;
    ConnectionContext(ServerContext::Ptr ctx, net::Connection* conn)
        : connection(conn), server_context(std::move(ctx)) {}

    uint64_t connection_id{0};
    std::string peer;

    net::Connection* connection{nullptr};

    ServerContext::Ptr server_context{nullptr};
};
