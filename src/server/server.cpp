#include "server.h"

#include <stdexcept>
#include <unistd.h>

#include "auth/auth_manager.h"
#include "auth/token_authority.h"
#include "common/debug.h"
#include "handlers/request_handler.h"
#include "net/acceptor.h"
#include "net/connection.h"
#include "protocol/response_builder.h"
#include "stream/download_coordinator.h"
#include "stream/janitor.h"
#include "stream/stream_registry.h"
#include "stream/upload_coordinator.h"
#include "utils/socket_transfer.h"

Server::Server(ServerConfig config)
    : config_(std::move(config)) {
    config_.validate();

    auth_manager_ = std::make_unique<AuthManager>(config_.username, config_.password);

    if (config_.auth_mode == AuthMode::TOKEN) {
        auth::TokenPolicy policy;
        policy.initial_lifetime = config_.token_lifetime;
        policy.extension_window = config_.token_extension;
        policy.max_lifetime = config_.token_max_lifetime;
        tokens_ = std::make_unique<auth::TokenAuthority>(policy);
    }

    stream::SlotOptions slot_options;
    slot_options.channel_capacity = config_.channel_capacity;
    slot_options.peer_timeout = config_.peer_timeout;
    registry_ = std::make_unique<stream::StreamRegistry>(slot_options);

    stream::CoordinatorOptions coordinator_options;
    coordinator_options.auth_mode = config_.auth_mode;
    coordinator_options.chunk_size = config_.chunk_size;
    coordinator_options.wait_for_uploader = config_.wait_for_uploader;
    uploads_ = std::make_unique<stream::UploadCoordinator>(*registry_, tokens_.get(), coordinator_options);
    downloads_ = std::make_unique<stream::DownloadCoordinator>(*registry_, tokens_.get(), coordinator_options);

    janitor_ = std::make_unique<stream::Janitor>(*registry_, tokens_.get(), config_.janitor_interval);

    server_context_ = std::make_shared<ServerContext>();
    server_context_->config = &config_;
    server_context_->tokens = tokens_.get();
    server_context_->registry = registry_.get();
    server_context_->auth_manager = auth_manager_.get();
    server_context_->uploads = uploads_.get();
    server_context_->downloads = downloads_.get();

    connections_ = std::make_unique<net::ConnectionManager>(
        config_.max_connections,
        [this](const net::Connection::Ptr& connection) { serve(connection); });
    janitor_->onSweep([this] {
        size_t reaped = connections_->reap();
        if (reaped > 0) {
            log_cpp20("[Server] reaped " + std::to_string(reaped) + " finished connection workers");
        }
    });
    acceptor_ = std::make_unique<net::Acceptor>(
        [this](int fd, const std::string& peer) { onAccept(fd, peer); });

    log_cpp20("Server configured: " + config_.toJson().dump());
}

Server::~Server() {
    stop();
}

void Server::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load(std::memory_order_acquire)) return;

    if (!acceptor_->listen_on(config_.port, config_.address)) {
        throw std::runtime_error("cannot listen on " + config_.address + ":" + std::to_string(config_.port));
    }
    server_context_->started_at = std::chrono::steady_clock::now();
    janitor_->start();
    if (!acceptor_->start()) {
        janitor_->stop();
        acceptor_->close_listener();
        throw std::runtime_error("cannot start the acceptor thread");
    }
    running_.store(true, std::memory_order_release);
    log_cpp20("relay listening on " + config_.address + ":" + std::to_string(port()) +
              " in " + toString(config_.auth_mode) + " mode");
}

void Server::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.exchange(false, std::memory_order_acq_rel)) return;

    acceptor_->stop();
    acceptor_->close_listener();

    size_t aborted = registry_->abortAll();
    connections_->shutdownAll();
    janitor_->stop();
    log_cpp20("relay stopped, " + std::to_string(aborted) + " live streams aborted");
}

uint16_t Server::port() const {
    return acceptor_->port();
}

void Server::onAccept(int fd, const std::string& peer) {
    if (connections_->addConnection(fd, peer)) {
        return;
    }
    protocol::ResponseBuilder builder;
    auto response = protocol::ResponseBuilder::buildJsonResponse(
        protocol::HttpStatus::SERVICE_UNAVAILABLE,
        builder.buildErrorResponse(503, "too many connections"));
    if (SocketTransfer::sendAll(fd, response.data(), response.size()) < 0) {
        log_cpp20("could not send 503 to " + peer);
    }
    ::close(fd);
}

void Server::serve(const net::Connection::Ptr& connection) {
    auto context = std::make_shared<ConnectionContext>(server_context_, connection.get());
    context->connection_id = connection->id();
    context->peer = connection->peer();

    auto handler = std::make_shared<handlers::RequestHandler>(context);
    handler->recvRequest();
}
