#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <sys/socket.h>

#include "reactor.h"
#include "listener.h"

namespace net {

// Owns the listening socket and hands every accepted connection to a callback.
class Acceptor : public ReactorBase {
public:
    using Ptr = std::shared_ptr<Acceptor>;
    // Receives a blocking, connected socket and the peer as "ip:port".
    using AcceptCallback = std::function<void(int fd, const std::string& peer)>;

    explicit Acceptor(AcceptCallback on_accept) : on_accept_(std::move(on_accept)) {}

    ~Acceptor() override {
        stop();
    }

    bool listen_on(uint16_t port, const std::string& ip = "127.0.0.1", int backlog = SOMAXCONN);

    // Actual port, useful after listening on port 0.
    uint16_t port() const { return listener_.bound_port(); }

    void close_listener() { listener_.close(); }

protected:
    void loop() override;

private:
    void accept_pending();

    Listener listener_;
    AcceptCallback on_accept_;
};

} // namespace net
