#pragma once

#include <cstdint> // For uint16_t
#include <netinet/in.h> // For sockaddr_in
#include <string>

namespace net {

class Listener {
public:
    Listener();
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    Listener(Listener&& other) noexcept;
    Listener& operator=(Listener&& other) noexcept;

    // Non-blocking listening socket. Port 0 picks an ephemeral port.
    bool listen_on(uint16_t port, const std::string& ip, int backlog = SOMAXCONN);

    // -1 with errno set when nothing is pending or accept failed.
    int accept_connection(struct sockaddr_in* client_addr = nullptr);

    int get_fd() const;
    uint16_t bound_port() const;
    void close();

private:
    int listen_fd_;
};

} // namespace net
