// Listener.cpp
#include "listener.h"
#include <sys/socket.h>
#include <unistd.h>     // for close()
#include <cstring>      // for memset()
#include <arpa/inet.h>  // for inet_pton()

#include "common/debug.h"

namespace net {

Listener::Listener() : listen_fd_(-1) {}

Listener::~Listener() {
    close();
}

Listener::Listener(Listener&& other) noexcept : listen_fd_(other.listen_fd_) {
    other.listen_fd_ = -1;
}

Listener& Listener::operator=(Listener&& other) noexcept {
    if (this != &other) {
        close();
        listen_fd_ = other.listen_fd_;
        other.listen_fd_ = -1;
    }
    return *this;
}

bool Listener::listen_on(uint16_t port, const std::string& ip, int backlog) {
    close();
    struct sockaddr_in server_addr;
    ::memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &server_addr.sin_addr) != 1) {
        RUNTIME_ERROR("invalid IPv4 address: %s", ip.c_str());
        return false;
    }

    listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (listen_fd_ < 0) {
        RUNTIME_ERROR("socket() failed: %s", strerror(errno));
        return false;
    }

    int opt = 1;
    if (setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        RUNTIME_ERROR("setsockopt() failed: %s", strerror(errno));
        close();
        return false;
    }

    if (bind(listen_fd_, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        RUNTIME_ERROR("bind() failed: %s", strerror(errno));
        close();
        return false;
    }

    if (listen(listen_fd_, backlog) < 0) {
        RUNTIME_ERROR("listen() failed: %s", strerror(errno));
        close();
        return false;
    }

    log_cpp20("Listening on " + ip + ":" + std::to_string(bound_port()));
    return true;
}

int Listener::accept_connection(struct sockaddr_in* client_addr) {
    if (listen_fd_ < 0) {
        errno = EBADF;
        return -1;
    }

    socklen_t client_addr_len = sizeof(struct sockaddr_in);
    // connection sockets stay blocking: each one is served by its own worker thread
    if (client_addr) {
        return accept4(listen_fd_, (struct sockaddr*)client_addr, &client_addr_len, SOCK_CLOEXEC);
    }
    return accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
}

int Listener::get_fd() const {
    return listen_fd_;
}

uint16_t Listener::bound_port() const {
    if (listen_fd_ < 0) return 0;
    struct sockaddr_in addr;
    socklen_t len = sizeof(addr);
    if (getsockname(listen_fd_, (struct sockaddr*)&addr, &len) != 0) {
        RUNTIME_ERROR("getsockname() failed: %s", strerror(errno));
        return 0;
    }
    return ntohs(addr.sin_port);
}

void Listener::close() {
    if (listen_fd_ != -1) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
}

} // namespace net
