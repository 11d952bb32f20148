#include "acceptor.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <string>
#include <thread>

#include "common/debug.h"

namespace net {

bool Acceptor::listen_on(uint16_t port, const std::string& ip, int backlog) {
    if (!listener_.listen_on(port, ip, backlog)) {
        return false;
    }
    if (!epoll_poller_.add_fd(listener_.get_fd(), EPOLLIN)) {
        listener_.close();
        return false;
    }
    return true;
}

void Acceptor::loop() {
    while (running_.load(std::memory_order_acquire)) {
        auto events_opt = epoll_poller_.poll(1000);
        if (!events_opt) {
            break;
        }
        for (const auto& event : *events_opt) {
            if (is_wakeup(event.data.fd)) {
                drain_wakeup();
                continue;
            }
            if (event.data.fd != listener_.get_fd()) {
                error_cpp20("Acceptor: unexpected event on fd " + std::to_string(event.data.fd));
                continue;
            }
            accept_pending();
        }
    }
    log_cpp20("Acceptor loop finished");
}

void Acceptor::accept_pending() {
    while (running_.load(std::memory_order_acquire)) {
        struct sockaddr_in client_addr;
        int client_fd = listener_.accept_connection(&client_addr);
        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            error_cpp20("Acceptor: accept failed: " + std::string(strerror(errno)));
            if (errno == EMFILE || errno == ENFILE) {
                // the listen fd stays readable, back off instead of spinning
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            return;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string peer = std::string(ip) + ":" + std::to_string(ntohs(client_addr.sin_port));
        log_cpp20("Acceptor: new connection on fd " + std::to_string(client_fd) + " from " + peer);
        on_accept_(client_fd, peer);
    }
}

} // namespace net
