#include "socket_transfer.h"

#include <string.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <errno.h>

#include "common/debug.h"


ssize_t SocketTransfer::sendAll(int socket, const char* buffer, size_t length) {
    size_t totalSent = 0;
    while (totalSent < length) {
        ssize_t sent = send(socket, buffer + totalSent, length - totalSent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            log_cpp20("send failed on fd " + std::to_string(socket) + ": " + std::string(strerror(errno)));
            return IO_ERROR;
        }
        if (sent == 0) {
            log_cpp20("Connection closed by peer on fd " + std::to_string(socket));
            return IO_ERROR;
        }
        totalSent += static_cast<size_t>(sent);
    }
    return static_cast<ssize_t>(totalSent);
}

ssize_t SocketTransfer::recvSome(int socket, char* buffer, size_t length) {
    for (;;) {
        ssize_t received = recv(socket, buffer, length, 0);
        if (received > 0) {
            return received;
        }
        if (received == 0) {
            log_cpp20("Connection closed by peer on fd " + std::to_string(socket));
            return PEER_CLOSED;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            log_cpp20("recv timed out on fd " + std::to_string(socket));
            return TIMED_OUT;
        }
        log_cpp20("recv failed on fd " + std::to_string(socket) + ": " + std::string(strerror(errno)));
        return IO_ERROR;
    }
}

bool SocketTransfer::setRecvTimeout(int socket, std::chrono::milliseconds timeout) {
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        RUNTIME_ERROR("setsockopt(SO_RCVTIMEO) failed on fd %d: %s", socket, strerror(errno));
        return false;
    }
    return true;
}
