#pragma once

#include <chrono>
#include <sys/types.h>

class SocketTransfer {

public:
    static constexpr ssize_t PEER_CLOSED = 0;
    static constexpr ssize_t IO_ERROR = -1;
    static constexpr ssize_t TIMED_OUT = -2;

    // Blocking send of the whole buffer; returns `length` or IO_ERROR.
    // Uses MSG_NOSIGNAL so a vanished peer never raises SIGPIPE.
    static ssize_t sendAll(int socket, const char* buffer, size_t length);

    // One blocking recv, retried on EINTR.
    // > 0: bytes read, PEER_CLOSED, IO_ERROR, or TIMED_OUT when SO_RCVTIMEO fired.
    static ssize_t recvSome(int socket, char* buffer, size_t length);

    // Zero clears the timeout.
    static bool setRecvTimeout(int socket, std::chrono::milliseconds timeout);
};
