#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

namespace net {

// One accepted client socket, used in blocking mode by a single worker thread.
// Reads go through a small buffer so that the bytes following the request head
// are handed to the body reader.
class Connection {
public:
    using Ptr = std::shared_ptr<Connection>;

    enum class ReadStatus {
        OK,
        CLOSED,     // peer closed before a complete head
        TIMEOUT,
        TOO_LARGE,
        IO_ERROR
    };

    Connection(int socket_fd, uint64_t id, std::string peer);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Reads up to and including the blank line ending the request head.
    // `head` receives the head without the final CRLFCRLF.
    ReadStatus readHead(std::string& head, size_t max_size, std::chrono::milliseconds timeout);

    // > 0 bytes read, 0 peer closed, < 0 error.
    ssize_t read(uint8_t* buffer, size_t length);

    // Reads one CRLF-terminated line (CRLF stripped). false on EOF, error or overlong line.
    bool readLine(std::string& line, size_t max_size);

    bool sendData(const std::string& data);
    bool sendData(const char* data, size_t length);

    // Non-blocking check: the client closed or reset its side.
    bool peerHungUp() const;

    // Request bytes received but not consumed yet, buffered here or in the kernel.
    size_t pendingBytes() const;

    // Interrupts blocked reads and writes from another thread. The fd stays
    // open until the owning worker drops the connection.
    void shutdown();

    int getSocketFD() const { return socket_fd_; }
    uint64_t id() const { return id_; }
    const std::string& peer() const { return peer_; }
    bool is_open() const { return is_connected_.load(std::memory_order_acquire); }

private:
    void close();
    ssize_t fill();

    static constexpr size_t READ_CHUNK = 16 * 1024;

    int socket_fd_;
    uint64_t id_;
    std::string peer_;
    std::atomic<bool> is_connected_{true};
    std::atomic<bool> is_shutdown_{false};

    std::string buffer_;
    size_t buffer_pos_{0};
};

// Runs every connection on its own worker thread. Coordinators block for as
// long as a transfer lasts, so a connection is never shared between threads.
class ConnectionManager {
public:
    using ServeFn = std::function<void(const Connection::Ptr&)>;

    ConnectionManager(size_t max_connections, ServeFn serve);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Takes ownership of `fd` on success. false when the limit is reached or
    // the manager is shutting down; the caller still owns `fd` then.
    bool addConnection(int fd, const std::string& peer);

    size_t active() const;

    // Joins workers whose connection has ended. Their sockets are already
    // closed: a worker drops its connection on the way out.
    size_t reap();

    // Stops accepting, shuts every socket down and joins every worker.
    void shutdownAll();

private:
    struct Worker {
        Connection::Ptr connection;
        std::thread thread;
    };

    void run(Connection::Ptr connection);

    const size_t max_connections_;
    ServeFn serve_;

    mutable std::mutex mutex_;
    std::map<uint64_t, Worker> workers_;
    std::vector<uint64_t> finished_;
    uint64_t next_id_{1};
    bool accepting_{true};
};

} // namespace net
