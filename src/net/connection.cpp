#include "connection.h"

#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cstring>
#include <system_error>

#include "common/debug.h"
#include "utils/socket_transfer.h"

namespace net {

Connection::Connection(int socket_fd, uint64_t id, std::string peer)
    : socket_fd_(socket_fd), id_(id), peer_(std::move(peer)) {
    if (socket_fd_ < 0) {
        error_cpp20("Invalid socket file descriptor");
        is_connected_ = false;
    }
}

Connection::~Connection() {
    close();
}

Connection::ReadStatus Connection::readHead(std::string& head, size_t max_size,
                                            std::chrono::milliseconds timeout) {
    if (!SocketTransfer::setRecvTimeout(socket_fd_, timeout)) {
        return ReadStatus::IO_ERROR;
    }

    // offset from buffer_pos_ where the terminator search resumes
    size_t scanned = 0;
    ReadStatus status = ReadStatus::OK;
    for (;;) {
        auto end = buffer_.find("\r\n\r\n", buffer_pos_ + scanned);
        if (end != std::string::npos) {
            head.assign(buffer_, buffer_pos_, end - buffer_pos_);
            buffer_pos_ = end + 4;
            break;
        }
        size_t pending = buffer_.size() - buffer_pos_;
        if (pending > max_size) {
            status = ReadStatus::TOO_LARGE;
            break;
        }
        // the terminator may straddle two reads
        scanned = pending >= 3 ? pending - 3 : 0;

        ssize_t n = fill();
        if (n == SocketTransfer::TIMED_OUT) {
            status = ReadStatus::TIMEOUT;
            break;
        }
        if (n == SocketTransfer::PEER_CLOSED) {
            status = ReadStatus::CLOSED;
            break;
        }
        if (n < 0) {
            status = ReadStatus::IO_ERROR;
            break;
        }
    }

    // the body of a streaming upload may legitimately stall for a long time
    if (!SocketTransfer::setRecvTimeout(socket_fd_, std::chrono::milliseconds(0)) &&
        status == ReadStatus::OK) {
        status = ReadStatus::IO_ERROR;
    }
    return status;
}

bool Connection::peerHungUp() const {
    if (!is_open()) return true;
    struct pollfd pfd{};
    pfd.fd = socket_fd_;
    pfd.events = POLLRDHUP;
    int n = ::poll(&pfd, 1, 0);
    if (n < 0) {
        return errno != EINTR;
    }
    return n > 0 && (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR | POLLNVAL)) != 0;
}

size_t Connection::pendingBytes() const {
    size_t pending = buffer_.size() - buffer_pos_;
    int queued = 0;
    if (::ioctl(socket_fd_, FIONREAD, &queued) == 0 && queued > 0) {
        pending += static_cast<size_t>(queued);
    }
    return pending;
}

ssize_t Connection::read(uint8_t* buffer, size_t length) {
    if (length == 0) return 0;
    if (buffer_pos_ < buffer_.size()) {
        size_t n = std::min(length, buffer_.size() - buffer_pos_);
        std::memcpy(buffer, buffer_.data() + buffer_pos_, n);
        buffer_pos_ += n;
        if (buffer_pos_ == buffer_.size()) {
            buffer_.clear();
            buffer_pos_ = 0;
        }
        return static_cast<ssize_t>(n);
    }
    if (!is_open()) return SocketTransfer::IO_ERROR;
    ssize_t n = SocketTransfer::recvSome(socket_fd_, reinterpret_cast<char*>(buffer), length);
    return n == SocketTransfer::TIMED_OUT ? SocketTransfer::IO_ERROR : n;
}

bool Connection::readLine(std::string& line, size_t max_size) {
    for (;;) {
        auto end = buffer_.find("\r\n", buffer_pos_);
        if (end != std::string::npos) {
            line.assign(buffer_, buffer_pos_, end - buffer_pos_);
            buffer_pos_ = end + 2;
            return true;
        }
        if (buffer_.size() - buffer_pos_ > max_size) {
            return false;
        }
        if (fill() <= 0) {
            return false;
        }
    }
}

ssize_t Connection::fill() {
    if (!is_open()) return SocketTransfer::IO_ERROR;
    if (buffer_pos_ > 0) {
        buffer_.erase(0, buffer_pos_);
        buffer_pos_ = 0;
    }
    char chunk[READ_CHUNK];
    ssize_t n = SocketTransfer::recvSome(socket_fd_, chunk, sizeof(chunk));
    if (n > 0) {
        buffer_.append(chunk, static_cast<size_t>(n));
    }
    return n;
}

bool Connection::sendData(const std::string& data) {
    return sendData(data.data(), data.size());
}

bool Connection::sendData(const char* data, size_t length) {
    if (!is_open() || is_shutdown_.load(std::memory_order_acquire)) {
        return false;
    }
    if (SocketTransfer::sendAll(socket_fd_, data, length) < 0) {
        log_cpp20("send failed on connection " + std::to_string(id_) + ": " + std::string(strerror(errno)));
        return false;
    }
    return true;
}

void Connection::shutdown() {
    bool expected = false;
    if (is_shutdown_.compare_exchange_strong(expected, true) && is_open()) {
        ::shutdown(socket_fd_, SHUT_RDWR);
    }
}

void Connection::close() {
    bool expected = true;
    if (is_connected_.compare_exchange_strong(expected, false)) {
        ::close(socket_fd_);
    }
}


ConnectionManager::ConnectionManager(size_t max_connections, ServeFn serve)
    : max_connections_(max_connections), serve_(std::move(serve)) {}

ConnectionManager::~ConnectionManager() {
    shutdownAll();
}

bool ConnectionManager::addConnection(int fd, const std::string& peer) {
    reap();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!accepting_) {
        return false;
    }
    if (max_connections_ > 0 && workers_.size() >= max_connections_) {
        log_cpp20("connection limit reached, rejecting " + peer);
        return false;
    }

    uint64_t id = next_id_++;
    auto connection = std::make_shared<Connection>(fd, id, peer);
    Worker& worker = workers_[id];
    worker.connection = connection;
    try {
        worker.thread = std::thread(&ConnectionManager::run, this, connection);
    } catch (const std::system_error& e) {
        error_cpp20("failed to start connection worker: " + std::string(e.what()));
        workers_.erase(id);
        // the Connection took the fd and closed it on destruction
        return true;
    }
    return true;
}

void ConnectionManager::run(Connection::Ptr connection) {
    const uint64_t id = connection->id();
    try {
        serve_(connection);
    } catch (const std::exception& e) {
        error_cpp20("connection " + std::to_string(id) + " failed: " + e.what());
    }
    connection->shutdown();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = workers_.find(id);
        if (it != workers_.end()) {
            it->second.connection.reset();
            finished_.push_back(id);
        }
    }
    // last reference: the socket is closed here, not when the thread is reaped
    connection.reset();
}

size_t ConnectionManager::reap() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (uint64_t id : finished_) {
            auto it = workers_.find(id);
            if (it == workers_.end()) continue;
            done.push_back(std::move(it->second.thread));
            workers_.erase(it);
        }
        finished_.clear();
    }
    for (auto& t : done) {
        if (t.joinable()) t.join();
    }
    return done.size();
}

size_t ConnectionManager::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size() - std::min(workers_.size(), finished_.size());
}

void ConnectionManager::shutdownAll() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;
        for (auto& [id, worker] : workers_) {
            if (worker.connection) worker.connection->shutdown();
            threads.push_back(std::move(worker.thread));
        }
        workers_.clear();
        finished_.clear();
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
}

} // namespace net
