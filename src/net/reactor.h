#pragma once
#include <atomic>
#include <cstdint>
#include <thread>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include "epoll_poller.h"
#include "common/debug.h"

namespace net {

// Event loop skeleton: one thread polling an epoll set. An eventfd sits in
// the set so that stop() interrupts a blocking poll right away.
// Subclasses call stop() in their own destructor, before loop() loses its object.
class ReactorBase {
public:
    ReactorBase() {
        wakeup_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeup_fd_ < 0) {
            RUNTIME_ERROR("eventfd() failed: %s", strerror(errno));
            return;
        }
        epoll_poller_.add_fd(wakeup_fd_, EPOLLIN);
    }

    virtual ~ReactorBase() {
        stop();
        if (wakeup_fd_ >= 0) ::close(wakeup_fd_);
    }

    ReactorBase(const ReactorBase&) = delete;
    ReactorBase& operator=(const ReactorBase&) = delete;

    bool start() {
        if (!epoll_poller_.valid() || wakeup_fd_ < 0) return false;
        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) return false;
        thread_ = std::thread(&ReactorBase::loop, this);
        return true;
    }

    void stop() {
        bool expected = true;
        if (running_.compare_exchange_strong(expected, false)) {
            wakeup();
        }
        if (thread_.joinable()) thread_.join();
    }

    bool running() const { return running_.load(std::memory_order_acquire); }

    int epoll_fd() const { return epoll_poller_.epoll_fd(); }

protected:
    virtual void loop() = 0;

    bool is_wakeup(int fd) const { return fd == wakeup_fd_; }

    void drain_wakeup() {
        uint64_t value;
        while (::read(wakeup_fd_, &value, sizeof(value)) > 0) {}
    }

private:
    void wakeup() {
        uint64_t one = 1;
        if (::write(wakeup_fd_, &one, sizeof(one)) != sizeof(one)) {
            RUNTIME_ERROR("eventfd write failed: %s", strerror(errno));
        }
    }

protected:
    std::atomic<bool> running_{false};
    EpollPoller epoll_poller_{};
    std::thread thread_{};
    int wakeup_fd_{-1};
};

} // namespace net
