#include "epoll_poller.h"
#include <sys/epoll.h>
#include <unistd.h>
#include <vector>

#include "common/debug.h"

namespace net {


EpollPoller::EpollPoller() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ == -1) {
        RUNTIME_ERROR("Failed to create epoll file descriptor: %s", strerror(errno));
    }
}

EpollPoller::~EpollPoller() {
    if (epoll_fd_ != -1)
        close(epoll_fd_);
}

bool EpollPoller::add_fd(int fd, uint32_t events) {
    struct epoll_event event;
    event.events = events;
    event.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &event) == -1) {
        RUNTIME_ERROR("Failed to add file descriptor to epoll: %s", strerror(errno));
        return false;
    }
    return true;
}

bool EpollPoller::modify_fd(int fd, uint32_t events) {
    struct epoll_event event;
    event.events = events;
    event.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &event) == -1) {
        RUNTIME_ERROR("Failed to modify file descriptor in epoll: %s", strerror(errno));
        return false;
    }
    return true;
}

bool EpollPoller::remove_fd(int fd) {
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) == -1) {
        RUNTIME_ERROR("Failed to remove file descriptor from epoll: %s", strerror(errno));
        return false;
    }
    return true;
}

std::optional<std::vector<epoll_event>> EpollPoller::poll(int timeout) {
    struct epoll_event events[MAX_EVENTS];
    int num_events = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout);

    if (num_events < 0) {
        if (errno == EINTR) {
            log_cpp20("epoll_wait interrupted by signal");
            return std::vector<epoll_event>{};
        }
        error_cpp20("epoll_wait failed: " + std::string(strerror(errno)));
        return std::nullopt;
    }

    return std::vector<epoll_event>(events, events + num_events);
}

} // namespace net
