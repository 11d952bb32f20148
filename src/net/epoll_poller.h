#pragma once

#include <sys/epoll.h>
#include <vector>
#include <optional>

namespace net {

class EpollPoller {
public:
    EpollPoller();
    ~EpollPoller();

    EpollPoller(const EpollPoller&) = delete;
    EpollPoller& operator=(const EpollPoller&) = delete;

    bool valid() const { return epoll_fd_ != -1; }
    bool add_fd(int fd, uint32_t events);
    bool modify_fd(int fd, uint32_t events);
    bool remove_fd(int fd);
    int epoll_fd() const { return epoll_fd_; }
    // Empty vector on timeout or EINTR, std::nullopt on failure.
    std::optional<std::vector<epoll_event>> poll(int timeout);

private:
    static constexpr int MAX_EVENTS = 64;
    int epoll_fd_;
};

} // namespace net
