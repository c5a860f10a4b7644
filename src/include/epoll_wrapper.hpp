#ifndef ARBOR_EPOLL_WRAPPER_HPP
#define ARBOR_EPOLL_WRAPPER_HPP

#include "common.hpp"

// Owner of an epoll instance. The registration bitset is not synchronised,
// callers serialise add() and remove().
class EpollWrapper
{
public:
    EpollWrapper() : epoll_fd(epoll_create1(EPOLL_CLOEXEC))
    {
        if (epoll_fd == -1)
        {
            throw std::system_error(errno, std::system_category(),
                                    "Failed to create epoll file descriptor");
        }
    }
    ~EpollWrapper() noexcept
    {
        if (epoll_fd != -1)
            close(epoll_fd);
    }

    // delete copy operations
    EpollWrapper(const EpollWrapper &) = delete;
    EpollWrapper &operator=(const EpollWrapper &) = delete;

    [[nodiscard]] inline int get() const noexcept
    {
        return epoll_fd;
    }

    [[nodiscard]] inline int wait(struct epoll_event *events, int maxEvents,
                                  int timeout) noexcept
    {
        return epoll_wait(epoll_fd, events, maxEvents, timeout);
    }

    [[nodiscard]] inline bool add(int fd, uint32_t events) noexcept
    {
        if (fd < 0 || static_cast<size_t>(fd) >= MAX_FDS)
            return false;

        if (fd_status.test(fd))
            return true; // already added

        struct epoll_event ev;
        ev.events = events;
        ev.data.fd = fd;

        if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &ev) == 0)
        {
            fd_status.set(fd);
            return true;
        }
        return false;
    }

    // re-arm a oneshot registration
    [[nodiscard]] inline bool modify(int fd, uint32_t events) noexcept
    {
        struct epoll_event ev;
        ev.events = events;
        ev.data.fd = fd;
        return epoll_ctl(epoll_fd, EPOLL_CTL_MOD, fd, &ev) == 0;
    }

    inline bool remove(int fd) noexcept
    {
        if (fd < 0 || static_cast<size_t>(fd) >= MAX_FDS)
            return false;

        if (!fd_status.test(fd))
            return true; // already removed

        fd_status.reset(fd);
        return epoll_ctl(epoll_fd, EPOLL_CTL_DEL, fd, nullptr) == 0;
    }

    [[nodiscard]] inline bool is_monitored(int fd) const noexcept
    {
        if (fd < 0 || static_cast<size_t>(fd) >= MAX_FDS)
            return false;
        return fd_status.test(fd);
    }

private:
    int epoll_fd;
    static constexpr size_t MAX_FDS = 65536; // maximum number of file descriptors
    std::bitset<MAX_FDS> fd_status;          // registered descriptors
};

#endif // ARBOR_EPOLL_WRAPPER_HPP
