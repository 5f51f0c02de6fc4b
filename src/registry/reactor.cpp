#include "registry/reactor.hpp"
#include <spdlog/spdlog.h>
#include <sys/epoll.h>
#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace mahilo::registry {

Reactor::Reactor() = default;

Reactor::~Reactor() {
    for (int fd : timers_) {
        close(fd);
    }
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

bool Reactor::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("Failed to create epoll: {}", strerror(errno));
        return false;
    }
    spdlog::debug("Reactor initialized (epoll_fd={})", epoll_fd_);
    return true;
}

bool Reactor::add(int fd, uint32_t events, EventCallback callback) {
    struct epoll_event ev;
    ev.events = events;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("Failed to add fd {} to epoll: {}", fd, strerror(errno));
        return false;
    }

    callbacks_[fd] = std::move(callback);
    spdlog::debug("Added fd {} to reactor (events=0x{:x})", fd, events);
    return true;
}

bool Reactor::remove(int fd) {
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        // ENOENT is ok - fd might already be closed
        if (errno != ENOENT) {
            spdlog::error("Failed to remove fd {} from epoll: {}", fd, strerror(errno));
            return false;
        }
    }

    callbacks_.erase(fd);
    auto timer = timers_.find(fd);
    if (timer != timers_.end()) {
        close(fd);
        timers_.erase(timer);
    }
    spdlog::debug("Removed fd {} from reactor", fd);
    return true;
}

int Reactor::add_timer(int interval_ms, TimerCallback callback) {
    if (interval_ms <= 0) {
        spdlog::error("Timer interval must be positive (got {})", interval_ms);
        return -1;
    }

    int fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        spdlog::error("Failed to create timerfd: {}", strerror(errno));
        return -1;
    }

    struct itimerspec spec{};
    spec.it_interval.tv_sec = interval_ms / 1000;
    spec.it_interval.tv_nsec = static_cast<long>(interval_ms % 1000) * 1000000L;
    spec.it_value = spec.it_interval;

    if (timerfd_settime(fd, 0, &spec, nullptr) < 0) {
        spdlog::error("Failed to arm timerfd: {}", strerror(errno));
        close(fd);
        return -1;
    }

    timers_.insert(fd);
    bool added = add(fd, EPOLLIN, [cb = std::move(callback)](int tfd, uint32_t) {
        uint64_t expirations = 0;
        ssize_t n = read(tfd, &expirations, sizeof(expirations));
        if (n != static_cast<ssize_t>(sizeof(expirations))) {
            if (errno != EAGAIN) {
                spdlog::warn("timerfd read failed: {}", strerror(errno));
            }
            return;
        }
        cb();
    });
    if (!added) {
        timers_.erase(fd);
        close(fd);
        return -1;
    }

    spdlog::debug("Timer fd {} armed every {}ms", fd, interval_ms);
    return fd;
}

int Reactor::poll(int timeout_ms) {
    constexpr int MAX_EVENTS = 64;
    struct epoll_event events[MAX_EVENTS];

    int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            return 0; // Interrupted, not an error
        }
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return -1;
    }

    for (int i = 0; i < n; i++) {
        int fd = events[i].data.fd;
        uint32_t ev = events[i].events;

        auto it = callbacks_.find(fd);
        if (it != callbacks_.end()) {
            it->second(fd, ev);
        }
    }

    return n;
}

void Reactor::run() {
    running_ = true;
    spdlog::info("Reactor starting event loop");

    while (running_) {
        int n = poll(100); // 100ms timeout for responsiveness
        if (n < 0) {
            break;
        }
    }

    spdlog::info("Reactor event loop stopped");
}

void Reactor::stop() {
    running_ = false;
}

} // namespace mahilo::registry
