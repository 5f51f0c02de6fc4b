#pragma once
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <cstdint>

namespace mahilo::registry {

// Event types
enum class EventType : uint32_t {
    READABLE  = 0x001,
    ERROR     = 0x008,
    HANGUP    = 0x010
};

// Event callback: (fd, events) -> void
using EventCallback = std::function<void(int fd, uint32_t events)>;

// Timer callback, run once per expiration batch
using TimerCallback = std::function<void()>;

class Reactor {
public:
    Reactor();
    ~Reactor();

    // Non-copyable
    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    // Initialize epoll
    bool init();

    // Add fd to watch (returns true on success)
    bool add(int fd, uint32_t events, EventCallback callback);

    // Remove fd from watch
    bool remove(int fd);

    // Periodic timer backed by a timerfd. Returns the timer fd, -1 on failure.
    int add_timer(int interval_ms, TimerCallback callback);

    // Run one iteration of event loop
    // timeout_ms: -1 = block forever, 0 = return immediately
    int poll(int timeout_ms = -1);

    // Run event loop until stopped
    void run();

    // Stop the event loop
    void stop();

    bool is_running() const { return running_; }

private:
    int epoll_fd_ = -1;
    bool running_ = false;
    std::unordered_map<int, EventCallback> callbacks_;
    std::unordered_set<int> timers_;   // timer fds owned by the reactor
};

inline uint32_t operator|(EventType a, EventType b) {
    return static_cast<uint32_t>(a) | static_cast<uint32_t>(b);
}

} // namespace mahilo::registry
