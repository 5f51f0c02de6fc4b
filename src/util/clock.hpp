#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace mahilo::util {

using TimePoint = std::chrono::system_clock::time_point;

// Time source for everything that schedules or stamps records.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock final : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

// Clock that only moves when told to. Used to drive retry backoff in tests.
class ManualClock final : public Clock {
public:
    explicit ManualClock(TimePoint start = TimePoint(std::chrono::seconds(1700000000)))
        : now_(start) {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

int64_t to_unix_seconds(TimePoint tp);
int64_t to_unix_millis(TimePoint tp);
TimePoint from_unix_millis(int64_t ms);

// 2024-01-31T12:00:00.000Z
std::string to_iso8601(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z]" in UTC.
std::optional<TimePoint> parse_iso8601(const std::string& text);

} // namespace mahilo::util
