#include "util/clock.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mahilo::util {

int64_t to_unix_seconds(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

int64_t to_unix_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_unix_millis(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

std::string to_iso8601(TimePoint tp) {
    int64_t ms = to_unix_millis(tp);
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        secs -= 1;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buffer;
}

std::optional<TimePoint> parse_iso8601(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (in.peek() == '.') {
        in.get();
        std::string digits;
        while (std::isdigit(in.peek())) {
            digits.push_back(static_cast<char>(in.get()));
        }
        if (digits.empty()) {
            return std::nullopt;
        }
        digits.resize(3, '0');
        millis = std::stoi(digits.substr(0, 3));
    }

    if (in.peek() == 'Z') {
        in.get();
    }
    if (in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    std::time_t secs = timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return from_unix_millis(static_cast<int64_t>(secs) * 1000 + millis);
}

} // namespace mahilo::util
