#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>

namespace mahilo::util {

void init_logger(const std::string& level, const std::string& pattern) {
    std::string resolved_level = level;
    if (const char* env = std::getenv("MAHILO_LOG_LEVEL")) {
        resolved_level = env;
    }

    std::string resolved_pattern = pattern;
    if (const char* env = std::getenv("MAHILO_LOG_PATTERN")) {
        resolved_pattern = env;
    }

    auto console = spdlog::get("mahilo");
    if (!console) {
        console = spdlog::stdout_color_mt("mahilo");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(spdlog::level::from_str(resolved_level));
    spdlog::set_pattern(resolved_pattern);
    spdlog::flush_on(spdlog::level::warn);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

} // namespace mahilo::util
