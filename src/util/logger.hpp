#pragma once
#include <spdlog/spdlog.h>
#include <string>

namespace mahilo::util {

// Initialize logging with console output.
// MAHILO_LOG_LEVEL / MAHILO_LOG_PATTERN override the arguments when set.
void init_logger(const std::string& level = "info",
                 const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

// Set log level
void set_log_level(spdlog::level::level_enum level);

} // namespace mahilo::util
