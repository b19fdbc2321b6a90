// Torch Market Core - Logging
// Named spdlog logger shared by the library

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string_view>

namespace torch::market::log {

inline constexpr const char* LOGGER_NAME = "torch";
inline constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

// Library logger. Created on first use with a colored stdout sink at info
// level, or picked up from the spdlog registry if the host registered one.
const std::shared_ptr<spdlog::logger>& logger();

// "trace", "debug", "info", "warn", "error", "off"; anything else is info
spdlog::level::level_enum parse_level(std::string_view level) noexcept;

void init_logging(std::string_view level);

}  // namespace torch::market::log
