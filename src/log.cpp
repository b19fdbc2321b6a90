// Torch Market Core - Logging Implementation

#include <torch/market/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace torch::market::log {

const std::shared_ptr<spdlog::logger>& logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get(LOGGER_NAME)) {
            return existing;
        }
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto created = std::make_shared<spdlog::logger>(LOGGER_NAME, console_sink);
        created->set_pattern(LOG_PATTERN);
        created->set_level(spdlog::level::info);
        spdlog::register_logger(created);
        return created;
    }();
    return instance;
}

spdlog::level::level_enum parse_level(std::string_view level) noexcept {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error" || level == "err") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init_logging(std::string_view level) {
    logger()->set_level(parse_level(level));
    logger()->debug("log level set to {}", spdlog::level::to_string_view(logger()->level()));
}

}  // namespace torch::market::log
