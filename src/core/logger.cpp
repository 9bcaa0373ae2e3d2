#include "core/logger.hpp"
#include "core/config.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace crew::core {

void init_logger() {
    static bool initialized = false;
    if (initialized) return;
    initialized = true;

    auto logger = spdlog::stdout_color_mt("crew");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [crew] [%^%l%$] [t%t] %v");
    spdlog::set_default_logger(logger);

    auto level = config::get_env("CREW_LOG_LEVEL");
    set_log_level(level.empty() ? spdlog::level::info : log_level_from_string(level));
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum log_level_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace crew::core
