// =============================================================================
// log.cpp - spdlog logger for the exchange core
// =============================================================================

#include "dexcore/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace dexcore {
namespace log {

spdlog::level::level_enum parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void setup(const std::string& level) {
    spdlog::drop(LOGGER_NAME);

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, console_sink);
    logger->set_level(parse_level(level));
    spdlog::register_logger(logger);

    logger->debug("Logging initialized at level: {}", level);
}

std::shared_ptr<spdlog::logger> get() {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stdout_color_mt(LOGGER_NAME);
    }
    return logger;
}

} // namespace log
} // namespace dexcore
