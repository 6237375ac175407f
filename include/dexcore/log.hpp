#ifndef DEXCORE_LOG_HPP
#define DEXCORE_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace dexcore {
namespace log {

constexpr const char* LOGGER_NAME = "dexcore";

// Install the "dexcore" logger (stdout colour sink) at the given level:
// "trace", "debug", "info", "warn", "error", "critical" or "off".
void setup(const std::string& level);

// The "dexcore" logger; created at info level on first use if setup() was not called
std::shared_ptr<spdlog::logger> get();

spdlog::level::level_enum parse_level(const std::string& level);

} // namespace log
} // namespace dexcore

#endif // DEXCORE_LOG_HPP
