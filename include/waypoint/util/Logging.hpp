#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace waypoint::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
// Applies WAYPOINT_LOG_LEVEL when it is set to a known level.
void initLoggingFromEnvironment();
LogLevel currentLogLevel();
bool shouldLog(LogLevel level);
void log(LogLevel level, const std::string& message);

std::optional<LogLevel> parseLogLevel(std::string_view text);
const char* toString(LogLevel level);

} // namespace waypoint::util
