#include "waypoint/util/Logging.hpp"

#include "waypoint/util/StringUtil.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace waypoint::util {
namespace {
std::mutex& logMutex() {
    static std::mutex m;
    return m;
}

std::atomic<LogLevel>& globalLevel() {
    static std::atomic<LogLevel> level{LogLevel::info};
    return level;
}
}

const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::trace: return "TRACE";
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    auto lowered = toLower(trim(text));
    if (lowered == "trace") return LogLevel::trace;
    if (lowered == "debug") return LogLevel::debug;
    if (lowered == "info") return LogLevel::info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::warn;
    if (lowered == "error") return LogLevel::error;
    return std::nullopt;
}

void initLogging(LogLevel level) {
    globalLevel().store(level, std::memory_order_relaxed);
}

void initLoggingFromEnvironment() {
    const char* value = std::getenv("WAYPOINT_LOG_LEVEL");
    if (value == nullptr) {
        return;
    }
    if (auto level = parseLogLevel(value)) {
        initLogging(*level);
    } else {
        log(LogLevel::warn, std::string{"Ignoring unknown WAYPOINT_LOG_LEVEL: "} + value);
    }
}

LogLevel currentLogLevel() {
    return globalLevel().load(std::memory_order_relaxed);
}

bool shouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(currentLogLevel());
}

void log(LogLevel level, const std::string& message) {
    if (!shouldLog(level)) return;

    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto sec_tp = floor<seconds>(now);
    const auto ms = duration_cast<milliseconds>(now - sec_tp).count();

    std::time_t t = system_clock::to_time_t(sec_tp);
    std::tm tmBuf{};
#ifdef _WIN32
    localtime_s(&tmBuf, &t);
#else
    localtime_r(&t, &tmBuf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;

    std::lock_guard lk(logMutex());
    std::clog << oss.str() << " [" << toString(level) << "] " << message << '\n';
}

} // namespace waypoint::util
