/**
 * @file logger.cpp
 * @brief Logger singleton and line formatting.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/utils/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>

namespace kasad {
namespace utils {

namespace {

const char* colorCode(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";    // Gray
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO:  return "\033[32m";    // Green
        case LogLevel::WARN:  return "\033[33m";    // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        case LogLevel::FATAL: return "\033[35;1m";  // Bold Magenta
        default:              return "";
    }
}

constexpr const char* COLOR_RESET = "\033[0m";

struct LevelName {
    LogLevel level;
    const char* tag;
    const char* flag;
};

constexpr LevelName LEVEL_NAMES[] = {
    {LogLevel::TRACE, "TRACE", "TRACE"},
    {LogLevel::DEBUG, "DEBUG", "DEBUG"},
    {LogLevel::INFO,  "INFO ", "INFO"},
    {LogLevel::WARN,  "WARN ", "WARN"},
    {LogLevel::ERROR, "ERROR", "ERROR"},
    {LogLevel::FATAL, "FATAL", "FATAL"},
    {LogLevel::OFF,   "OFF  ", "OFF"},
};

}  // namespace

const char* logLevelToString(LogLevel level) {
    for (const auto& name : LEVEL_NAMES) {
        if (name.level == level) {
            return name.tag;
        }
    }
    return "?????";
}

LogLevel parseLogLevel(const std::string& text) {
    for (const auto& name : LEVEL_NAMES) {
        if (text == name.flag) {
            return name.level;
        }
    }
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(static_cast<int>(LogLevel::INFO))
    , colorEnabled_(true)
    , sink_(&std::cerr)
{}

void Logger::setOutput(std::ostream* out) {
    std::lock_guard<std::mutex> lock(sinkMutex_);
    sink_ = out ? out : &std::cerr;
}

void Logger::write(LogLevel level, const char* component, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    // [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] [Component] message
    std::ostringstream line;
    line << '[' << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
         << '.' << std::setfill('0') << std::setw(3) << millis << "] ";

    if (colorEnabled_.load(std::memory_order_relaxed)) {
        line << colorCode(level) << '[' << logLevelToString(level) << ']' << COLOR_RESET;
    } else {
        line << '[' << logLevelToString(level) << ']';
    }
    line << " [" << component << "] " << message << '\n';

    {
        std::lock_guard<std::mutex> lock(sinkMutex_);
        *sink_ << line.str() << std::flush;
    }

    if (level == LogLevel::FATAL) {
        std::abort();
    }
}

}  // namespace utils
}  // namespace kasad
