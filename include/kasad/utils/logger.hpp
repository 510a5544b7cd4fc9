/**
 * @file logger.hpp
 * @brief Leveled, component-tagged logging used by every kasad layer.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/utils/export.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace kasad {
namespace utils {

/// Severity, lowest first. OFF silences everything.
enum class LogLevel : int {
    TRACE = 0,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL,
    OFF
};

/// Five-character tag printed in each line ("INFO ", "WARN ", ...).
KASAD_UTILS_API const char* logLevelToString(LogLevel level);

/// Maps --log-level text (upper case) to a level; unknown text gives INFO.
KASAD_UTILS_API LogLevel parseLogLevel(const std::string& text);

namespace detail {

inline void appendFormatted(std::ostringstream& out, const char* format) {
    out << format;
}

// Each "{}" takes the next argument. Extra arguments are ignored and extra
// placeholders are printed as-is.
template<typename T, typename... Rest>
void appendFormatted(std::ostringstream& out, const char* format, T&& value, Rest&&... rest) {
    for (const char* p = format; *p != '\0'; ++p) {
        if (p[0] == '{' && p[1] == '}') {
            out << std::forward<T>(value);
            appendFormatted(out, p + 2, std::forward<Rest>(rest)...);
            return;
        }
        out << *p;
    }
}

}  // namespace detail

/**
 * @class Logger
 * @brief Process-wide sink with an atomic threshold.
 *
 * Lines are written whole under one mutex, so concurrent threads never
 * interleave within a line.
 *
 * @code
 * LOG_INFO("Discovery", "Found {} at {}", deviceId, address.toString());
 * @endcode
 */
class KASAD_UTILS_API Logger {
public:
    static Logger& instance();

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /// ANSI colors around the level tag. On by default.
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Send lines to @p out instead of std::cerr; nullptr restores it.
     *
     * The stream must outlive every log call made while it is installed.
     */
    void setOutput(std::ostream* out);

    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream message;
        detail::appendFormatted(message, format, std::forward<Args>(args)...);
        write(level, component, message.str());
    }

    /**
     * @brief Emit one line: timestamp, level, component, message.
     *
     * A FATAL line aborts the process after it is written.
     */
    void write(LogLevel level, const char* component, const std::string& message);

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex sinkMutex_;
    std::ostream* sink_;
};

}  // namespace utils
}  // namespace kasad

// =============================================================================
// Logging macros
// =============================================================================

#define KASAD_LOG(level, component, ...) \
    ::kasad::utils::Logger::instance().log(level, component, __VA_ARGS__)

#define LOG_TRACE(component, ...) KASAD_LOG(::kasad::utils::LogLevel::TRACE, component, __VA_ARGS__)
#define LOG_DEBUG(component, ...) KASAD_LOG(::kasad::utils::LogLevel::DEBUG, component, __VA_ARGS__)
#define LOG_INFO(component, ...)  KASAD_LOG(::kasad::utils::LogLevel::INFO, component, __VA_ARGS__)
#define LOG_WARN(component, ...)  KASAD_LOG(::kasad::utils::LogLevel::WARN, component, __VA_ARGS__)
#define LOG_ERROR(component, ...) KASAD_LOG(::kasad::utils::LogLevel::ERROR, component, __VA_ARGS__)
#define LOG_FATAL(component, ...) KASAD_LOG(::kasad::utils::LogLevel::FATAL, component, __VA_ARGS__)
