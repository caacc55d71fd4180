#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <optional>

namespace core {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Thread-safe Logger utility.
 * Used by the detection loop thread and the OSC sender thread concurrently.
 * Keep per-frame calls throttled, console I/O blocks.
 */
class Logger {
public:
    static void log(LogLevel level, const std::string& message);

    /**
     * Messages below this level are dropped. Defaults to DEBUG.
     */
    static void setLevel(LogLevel level);
    static LogLevel level();

    /**
     * "debug", "info", "warn" or "error" (case-sensitive).
     */
    static std::optional<LogLevel> parseLevel(const std::string& name);

    template<typename... Args>
    static void debug(Args... args) {
        if (!enabled(LogLevel::DEBUG)) return;
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::DEBUG, ss.str());
    }

    template<typename... Args>
    static void info(Args... args) {
        if (!enabled(LogLevel::INFO)) return;
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::INFO, ss.str());
    }

    template<typename... Args>
    static void warn(Args... args) {
        if (!enabled(LogLevel::WARN)) return;
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::WARN, ss.str());
    }

    template<typename... Args>
    static void error(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        log(LogLevel::ERROR, ss.str());
    }

private:
    static bool enabled(LogLevel level);

    static std::mutex mutex_;
    static LogLevel level_;
};

} // namespace core
