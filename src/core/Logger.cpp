#include "core/Logger.hpp"

#include <ctime>

namespace core {

std::mutex Logger::mutex_;
LogLevel Logger::level_ = LogLevel::DEBUG;

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::cout << "[" << std::put_time(&local, "%H:%M:%S")
              << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

    switch (level) {
        case LogLevel::DEBUG: std::cout << "\033[36m[DEBUG]\033[0m "; break; // Cyan
        case LogLevel::INFO:  std::cout << "\033[32m[INFO] \033[0m "; break; // Green
        case LogLevel::WARN:  std::cout << "\033[33m[WARN] \033[0m "; break; // Yellow
        case LogLevel::ERROR: std::cout << "\033[31m[ERROR]\033[0m "; break; // Red
    }

    std::cout << message << std::endl;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return std::nullopt;
}

bool Logger::enabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(level_);
}

} // namespace core
