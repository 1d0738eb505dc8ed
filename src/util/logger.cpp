#include "metacache/util/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace metacache::util {

/*
    Meyer's Singleton: constructed on first call, thread safe initialization (c++11 guarantee)
*/
Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

LogLevel Logger::level() const {
    return level_.load();
}

void Logger::debug(std::string_view message) {
    log(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) {
    log(LogLevel::Info, message);
}

void Logger::warn(std::string_view message) {
    log(LogLevel::Warn, message);
}

void Logger::error(std::string_view message) {
    log(LogLevel::Error, message);
}

void Logger::log(LogLevel level, std::string_view message) {
    if (level == LogLevel::None || level < level_.load()) {
        return;
    }

    std::string line =
        timestamp() + " [" + std::string(level_string(level)) + "] " + std::string(message) + "\n";
    std::lock_guard lock(mutex_);
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << line;
}

std::string Logger::timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    // format: "2024-01-15 10:30:45.123"
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

// string literals live for the whole program, so a string_view is enough here
std::string_view Logger::level_string(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO ";
        case LogLevel::Warn:
            return "WARN ";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "?????";
    }
}

LogLevel parse_log_level(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "none") return LogLevel::None;
    return LogLevel::Info;
}

}  // namespace metacache::util
