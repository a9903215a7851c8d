// TripNavSim/common/logger.h
#ifndef TRIPNAV_LOGGER_H
#define TRIPNAV_LOGGER_H

#include <cstdio>
#include <ctime>
#include <chrono>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <string>

namespace tripnav {
namespace logging {

enum class LogLevel {
    VERBOSE = 0,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Runtime threshold, shared by every translation unit (C++14: function-local static).
inline LogLevel& minLogLevelStorage() {
    static LogLevel level = LogLevel::INFO;
    return level;
}

inline void setMinLogLevel(LogLevel level) { minLogLevelStorage() = level; }
inline LogLevel getMinLogLevel() { return minLogLevelStorage(); }

inline bool isLogLevelEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(minLogLevelStorage());
}

// Accepts "verbose", "debug", "info", "warning", "error", "fatal". Returns false if unknown.
inline bool parseLogLevel(const std::string& text, LogLevel& out) {
    if (text == "verbose") { out = LogLevel::VERBOSE; return true; }
    if (text == "debug")   { out = LogLevel::DEBUG;   return true; }
    if (text == "info")    { out = LogLevel::INFO;    return true; }
    if (text == "warning") { out = LogLevel::WARNING; return true; }
    if (text == "error")   { out = LogLevel::ERROR;   return true; }
    if (text == "fatal")   { out = LogLevel::FATAL;   return true; }
    return false;
}

inline std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&in_time_t, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %X");
    return ss.str();
}

} // namespace logging
} // namespace tripnav

// Log line: [timestamp] [LEVEL] [file:line] message
#define TRIPNAV_LOG_IMPL(level, label, file, line, ...) \
    do { \
        if (::tripnav::logging::isLogLevelEnabled(level)) { \
            std::cout << "[" << ::tripnav::logging::getCurrentTimestamp() << "] [" << label << "] [" \
                      << file << ":" << line << "] "; \
            std::cout.flush(); \
            std::printf(__VA_ARGS__); \
            std::fflush(stdout); \
            std::cout << std::endl; \
        } \
    } while (0)

#define TRIPNAV_LOG_FATAL(...)   TRIPNAV_LOG_IMPL(::tripnav::logging::LogLevel::FATAL, "FATAL", __FILE__, __LINE__, __VA_ARGS__)
#define TRIPNAV_LOG_ERROR(...)   TRIPNAV_LOG_IMPL(::tripnav::logging::LogLevel::ERROR, "ERROR", __FILE__, __LINE__, __VA_ARGS__)
#define TRIPNAV_LOG_WARNING(...) TRIPNAV_LOG_IMPL(::tripnav::logging::LogLevel::WARNING, "WARNING", __FILE__, __LINE__, __VA_ARGS__)
#define TRIPNAV_LOG_INFO(...)    TRIPNAV_LOG_IMPL(::tripnav::logging::LogLevel::INFO, "INFO", __FILE__, __LINE__, __VA_ARGS__)
#define TRIPNAV_LOG_DEBUG(...)   TRIPNAV_LOG_IMPL(::tripnav::logging::LogLevel::DEBUG, "DEBUG", __FILE__, __LINE__, __VA_ARGS__)
#define TRIPNAV_LOG_VERBOSE(...) TRIPNAV_LOG_IMPL(::tripnav::logging::LogLevel::VERBOSE, "VERBOSE", __FILE__, __LINE__, __VA_ARGS__)

#endif // TRIPNAV_LOGGER_H
