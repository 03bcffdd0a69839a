#pragma once

#include <cstdlib>
#include <iostream>
#include <string>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <cstring>
#include <cctype>
#include <cstdio>

namespace graphlink {
namespace log {

enum class LogLevel {
    ERROR,      // Severe error, but recoverable
    WARNING,    // Potential issues
    INFO,       // General information
    DEBUG,      // Debugging details
};

inline std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::DEBUG:   return "DEBUG";
        default:                return "UNKNOWN";
    }
}

// GRAPHLINK_LOG_LEVEL=error|warning|info|debug, read once.
inline LogLevel minimumLevel() {
    static const LogLevel level = []() {
        const char* env = std::getenv("GRAPHLINK_LOG_LEVEL");
        if (!env || env[0] == '\0') return LogLevel::WARNING;
        std::string value(env);
        for (auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (value == "error") return LogLevel::ERROR;
        if (value == "info") return LogLevel::INFO;
        if (value == "debug") return LogLevel::DEBUG;
        return LogLevel::WARNING;
    }();
    return level;
}

inline bool enabled(LogLevel level) {
    return static_cast<int>(level) <= static_cast<int>(minimumLevel());
}

#define GRAPHLINK_ANSI_RESET   "\033[0m"
#define GRAPHLINK_ANSI_RED     "\033[31m"
#define GRAPHLINK_ANSI_YELLOW  "\033[33m"
#define GRAPHLINK_ANSI_GREEN   "\033[32m"
#define GRAPHLINK_ANSI_CYAN    "\033[36m"

inline const char* getColorForLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:   return GRAPHLINK_ANSI_RED;
        case LogLevel::WARNING: return GRAPHLINK_ANSI_YELLOW;
        case LogLevel::INFO:    return GRAPHLINK_ANSI_GREEN;
        case LogLevel::DEBUG:   return GRAPHLINK_ANSI_CYAN;
        default:                return GRAPHLINK_ANSI_RESET;
    }
}

inline const char* basename(const char* path) {
    const char* slash = strrchr(path, '/');
    return slash ? slash + 1 : path;
}

template<typename... Args>
inline void write(LogLevel level, const char* file, int line, const char* format, Args... args) {
    if (!enabled(level)) return;

    char buffer[1024];
    snprintf(buffer, sizeof(buffer), format, args...);

    std::cerr << getColorForLevel(level)
              << "[" << getTimestamp() << "] "
              << "[" << logLevelToString(level) << "] "
              << "[" << basename(file) << ":" << line << "] "
              << buffer
              << GRAPHLINK_ANSI_RESET << std::endl;
}

} // namespace log
} // namespace graphlink

#define GRAPHLINK_LOG_ERROR(format, ...) \
    ::graphlink::log::write(::graphlink::log::LogLevel::ERROR, __FILE__, __LINE__, format, ##__VA_ARGS__)

#define GRAPHLINK_LOG_WARNING(format, ...) \
    ::graphlink::log::write(::graphlink::log::LogLevel::WARNING, __FILE__, __LINE__, format, ##__VA_ARGS__)

#define GRAPHLINK_LOG_INFO(format, ...) \
    ::graphlink::log::write(::graphlink::log::LogLevel::INFO, __FILE__, __LINE__, format, ##__VA_ARGS__)

#define GRAPHLINK_LOG_DEBUG(format, ...) \
    ::graphlink::log::write(::graphlink::log::LogLevel::DEBUG, __FILE__, __LINE__, format, ##__VA_ARGS__)
