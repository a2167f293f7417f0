#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

namespace kivybot::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo) {
    if (value == "debug" || value == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (value == "info" || value == "INFO") {
        return LogLevel::kInfo;
    }
    if (value == "warn" || value == "WARN" || value == "warning") {
        return LogLevel::kWarn;
    }
    if (value == "error" || value == "ERROR") {
        return LogLevel::kError;
    }
    return fallback;
}

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

namespace detail {

inline LogConfig& GlobalLogConfig() {
    static LogConfig config;
    return config;
}

inline std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

inline std::string UtcTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

}  // namespace detail

inline void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(detail::LogMutex());
    detail::GlobalLogConfig() = config;
}

inline void Write(const LogMessage& entry) {
    std::lock_guard<std::mutex> lock(detail::LogMutex());
    if (entry.level < detail::GlobalLogConfig().min_level) {
        return;
    }
    std::cerr << detail::UtcTimestamp() << ' ' << ToString(entry.level)
              << " [" << entry.tag << "] " << entry.message;
    for (const auto& field : entry.fields) {
        std::cerr << ' ' << field.first << '=' << field.second;
    }
    std::cerr << std::endl;
}

inline void Log(LogLevel level, const std::string& tag, const std::string& message) {
    Write(LogMessage{level, tag, message, {}});
}

inline void LogDebug(const std::string& tag, const std::string& message) {
    Log(LogLevel::kDebug, tag, message);
}

inline void LogInfo(const std::string& tag, const std::string& message) {
    Log(LogLevel::kInfo, tag, message);
}

inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}

inline void LogError(const std::string& tag, const std::string& message) {
    Log(LogLevel::kError, tag, message);
}

}  // namespace kivybot::utils
