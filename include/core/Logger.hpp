#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace core {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Thread-safe Logger utility.
 * The sign pipeline runs once per detection tick, so per-frame logging is
 * kept to DEBUG and rate-limited by the caller.
 */
class Logger {
public:
    static void setLevel(LogLevel level) { minLevel_ = level; }

    static void log(LogLevel level, const std::string& message) {
        if (static_cast<int>(level) < static_cast<int>(minLevel_.load())) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::ostream& out = (level == LogLevel::ERROR) ? std::cerr : std::cout;
        out << "[" << std::put_time(std::localtime(&time), "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: out << "\033[36m[DEBUG]\033[0m "; break; // Cyan
            case LogLevel::INFO:  out << "\033[32m[INFO] \033[0m "; break; // Green
            case LogLevel::WARN:  out << "\033[33m[WARN] \033[0m "; break; // Yellow
            case LogLevel::ERROR: out << "\033[31m[ERROR]\033[0m "; break; // Red
        }

        out << message << std::endl;
    }

    // Parse "debug"/"info"/"warn"/"error"; unknown names fall back to INFO
    static LogLevel parseLevel(const std::string& name) {
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "warn" || name == "warning") return LogLevel::WARN;
        if (name == "error") return LogLevel::ERROR;
        return LogLevel::INFO;
    }

    template<typename... Args>
    static void debug(Args... args) {
        if (LogLevel::DEBUG < minLevel_.load()) return;
        log(LogLevel::DEBUG, format(args...));
    }

    template<typename... Args>
    static void info(Args... args) {
        log(LogLevel::INFO, format(args...));
    }

    template<typename... Args>
    static void warn(Args... args) {
        log(LogLevel::WARN, format(args...));
    }

    template<typename... Args>
    static void error(Args... args) {
        log(LogLevel::ERROR, format(args...));
    }

private:
    template<typename... Args>
    static std::string format(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        return ss.str();
    }

    static inline std::mutex mutex_;
    static inline std::atomic<LogLevel> minLevel_{LogLevel::INFO};
};

} // namespace core
