#pragma once

#include <atomic>
#include <iostream>
#include <string>
#include <mutex>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace core {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Thread-safe Logger utility.
 * Messages below the global minimum level are dropped before formatting.
 * Avoid per-tick info logging: the classifier runs at headset frame rate.
 */
class Logger {
public:
    static void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tmBuf{};
        localtime_r(&time, &tmBuf);

        std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        out << "[" << std::put_time(&tmBuf, "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: out << "\033[36m[DEBUG]\033[0m "; break; // Cyan
            case LogLevel::INFO:  out << "\033[32m[INFO] \033[0m "; break; // Green
            case LogLevel::WARN:  out << "\033[33m[WARN] \033[0m "; break; // Yellow
            case LogLevel::ERROR: out << "\033[31m[ERROR]\033[0m "; break; // Red
        }

        out << message << std::endl;
    }

    static void setLevel(LogLevel level) { minLevel_.store(level); }
    static LogLevel getLevel() { return minLevel_.load(); }

    static bool enabled(LogLevel level) { return level >= minLevel_.load(); }

    /**
     * Parse "debug" / "info" / "warn" / "error" (case-sensitive).
     * Returns false and leaves `out` untouched for anything else.
     */
    static bool parseLevel(const std::string& name, LogLevel& out) {
        if (name == "debug") { out = LogLevel::DEBUG; return true; }
        if (name == "info")  { out = LogLevel::INFO;  return true; }
        if (name == "warn")  { out = LogLevel::WARN;  return true; }
        if (name == "error") { out = LogLevel::ERROR; return true; }
        return false;
    }

    // Helper for formatted logging
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
    inline static std::mutex mutex_;
    inline static std::atomic<LogLevel> minLevel_{LogLevel::INFO};
};

} // namespace core
