#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace jsgate {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static void SetLevel(LogLevel level) { level_.store(static_cast<int>(level)); }
    static LogLevel Level() { return static_cast<LogLevel>(level_.load()); }

    // Routes every level to stderr. Used by the worker, whose stdout carries frames.
    static void SetStderrOnly(bool stderr_only) { stderr_only_.store(stderr_only); }

    static bool ParseLevel(const std::string& name, LogLevel* level) {
        if (name == "debug") { *level = LogLevel::DEBUG; return true; }
        if (name == "info") { *level = LogLevel::INFO; return true; }
        if (name == "warn" || name == "warning") { *level = LogLevel::WARNING; return true; }
        if (name == "error") { *level = LogLevel::ERROR; return true; }
        return false;
    }

    static void Log(LogLevel level, const std::string& message) {
        if (static_cast<int>(level) < level_.load()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::tm local_tm{};
        localtime_r(&time, &local_tm);

        std::ostream& out = (level == LogLevel::ERROR || stderr_only_.load()) ? std::cerr : std::cout;
        out << "[" << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "] ";

        switch (level) {
            case LogLevel::DEBUG: out << "[DEBUG] "; break;
            case LogLevel::INFO: out << "[INFO] "; break;
            case LogLevel::WARNING: out << "[WARN] "; break;
            case LogLevel::ERROR: out << "[ERROR] "; break;
        }
        out << message << std::endl;
    }

    template<typename... Args>
    static void Debug(Args... args) {
        if (Level() > LogLevel::DEBUG) return;
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::DEBUG, ss.str());
    }

    template<typename... Args>
    static void Info(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::INFO, ss.str());
    }

    template<typename... Args>
    static void Warn(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::WARNING, ss.str());
    }

    template<typename... Args>
    static void Error(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        Log(LogLevel::ERROR, ss.str());
    }

private:
    static std::mutex mutex_;
    static std::atomic<int> level_;
    static std::atomic<bool> stderr_only_;
};

inline std::mutex Logger::mutex_;
inline std::atomic<int> Logger::level_{static_cast<int>(LogLevel::INFO)};
inline std::atomic<bool> Logger::stderr_only_{false};

} // namespace jsgate
