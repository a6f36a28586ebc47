#pragma once
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include <unistd.h>

// Logging levels
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

// Parses "debug", "info", "warning", "error", "critical". Unknown names map to INFO.
inline LogLevel log_level_from_string(const std::string& name);

class Logger {
private:
    LogLevel level_;
    std::mutex log_mutex_;
    std::ofstream log_file_;
    bool log_to_file_;
    std::string tag_;

public:
    Logger(LogLevel level = LogLevel::INFO, const std::string& filename = "")
        : level_(level), log_to_file_(!filename.empty()) {
        if (log_to_file_) {
            log_file_.open(filename, std::ios::app);
        }
    }

    ~Logger() {
        if (log_file_.is_open()) {
            log_file_.close();
        }
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level) {
        level_ = level;
    }

    LogLevel level() const { return level_; }

    // Process tag printed in every line, e.g. "supervisor" or "worker-2".
    void set_tag(const std::string& tag) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        tag_ = tag;
    }

    void log(LogLevel severity, const std::string& message, const std::string& client_ip = "") {
        if (severity < level_) return;

        std::lock_guard<std::mutex> lock(log_mutex_);
        auto now = std::chrono::system_clock::now();
        auto now_time = std::chrono::system_clock::to_time_t(now);
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local_tm{};
        localtime_r(&now_time, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << now_ms.count()
           << " [" << level_to_string(severity) << "]"
           << " [" << (tag_.empty() ? "main" : tag_) << ":" << getpid() << "]";

        if (!client_ip.empty()) {
            ss << " [" << client_ip << "]";
        }

        ss << " " << message << std::endl;

        std::cout << ss.str() << std::flush;
        if (log_to_file_ && log_file_.is_open()) {
            log_file_ << ss.str();
            log_file_.flush();
        }
    }

    // Holds the log mutex across fork() so the child never inherits it locked
    // by a thread that does not exist there.
    class ForkGuard {
    public:
        explicit ForkGuard(Logger& logger) : lock_(logger.log_mutex_) {}
    private:
        std::lock_guard<std::mutex> lock_;
    };

private:
    std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            default: return "UNKNOWN";
        }
    }
};

inline LogLevel log_level_from_string(const std::string& name) {
    std::string lower;
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical") return LogLevel::CRITICAL;
    return LogLevel::INFO;
}
