#pragma once

// ============================================================
// logger.hpp -- Process-wide logger
//
// Lines look like
//   2026-01-02 10:11:12.345 [INFO ] server: Listening on 0.0.0.0:8080
// WARN and above go to stderr, the rest to stdout. An optional log
// file receives every line that passes the level filter. Failed
// transfers are additionally appended to a separate transfer log.
// ============================================================

#include "platform.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
    OFF   = 4,
};

static constexpr const char* DEFAULT_TRANSFER_LOG = "lanshare_transfer_errors.log";

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    LogLevel level() {
        std::lock_guard<std::mutex> lk(mutex_);
        return level_;
    }

    // Prefix for every line, e.g. "server" or "client"
    void set_component(const std::string& name) {
        std::lock_guard<std::mutex> lk(mutex_);
        component_ = name;
    }

    // Console output can be silenced while a progress line owns the terminal
    void set_console(bool enabled) {
        std::lock_guard<std::mutex> lk(mutex_);
        console_ = enabled;
    }

    // Returns false if the file could not be opened.
    bool set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    // "" disables the transfer log. Opened lazily on the first failure.
    void set_transfer_log(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (transfer_file_.is_open()) transfer_file_.close();
        transfer_path_ = path;
    }

    void log(LogLevel lvl, const std::string& msg) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl < level_) return;
        emit(lvl, format_line(lvl, msg));
    }

    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }

    // Logged at ERROR and kept in the transfer log regardless of level
    void transfer_error(const std::string& msg) {
        std::lock_guard<std::mutex> lk(mutex_);
        std::string line = format_line(LogLevel::ERR, "transfer failed: " + msg);
        if (level_ <= LogLevel::ERR) emit(LogLevel::ERR, line);

        if (transfer_path_.empty()) return;
        if (!transfer_file_.is_open()) transfer_file_.open(transfer_path_, std::ios::app);
        if (transfer_file_.is_open()) {
            transfer_file_ << line << "\n";
            transfer_file_.flush();
        }
    }

private:
    Logger() = default;

    // Caller holds mutex_
    void emit(LogLevel lvl, const std::string& line) {
        if (console_) {
            std::ostream& out = lvl >= LogLevel::WARN ? std::cerr : std::cout;
            out << line << "\n";
        }
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    std::string format_line(LogLevel lvl, const std::string& msg) const {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;

        std::tm local{};
        localtime_r(&t, &local);

        std::ostringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms
           << " [" << level_name(lvl) << "] ";
        if (!component_.empty()) ss << component_ << ": ";
        ss << msg;
        return ss.str();
    }

    static const char* level_name(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
            case LogLevel::OFF:   break;
        }
        return "-----";
    }

    std::mutex    mutex_;
    LogLevel      level_{LogLevel::INFO};
    bool          console_{true};
    std::string   component_;
    std::ofstream file_;
    std::string   transfer_path_{DEFAULT_TRANSFER_LOG};
    std::ofstream transfer_file_;
};

#define LOG_DEBUG(msg) Logger::get().debug(msg)
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
