/*******************************************************************************
    Project: SHIELD Delayed Submission Service

    File: logger.h

    Description:
        Thread-safe, level-filtered process logger shared by every component
        of the delayed submission service (leader election, submission queue,
        delay scheduler, inter-instance transfer).

        Core Features:
        - Configurable log levels (DEBUG, INFO, WARNING, ERROR)
        - Millisecond-precision timestamps for correlating instances
        - Messages below the threshold are never written
        - Redirectable output stream (std::cout by default)

    SHIELD Logging Rule:
        Log lines describe what happened, never what a participant answered.
        Callers pass counts, survey ids and instance ids only. Code paths that
        handle response content (flush, anonymize, persist, transfer) log a
        fixed, content-free message when they fail.

    Thread Safety Model:
        - Static mutex serializes all output and sink changes
        - Level check happens before the lock is taken

    Typical Usage:
        #include "common/logger.h"
        using namespace dss;

        Logger::set_level(LogLevel::INFO);
        Logger::info("Leader election started for instance web-1:8080");
        Logger::warning("Transfer to leader failed, 5 responses retained");

*******************************************************************************/

#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <ctime>

namespace dss {

//==============================================================================
// LOG LEVEL ENUMERATION
//==============================================================================
//
// Ordered by severity; a message is written when level >= current level.
//
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
private:
    static LogLevel current_level_;
    static std::ostream* output_;
    static std::mutex mutex_;

    // "2026-10-19 14:32:15.123"
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm;
        localtime_r(&time, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            default:
                return "UNKNOWN";
        }
    }

public:
    static void set_level(LogLevel level) {
        current_level_ = level;
    }

    // Accepts "debug", "info", "warning"/"warn", "error" in any case.
    // Returns false (level unchanged) for anything else.
    static bool set_level(const std::string& name);

    static LogLevel get_level() {
        return current_level_;
    }

    // Redirects output; nullptr restores std::cout.
    static void set_output(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = out ? out : &std::cout;
    }

    static void log(LogLevel level, const std::string& message) {
        if (level < current_level_) return;

        std::lock_guard<std::mutex> lock(mutex_);
        *output_ << "[" << get_timestamp() << "] "
                 << "[" << level_to_string(level) << "] "
                 << message << std::endl;
    }

    static void debug(const std::string& message) {
        log(LogLevel::DEBUG, message);
    }

    static void info(const std::string& message) {
        log(LogLevel::INFO, message);
    }

    static void warning(const std::string& message) {
        log(LogLevel::WARNING, message);
    }

    static void error(const std::string& message) {
        log(LogLevel::ERROR, message);
    }
};

} // namespace dss

#endif // LOGGER_H
