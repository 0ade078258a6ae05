/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: logger.h

    Description:
        This header defines the Logger class used by the orchestrator and by
        every worker replica. The Logger provides thread-safe, level-filtered
        logging with millisecond-precision timestamps.

        Core Features:
        - Mutex-protected output for multi-threaded callers
        - Configurable log levels (DEBUG, INFO, WARNING, ERROR)
        - Millisecond-precision timestamps for correlating processes
        - Optional process tag, set in each worker replica after fork()
        - Optional append-mode log file next to stdout

    Multi-Process Model:
        Worker replicas are forked from the orchestrator and inherit the
        Logger's static state (level, tag, open log file). Every line is
        formatted into a single string and written with one flush, so lines
        written concurrently by different processes never interleave inside
        a line. The mutex only serializes threads of the same process.

        Line format:
            [2025-11-27 14:03:12.481] [INFO] [scale_worker_4242] Received 6

    Typical Usage:
        #include "common/logger.h"
        using namespace pipeline;

        Logger::set_level(LogLevel::INFO);
        Logger::info("Started");
        Logger::error("Failed to create worker pool");
*******************************************************************************/

#ifndef PIPELINE_LOGGER_H
#define PIPELINE_LOGGER_H

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>

namespace pipeline {

/**
 * @enum LogLevel
 * @brief Severity levels, ordered so that numeric comparison filters.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

/**
 * @class Logger
 * @brief Process-wide static logger.
 *
 * All members are static; there is no Logger instance. Static state is
 * defined in logger.cpp.
 */
class Logger {
private:
    static LogLevel current_level_;
    static std::mutex mutex_;
    static std::string process_tag_;
    static std::ofstream log_file_;

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
        std::lock_guard<std::mutex> lock(mutex_);
        current_level_ = level;
    }

    /**
     * @brief Tag printed on every line, e.g. "telemetry_worker_4242".
     *
     * Pass an empty string to remove the tag.
     */
    static void set_process_tag(const std::string& tag) {
        std::lock_guard<std::mutex> lock(mutex_);
        process_tag_ = tag;
    }

    /**
     * @brief Mirror every line into @p path.
     *
     * @param truncate  Start from an empty file (orchestrator startup).
     *                  Replicas must never truncate.
     * @return false if the file could not be opened; stdout logging is
     *         unaffected either way.
     */
    static bool set_log_file(const std::string& path, bool truncate = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (log_file_.is_open()) {
            log_file_.close();
        }
        if (path.empty()) {
            return true;
        }
        if (truncate) {
            std::ofstream wipe(path, std::ios::out | std::ios::trunc);
            if (!wipe) {
                return false;
            }
        }
        // Append mode maps to O_APPEND, so forked replicas sharing the
        // descriptor never overwrite each other's lines.
        log_file_.open(path, std::ios::out | std::ios::app);
        return log_file_.is_open();
    }

    static void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < current_level_) return;

        std::string line = "[" + get_timestamp() + "] [" + level_to_string(level) + "] ";
        if (!process_tag_.empty()) {
            line += "[" + process_tag_ + "] ";
        }
        line += message;
        line += '\n';

        std::cout << line << std::flush;
        if (log_file_.is_open()) {
            log_file_ << line << std::flush;
        }
    }

    /**
     * @brief Flush pending output; called before fork() so that buffered
     *        bytes are not duplicated into every child.
     */
    static void flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
        if (log_file_.is_open()) {
            log_file_.flush();
        }
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

} // namespace pipeline

#endif // PIPELINE_LOGGER_H
