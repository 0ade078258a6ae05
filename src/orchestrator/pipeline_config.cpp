/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: pipeline_config.cpp

    Description:
        Command-line parsing and validation of PipelineConfig.

        Flags take the form "--name value". Numeric values are parsed
        strictly: trailing characters ("10x") are rejected.
*******************************************************************************/

#include "orchestrator/pipeline_config.h"

#include <iostream>
#include <stdexcept>

namespace pipeline {

namespace {

bool parse_int64(const std::string& text, int64_t& value) {
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        value = static_cast<int64_t>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_int(const std::string& text, int& value) {
    int64_t wide = 0;
    if (!parse_int64(text, wide) || wide < INT32_MIN || wide > INT32_MAX) {
        return false;
    }
    value = static_cast<int>(wide);
    return true;
}

bool parse_double(const std::string& text, double& value) {
    try {
        size_t consumed = 0;
        value = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

bool parse_log_level(const std::string& text, LogLevel& level) {
    if (text == "debug" || text == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (text == "info" || text == "INFO") {
        level = LogLevel::INFO;
    } else if (text == "warning" || text == "WARNING" || text == "warn" || text == "WARN") {
        level = LogLevel::WARNING;
    } else if (text == "error" || text == "ERROR") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --source-capacity N    Source queue capacity, <= 0 unbounded (default: 10)\n"
              << "  --scaled-capacity N    Scaled queue capacity, <= 0 unbounded (default: 10)\n"
              << "  --status-capacity N    Status queue capacity, <= 0 unbounded (default: 10)\n"
              << "  --source-workers N     Counter source replicas (default: 1)\n"
              << "  --scale-workers N      Scale stage replicas (default: 1)\n"
              << "  --status-workers N     Status stage replicas (default: 1)\n"
              << "  --start N              First value emitted by the source (default: 1)\n"
              << "  --count N              Values emitted per source, <= 0 forever (default: 0)\n"
              << "  --source-period MS     Delay between source values (default: 100)\n"
              << "  --factor N             Scale factor (default: 2)\n"
              << "  --status-text TEXT     Status line sent by the status stage (default: alive)\n"
              << "  --status-period MS     Delay between status lines (default: 1000)\n"
              << "  --run-time SEC         Time to run before shutdown (default: 100)\n"
              << "  --poll-interval MS     Main loop period (default: 1000)\n"
              << "  --join-timeout MS      Wait per replica at shutdown (default: 5000)\n"
              << "  --log-level LEVEL      debug|info|warning|error (default: info)\n"
              << "  --log-file PATH        Also write the log to PATH (truncated at start)\n"
              << "  --help                 Show this help message\n";
}

bool parse_pipeline_args(int argc, char* argv[], PipelineConfig& config,
                         bool& show_help, std::string& error) {
    show_help = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            show_help = true;
            return true;
        }

        if (i + 1 >= argc) {
            error = (arg.rfind("--", 0) == 0) ? "Missing value for " + arg
                                              : "Unknown option: " + arg;
            return false;
        }
        std::string value = argv[i + 1];

        bool ok = true;
        if (arg == "--source-capacity") {
            ok = parse_int(value, config.source_queue_capacity);
        } else if (arg == "--scaled-capacity") {
            ok = parse_int(value, config.scaled_queue_capacity);
        } else if (arg == "--status-capacity") {
            ok = parse_int(value, config.status_queue_capacity);
        } else if (arg == "--source-workers") {
            ok = parse_int(value, config.source_workers);
        } else if (arg == "--scale-workers") {
            ok = parse_int(value, config.scale_workers);
        } else if (arg == "--status-workers") {
            ok = parse_int(value, config.status_workers);
        } else if (arg == "--start") {
            ok = parse_int64(value, config.source_start);
        } else if (arg == "--count") {
            ok = parse_int64(value, config.source_count);
        } else if (arg == "--source-period") {
            ok = parse_int64(value, config.source_period_ms);
        } else if (arg == "--factor") {
            ok = parse_int64(value, config.scale_factor);
        } else if (arg == "--status-text") {
            config.status_text = value;
        } else if (arg == "--status-period") {
            ok = parse_int64(value, config.status_period_ms);
        } else if (arg == "--run-time") {
            ok = parse_double(value, config.run_time_sec);
        } else if (arg == "--poll-interval") {
            ok = parse_int64(value, config.main_poll_interval_ms);
        } else if (arg == "--join-timeout") {
            ok = parse_int64(value, config.join_timeout_ms);
        } else if (arg == "--log-level") {
            ok = parse_log_level(value, config.log_level);
        } else if (arg == "--log-file") {
            config.log_file = value;
        } else {
            error = "Unknown option: " + arg;
            return false;
        }

        if (!ok) {
            error = "Invalid value for " + arg + ": " + value;
            return false;
        }
        ++i;
    }

    return true;
}

bool validate_config(const PipelineConfig& config, std::string& error) {
    if (config.source_workers < 1 || config.scale_workers < 1 || config.status_workers < 1) {
        error = "Worker counts must be at least 1";
        return false;
    }
    if (config.run_time_sec <= 0.0) {
        error = "Run time must be positive";
        return false;
    }
    if (config.main_poll_interval_ms <= 0 || config.join_timeout_ms <= 0) {
        error = "Poll interval and join timeout must be positive";
        return false;
    }
    if (config.source_period_ms < 0 || config.status_period_ms <= 0) {
        error = "Source period must be >= 0 and status period > 0";
        return false;
    }
    return true;
}

} // namespace pipeline
