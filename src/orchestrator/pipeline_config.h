/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: pipeline_config.h

    Description:
        Settings of the orchestrator executable and the command-line parser
        that fills them.

        Pipeline topology driven by this configuration:

          ┌────────────────┐ source ┌──────────────┐ scaled ┌──────────────┐
          │ counter_source │───────►│ scale_worker │───────►│              │
          └────────────────┘        └──────────────┘        │ orchestrator │
          ┌────────────────┐ status                         │ (main loop)  │
          │ status_worker  │───────────────────────────────►│              │
          └────────────────┘                                └──────────────┘

        Defaults match the reference deployment: queues of 10 messages, one
        replica per stage, a 100 second run and a 1 second main loop.
*******************************************************************************/

#ifndef PIPELINE_CONFIG_H
#define PIPELINE_CONFIG_H

#include "common/logger.h"

#include <cstdint>
#include <string>

namespace pipeline {

struct PipelineConfig {
    // Channel capacities (<= 0 for unbounded)
    int source_queue_capacity;
    int scaled_queue_capacity;
    int status_queue_capacity;

    // Replica counts
    int source_workers;
    int scale_workers;
    int status_workers;

    // Stage arguments
    int64_t source_start;
    int64_t source_count;           // <= 0: emit forever
    int64_t source_period_ms;
    int64_t scale_factor;
    std::string status_text;
    int64_t status_period_ms;

    // Orchestrator timing
    double run_time_sec;
    int64_t main_poll_interval_ms;
    int64_t join_timeout_ms;

    // Logging
    LogLevel log_level;
    std::string log_file;

    PipelineConfig()
        : source_queue_capacity(10),
          scaled_queue_capacity(10),
          status_queue_capacity(10),
          source_workers(1),
          scale_workers(1),
          status_workers(1),
          source_start(1),
          source_count(0),
          source_period_ms(100),
          scale_factor(2),
          status_text("alive"),
          status_period_ms(1000),
          run_time_sec(100.0),
          main_poll_interval_ms(1000),
          join_timeout_ms(5000),
          log_level(LogLevel::INFO) {}
};

/**
 * @brief Fill @p config from command-line flags.
 *
 * @param[out] show_help  set when --help was given (config left untouched)
 * @param[out] error      description of the first bad flag
 * @return false on an unknown flag, a missing value or a malformed number
 */
bool parse_pipeline_args(int argc, char* argv[], PipelineConfig& config,
                         bool& show_help, std::string& error);

/**
 * @brief Reject settings the orchestrator cannot run with.
 * @param[out] error  description of the first invalid setting
 */
bool validate_config(const PipelineConfig& config, std::string& error);

void print_usage(const char* program_name);

bool parse_log_level(const std::string& text, LogLevel& level);

} // namespace pipeline

#endif // PIPELINE_CONFIG_H
