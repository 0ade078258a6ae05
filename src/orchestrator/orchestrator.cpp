/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: orchestrator.cpp

    Description:
        Builds, runs and shuts down the demonstration pipeline. See
        orchestrator.h for the sequence and return codes.
*******************************************************************************/

#include "orchestrator/orchestrator.h"
#include "common/logger.h"
#include "stages/pipeline_stages.h"
#include "worker/worker_pool.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace pipeline {

namespace {

/// Slice of the main loop sleep; bounds the reaction time to a shutdown.
constexpr std::chrono::milliseconds kMainLoopSlice(50);

/**
 * Read everything currently queued on the channels that feed the
 * orchestrator, without blocking.
 */
void collect_outputs(BoundedChannel& scaled, BoundedChannel& status, PipelineStats& stats) {
    while (true) {
        try {
            auto message = scaled.get_message(false);
            if (!message) break;
            Logger::info("Main received: " + message->to_string());
            if (auto* integer = dynamic_cast<IntegerMessage*>(message.get())) {
                stats.results.push_back(integer->value);
            }
        } catch (const std::runtime_error& e) {
            stats.malformed_messages++;
            Logger::error("Main dropped malformed message: " + std::string(e.what()));
        }
    }

    while (true) {
        try {
            auto message = status.get_message(false);
            if (!message) break;
            Logger::debug("Main received status: " + message->to_string());
            stats.status_messages++;
        } catch (const std::runtime_error& e) {
            stats.malformed_messages++;
            Logger::error("Main dropped malformed status message: " + std::string(e.what()));
        }
    }
}

} // namespace

int run_pipeline(const PipelineConfig& config,
                 const std::atomic<bool>& shutdown_requested,
                 PipelineStats* stats) {
    PipelineStats local_stats;
    PipelineStats& run_stats = stats ? *stats : local_stats;
    run_stats = PipelineStats();

    //==========================================================================
    // Logging and configuration
    //==========================================================================
    Logger::set_level(config.log_level);
    // An empty path closes a file left open by an earlier run.
    if (!Logger::set_log_file(config.log_file, true)) {
        Logger::error("Failed to open log file " + config.log_file);
        return -1;
    }

    std::string error;
    if (!validate_config(config, error)) {
        Logger::error("Invalid configuration: " + error);
        return -1;
    }

    //==========================================================================
    // Shared objects
    //==========================================================================
    auto control = ControlSignal::create();
    if (!control) {
        Logger::error("Failed to create control signal");
        return -1;
    }

    auto source_queue = BoundedChannel::create(config.source_queue_capacity);
    auto scaled_queue = BoundedChannel::create(config.scaled_queue_capacity);
    auto status_queue = BoundedChannel::create(config.status_queue_capacity);
    if (!source_queue || !scaled_queue || !status_queue) {
        Logger::error("Failed to create channels");
        return -1;
    }

    //==========================================================================
    // Worker specifications and pool
    //==========================================================================
    WorkerSpecPtr source_spec;
    if (!WorkerSpecification::create(
            "counter_source_worker", counter_source_worker, config.source_workers,
            {config.source_start, config.source_count,
             std::chrono::milliseconds(config.source_period_ms)},
            {}, {source_queue}, control, source_spec)) {
        return -1;
    }

    WorkerSpecPtr scale_spec;
    if (!WorkerSpecification::create(
            "scale_worker", scale_worker, config.scale_workers,
            {config.scale_factor},
            {source_queue}, {scaled_queue}, control, scale_spec)) {
        return -1;
    }

    WorkerSpecPtr status_spec;
    if (!WorkerSpecification::create(
            "status_worker", status_worker, config.status_workers,
            {config.status_text, std::chrono::milliseconds(config.status_period_ms)},
            {}, {status_queue}, control, status_spec)) {
        return -1;
    }

    std::unique_ptr<WorkerPool> pool;
    if (!WorkerPool::create({source_spec, scale_spec, status_spec}, pool)) {
        return -1;
    }

    // Channels in pipeline order; shutdown drains them last to first.
    const std::vector<ChannelPtr> all_queues = {source_queue, scaled_queue, status_queue};
    const auto join_timeout = std::chrono::milliseconds(config.join_timeout_ms);

    if (!pool->start_workers()) {
        Logger::error("Failed to start workers");
        pool->request_exit_all();
        for (auto it = all_queues.rbegin(); it != all_queues.rend(); ++it) {
            (*it)->drain();
        }
        pool->join_all(join_timeout);
        return -1;
    }

    Logger::info("Started");

    //==========================================================================
    // Main loop
    //==========================================================================
    const auto start_time = std::chrono::steady_clock::now();
    const auto run_time = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(config.run_time_sec));
    const auto poll_interval = std::chrono::milliseconds(config.main_poll_interval_ms);
    size_t last_alive = pool->replica_count();

    while (!shutdown_requested && std::chrono::steady_clock::now() - start_time < run_time) {
        collect_outputs(*scaled_queue, *status_queue, run_stats);

        size_t alive = pool->alive_count();
        if (alive < last_alive) {
            Logger::warning(std::to_string(last_alive - alive) +
                            " replica(s) exited during the run; " +
                            std::to_string(alive) + " still running");
            last_alive = alive;
        }

        const auto wake = std::chrono::steady_clock::now() + poll_interval;
        while (!shutdown_requested && std::chrono::steady_clock::now() < wake &&
               std::chrono::steady_clock::now() - start_time < run_time) {
            std::this_thread::sleep_for(kMainLoopSlice);
        }
    }
    collect_outputs(*scaled_queue, *status_queue, run_stats);

    if (shutdown_requested) {
        Logger::info("Shutdown requested");
    }

    //==========================================================================
    // Shutdown: request exit, drain, join, reset
    //==========================================================================
    pool->request_exit_all();
    Logger::info("Requested exit");

    for (auto it = all_queues.rbegin(); it != all_queues.rend(); ++it) {
        run_stats.drained_at_shutdown += (*it)->drain();
    }
    Logger::info("Queues cleared (" + std::to_string(run_stats.drained_at_shutdown) +
                 " message(s) discarded)");

    JoinReport report = pool->join_all(join_timeout);
    run_stats.unclean_replicas = report.failures().size();
    Logger::info("Stopped");

    if (!pool->reset_controls()) {
        Logger::warning("Control signal left in exit state");
    }

    return report.all_clean() ? 0 : 1;
}

} // namespace pipeline
