/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: orchestrator.h

    Description:
        run_pipeline() is the top-level orchestration routine: it builds the
        channels, control signal, worker specifications and pool described
        by a PipelineConfig, runs the pipeline, and shuts it down.

        Sequence:
            1. Logger setup (level, optional log file truncated)
            2. Build control signal and channels
            3. Create one WorkerSpecification per stage, then the WorkerPool
            4. start_workers()
            5. Main loop until run time elapses or shutdown is requested:
               read every channel that feeds the orchestrator without
               blocking, log what arrived, watch for replicas that died
            6. request_exit_all(), drain channels from last stage to first,
               join_all(), reset_controls()

        Return Codes:
            < 0  setup failure (logger, config, control signal, channel,
                 specification, pool, or start)
              0  clean full run
              1  run completed but at least one replica exited uncleanly
*******************************************************************************/

#ifndef PIPELINE_ORCHESTRATOR_H
#define PIPELINE_ORCHESTRATOR_H

#include "orchestrator/pipeline_config.h"

#include <atomic>
#include <cstdint>
#include <vector>

namespace pipeline {

/// What the orchestrator observed during one run.
struct PipelineStats {
    std::vector<int64_t> results;   // scaled values, in arrival order
    uint64_t status_messages;
    uint64_t malformed_messages;
    size_t drained_at_shutdown;
    size_t unclean_replicas;

    PipelineStats() : status_messages(0), malformed_messages(0),
                      drained_at_shutdown(0), unclean_replicas(0) {}
};

/**
 * @brief Run the configured pipeline to completion.
 *
 * @param shutdown_requested  polled by the main loop; set it (e.g. from a
 *                            signal handler) to end the run early
 * @param stats               optional; filled with observations of the run
 */
int run_pipeline(const PipelineConfig& config,
                 const std::atomic<bool>& shutdown_requested,
                 PipelineStats* stats = nullptr);

} // namespace pipeline

#endif // PIPELINE_ORCHESTRATOR_H
