/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: main_pipeline.cpp

    Description:
        Entry point of the orchestrator process. Parses the command line,
        installs signal handlers and hands control to run_pipeline().

        Usage:
            ./pipeline_main [options]        (see --help)

        Examples:
            # Default run: 100 s, values 1, 2, 3, ... doubled
            ./pipeline_main

            # Short run with three scaling replicas and a log file
            ./pipeline_main --run-time 5 --scale-workers 3 --log-file pipeline.log

        Exit Codes:
            0    clean run
            1    bad command line, or replicas exited uncleanly
            < 0  setup failure (printed as "Failed with return code N")

        Shutdown:
            Ctrl+C (SIGINT) or SIGTERM sets a flag polled by the main loop,
            which then performs the regular request-exit / drain / join
            sequence. Replicas ignore SIGINT themselves.
*******************************************************************************/

#include "common/logger.h"
#include "orchestrator/orchestrator.h"
#include "orchestrator/pipeline_config.h"

#include <atomic>
#include <csignal>
#include <iostream>

using namespace pipeline;

std::atomic<bool> shutdown_requested(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        // Only the flag: anything else here is not async-signal-safe.
        shutdown_requested = true;
    }
}

int main(int argc, char* argv[]) {
    PipelineConfig config;
    bool show_help = false;
    std::string error;

    if (!parse_pipeline_args(argc, argv, config, show_help, error)) {
        std::cerr << error << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (show_help) {
        print_usage(argv[0]);
        return 0;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    Logger::info("=== Drone Pipeline Orchestrator ===");

    int result = run_pipeline(config, shutdown_requested);
    if (result < 0) {
        std::cout << "Failed with return code " << result << "\n";
    } else if (result > 0) {
        std::cout << "Finished with unclean worker shutdown\n";
    } else {
        std::cout << "Success!\n";
    }
    return result;
}
