/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: worker_pool.cpp

    Description:
        Process lifecycle of pipeline workers: fork, supervise, join.
*******************************************************************************/

#include "worker/worker_pool.h"
#include "common/logger.h"

#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

namespace pipeline {

namespace {

/**
 * Entry point of a forked replica. Never returns: destructors of objects
 * copied from the orchestrator must not run in the child.
 */
[[noreturn]] void run_replica(const WorkerSpecification& spec, int replica_index,
                              pid_t orchestrator_pid) {
    // Die with the orchestrator instead of lingering as an orphan.
    prctl(PR_SET_PDEATHSIG, SIGTERM);
    if (getppid() != orchestrator_pid) {
        _exit(kReplicaExitBeforeRequest);
    }

    signal(SIGINT, SIG_IGN);
    signal(SIGTERM, SIG_DFL);

    Logger::set_process_tag(spec.name() + "_" + std::to_string(getpid()));
    Logger::debug("Replica " + std::to_string(replica_index) + " started");

    int exit_code = kReplicaExitClean;
    try {
        spec.run();
        if (setup_failure_reported()) {
            exit_code = kReplicaExitBeforeRequest;
        } else if (!spec.control()->is_exit_requested()) {
            Logger::warning("Worker returned before exit was requested");
            exit_code = kReplicaExitBeforeRequest;
        } else {
            Logger::info("Worker has been terminated");
        }
    } catch (const std::exception& e) {
        Logger::error("Worker body failed: " + std::string(e.what()));
        exit_code = kReplicaExitBodyFailed;
    } catch (...) {
        Logger::error("Worker body failed with a non-standard exception");
        exit_code = kReplicaExitBodyFailed;
    }

    Logger::flush();
    _exit(exit_code);
}

void classify_status(int status, ReplicaOutcome& outcome, int& detail) {
    if (WIFEXITED(status)) {
        detail = WEXITSTATUS(status);
        switch (detail) {
            case kReplicaExitClean:
                outcome = ReplicaOutcome::CLEAN_EXIT;
                break;
            case kReplicaExitBeforeRequest:
                outcome = ReplicaOutcome::EXITED_BEFORE_REQUEST;
                break;
            default:
                outcome = ReplicaOutcome::BODY_FAILED;
                break;
        }
    } else if (WIFSIGNALED(status)) {
        outcome = ReplicaOutcome::CRASHED;
        detail = WTERMSIG(status);
    } else {
        outcome = ReplicaOutcome::CRASHED;
        detail = 0;
    }
}

} // namespace

//==============================================================================
// Reports
//==============================================================================

std::string outcome_to_string(ReplicaOutcome outcome) {
    switch (outcome) {
        case ReplicaOutcome::NOT_STARTED:           return "NOT_STARTED";
        case ReplicaOutcome::RUNNING:               return "RUNNING";
        case ReplicaOutcome::CLEAN_EXIT:            return "CLEAN_EXIT";
        case ReplicaOutcome::EXITED_BEFORE_REQUEST: return "EXITED_BEFORE_REQUEST";
        case ReplicaOutcome::BODY_FAILED:           return "BODY_FAILED";
        case ReplicaOutcome::CRASHED:               return "CRASHED";
        case ReplicaOutcome::HUNG:                  return "HUNG";
    }
    return "UNKNOWN";
}

std::string ReplicaStatus::describe() const {
    std::string text = worker_name + "[" + std::to_string(replica_index) + "]" +
                       " pid=" + std::to_string(pid) +
                       " outcome=" + outcome_to_string(outcome);
    if (outcome == ReplicaOutcome::CRASHED || outcome == ReplicaOutcome::HUNG) {
        text += " signal=" + std::to_string(detail);
    } else if (outcome == ReplicaOutcome::BODY_FAILED) {
        text += " exit_code=" + std::to_string(detail);
    }
    return text;
}

bool JoinReport::all_clean() const {
    for (const auto& replica : replicas) {
        if (replica.outcome != ReplicaOutcome::CLEAN_EXIT) {
            return false;
        }
    }
    return true;
}

std::vector<ReplicaStatus> JoinReport::failures() const {
    std::vector<ReplicaStatus> result;
    for (const auto& replica : replicas) {
        if (replica.outcome != ReplicaOutcome::CLEAN_EXIT) {
            result.push_back(replica);
        }
    }
    return result;
}

//==============================================================================
// Construction
//==============================================================================

bool WorkerPool::create(const std::vector<WorkerSpecPtr>& specs,
                        std::unique_ptr<WorkerPool>& pool) {
    pool.reset();

    if (specs.empty()) {
        Logger::error("Cannot create a worker pool without worker specifications");
        return false;
    }
    for (size_t i = 0; i < specs.size(); ++i) {
        if (!specs[i]) {
            Logger::error("Worker specification " + std::to_string(i) + " is null");
            return false;
        }
    }

    pool.reset(new WorkerPool(specs));
    return true;
}

WorkerPool::WorkerPool(const std::vector<WorkerSpecPtr>& specs)
    : specs_(specs),
      started_(false),
      owner_pid_(getpid()) {
    for (size_t s = 0; s < specs_.size(); ++s) {
        for (int r = 0; r < specs_[s]->replica_count(); ++r) {
            replicas_.push_back(Replica{s, r, -1, ReplicaOutcome::NOT_STARTED, 0});
        }

        // Specifications may share a signal; keep each one once.
        const auto& control = specs_[s]->control();
        bool seen = false;
        for (const auto& existing : controls_) {
            if (existing.get() == control.get()) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            controls_.push_back(control);
        }
    }
}

WorkerPool::~WorkerPool() {
    if (getpid() != owner_pid_ || !started_) {
        return;
    }
    if (alive_count() > 0) {
        Logger::warning("Worker pool destroyed while replicas are running; shutting them down");
        request_exit_all();
        join_all();
    }
}

//==============================================================================
// Lifecycle
//==============================================================================

bool WorkerPool::start_workers() {
    if (started_) {
        Logger::warning("Worker pool already started");
        return false;
    }
    started_ = true;

    const pid_t orchestrator_pid = getpid();

    for (auto& replica : replicas_) {
        const WorkerSpecification& spec = *specs_[replica.spec_index];

        // Buffered output would otherwise be duplicated into the child.
        Logger::flush();

        pid_t pid = fork();
        if (pid < 0) {
            Logger::error("Failed to fork " + label_of(replica) + ": " +
                          std::string(strerror(errno)));
            return false;
        }
        if (pid == 0) {
            run_replica(spec, replica.replica_index, orchestrator_pid);
        }

        replica.pid = pid;
        replica.outcome = ReplicaOutcome::RUNNING;
        Logger::info("Spawned " + label_of(replica) + " PID=" + std::to_string(pid));
    }

    return true;
}

void WorkerPool::request_exit_all() {
    for (const auto& control : controls_) {
        control->request_exit();
    }
    Logger::info("Requested exit on " + std::to_string(controls_.size()) + " control signal(s)");
}

JoinReport WorkerPool::join_all(std::chrono::milliseconds per_process_timeout) {
    JoinReport report;

    for (auto& replica : replicas_) {
        if (replica.outcome == ReplicaOutcome::RUNNING) {
            const auto deadline = std::chrono::steady_clock::now() + per_process_timeout;
            while (!try_reap(replica)) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    Logger::error(label_of(replica) + " (PID=" + std::to_string(replica.pid) +
                                  ") did not exit within " +
                                  std::to_string(per_process_timeout.count()) + " ms");
                    kill_and_reap(replica);
                    break;
                }
                std::this_thread::sleep_for(kJoinPollInterval);
            }
        }
        report.replicas.push_back(status_of(replica));
    }

    auto failures = report.failures();
    if (failures.empty()) {
        Logger::info("All " + std::to_string(report.replicas.size()) + " replica(s) exited cleanly");
    } else {
        for (const auto& failure : failures) {
            Logger::error("Unclean replica: " + failure.describe());
        }
    }
    return report;
}

size_t WorkerPool::alive_count() {
    size_t alive = 0;
    for (auto& replica : replicas_) {
        if (replica.outcome == ReplicaOutcome::RUNNING && !try_reap(replica)) {
            alive++;
        }
    }
    return alive;
}

bool WorkerPool::reset_controls() {
    if (alive_count() > 0) {
        Logger::error("Cannot reset control signals while replicas are running");
        return false;
    }
    for (const auto& control : controls_) {
        control->reset();
    }
    return true;
}

//==============================================================================
// Supervision helpers
//==============================================================================

bool WorkerPool::try_reap(Replica& replica) {
    int status = 0;
    pid_t result = waitpid(replica.pid, &status, WNOHANG);
    if (result == 0) {
        return false;
    }
    if (result < 0) {
        if (errno == EINTR) {
            return false;
        }
        Logger::error("waitpid failed for " + label_of(replica) + ": " +
                      std::string(strerror(errno)));
        replica.outcome = ReplicaOutcome::CRASHED;
        replica.detail = 0;
        return true;
    }

    classify_status(status, replica.outcome, replica.detail);
    if (replica.outcome != ReplicaOutcome::CLEAN_EXIT) {
        Logger::warning(label_of(replica) + " exited: " + status_of(replica).describe());
    }
    return true;
}

void WorkerPool::kill_and_reap(Replica& replica) {
    if (kill(replica.pid, SIGKILL) != 0 && errno != ESRCH) {
        Logger::error("Failed to kill " + label_of(replica) + ": " + std::string(strerror(errno)));
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(replica.pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    replica.outcome = ReplicaOutcome::HUNG;
    replica.detail = SIGKILL;
}

ReplicaStatus WorkerPool::status_of(const Replica& replica) const {
    ReplicaStatus status;
    status.worker_name = specs_[replica.spec_index]->name();
    status.spec_index = replica.spec_index;
    status.replica_index = replica.replica_index;
    status.pid = replica.pid;
    status.outcome = replica.outcome;
    status.detail = replica.detail;
    return status;
}

std::string WorkerPool::label_of(const Replica& replica) const {
    return specs_[replica.spec_index]->name() + "[" + std::to_string(replica.replica_index) + "]";
}

} // namespace pipeline
