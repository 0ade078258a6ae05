/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: worker_pool.h

    Description:
        WorkerPool owns the processes of a pipeline. It is built from a list
        of WorkerSpecifications and forks replica_count processes per
        specification.

        Lifecycle:

            create() ──► start_workers() ──► (running) ──► request_exit_all()
                                                               │
                    reset_controls() ◄── join_all() ◄── drain channels
                      (optional)

        Shutdown Discipline (orchestrator side, strictly in this order):
            1. request_exit_all()  - raise exit on every distinct signal
            2. drain every channel - no producer stays parked on a full put
            3. join_all()          - reap every replica, bounded per process
            4. reset_controls()    - only if the signals will be reused

        Replica Process:
            - log lines are tagged "<spec name>_<pid>"
            - SIGINT is ignored (the orchestrator coordinates shutdown)
            - the kernel delivers SIGTERM if the orchestrator dies
            - the body runs once; the exit code records how it ended

        Failure Detection:
            join_all() never blocks forever. Each replica gets at most
            per_process_timeout to exit; one still running after that is
            reported HUNG, killed with SIGKILL and reaped. Replicas that
            crashed, threw, or returned before exit was requested are
            reported with their own outcome. The caller decides what to do
            with the report; the pool only makes the failure visible.
*******************************************************************************/

#ifndef PIPELINE_WORKER_POOL_H
#define PIPELINE_WORKER_POOL_H

#include "worker/worker_spec.h"

#include <chrono>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace pipeline {

/// Default bounded wait applied to each replica by join_all().
constexpr std::chrono::milliseconds kDefaultJoinTimeout(5000);

/// How often join_all() re-checks a replica that has not exited yet.
constexpr std::chrono::milliseconds kJoinPollInterval(10);

// Exit codes used by replica processes.
constexpr int kReplicaExitClean = 0;
constexpr int kReplicaExitBodyFailed = 2;
constexpr int kReplicaExitBeforeRequest = 3;

enum class ReplicaOutcome {
    NOT_STARTED,            // never forked (or start_workers() not called)
    RUNNING,                // forked, not reaped yet
    CLEAN_EXIT,             // body returned after exit was requested
    EXITED_BEFORE_REQUEST,  // body returned on its own (e.g. setup failure)
    BODY_FAILED,            // exception escaped the body, or unknown exit code
    CRASHED,                // terminated by a signal
    HUNG                    // still running at the join deadline; killed
};

std::string outcome_to_string(ReplicaOutcome outcome);

struct ReplicaStatus {
    std::string worker_name;
    size_t spec_index;
    int replica_index;
    pid_t pid;
    ReplicaOutcome outcome;
    int detail;             // exit code or signal number, 0 otherwise

    ReplicaStatus() : spec_index(0), replica_index(0), pid(-1),
                      outcome(ReplicaOutcome::NOT_STARTED), detail(0) {}

    std::string describe() const;
};

struct JoinReport {
    std::vector<ReplicaStatus> replicas;

    bool all_clean() const;
    std::vector<ReplicaStatus> failures() const;
};

class WorkerPool {
public:
    /**
     * @brief Build a pool from @p specs.
     *
     * Fails if the list is empty or holds a null specification.
     *
     * @param[out] pool  receives the pool on success, reset on failure
     */
    static bool create(const std::vector<WorkerSpecPtr>& specs,
                       std::unique_ptr<WorkerPool>& pool);

    /// Requests exit and joins if the pool was started and not joined.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Fork every replica: spec by spec, replicas in index order.
     *
     * @return false if the pool was already started or a fork failed. After
     *         a partial start the caller still runs the normal shutdown.
     */
    bool start_workers();

    /// request_exit() once on every distinct control signal.
    void request_exit_all();

    /**
     * @brief Wait for every replica, at most @p per_process_timeout each.
     *
     * Safe to call more than once; replicas reaped earlier keep the outcome
     * recorded for them.
     */
    JoinReport join_all(std::chrono::milliseconds per_process_timeout = kDefaultJoinTimeout);

    /// Reap replicas that already exited and count the ones still running.
    size_t alive_count();

    /**
     * @brief reset() every distinct control signal.
     * @return false (after logging) while any replica is still running
     */
    bool reset_controls();

    size_t replica_count() const { return replicas_.size(); }
    size_t control_signal_count() const { return controls_.size(); }
    bool is_started() const { return started_; }

private:
    struct Replica {
        size_t spec_index;
        int replica_index;
        pid_t pid;
        ReplicaOutcome outcome;
        int detail;
    };

    explicit WorkerPool(const std::vector<WorkerSpecPtr>& specs);

    bool try_reap(Replica& replica);
    void kill_and_reap(Replica& replica);
    ReplicaStatus status_of(const Replica& replica) const;
    std::string label_of(const Replica& replica) const;

    std::vector<WorkerSpecPtr> specs_;
    std::vector<Replica> replicas_;
    std::vector<std::shared_ptr<ControlSignal>> controls_;
    bool started_;
    pid_t owner_pid_;
};

} // namespace pipeline

#endif // PIPELINE_WORKER_POOL_H
