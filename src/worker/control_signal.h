/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: control_signal.h

    Description:
        ControlSignal is how the orchestrator talks to running worker
        replicas. It carries two independent flags, "paused" and
        "exit requested", stored as lock-free atomics in a shared mapping so
        that a write in the orchestrator is visible to every replica forked
        after the signal was created.

        Semantics:
        - pause()/resume() toggle the paused flag.
        - check_pause() is the cooperative suspension point: it returns at
          once unless paused, otherwise polls every poll_interval until the
          signal is resumed OR exit is requested. An exit request therefore
          always unblocks a paused worker.
        - request_exit() is sticky: exit stays requested until reset().
        - reset() clears both flags. Call it only after every replica bound
          to this signal has been joined.

        Typical worker loop:

            while (!control.is_exit_requested()) {
                control.check_pause();
                auto payload = input->get(true, kReadTimeout);
                if (!payload) continue;
                ...
            }

    Sharing:
        Create with ControlSignal::create() in the orchestrator and pass the
        shared_ptr to every WorkerSpecification that needs it. Several
        specifications may share one signal.
*******************************************************************************/

#ifndef PIPELINE_CONTROL_SIGNAL_H
#define PIPELINE_CONTROL_SIGNAL_H

#include "common/shared_memory.h"

#include <atomic>
#include <chrono>
#include <memory>

namespace pipeline {

/// Default re-poll period of check_pause().
constexpr std::chrono::milliseconds kDefaultPausePollInterval(100);

class ControlSignal {
public:
    /**
     * @brief Allocate a signal in shared memory with both flags cleared.
     * @return nullptr (after logging) if the shared mapping fails
     */
    static std::shared_ptr<ControlSignal> create(
        std::chrono::milliseconds poll_interval = kDefaultPausePollInterval);

    ControlSignal(const ControlSignal&) = delete;
    ControlSignal& operator=(const ControlSignal&) = delete;

    void pause();
    void resume();
    bool is_paused() const;

    /// Block while paused; returns as soon as resumed or exit is requested.
    void check_pause() const;

    void request_exit();
    bool is_exit_requested() const;

    /// Clear both flags. Only valid when no bound worker is running.
    void reset();

    std::chrono::milliseconds poll_interval() const { return poll_interval_; }

private:
    struct SharedState {
        std::atomic<bool> paused;
        std::atomic<bool> exit_requested;
    };

    static_assert(std::atomic<bool>::is_always_lock_free,
                  "control flags must be address-free atomics");

    ControlSignal(std::unique_ptr<SharedRegion> region,
                  std::chrono::milliseconds poll_interval);

    std::unique_ptr<SharedRegion> region_;
    SharedState* state_;
    std::chrono::milliseconds poll_interval_;
};

} // namespace pipeline

#endif // PIPELINE_CONTROL_SIGNAL_H
