/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: shared_memory.h

    Description:
        Building blocks for state shared between the orchestrator and the
        worker replicas it forks.

        SharedRegion:
            RAII owner of an anonymous MAP_SHARED mapping. A region created
            before fork() appears at the same address in every child, so
            raw pointers into it stay valid across the process tree. Pages
            are reserved lazily (MAP_NORESERVE) and start zero-filled.

        Process-shared primitives:
            pthread mutexes and condition variables placed inside a region
            and initialized with PTHREAD_PROCESS_SHARED. Mutexes are robust:
            if a replica dies while holding one, the next locker receives
            EOWNERDEAD and marks the mutex consistent. SharedLock reports
            the recovery through consume_owner_died() so the owner of the
            guarded data can reset it.
            Condition variables run on CLOCK_MONOTONIC.

        SharedLock:
            lock_guard-style RAII holder for a process-shared mutex, with
            timed and untimed waits on a process-shared condition variable.

    Ownership:
        Only the creating process destroys the pthread objects. A forked
        child that happens to run destructors (e.g. a test child returning
        from main) unmaps its own view and leaves the shared state alone.
*******************************************************************************/

#ifndef PIPELINE_SHARED_MEMORY_H
#define PIPELINE_SHARED_MEMORY_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <pthread.h>
#include <sys/types.h>
#include <time.h>

namespace pipeline {

class SharedRegion {
public:
    /**
     * @brief Map @p size bytes of zero-filled shared memory.
     * @return nullptr (after logging) if mmap fails or size is zero
     */
    static std::unique_ptr<SharedRegion> create(size_t size);

    ~SharedRegion();

    SharedRegion(const SharedRegion&) = delete;
    SharedRegion& operator=(const SharedRegion&) = delete;

    void* data() const { return base_; }
    size_t size() const { return size_; }

    /// True in the process that created the mapping.
    bool is_owner() const;

private:
    SharedRegion(void* base, size_t size);

    void* base_;
    size_t size_;
    pid_t owner_pid_;
};

/// Initialize a mutex living in shared memory (process-shared, robust).
bool init_shared_mutex(pthread_mutex_t* mutex);

/// Initialize a condition variable living in shared memory
/// (process-shared, CLOCK_MONOTONIC).
bool init_shared_cond(pthread_cond_t* cond);

/// Absolute CLOCK_MONOTONIC time @p timeout from now, for timed waits.
timespec monotonic_deadline(std::chrono::milliseconds timeout);

class SharedLock {
public:
    /**
     * @brief Lock @p mutex, recovering it if its previous owner died.
     * @throws std::runtime_error if the mutex cannot be acquired at all
     */
    explicit SharedLock(pthread_mutex_t* mutex);
    ~SharedLock();

    SharedLock(const SharedLock&) = delete;
    SharedLock& operator=(const SharedLock&) = delete;

    /// Wait on @p cond with no deadline.
    void wait(pthread_cond_t* cond);

    /**
     * @brief Wait on @p cond until @p deadline (CLOCK_MONOTONIC).
     * @return false once the deadline has passed
     */
    bool wait_until(pthread_cond_t* cond, const timespec& deadline);

    /**
     * @brief True once if the mutex was recovered from a process that died
     *        holding it since the last call.
     *
     * The state guarded by the mutex may then be half-updated; the caller
     * must repair or reset it before using it.
     */
    bool consume_owner_died();

private:
    void recover_if_owner_died(int rc);

    pthread_mutex_t* mutex_;
    bool owner_died_;
};

} // namespace pipeline

#endif // PIPELINE_SHARED_MEMORY_H
