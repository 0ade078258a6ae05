/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: shared_memory.cpp

    Description:
        Anonymous shared mappings and process-shared pthread primitives.
*******************************************************************************/

#include "common/shared_memory.h"
#include "common/logger.h"

#include <sys/mman.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace pipeline {

//==============================================================================
// SharedRegion
//==============================================================================

std::unique_ptr<SharedRegion> SharedRegion::create(size_t size) {
    if (size == 0) {
        Logger::error("Refusing to map an empty shared region");
        return nullptr;
    }

    void* base = mmap(nullptr, size, PROT_READ | PROT_WRITE,
                      MAP_SHARED | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
    if (base == MAP_FAILED) {
        Logger::error("Failed to map " + std::to_string(size) +
                      " bytes of shared memory: " + std::string(strerror(errno)));
        return nullptr;
    }

    return std::unique_ptr<SharedRegion>(new SharedRegion(base, size));
}

SharedRegion::SharedRegion(void* base, size_t size)
    : base_(base), size_(size), owner_pid_(getpid()) {
}

SharedRegion::~SharedRegion() {
    if (base_ != nullptr) {
        munmap(base_, size_);
    }
}

bool SharedRegion::is_owner() const {
    return getpid() == owner_pid_;
}

//==============================================================================
// Process-shared primitives
//==============================================================================

bool init_shared_mutex(pthread_mutex_t* mutex) {
    pthread_mutexattr_t attr;
    if (pthread_mutexattr_init(&attr) != 0) {
        Logger::error("pthread_mutexattr_init failed");
        return false;
    }

    bool ok = pthread_mutexattr_setpshared(&attr, PTHREAD_PROCESS_SHARED) == 0 &&
              pthread_mutexattr_setrobust(&attr, PTHREAD_MUTEX_ROBUST) == 0;
    int rc = ok ? pthread_mutex_init(mutex, &attr) : -1;
    pthread_mutexattr_destroy(&attr);

    if (rc != 0) {
        Logger::error("Failed to initialize process-shared mutex");
        return false;
    }
    return true;
}

bool init_shared_cond(pthread_cond_t* cond) {
    pthread_condattr_t attr;
    if (pthread_condattr_init(&attr) != 0) {
        Logger::error("pthread_condattr_init failed");
        return false;
    }

    bool ok = pthread_condattr_setpshared(&attr, PTHREAD_PROCESS_SHARED) == 0 &&
              pthread_condattr_setclock(&attr, CLOCK_MONOTONIC) == 0;
    int rc = ok ? pthread_cond_init(cond, &attr) : -1;
    pthread_condattr_destroy(&attr);

    if (rc != 0) {
        Logger::error("Failed to initialize process-shared condition variable");
        return false;
    }
    return true;
}

timespec monotonic_deadline(std::chrono::milliseconds timeout) {
    timespec now;
    clock_gettime(CLOCK_MONOTONIC, &now);

    if (timeout.count() < 0) {
        timeout = std::chrono::milliseconds(0);
    }

    auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    auto nsecs = std::chrono::duration_cast<std::chrono::nanoseconds>(timeout - secs);

    timespec deadline;
    deadline.tv_sec = now.tv_sec + static_cast<time_t>(secs.count());
    deadline.tv_nsec = now.tv_nsec + static_cast<long>(nsecs.count());
    if (deadline.tv_nsec >= 1000000000L) {
        deadline.tv_sec += 1;
        deadline.tv_nsec -= 1000000000L;
    }
    return deadline;
}

//==============================================================================
// SharedLock
//==============================================================================

SharedLock::SharedLock(pthread_mutex_t* mutex)
    : mutex_(mutex),
      owner_died_(false) {
    int rc = pthread_mutex_lock(mutex_);
    if (rc != 0 && rc != EOWNERDEAD) {
        throw std::runtime_error("Failed to lock shared mutex: " +
                                 std::string(strerror(rc)));
    }
    recover_if_owner_died(rc);
}

SharedLock::~SharedLock() {
    pthread_mutex_unlock(mutex_);
}

void SharedLock::wait(pthread_cond_t* cond) {
    int rc = pthread_cond_wait(cond, mutex_);
    recover_if_owner_died(rc);
}

bool SharedLock::wait_until(pthread_cond_t* cond, const timespec& deadline) {
    int rc = pthread_cond_timedwait(cond, mutex_, &deadline);
    recover_if_owner_died(rc);
    return rc != ETIMEDOUT;
}

bool SharedLock::consume_owner_died() {
    bool died = owner_died_;
    owner_died_ = false;
    return died;
}

void SharedLock::recover_if_owner_died(int rc) {
    if (rc == EOWNERDEAD) {
        // A replica died inside a critical section; the guarded state is
        // suspect until the caller checks consume_owner_died().
        Logger::warning("Recovered shared mutex from a terminated process");
        pthread_mutex_consistent(mutex_);
        owner_died_ = true;
    }
}

} // namespace pipeline
