/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: control_signal.cpp

    Description:
        Shared pause/exit flags. See control_signal.h.
*******************************************************************************/

#include "worker/control_signal.h"
#include "common/logger.h"

#include <new>
#include <thread>

namespace pipeline {

std::shared_ptr<ControlSignal> ControlSignal::create(std::chrono::milliseconds poll_interval) {
    if (poll_interval.count() <= 0) {
        Logger::error("Control signal poll interval must be positive");
        return nullptr;
    }

    auto region = SharedRegion::create(sizeof(SharedState));
    if (!region) {
        Logger::error("Failed to allocate control signal");
        return nullptr;
    }

    return std::shared_ptr<ControlSignal>(new ControlSignal(std::move(region), poll_interval));
}

ControlSignal::ControlSignal(std::unique_ptr<SharedRegion> region,
                             std::chrono::milliseconds poll_interval)
    : region_(std::move(region)),
      state_(nullptr),
      poll_interval_(poll_interval) {
    state_ = new (region_->data()) SharedState();
    state_->paused.store(false);
    state_->exit_requested.store(false);
}

void ControlSignal::pause() {
    state_->paused.store(true);
}

void ControlSignal::resume() {
    state_->paused.store(false);
}

bool ControlSignal::is_paused() const {
    return state_->paused.load();
}

void ControlSignal::check_pause() const {
    while (state_->paused.load() && !state_->exit_requested.load()) {
        std::this_thread::sleep_for(poll_interval_);
    }
}

void ControlSignal::request_exit() {
    state_->exit_requested.store(true);
}

bool ControlSignal::is_exit_requested() const {
    return state_->exit_requested.load();
}

void ControlSignal::reset() {
    state_->exit_requested.store(false);
    state_->paused.store(false);
}

} // namespace pipeline
