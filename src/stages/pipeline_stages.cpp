/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: pipeline_stages.cpp

    Description:
        Generic pipeline stages. See pipeline_stages.h for their arguments
        and wiring.
*******************************************************************************/

#include "stages/pipeline_stages.h"
#include "common/logger.h"

#include <algorithm>
#include <any>
#include <stdexcept>
#include <string>
#include <thread>

namespace pipeline {

namespace {

/// Sleep for @p duration in short slices, waking early on an exit request.
void idle_for(std::chrono::milliseconds duration, const ControlSignal& control) {
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!control.is_exit_requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kStageReadTimeout));
    }
}

bool check_wiring(const std::string& stage, const ChannelList& inputs, size_t want_inputs,
                  const ChannelList& outputs, size_t want_outputs) {
    if (inputs.size() != want_inputs || outputs.size() != want_outputs) {
        report_setup_failure(stage + " expects " + std::to_string(want_inputs) +
                             " input(s) and " + std::to_string(want_outputs) +
                             " output(s), got " + std::to_string(inputs.size()) +
                             " and " + std::to_string(outputs.size()));
        return false;
    }
    return true;
}

} // namespace

bool put_until_exit(BoundedChannel& channel, const Message& message, ControlSignal& control) {
    const Payload payload = message.serialize();
    if (!channel.fits(payload.size())) {
        Logger::error("Dropping " + std::to_string(payload.size()) +
                      "-byte message: larger than the output channel can ever hold");
        return false;
    }
    while (!control.is_exit_requested()) {
        if (channel.put(payload, true, kStagePutTimeout)) {
            return true;
        }
        control.check_pause();
    }
    return false;
}

//==============================================================================
// counter_source_worker
//==============================================================================

void counter_source_worker(const StaticArgs& args, const ChannelList& inputs,
                           const ChannelList& outputs, ControlSignal& control) {
    if (!check_wiring("counter_source_worker", inputs, 0, outputs, 1)) {
        return;
    }

    int64_t start = 0;
    int64_t count = 0;
    std::chrono::milliseconds period(0);
    try {
        start = std::any_cast<int64_t>(args.at(0));
        count = std::any_cast<int64_t>(args.at(1));
        period = std::any_cast<std::chrono::milliseconds>(args.at(2));
    } catch (const std::exception& e) {
        report_setup_failure("counter_source_worker: bad arguments: " + std::string(e.what()));
        return;
    }

    Logger::info("Counter source started (start=" + std::to_string(start) +
                 ", count=" + std::to_string(count) + ")");

    BoundedChannel& output = *outputs[0];
    int64_t produced = 0;
    uint64_t sequence = 0;

    while (!control.is_exit_requested()) {
        control.check_pause();

        if (count > 0 && produced >= count) {
            idle_for(std::max(period, kStageReadTimeout), control);
            continue;
        }

        IntegerMessage message(start + produced);
        message.id = sequence++;
        if (put_until_exit(output, message, control)) {
            Logger::debug("Emitted " + std::to_string(message.value));
        } else if (control.is_exit_requested()) {
            break;
        }
        produced++;

        idle_for(period, control);
    }

    Logger::info("Counter source produced " + std::to_string(produced) + " value(s)");
}

//==============================================================================
// scale_worker
//==============================================================================

void scale_worker(const StaticArgs& args, const ChannelList& inputs,
                  const ChannelList& outputs, ControlSignal& control) {
    if (!check_wiring("scale_worker", inputs, 1, outputs, 1)) {
        return;
    }

    int64_t factor = 1;
    try {
        factor = std::any_cast<int64_t>(args.at(0));
    } catch (const std::exception& e) {
        report_setup_failure("scale_worker: bad arguments: " + std::string(e.what()));
        return;
    }

    BoundedChannel& input = *inputs[0];
    BoundedChannel& output = *outputs[0];
    uint64_t processed = 0;

    while (!control.is_exit_requested()) {
        control.check_pause();

        try {
            auto message = input.get_message(true, kStageReadTimeout);
            if (!message) {
                continue;
            }

            auto* integer = dynamic_cast<IntegerMessage*>(message.get());
            if (!integer) {
                Logger::warning("scale_worker: ignoring non-integer message " + message->to_string());
                continue;
            }

            IntegerMessage scaled(integer->value * factor);
            scaled.id = integer->id;
            if (put_until_exit(output, scaled, control)) {
                processed++;
            }
        } catch (const std::runtime_error& e) {
            Logger::error("Error in scale worker loop: " + std::string(e.what()));
        }
    }

    Logger::info("Scale worker processed " + std::to_string(processed) + " message(s)");
}

//==============================================================================
// status_worker
//==============================================================================

void status_worker(const StaticArgs& args, const ChannelList& inputs,
                   const ChannelList& outputs, ControlSignal& control) {
    if (!check_wiring("status_worker", inputs, 0, outputs, 1)) {
        return;
    }

    std::string text;
    std::chrono::milliseconds period(0);
    try {
        text = std::any_cast<std::string>(args.at(0));
        period = std::any_cast<std::chrono::milliseconds>(args.at(1));
    } catch (const std::exception& e) {
        report_setup_failure("status_worker: bad arguments: " + std::string(e.what()));
        return;
    }

    BoundedChannel& output = *outputs[0];

    while (!control.is_exit_requested()) {
        control.check_pause();

        if (!put_until_exit(output, TextMessage(text), control) &&
            control.is_exit_requested()) {
            break;
        }

        idle_for(period, control);
    }
}

} // namespace pipeline
