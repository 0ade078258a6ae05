/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: pipeline_stages.h

    Description:
        Ready-made worker bodies. They follow the worker body contract in
        worker/worker_spec.h and double as reference implementations of the
        cooperative loop every body must run:

            while (!control.is_exit_requested()) {
                control.check_pause();
                read input with kStageReadTimeout   (skip if nothing arrived)
                process
                write outputs with put_until_exit()
            }

        Stages:

        counter_source_worker
            args:    int64_t start, int64_t count, std::chrono::milliseconds period
            inputs:  none
            outputs: [0] IntegerMessage start, start+1, ...
            Emits `count` values (count <= 0: forever), one per period, then
            idles until exit is requested.

        scale_worker
            args:    int64_t factor
            inputs:  [0] IntegerMessage
            outputs: [0] IntegerMessage value * factor
            Malformed or non-integer messages are logged and skipped.

        status_worker
            args:    std::string text, std::chrono::milliseconds period
            inputs:  none
            outputs: [0] TextMessage text, once per period
*******************************************************************************/

#ifndef PIPELINE_STAGES_H
#define PIPELINE_STAGES_H

#include "worker/worker_spec.h"

#include <chrono>

namespace pipeline {

/// Bounded wait of every stage read; an exit request is noticed within it.
constexpr std::chrono::milliseconds kStageReadTimeout(100);

/// Bounded wait of a single put attempt inside put_until_exit().
constexpr std::chrono::milliseconds kStagePutTimeout(100);

/**
 * @brief Put @p message, retrying on a full channel until it fits or exit
 *        is requested.
 *
 * A message larger than the channel can ever hold is logged and dropped
 * without retrying.
 *
 * @return false if the message was dropped or exit was requested first
 */
bool put_until_exit(BoundedChannel& channel, const Message& message, ControlSignal& control);

void counter_source_worker(const StaticArgs& args, const ChannelList& inputs,
                           const ChannelList& outputs, ControlSignal& control);

void scale_worker(const StaticArgs& args, const ChannelList& inputs,
                  const ChannelList& outputs, ControlSignal& control);

void status_worker(const StaticArgs& args, const ChannelList& inputs,
                   const ChannelList& outputs, ControlSignal& control);

} // namespace pipeline

#endif // PIPELINE_STAGES_H
