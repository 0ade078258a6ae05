/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: bounded_channel.h

    Description:
        BoundedChannel is the FIFO that connects pipeline stages. One
        channel may have any number of producer and consumer processes.

        Shared Layout (one anonymous shared mapping per channel):

        ┌───────────────────────────┬─────────────────────────────────────┐
        │ ChannelHeader             │ arena (ring of length-prefixed      │
        │  mutex, not_empty,        │ frames)                             │
        │  not_full, capacity,      │  [len(4)][payload][len(4)][payload] │
        │  count, head, used        │                                     │
        └───────────────────────────┴─────────────────────────────────────┘

        Capacity:
        - capacity > 0: at most `capacity` messages are stored.
        - capacity <= 0: no message-count limit ("unbounded").
        In both cases the arena's byte size is a hard limit too. A put that
        does not fit waits exactly like a put on a count-full channel, so
        producers always feel backpressure instead of losing data.

        Blocking Rules (put and get):
        - block == false            → try once, report full/empty at once
        - block == true, timeout    → wait at most `timeout`
        - block == true, no timeout → wait indefinitely

        A failed put returns false; a failed get returns std::nullopt. Neither
        is an error: worker bodies use them to interleave channel reads with
        checks of their ControlSignal.

        Worker bodies should always pass a timeout. A body parked in an
        untimed get() never sees an exit request.

        A payload larger than the arena (see fits()) is rejected at once
        with an error; waiting would never help.

    Dead Processes:
        If a process dies while holding the channel mutex, the next caller
        recovers the mutex and empties the channel, logging how many
        messages were discarded. Frames written by the dead process cannot
        be told apart from intact ones, so none are kept.

    Typed Access:
        put_message()/get_message() move Message objects through the
        channel using the codec in common/message.h.
*******************************************************************************/

#ifndef PIPELINE_BOUNDED_CHANNEL_H
#define PIPELINE_BOUNDED_CHANNEL_H

#include "common/message.h"
#include "common/shared_memory.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace pipeline {

using Payload = std::vector<uint8_t>;
using Timeout = std::optional<std::chrono::milliseconds>;

/// Default arena size; pages are committed only when touched.
constexpr size_t kDefaultChannelArenaBytes = 16 * 1024 * 1024;

/// Bytes of length prefix stored in front of every payload.
constexpr size_t kFrameHeaderSize = 4;

class BoundedChannel {
public:
    /**
     * @brief Create a channel in shared memory.
     *
     * @param capacity     Maximum number of messages; <= 0 for unbounded
     * @param arena_bytes  Byte size of the message arena (0 for default)
     * @return nullptr (after logging) if shared memory cannot be set up
     */
    static std::shared_ptr<BoundedChannel> create(int capacity,
                                                  size_t arena_bytes = kDefaultChannelArenaBytes);

    ~BoundedChannel();

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /**
     * @brief Append @p payload.
     * @return false if the channel stayed full (non-blocking or timed out),
     *         or if the payload can never fit in the arena
     */
    bool put(const Payload& payload, bool block = true, Timeout timeout = std::nullopt);

    /**
     * @brief Remove and return the oldest payload.
     * @return std::nullopt if the channel stayed empty
     */
    std::optional<Payload> get(bool block = true, Timeout timeout = std::nullopt);

    /// Non-blocking get().
    std::optional<Payload> try_get();

    bool put_message(const Message& message, bool block = true, Timeout timeout = std::nullopt);

    /**
     * @brief get() followed by Message::deserialize().
     * @return nullptr if the channel stayed empty
     * @throws std::runtime_error if the payload is not a valid message
     *         (the payload is consumed either way)
     */
    std::unique_ptr<Message> get_message(bool block = true, Timeout timeout = std::nullopt);

    bool is_empty();
    size_t size();
    int capacity() const { return capacity_; }

    /// False if a payload of @p payload_size bytes can never be stored.
    bool fits(size_t payload_size) const {
        return kFrameHeaderSize + payload_size <= arena_size_;
    }

    /**
     * @brief Discard every stored message and wake blocked producers.
     * @return number of messages removed
     */
    size_t drain();

private:
    struct ChannelHeader {
        pthread_mutex_t mutex;
        pthread_cond_t not_empty;
        pthread_cond_t not_full;
        int64_t capacity;
        uint64_t arena_size;
        uint64_t count;
        uint64_t head;   // offset of the oldest frame
        uint64_t used;   // bytes occupied by stored frames
    };

    BoundedChannel(std::unique_ptr<SharedRegion> region, int capacity, size_t arena_size);

    bool initialize();
    void reset_if_owner_died(SharedLock& lock);
    bool has_room(uint64_t frame_size) const;
    void copy_in(uint64_t offset, const uint8_t* src, uint64_t length);
    void copy_out(uint64_t offset, uint8_t* dst, uint64_t length) const;

    std::unique_ptr<SharedRegion> region_;
    ChannelHeader* header_;
    uint8_t* arena_;
    int capacity_;
    size_t arena_size_;
    bool initialized_;
};

using ChannelPtr = std::shared_ptr<BoundedChannel>;
using ChannelList = std::vector<ChannelPtr>;

} // namespace pipeline

#endif // PIPELINE_BOUNDED_CHANNEL_H
