/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: bounded_channel.cpp

    Description:
        Multi-process FIFO over a shared ring arena. See bounded_channel.h.
*******************************************************************************/

#include "worker/bounded_channel.h"
#include "common/logger.h"

#include <algorithm>
#include <cstring>
#include <new>
#include <utility>

namespace pipeline {

namespace {

/**
 * Wait on @p cond until @p ready() holds, honoring the block/timeout rules.
 * Called with the channel mutex held through @p lock; @p on_wake runs after
 * every wake-up, before @p ready() is checked again.
 */
template <typename Predicate, typename WakeHook>
bool wait_for(SharedLock& lock, pthread_cond_t* cond, bool block,
              const Timeout& timeout, Predicate ready, WakeHook on_wake) {
    if (ready()) return true;
    if (!block) return false;

    if (!timeout) {
        while (!ready()) {
            lock.wait(cond);
            on_wake();
        }
        return true;
    }

    const timespec deadline = monotonic_deadline(*timeout);
    while (!ready()) {
        bool signalled = lock.wait_until(cond, deadline);
        on_wake();
        if (!signalled) {
            return ready();
        }
    }
    return true;
}

} // namespace

//==============================================================================
// Construction
//==============================================================================

std::shared_ptr<BoundedChannel> BoundedChannel::create(int capacity, size_t arena_bytes) {
    if (arena_bytes == 0) {
        arena_bytes = kDefaultChannelArenaBytes;
    }
    if (arena_bytes <= kFrameHeaderSize) {
        Logger::error("Channel arena of " + std::to_string(arena_bytes) +
                      " bytes cannot hold any message");
        return nullptr;
    }

    auto region = SharedRegion::create(sizeof(ChannelHeader) + arena_bytes);
    if (!region) {
        Logger::error("Failed to allocate channel storage");
        return nullptr;
    }

    std::shared_ptr<BoundedChannel> channel(
        new BoundedChannel(std::move(region), capacity, arena_bytes));
    if (!channel->initialize()) {
        Logger::error("Failed to initialize channel synchronization");
        return nullptr;
    }

    Logger::debug("Created channel (capacity=" + std::to_string(capacity) +
                  ", arena=" + std::to_string(arena_bytes) + " bytes)");
    return channel;
}

BoundedChannel::BoundedChannel(std::unique_ptr<SharedRegion> region, int capacity,
                               size_t arena_size)
    : region_(std::move(region)),
      header_(nullptr),
      arena_(nullptr),
      capacity_(capacity),
      arena_size_(arena_size),
      initialized_(false) {
    uint8_t* base = static_cast<uint8_t*>(region_->data());
    header_ = new (base) ChannelHeader();
    arena_ = base + sizeof(ChannelHeader);
}

bool BoundedChannel::initialize() {
    header_->capacity = capacity_;
    header_->arena_size = arena_size_;
    header_->count = 0;
    header_->head = 0;
    header_->used = 0;

    if (!init_shared_mutex(&header_->mutex)) {
        return false;
    }
    if (!init_shared_cond(&header_->not_empty)) {
        pthread_mutex_destroy(&header_->mutex);
        return false;
    }
    if (!init_shared_cond(&header_->not_full)) {
        pthread_cond_destroy(&header_->not_empty);
        pthread_mutex_destroy(&header_->mutex);
        return false;
    }

    initialized_ = true;
    return true;
}

BoundedChannel::~BoundedChannel() {
    if (initialized_ && region_->is_owner()) {
        pthread_cond_destroy(&header_->not_full);
        pthread_cond_destroy(&header_->not_empty);
        pthread_mutex_destroy(&header_->mutex);
    }
}

/**
 * A replica killed inside put() or get() can leave count, head and used out
 * of step; the frames can no longer be trusted, so the ring is emptied.
 */
void BoundedChannel::reset_if_owner_died(SharedLock& lock) {
    if (!lock.consume_owner_died()) {
        return;
    }
    Logger::warning("Channel reset after a process died while using it; " +
                    std::to_string(header_->count) + " message(s) discarded");
    header_->count = 0;
    header_->head = 0;
    header_->used = 0;
    pthread_cond_broadcast(&header_->not_full);
}

//==============================================================================
// Ring arena
//==============================================================================

bool BoundedChannel::has_room(uint64_t frame_size) const {
    if (header_->capacity > 0 &&
        header_->count >= static_cast<uint64_t>(header_->capacity)) {
        return false;
    }
    return header_->used + frame_size <= header_->arena_size;
}

void BoundedChannel::copy_in(uint64_t offset, const uint8_t* src, uint64_t length) {
    offset %= header_->arena_size;
    uint64_t first = std::min(length, header_->arena_size - offset);
    std::memcpy(arena_ + offset, src, first);
    if (first < length) {
        std::memcpy(arena_, src + first, length - first);
    }
}

void BoundedChannel::copy_out(uint64_t offset, uint8_t* dst, uint64_t length) const {
    offset %= header_->arena_size;
    uint64_t first = std::min(length, header_->arena_size - offset);
    std::memcpy(dst, arena_ + offset, first);
    if (first < length) {
        std::memcpy(dst + first, arena_, length - first);
    }
}

//==============================================================================
// Operations
//==============================================================================

bool BoundedChannel::put(const Payload& payload, bool block, Timeout timeout) {
    if (!fits(payload.size())) {
        Logger::error("Message of " + std::to_string(payload.size()) +
                      " bytes exceeds channel arena of " + std::to_string(arena_size_) + " bytes");
        return false;
    }
    const uint64_t frame_size = kFrameHeaderSize + payload.size();

    SharedLock lock(&header_->mutex);
    reset_if_owner_died(lock);
    if (!wait_for(lock, &header_->not_full, block, timeout,
                  [this, frame_size] { return has_room(frame_size); },
                  [this, &lock] { reset_if_owner_died(lock); })) {
        return false;
    }

    const uint64_t tail = header_->head + header_->used;
    const uint32_t length = static_cast<uint32_t>(payload.size());
    copy_in(tail, reinterpret_cast<const uint8_t*>(&length), kFrameHeaderSize);
    if (length > 0) {
        copy_in(tail + kFrameHeaderSize, payload.data(), length);
    }

    header_->used += frame_size;
    header_->count++;

    pthread_cond_broadcast(&header_->not_empty);
    return true;
}

std::optional<Payload> BoundedChannel::get(bool block, Timeout timeout) {
    SharedLock lock(&header_->mutex);
    reset_if_owner_died(lock);
    if (!wait_for(lock, &header_->not_empty, block, timeout,
                  [this] { return header_->count > 0; },
                  [this, &lock] { reset_if_owner_died(lock); })) {
        return std::nullopt;
    }

    uint32_t length = 0;
    copy_out(header_->head, reinterpret_cast<uint8_t*>(&length), kFrameHeaderSize);

    Payload payload(length);
    if (length > 0) {
        copy_out(header_->head + kFrameHeaderSize, payload.data(), length);
    }

    const uint64_t frame_size = kFrameHeaderSize + length;
    header_->head = (header_->head + frame_size) % header_->arena_size;
    header_->used -= frame_size;
    header_->count--;
    if (header_->count == 0) {
        header_->head = 0;
    }

    // Broadcast: a freed frame may satisfy several smaller pending puts.
    pthread_cond_broadcast(&header_->not_full);
    return payload;
}

std::optional<Payload> BoundedChannel::try_get() {
    return get(false);
}

bool BoundedChannel::put_message(const Message& message, bool block, Timeout timeout) {
    return put(message.serialize(), block, timeout);
}

std::unique_ptr<Message> BoundedChannel::get_message(bool block, Timeout timeout) {
    auto payload = get(block, timeout);
    if (!payload) {
        return nullptr;
    }
    return Message::deserialize(*payload);
}

bool BoundedChannel::is_empty() {
    SharedLock lock(&header_->mutex);
    reset_if_owner_died(lock);
    return header_->count == 0;
}

size_t BoundedChannel::size() {
    SharedLock lock(&header_->mutex);
    reset_if_owner_died(lock);
    return static_cast<size_t>(header_->count);
}

size_t BoundedChannel::drain() {
    SharedLock lock(&header_->mutex);
    size_t removed = static_cast<size_t>(header_->count);
    header_->count = 0;
    header_->head = 0;
    header_->used = 0;
    pthread_cond_broadcast(&header_->not_full);
    return removed;
}

} // namespace pipeline
