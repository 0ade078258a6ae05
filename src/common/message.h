/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: message.h

    Description:
        Typed messages exchanged between pipeline stages. Bounded channels
        carry opaque byte payloads; this header defines how typed values are
        turned into those payloads and back.

        Wire Format (all multi-byte fields in network byte order):

        ┌──────────┬──────────────┬────────────────┬─────────────────┐
        │ type (1) │ id (8)       │ payload size(4)│ payload (N)     │
        └──────────┴──────────────┴────────────────┴─────────────────┘

        - type:         MessageType discriminator
        - id:           sender-assigned sequence number (0 if unused)
        - payload size: number of bytes following the 13-byte header

        Message Types:
        - INTEGER: one signed 64-bit value
        - TEXT:    one length-prefixed UTF-8 string (status lines, commands)

    Error Handling:
        Deserialization throws std::runtime_error on truncated or unknown
        input. Channel consumers catch it, log it and move on to the next
        message.
*******************************************************************************/

#ifndef PIPELINE_MESSAGE_H
#define PIPELINE_MESSAGE_H

#include <string>
#include <vector>
#include <cstdint>
#include <cstring>
#include <memory>
#include <utility>

namespace pipeline {

/// Size of the fixed message header (type + id + payload size).
constexpr size_t kMessageHeaderSize = 13;

enum class MessageType : uint8_t {
    INTEGER = 1,
    TEXT = 2,
    ERROR = 255
};

/**
 * @class Message
 * @brief Base of all channel messages.
 *
 * serialize() on the base emits a header-only message. Subclasses override
 * it to append their payload. Message::deserialize() reads the type byte
 * and dispatches to the matching subclass.
 */
class Message {
public:
    MessageType type;
    uint64_t id;
    uint32_t payload_size;

    Message(MessageType t = MessageType::ERROR)
        : type(t), id(0), payload_size(0) {}

    virtual ~Message() = default;

    virtual std::vector<uint8_t> serialize() const;

    /**
     * @brief Decode any message produced by serialize().
     * @throws std::runtime_error on malformed input
     */
    static std::unique_ptr<Message> deserialize(const std::vector<uint8_t>& data);

    virtual std::string to_string() const;
};

class IntegerMessage : public Message {
public:
    int64_t value;

    IntegerMessage() : Message(MessageType::INTEGER), value(0) {}
    explicit IntegerMessage(int64_t v) : Message(MessageType::INTEGER), value(v) {}

    std::vector<uint8_t> serialize() const override;
    static std::unique_ptr<IntegerMessage> deserialize(const uint8_t* data, size_t size);

    std::string to_string() const override;
};

class TextMessage : public Message {
public:
    std::string text;

    TextMessage() : Message(MessageType::TEXT) {}
    explicit TextMessage(std::string t) : Message(MessageType::TEXT), text(std::move(t)) {}

    std::vector<uint8_t> serialize() const override;
    static std::unique_ptr<TextMessage> deserialize(const uint8_t* data, size_t size);

    std::string to_string() const override;
};

// Byte order helpers (host is assumed little-endian, as on every target
// this framework runs on).
inline uint32_t hton32(uint32_t val) {
    return ((val & 0xFF) << 24) | ((val & 0xFF00) << 8) |
           ((val >> 8) & 0xFF00) | ((val >> 24) & 0xFF);
}

inline uint64_t hton64(uint64_t val) {
    return ((uint64_t)hton32(val & 0xFFFFFFFF) << 32) | hton32(val >> 32);
}

inline uint32_t ntoh32(uint32_t val) { return hton32(val); }
inline uint64_t ntoh64(uint64_t val) { return hton64(val); }

} // namespace pipeline

#endif // PIPELINE_MESSAGE_H
