/*******************************************************************************
    Project: Drone Pipeline Worker Framework

    File: message.cpp

    Description:
        Serialization and deserialization of channel messages. See
        message.h for the wire format.
*******************************************************************************/

#include "common/message.h"
#include <stdexcept>
#include <cstring>

namespace pipeline {

//==============================================================================
// Helpers
//==============================================================================

static void write_header(std::vector<uint8_t>& buffer, MessageType type, uint64_t id) {
    buffer.push_back(static_cast<uint8_t>(type));

    uint64_t net_id = hton64(id);
    const uint8_t* id_bytes = reinterpret_cast<const uint8_t*>(&net_id);
    buffer.insert(buffer.end(), id_bytes, id_bytes + 8);

    // Placeholder for payload size, patched by finish_payload()
    buffer.resize(buffer.size() + 4);
}

static void finish_payload(std::vector<uint8_t>& buffer) {
    uint32_t payload_size = static_cast<uint32_t>(buffer.size() - kMessageHeaderSize);
    uint32_t net_size = hton32(payload_size);
    std::memcpy(&buffer[kMessageHeaderSize - 4], &net_size, 4);
}

static void read_header(const uint8_t* data, size_t size, Message& msg) {
    if (size < kMessageHeaderSize) {
        throw std::runtime_error("Message shorter than header");
    }
    msg.type = static_cast<MessageType>(data[0]);

    uint64_t net_id;
    std::memcpy(&net_id, data + 1, 8);
    msg.id = ntoh64(net_id);

    uint32_t net_size;
    std::memcpy(&net_size, data + 9, 4);
    msg.payload_size = ntoh32(net_size);

    if (kMessageHeaderSize + msg.payload_size > size) {
        throw std::runtime_error("Message payload truncated");
    }
}

static void serialize_string(std::vector<uint8_t>& buffer, const std::string& str) {
    uint32_t len = hton32(static_cast<uint32_t>(str.size()));
    const uint8_t* len_bytes = reinterpret_cast<const uint8_t*>(&len);
    buffer.insert(buffer.end(), len_bytes, len_bytes + 4);
    buffer.insert(buffer.end(), str.begin(), str.end());
}

static std::string deserialize_string(const uint8_t*& ptr, const uint8_t* end) {
    if (ptr + 4 > end) throw std::runtime_error("Buffer underflow reading string length");
    uint32_t len;
    std::memcpy(&len, ptr, 4);
    len = ntoh32(len);
    ptr += 4;

    if (ptr + len > end) throw std::runtime_error("Buffer underflow reading string data");
    std::string result(reinterpret_cast<const char*>(ptr), len);
    ptr += len;
    return result;
}

//==============================================================================
// Message
//==============================================================================

std::vector<uint8_t> Message::serialize() const {
    std::vector<uint8_t> buffer;
    write_header(buffer, type, id);
    finish_payload(buffer);
    return buffer;
}

std::unique_ptr<Message> Message::deserialize(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        throw std::runtime_error("Empty message");
    }

    switch (static_cast<MessageType>(data[0])) {
        case MessageType::INTEGER:
            return IntegerMessage::deserialize(data.data(), data.size());
        case MessageType::TEXT:
            return TextMessage::deserialize(data.data(), data.size());
        default:
            throw std::runtime_error("Unknown message type " +
                                     std::to_string(static_cast<int>(data[0])));
    }
}

std::string Message::to_string() const {
    return "Message(type=" + std::to_string(static_cast<int>(type)) +
           ", id=" + std::to_string(id) + ")";
}

//==============================================================================
// IntegerMessage
//==============================================================================

std::vector<uint8_t> IntegerMessage::serialize() const {
    std::vector<uint8_t> buffer;
    write_header(buffer, type, id);

    uint64_t net_value = hton64(static_cast<uint64_t>(value));
    const uint8_t* value_bytes = reinterpret_cast<const uint8_t*>(&net_value);
    buffer.insert(buffer.end(), value_bytes, value_bytes + 8);

    finish_payload(buffer);
    return buffer;
}

std::unique_ptr<IntegerMessage> IntegerMessage::deserialize(const uint8_t* data, size_t size) {
    auto msg = std::make_unique<IntegerMessage>();
    read_header(data, size, *msg);

    if (msg->payload_size < 8) throw std::runtime_error("Buffer underflow reading integer");
    uint64_t net_value;
    std::memcpy(&net_value, data + kMessageHeaderSize, 8);
    msg->value = static_cast<int64_t>(ntoh64(net_value));
    return msg;
}

std::string IntegerMessage::to_string() const {
    return std::to_string(value);
}

//==============================================================================
// TextMessage
//==============================================================================

std::vector<uint8_t> TextMessage::serialize() const {
    std::vector<uint8_t> buffer;
    write_header(buffer, type, id);
    serialize_string(buffer, text);
    finish_payload(buffer);
    return buffer;
}

std::unique_ptr<TextMessage> TextMessage::deserialize(const uint8_t* data, size_t size) {
    auto msg = std::make_unique<TextMessage>();
    read_header(data, size, *msg);

    const uint8_t* ptr = data + kMessageHeaderSize;
    const uint8_t* end = ptr + msg->payload_size;
    msg->text = deserialize_string(ptr, end);
    return msg;
}

std::string TextMessage::to_string() const {
    return text;
}

} // namespace pipeline
