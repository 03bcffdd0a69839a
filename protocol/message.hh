#pragma once

#include <cstdint>

namespace graphlink {
namespace protocol {

// Message header for RPC communication
struct MessageHeader {
    uint64_t sender_id;      // client ID
    uint32_t message_type;   // MessageType
    uint32_t payload_size;   // size of the protobuf payload
};

// MessageType enum (selects the protobuf message carried by the frame)
enum class MessageType : uint32_t {
    UNKNOWN = 0,
    QUERY = 1,
    COMMIT_OR_ABORT = 2,
    ALTER = 3,
    CHECK_VERSION = 4,
    LOGIN = 5,
    RPC_ERROR = 255
};

const char* MessageTypeToString(MessageType type);

} // namespace protocol
} // namespace graphlink
