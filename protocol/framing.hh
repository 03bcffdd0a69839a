#pragma once

#include <cstdint>
#include <string>

#include "message.hh"

namespace graphlink {
namespace protocol {

enum class FrameStatus {
    OK,
    CLOSED,     // peer closed the connection
    TIMEOUT,    // socket send/receive timeout expired
    ERROR,      // any other socket failure (errno preserved)
};

// Largest payload read_frame accepts; bigger headers are treated as corrupt.
constexpr uint32_t kMaxFrameSize = 64u * 1024 * 1024;

// Frame = MessageHeader (network byte order) followed by the payload.
class Framing {
public:
    static FrameStatus write_frame(int socket, uint64_t sender_id,
                                   MessageType message_type, const std::string& payload);
    static FrameStatus read_frame(int socket, uint64_t& sender_id,
                                  MessageType& message_type, std::string& payload);
};

const char* FrameStatusToString(FrameStatus status);

} // namespace protocol
} // namespace graphlink
