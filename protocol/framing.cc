#include "framing.hh"
#include "../common/log.h"

#include <cerrno>
#include <cstring>
#include <vector>
#include <endian.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>

namespace graphlink {
namespace protocol {

namespace {

FrameStatus classify_errno(int err) {
    if (err == EAGAIN || err == EWOULDBLOCK) return FrameStatus::TIMEOUT;
    return FrameStatus::ERROR;
}

FrameStatus recv_exact(int socket, char* data, size_t size) {
    size_t received = 0;
    while (received < size) {
        ssize_t n = recv(socket, data + received, size - received, MSG_WAITALL);
        if (n == 0) {
            return FrameStatus::CLOSED;
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            return classify_errno(errno);
        }
        received += static_cast<size_t>(n);
    }
    return FrameStatus::OK;
}

}  // namespace

const char* MessageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::QUERY: return "QUERY";
        case MessageType::COMMIT_OR_ABORT: return "COMMIT_OR_ABORT";
        case MessageType::ALTER: return "ALTER";
        case MessageType::CHECK_VERSION: return "CHECK_VERSION";
        case MessageType::LOGIN: return "LOGIN";
        case MessageType::RPC_ERROR: return "RPC_ERROR";
        default: return "UNKNOWN";
    }
}

const char* FrameStatusToString(FrameStatus status) {
    switch (status) {
        case FrameStatus::OK: return "OK";
        case FrameStatus::CLOSED: return "CLOSED";
        case FrameStatus::TIMEOUT: return "TIMEOUT";
        case FrameStatus::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

FrameStatus Framing::write_frame(int socket, uint64_t sender_id,
                                 MessageType message_type, const std::string& payload) {
    // Prepare header
    MessageHeader header;
    header.sender_id = htobe64(sender_id);
    header.message_type = htonl(static_cast<uint32_t>(message_type));
    header.payload_size = htonl(static_cast<uint32_t>(payload.size()));

    // Combine header and payload
    size_t total_size = sizeof(header) + payload.size();
    std::vector<char> buffer(total_size);
    std::memcpy(buffer.data(), &header, sizeof(header));
    std::memcpy(buffer.data() + sizeof(header), payload.data(), payload.size());

    size_t sent = 0;
    while (sent < total_size) {
        ssize_t n = send(socket, buffer.data() + sent, total_size - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            GRAPHLINK_LOG_DEBUG("Failed to send frame (%s): %s", MessageTypeToString(message_type),
                                std::strerror(err));
            return classify_errno(err);
        }
        sent += static_cast<size_t>(n);
    }

    GRAPHLINK_LOG_DEBUG("Sent frame %s (%zu bytes payload)", MessageTypeToString(message_type),
                        payload.size());
    return FrameStatus::OK;
}

FrameStatus Framing::read_frame(int socket, uint64_t& sender_id,
                                MessageType& message_type, std::string& payload) {
    // Read fixed-size header
    MessageHeader net_header{};
    FrameStatus status = recv_exact(socket, reinterpret_cast<char*>(&net_header), sizeof(net_header));
    if (status != FrameStatus::OK) {
        GRAPHLINK_LOG_DEBUG("Failed to receive frame header: %s", FrameStatusToString(status));
        return status;
    }

    // Convert message header (network order -> host order)
    sender_id = be64toh(net_header.sender_id);
    message_type = static_cast<MessageType>(ntohl(net_header.message_type));
    uint32_t payload_size = ntohl(net_header.payload_size);

    GRAPHLINK_LOG_DEBUG("Received header: sender_id=%lu, message_type=%u, payload_size=%u",
                        static_cast<unsigned long>(sender_id),
                        static_cast<uint32_t>(message_type), payload_size);

    if (payload_size > kMaxFrameSize) {
        GRAPHLINK_LOG_WARNING("Rejecting frame %s: payload_size=%u exceeds limit %u",
                              MessageTypeToString(message_type), payload_size, kMaxFrameSize);
        return FrameStatus::ERROR;
    }

    // Read payload (if exists)
    payload.clear();
    if (payload_size > 0) {
        payload.resize(payload_size);
        status = recv_exact(socket, &payload[0], payload_size);
        if (status != FrameStatus::OK) {
            GRAPHLINK_LOG_DEBUG("Failed to receive frame payload: %s", FrameStatusToString(status));
            return status;
        }
    }

    return FrameStatus::OK;
}

} // namespace protocol
} // namespace graphlink
