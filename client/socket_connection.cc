#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <errno.h>
#include <atomic>
#include <cstring>
#include <cstdlib>
#include <chrono>
#include <fstream>
#include <mutex>

#include "socket_connection.hh"
#include "../protocol/framing.hh"
#include "../common/log.h"

namespace graphlink {

using protocol::FrameStatus;
using protocol::Framing;
using protocol::MessageType;
using protocol::MessageTypeToString;

namespace {

uint64_t next_sender_id() {
    static std::atomic<uint64_t> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

const std::string& GetTimingLogPath() {
    static const std::string path = []() {
        const char* env = std::getenv("GRAPHLINK_RPC_TIMING_LOG");
        if (env && env[0] != '\0') {
            return std::string(env);
        }
        return std::string();
    }();
    return path;
}

struct NetworkTiming {
    std::chrono::steady_clock::time_point send_start;
    std::chrono::steady_clock::time_point send_end;
    std::chrono::steady_clock::time_point recv_start;
    std::chrono::steady_clock::time_point recv_end;
};

void AppendProtobufTimingRecord(
    MessageType message_type,
    std::chrono::steady_clock::time_point serialize_start,
    std::chrono::steady_clock::time_point serialize_end,
    std::chrono::steady_clock::time_point deserialize_start,
    std::chrono::steady_clock::time_point deserialize_end,
    const NetworkTiming& net_timing,
    size_t request_bytes,
    size_t response_bytes,
    const char* outcome) {

    const std::string& path = GetTimingLogPath();
    if (path.empty()) return;

    static std::mutex file_mutex;
    std::lock_guard<std::mutex> lock(file_mutex);

    std::ofstream out(path, std::ios::app);
    if (!out) return;

    auto duration_ns = [](const std::chrono::steady_clock::time_point& start,
                          const std::chrono::steady_clock::time_point& end) {
        return static_cast<long long>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    };

    long long roundtrip_ns = duration_ns(serialize_end, deserialize_start);
    if (roundtrip_ns < 0) roundtrip_ns = 0;

    out << "message=" << MessageTypeToString(message_type)
        << " serialize_ns=" << duration_ns(serialize_start, serialize_end)
        << " deserialize_ns=" << duration_ns(deserialize_start, deserialize_end)
        << " send_ns=" << duration_ns(net_timing.send_start, net_timing.send_end)
        << " recv_ns=" << duration_ns(net_timing.recv_start, net_timing.recv_end)
        << " roundtrip_ns=" << roundtrip_ns
        << " request_bytes=" << request_bytes
        << " response_bytes=" << response_bytes
        << " outcome=" << outcome
        << std::endl;
}

StatusCode status_for_frame_failure(FrameStatus status) {
    return status == FrameStatus::TIMEOUT ? StatusCode::kDeadlineExceeded
                                          : StatusCode::kUnavailable;
}

}  // namespace

SocketConnection::SocketConnection(const std::string& host, int port,
                                   std::chrono::milliseconds default_timeout)
    : host_(host),
      port_(port),
      default_timeout_(default_timeout),
      sender_id_(next_sender_id()),
      socket_fd_(-1),
      connected_(false) {
    GRAPHLINK_LOG_INFO("SocketConnection(%p): endpoint %s:%d, sender_id=%lu",
                       static_cast<const void*>(this), host_.c_str(), port_,
                       static_cast<unsigned long>(sender_id_));
}

SocketConnection::~SocketConnection() {
    close();
}

void SocketConnection::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect_locked();
}

bool SocketConnection::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

void SocketConnection::connect_locked(std::chrono::milliseconds timeout) {
    if (connected_) {
        return;
    }

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* addresses = nullptr;
    const std::string port = std::to_string(port_);
    int rc = getaddrinfo(host_.c_str(), port.c_str(), &hints, &addresses);
    if (rc != 0) {
        throw RpcError(StatusCode::kUnavailable,
                       "cannot resolve " + host_ + ": " + gai_strerror(rc));
    }

    int last_errno = 0;
    for (struct addrinfo* ai = addresses; ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_errno = errno;
            continue;
        }
        socket_fd_ = fd;
        // SO_SNDTIMEO also bounds connect()
        apply_timeout_locked(timeout);
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            connected_ = true;
            break;
        }
        last_errno = errno;
        ::close(fd);
        socket_fd_ = -1;
    }
    freeaddrinfo(addresses);

    if (!connected_) {
        GRAPHLINK_LOG_WARNING("SocketConnection(%p): connect to %s:%d failed: %s",
                              static_cast<const void*>(this), host_.c_str(), port_,
                              std::strerror(last_errno));
        StatusCode code = (last_errno == EINPROGRESS || last_errno == EAGAIN)
                              ? StatusCode::kDeadlineExceeded
                              : StatusCode::kUnavailable;
        throw RpcError(code, "cannot connect to " + host_ + ":" + port + ": " +
                                 std::strerror(last_errno));
    }

    GRAPHLINK_LOG_INFO("SocketConnection(%p): connected to %s:%d (fd=%d)",
                       static_cast<const void*>(this), host_.c_str(), port_, socket_fd_);
}

void SocketConnection::disconnect_locked() {
    if (socket_fd_ >= 0) {
        GRAPHLINK_LOG_INFO("SocketConnection(%p): disconnecting socket_fd=%d",
                           static_cast<const void*>(this), socket_fd_);
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
    connected_ = false;
}

void SocketConnection::apply_timeout_locked(std::chrono::milliseconds timeout) {
    struct timeval tv;
    const long long ms = timeout.count();
    tv.tv_sec = static_cast<time_t>(ms / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
    if (setsockopt(socket_fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(socket_fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        GRAPHLINK_LOG_WARNING("SocketConnection(%p): failed to set socket timeout: %s",
                              static_cast<const void*>(this), std::strerror(errno));
    }
}

template<typename RequestType, typename ResponseType>
void SocketConnection::send_protobuf_message(const RequestType& request, ResponseType& response,
                                             MessageType message_type,
                                             const CallOptions& options) {
    if (options.cancellation && options.cancellation->is_cancelled()) {
        throw RpcError(StatusCode::kCancelled, "call cancelled before it was sent");
    }

    const std::chrono::milliseconds timeout = options.timeout.value_or(default_timeout_);
    // a zero socket timeout would block forever
    if (timeout.count() <= 0) {
        throw RpcError(StatusCode::kDeadlineExceeded,
                       std::string("deadline already expired for ") + MessageTypeToString(message_type));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    connect_locked(timeout);
    apply_timeout_locked(timeout);

    // serialize request
    auto serialize_start = std::chrono::steady_clock::now();
    std::string serialized_request;
    if (!request.SerializeToString(&serialized_request)) {
        throw RpcError(StatusCode::kInternal, "failed to serialize request");
    }
    auto serialize_end = std::chrono::steady_clock::now();
    GRAPHLINK_LOG_DEBUG("PROTOBUF_MESSAGE: %s request serialized, size: %zu bytes",
                        MessageTypeToString(message_type), serialized_request.size());

    NetworkTiming timing{serialize_end, serialize_end, serialize_end, serialize_end};

    timing.send_start = std::chrono::steady_clock::now();
    FrameStatus status = Framing::write_frame(socket_fd_, sender_id_, message_type, serialized_request);
    timing.send_end = std::chrono::steady_clock::now();
    if (status != FrameStatus::OK) {
        // the stream may hold a partial frame; never reuse it
        disconnect_locked();
        AppendProtobufTimingRecord(message_type, serialize_start, serialize_end, timing.send_end,
                                   timing.send_end, timing, serialized_request.size(), 0,
                                   "send_failed");
        throw RpcError(status_for_frame_failure(status),
                       std::string("failed to send ") + MessageTypeToString(message_type) +
                           " to " + host_ + ": " + protocol::FrameStatusToString(status));
    }

    uint64_t response_sender_id = 0;
    MessageType response_type = MessageType::UNKNOWN;
    std::string serialized_response;
    timing.recv_start = std::chrono::steady_clock::now();
    status = Framing::read_frame(socket_fd_, response_sender_id, response_type, serialized_response);
    timing.recv_end = std::chrono::steady_clock::now();
    if (status != FrameStatus::OK) {
        disconnect_locked();
        AppendProtobufTimingRecord(message_type, serialize_start, serialize_end, timing.recv_end,
                                   timing.recv_end, timing, serialized_request.size(), 0,
                                   "recv_failed");
        throw RpcError(status_for_frame_failure(status),
                       std::string("no response to ") + MessageTypeToString(message_type) +
                           " from " + host_ + ": " + protocol::FrameStatusToString(status));
    }

    if (options.cancellation && options.cancellation->is_cancelled()) {
        throw RpcError(StatusCode::kCancelled, "call cancelled while in flight");
    }

    if (response_type == MessageType::RPC_ERROR) {
        protocol::Status remote_status;
        if (!remote_status.ParseFromString(serialized_response)) {
            throw RpcError(StatusCode::kInternal, "malformed error status from server");
        }
        GRAPHLINK_LOG_DEBUG("PROTOBUF_MESSAGE: server rejected %s: code=%d, %s",
                            MessageTypeToString(message_type), remote_status.code(),
                            remote_status.message().c_str());
        AppendProtobufTimingRecord(message_type, serialize_start, serialize_end, timing.recv_end,
                                   timing.recv_end, timing, serialized_request.size(),
                                   serialized_response.size(), "rpc_error");
        throw RpcError(static_cast<StatusCode>(remote_status.code()), remote_status.message());
    }

    if (response_type != message_type) {
        disconnect_locked();
        throw RpcError(StatusCode::kInternal,
                       std::string("expected ") + MessageTypeToString(message_type) +
                           " response, got " + MessageTypeToString(response_type));
    }

    // deserialize response
    auto deserialize_start = std::chrono::steady_clock::now();
    bool parse_ok = response.ParseFromString(serialized_response);
    auto deserialize_end = std::chrono::steady_clock::now();

    AppendProtobufTimingRecord(message_type, serialize_start, serialize_end, deserialize_start,
                               deserialize_end, timing, serialized_request.size(),
                               serialized_response.size(), parse_ok ? "ok" : "parse_failed");

    if (!parse_ok) {
        throw RpcError(StatusCode::kInternal, "failed to parse response");
    }

    GRAPHLINK_LOG_DEBUG("PROTOBUF_MESSAGE: %s exchange completed (%zu response bytes)",
                        MessageTypeToString(message_type), serialized_response.size());
}

protocol::Response SocketConnection::query(const protocol::Request& request,
                                           const CallOptions& options) {
    GRAPHLINK_LOG_DEBUG("CLIENT: query called with start_ts=%lu, mutations=%d",
                        static_cast<unsigned long>(request.start_ts()), request.mutations_size());
    protocol::Response response;
    send_protobuf_message(request, response, MessageType::QUERY, options);
    return response;
}

protocol::TxnContext SocketConnection::commit_or_abort(const protocol::TxnContext& context,
                                                       const CallOptions& options) {
    GRAPHLINK_LOG_DEBUG("CLIENT: commit_or_abort called with start_ts=%lu, aborted=%s",
                        static_cast<unsigned long>(context.start_ts()),
                        context.aborted() ? "true" : "false");
    protocol::TxnContext response;
    send_protobuf_message(context, response, MessageType::COMMIT_OR_ABORT, options);
    return response;
}

protocol::Payload SocketConnection::alter(const protocol::Operation& operation,
                                          const CallOptions& options) {
    GRAPHLINK_LOG_DEBUG("CLIENT: alter called");
    protocol::Payload response;
    send_protobuf_message(operation, response, MessageType::ALTER, options);
    return response;
}

protocol::Version SocketConnection::check_version(const CallOptions& options) {
    GRAPHLINK_LOG_DEBUG("CLIENT: check_version called");
    protocol::Check request;
    protocol::Version response;
    send_protobuf_message(request, response, MessageType::CHECK_VERSION, options);
    return response;
}

protocol::Response SocketConnection::login(const protocol::LoginRequest& request,
                                           const CallOptions& options) {
    GRAPHLINK_LOG_DEBUG("CLIENT: login called for user '%s'", request.userid().c_str());
    protocol::Response response;
    send_protobuf_message(request, response, MessageType::LOGIN, options);
    return response;
}

} // namespace graphlink
