#ifndef GRAPHLINK_SOCKET_CONNECTION_H
#define GRAPHLINK_SOCKET_CONNECTION_H

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "connection.hh"
#include "../protocol/message.hh"

namespace graphlink {

/**
 * @brief
 * Connection speaking the framed protobuf protocol over one TCP socket.
 *
 * The socket is opened lazily on the first call and reopened on the next
 * call after any transport failure. Calls are serialized on the socket, so a
 * single instance can be shared by concurrent transactions.
 */
class SocketConnection : public Connection {
public:
    SocketConnection(const std::string& host, int port,
                     std::chrono::milliseconds default_timeout);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    protocol::Response query(const protocol::Request& request,
                             const CallOptions& options) override;
    protocol::TxnContext commit_or_abort(const protocol::TxnContext& context,
                                         const CallOptions& options) override;
    protocol::Payload alter(const protocol::Operation& operation,
                            const CallOptions& options) override;
    protocol::Version check_version(const CallOptions& options) override;
    protocol::Response login(const protocol::LoginRequest& request,
                             const CallOptions& options) override;

    void close() override;

    bool is_connected() const;
    const std::string& host() const { return host_; }
    int port() const { return port_; }

private:
    template<typename RequestType, typename ResponseType>
    void send_protobuf_message(const RequestType& request, ResponseType& response,
                               protocol::MessageType message_type, const CallOptions& options);

    void connect_locked(std::chrono::milliseconds timeout);
    void disconnect_locked();
    void apply_timeout_locked(std::chrono::milliseconds timeout);

    const std::string host_;
    const int port_;
    const std::chrono::milliseconds default_timeout_;
    const uint64_t sender_id_;

    mutable std::mutex mutex_;
    int socket_fd_;
    bool connected_;
};

} // namespace graphlink

#endif // GRAPHLINK_SOCKET_CONNECTION_H
