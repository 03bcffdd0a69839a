#ifndef GRAPHLINK_CLIENT_H
#define GRAPHLINK_CLIENT_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "call_options.hh"
#include "client_config.hh"
#include "connection.hh"
#include "rpc_error.hh"
#include "../common/result.hh"

namespace graphlink {

class Transaction;

/**
 * @brief
 * Entry point of the driver: owns a fixed set of backend connections and
 * creates transactions over them.
 *
 * Every remote call goes through execute(), which picks the next connection
 * round-robin and converts RpcError into the caller's failure value.
 * A Client must outlive the transactions it creates.
 */
class Client {
public:
    // close_connections: close() every connection on dispose().
    explicit Client(std::vector<std::shared_ptr<Connection>> connections,
                    bool close_connections = false);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // One SocketConnection per configured endpoint, owned by the client.
    static std::unique_ptr<Client> connect(const ClientConfig& config);

    // transactions (throw ObjectDisposedError once disposed)
    std::unique_ptr<Transaction> new_transaction();
    std::unique_ptr<Transaction> new_read_only_transaction(bool best_effort = false);

    // administration
    Result<void> alter(const protocol::Operation& operation, const CallOptions& options = {});
    Result<std::string> check_version(const CallOptions& options = {});
    Result<void> login(const protocol::LoginRequest& request, const CallOptions& options = {});

    template<typename Op, typename OnFailure>
    auto execute(Op&& op, OnFailure&& on_failure) -> decltype(op(std::declval<Connection&>()));

    void dispose();
    bool is_disposed() const { return disposed_.load(std::memory_order_acquire); }
    size_t connection_count() const { return connections_.size(); }

private:
    friend class Transaction;

    size_t next_connection();

    // Runs task on a detached thread; ~Client waits for it.
    void run_in_background(std::function<void()> task);
    // Same, handing the task's outcome back through a future.
    std::future<Result<void>> await_in_background(std::function<Result<void>()> task);

    const std::vector<std::shared_ptr<Connection>> connections_;
    const bool close_connections_;

    std::atomic<size_t> next_connection_{0};
    std::atomic<bool> disposed_{false};

    std::mutex background_mutex_;
    std::condition_variable background_cv_;
    size_t background_tasks_ = 0;
};

template<typename Op, typename OnFailure>
auto Client::execute(Op&& op, OnFailure&& on_failure) -> decltype(op(std::declval<Connection&>())) {
    if (is_disposed()) {
        throw ObjectDisposedError("Client");
    }

    Connection& connection = *connections_[next_connection()];
    try {
        return op(connection);
    } catch (const RpcError& e) {
        return on_failure(e);
    }
}

} // namespace graphlink

#endif // GRAPHLINK_CLIENT_H
