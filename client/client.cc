#include <exception>
#include <stdexcept>
#include <thread>

#include "client.hh"
#include "socket_connection.hh"
#include "transaction.hh"
#include "../common/log.h"

namespace graphlink {

Client::Client(std::vector<std::shared_ptr<Connection>> connections, bool close_connections)
    : connections_(std::move(connections)), close_connections_(close_connections) {
    if (connections_.empty()) {
        throw std::invalid_argument("Client needs at least one connection");
    }
    for (const auto& connection : connections_) {
        if (!connection) {
            throw std::invalid_argument("Client connections must not be null");
        }
    }
    GRAPHLINK_LOG_INFO("Client(%p): created with %zu connection(s)",
                       static_cast<const void*>(this), connections_.size());
}

Client::~Client() {
    {
        std::unique_lock<std::mutex> lock(background_mutex_);
        if (background_tasks_ > 0) {
            GRAPHLINK_LOG_DEBUG("Client(%p): waiting for %zu background discard(s)",
                                static_cast<const void*>(this), background_tasks_);
        }
        background_cv_.wait(lock, [this] { return background_tasks_ == 0; });
    }
    dispose();
}

std::unique_ptr<Client> Client::connect(const ClientConfig& config) {
    if (config.endpoints.empty()) {
        throw std::invalid_argument("ClientConfig has no endpoints");
    }
    std::vector<std::shared_ptr<Connection>> connections;
    connections.reserve(config.endpoints.size());
    for (const auto& endpoint : config.endpoints) {
        connections.push_back(std::make_shared<SocketConnection>(
            endpoint.host, endpoint.port, config.default_timeout));
    }
    return std::unique_ptr<Client>(new Client(std::move(connections), true));
}

//
// ------------------------------------------------------
//              Transactions
// ------------------------------------------------------
//

std::unique_ptr<Transaction> Client::new_transaction() {
    if (is_disposed()) {
        throw ObjectDisposedError("Client");
    }
    return std::unique_ptr<Transaction>(new Transaction(this, false, false));
}

std::unique_ptr<Transaction> Client::new_read_only_transaction(bool best_effort) {
    if (is_disposed()) {
        throw ObjectDisposedError("Client");
    }
    return std::unique_ptr<Transaction>(new Transaction(this, true, best_effort));
}

//
// ------------------------------------------------------
//              Execution
// ------------------------------------------------------
//

size_t Client::next_connection() {
    // Relaxed is enough: only range matters, not fairness.
    return next_connection_.fetch_add(1, std::memory_order_relaxed) % connections_.size();
}

Result<void> Client::alter(const protocol::Operation& operation, const CallOptions& options) {
    if (is_disposed()) {
        return Result<void>::fail(ObjectDisposed("Client"));
    }
    return execute(
        [&](Connection& connection) {
            connection.alter(operation, options);
            return Result<void>::ok();
        },
        [](const RpcError& e) {
            GRAPHLINK_LOG_WARNING("alter failed: %s", e.what());
            return Result<void>::fail(e.to_error());
        });
}

Result<std::string> Client::check_version(const CallOptions& options) {
    if (is_disposed()) {
        return Result<std::string>::fail(ObjectDisposed("Client"));
    }
    return execute(
        [&](Connection& connection) {
            return Result<std::string>::ok(connection.check_version(options).tag());
        },
        [](const RpcError& e) {
            GRAPHLINK_LOG_WARNING("check_version failed: %s", e.what());
            return Result<std::string>::fail(e.to_error());
        });
}

Result<void> Client::login(const protocol::LoginRequest& request, const CallOptions& options) {
    if (is_disposed()) {
        return Result<void>::fail(ObjectDisposed("Client"));
    }
    return execute(
        [&](Connection& connection) {
            connection.login(request, options);
            return Result<void>::ok();
        },
        [](const RpcError& e) {
            GRAPHLINK_LOG_WARNING("login failed: %s", e.what());
            return Result<void>::fail(e.to_error());
        });
}

void Client::run_in_background(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(background_mutex_);
        ++background_tasks_;
    }
    std::thread([this, task = std::move(task)]() {
        task();
        std::lock_guard<std::mutex> lock(background_mutex_);
        --background_tasks_;
        background_cv_.notify_all();
    }).detach();
}

std::future<Result<void>> Client::await_in_background(std::function<Result<void>()> task) {
    auto done = std::make_shared<std::promise<Result<void>>>();
    std::future<Result<void>> outcome = done->get_future();
    run_in_background([done, task = std::move(task)]() {
        try {
            done->set_value(task());
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    });
    return outcome;
}

//
// ------------------------------------------------------
//              Disposal
// ------------------------------------------------------
//

void Client::dispose() {
    if (disposed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    GRAPHLINK_LOG_INFO("Client(%p): disposed", static_cast<const void*>(this));
    if (close_connections_) {
        for (const auto& connection : connections_) {
            connection->close();
        }
    }
}

} // namespace graphlink
