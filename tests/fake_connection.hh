#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "client/connection.hh"

namespace graphlink {
namespace test {

// Shared, thread-safe record of which connection served each call.
class CallLog {
public:
    void record(int id) {
        std::lock_guard<std::mutex> lock(mutex_);
        ids_.push_back(id);
    }
    std::vector<int> ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ids_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<int> ids_;
};

/**
 * In-memory Connection. By default every query answers with a context for
 * `start_ts` carrying one fresh key/pred and hash "h<n>"; failures and custom
 * answers are scripted per call kind.
 */
class FakeConnection : public Connection {
public:
    explicit FakeConnection(int id = 0, std::shared_ptr<CallLog> log = nullptr)
        : id_(id), log_(std::move(log)) {}

    // scripting
    uint64_t start_ts = 7;
    std::optional<StatusCode> query_failure;
    std::optional<StatusCode> commit_failure;
    std::optional<StatusCode> admin_failure;
    std::function<protocol::Response(const protocol::Request&)> query_handler;
    std::string version_tag = "v1.0.0";
    std::chrono::milliseconds commit_delay{0};

    protocol::Response query(const protocol::Request& request, const CallOptions&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        note();
        queries_.push_back(request);
        if (query_failure) {
            throw RpcError(*query_failure, "scripted query failure");
        }
        if (query_handler) {
            return query_handler(request);
        }
        const size_t n = queries_.size();
        protocol::Response response;
        response.set_json("{\"n\":" + std::to_string(n) + "}");
        auto* txn = response.mutable_txn();
        txn->set_start_ts(start_ts);
        txn->set_hash("h" + std::to_string(n));
        txn->add_keys("k" + std::to_string(n));
        txn->add_preds("p" + std::to_string(n));
        return response;
    }

    protocol::TxnContext commit_or_abort(const protocol::TxnContext& context,
                                         const CallOptions&) override {
        if (commit_delay.count() > 0) {
            std::this_thread::sleep_for(commit_delay);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        note();
        commits_.push_back(context);
        if (commit_failure) {
            throw RpcError(*commit_failure, "scripted commit failure");
        }
        protocol::TxnContext response = context;
        if (!context.aborted()) {
            response.set_commit_ts(context.start_ts() + 1);
        }
        return response;
    }

    protocol::Payload alter(const protocol::Operation& operation, const CallOptions&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        note();
        alters_.push_back(operation);
        if (admin_failure) {
            throw RpcError(*admin_failure, "scripted alter failure");
        }
        return protocol::Payload();
    }

    protocol::Version check_version(const CallOptions&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        note();
        ++version_checks_;
        if (admin_failure) {
            throw RpcError(*admin_failure, "scripted check_version failure");
        }
        protocol::Version version;
        version.set_tag(version_tag);
        return version;
    }

    protocol::Response login(const protocol::LoginRequest& request, const CallOptions&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        note();
        logins_.push_back(request);
        if (admin_failure) {
            throw RpcError(*admin_failure, "scripted login failure");
        }
        return protocol::Response();
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++closes_;
    }

    std::vector<protocol::Request> queries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queries_;
    }
    std::vector<protocol::TxnContext> commits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commits_;
    }
    std::vector<protocol::Operation> alters() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return alters_;
    }
    std::vector<protocol::LoginRequest> logins() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return logins_;
    }
    int version_checks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return version_checks_;
    }
    int closes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closes_;
    }
    size_t remote_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queries_.size() + commits_.size() + alters_.size() + logins_.size() +
               static_cast<size_t>(version_checks_);
    }

private:
    void note() {
        if (log_) log_->record(id_);
    }

    const int id_;
    std::shared_ptr<CallLog> log_;

    mutable std::mutex mutex_;
    std::vector<protocol::Request> queries_;
    std::vector<protocol::TxnContext> commits_;
    std::vector<protocol::Operation> alters_;
    std::vector<protocol::LoginRequest> logins_;
    int version_checks_ = 0;
    int closes_ = 0;
};

} // namespace test
} // namespace graphlink
