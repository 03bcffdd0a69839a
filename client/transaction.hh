#ifndef GRAPHLINK_TRANSACTION_H
#define GRAPHLINK_TRANSACTION_H

#include <atomic>
#include <future>
#include <map>
#include <optional>
#include <string>

#include "call_options.hh"
#include "request_builder.hh"
#include "../common/result.hh"

#include "graphlink.pb.h"

namespace graphlink {

class Client;

enum class TransactionState {
    kOk,
    kCommitted,
    kAborted,
    kError,     // a mutation's remote call failed
};

const char* TransactionStateToString(TransactionState state);

/**
 * @brief
 * Optimistic transaction bound to one start timestamp.
 *
 * Created by Client::new_transaction() (read-write) or
 * Client::new_read_only_transaction() (read-only, optionally best-effort).
 * Read-only handles refuse mutate() and commit().
 *
 * Not thread-safe: one transaction is used by one thread at a time.
 * Destroying a transaction still in kOk discards it in the background.
 */
class Transaction {
public:
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Result<protocol::Response> query(const std::string& query_string,
                                     const CallOptions& options = {});
    Result<protocol::Response> query_with_vars(const std::string& query_string,
                                               const std::map<std::string, std::string>& vars,
                                               const CallOptions& options = {});

    Result<protocol::Response> mutate(const RequestBuilder& request,
                                      const CallOptions& options = {});
    Result<protocol::Response> mutate(const std::string& set_json,
                                      const std::string& delete_json = "",
                                      bool commit_now = false,
                                      const CallOptions& options = {});

    Result<void> commit(const CallOptions& options = {});

    // Safe to call any number of times, in any state.
    Result<void> discard(const CallOptions& options = {});

    // Fire-and-forget discard; the client finishes it on a background thread.
    void release();
    // Awaitable discard. The state changes before this returns; only the
    // remote call runs, on a thread the client waits for in ~Client.
    std::future<Result<void>> release_async();

    TransactionState state() const { return state_; }
    bool read_only() const { return read_only_; }
    bool best_effort() const { return best_effort_; }
    bool has_mutated() const { return has_mutated_; }
    const protocol::TxnContext& context() const { return context_; }

private:
    friend class Client;

    Transaction(Client* client, bool read_only, bool best_effort);

    // Moves kOk to kAborted. Returns the context to send, or nothing when
    // the server has nothing to roll back.
    std::optional<protocol::TxnContext> begin_discard();

    Result<protocol::Response> send_request(const protocol::Request& request,
                                            const CallOptions& options);

    static Result<void> finish(Client* client, const protocol::TxnContext& context,
                               const CallOptions& options);

    Client* const client_;
    const bool read_only_;
    const bool best_effort_;

    TransactionState state_;
    protocol::TxnContext context_;
    bool has_mutated_;
    std::atomic<bool> disposed_;
};

} // namespace graphlink

#endif // GRAPHLINK_TRANSACTION_H
