#include "transaction.hh"

#include <utility>

#include "client.hh"
#include "transaction_context.hh"
#include "../common/log.h"

namespace graphlink {

const char* TransactionStateToString(TransactionState state) {
    switch (state) {
        case TransactionState::kOk: return "OK";
        case TransactionState::kCommitted: return "Committed";
        case TransactionState::kAborted: return "Aborted";
        case TransactionState::kError: return "Error";
        default: return "Unknown";
    }
}

Transaction::Transaction(Client* client, bool read_only, bool best_effort)
    : client_(client),
      read_only_(read_only),
      best_effort_(best_effort),
      state_(TransactionState::kOk),
      has_mutated_(false),
      disposed_(false) {}

Transaction::~Transaction() {
    release();
}

Result<protocol::Response> Transaction::query(const std::string& query_string,
                                              const CallOptions& options) {
    return query_with_vars(query_string, {}, options);
}

Result<protocol::Response> Transaction::query_with_vars(
    const std::string& query_string,
    const std::map<std::string, std::string>& vars,
    const CallOptions& options) {

    if (disposed_) {
        return Result<protocol::Response>::fail(ObjectDisposed("Transaction"));
    }
    if (client_->is_disposed()) {
        return Result<protocol::Response>::fail(ObjectDisposed("Client"));
    }
    if (state_ != TransactionState::kOk) {
        return Result<protocol::Response>::fail(TransactionNotOk(TransactionStateToString(state_)));
    }

    protocol::Request request;
    request.set_query(query_string);
    request.set_start_ts(context_.start_ts());
    request.set_hash(context_.hash());
    request.set_read_only(read_only_);
    request.set_best_effort(best_effort_);
    for (const auto& kv : vars) {
        (*request.mutable_vars())[kv.first] = kv.second;
    }

    auto response = send_request(request, options);

    if (response.is_failed()) {
        GRAPHLINK_LOG_DEBUG("query failed: %s", response.describe().c_str());
        return response;
    }

    const protocol::Response& payload = response.value();
    auto merged = merge_context(context_, payload.has_txn() ? &payload.txn() : nullptr);
    if (merged.is_failed()) {
        return Result<protocol::Response>::fail(merged.errors());
    }
    return response;
}

Result<protocol::Response> Transaction::mutate(const RequestBuilder& request,
                                               const CallOptions& options) {
    if (read_only_) {
        return Result<protocol::Response>::fail(ReadOnlyTransaction());
    }
    if (disposed_) {
        return Result<protocol::Response>::fail(ObjectDisposed("Transaction"));
    }
    if (client_->is_disposed()) {
        return Result<protocol::Response>::fail(ObjectDisposed("Client"));
    }
    if (state_ != TransactionState::kOk) {
        return Result<protocol::Response>::fail(TransactionNotOk(TransactionStateToString(state_)));
    }

    protocol::Request req = request.request();
    if (req.mutations_size() == 0) {
        return Result<protocol::Response>::ok(protocol::Response());
    }

    has_mutated_ = true;

    req.set_start_ts(context_.start_ts());
    req.set_hash(context_.hash());

    auto response = send_request(req, options);
    if (response.is_failed() && response.error().code == ErrorCode::kObjectDisposed) {
        return response;
    }

    if (response.is_failed()) {
        // The caller must see the mutation failure, not the discard outcome.
        auto discarded = discard();
        if (discarded.is_failed()) {
            GRAPHLINK_LOG_DEBUG("discard after failed mutation also failed: %s",
                                discarded.describe().c_str());
        }
        state_ = TransactionState::kError;  // overwrites kAborted set by discard()
        GRAPHLINK_LOG_WARNING("mutation failed, transaction is in error: %s",
                              response.describe().c_str());
        return response;
    }

    if (req.commit_now()) {
        state_ = TransactionState::kCommitted;
    }

    const protocol::Response& payload = response.value();
    auto merged = merge_context(context_, payload.has_txn() ? &payload.txn() : nullptr);
    if (merged.is_failed()) {
        // Keep the response but report the broken bookkeeping.
        return Result<protocol::Response>::ok(payload).with_errors(merged.errors());
    }
    return response;
}

Result<protocol::Response> Transaction::send_request(const protocol::Request& request,
                                                     const CallOptions& options) {
    try {
        return client_->execute(
            [&](Connection& connection) {
                return Result<protocol::Response>::ok(connection.query(request, options));
            },
            [](const RpcError& e) {
                return Result<protocol::Response>::fail(e.to_error());
            });
    } catch (const ObjectDisposedError&) {
        // client disposed between the caller's check and the call
        return Result<protocol::Response>::fail(ObjectDisposed("Client"));
    }
}

Result<protocol::Response> Transaction::mutate(const std::string& set_json,
                                               const std::string& delete_json,
                                               bool commit_now,
                                               const CallOptions& options) {
    return mutate(RequestBuilder()
                      .commit_now(commit_now)
                      .with_mutation(MutationBuilder().set_json(set_json).delete_json(delete_json)),
                  options);
}

Result<void> Transaction::commit(const CallOptions& options) {
    if (read_only_) {
        return Result<void>::fail(ReadOnlyTransaction());
    }
    if (disposed_) {
        return Result<void>::fail(ObjectDisposed("Transaction"));
    }
    if (client_->is_disposed()) {
        return Result<void>::fail(ObjectDisposed("Client"));
    }
    if (state_ != TransactionState::kOk) {
        return Result<void>::fail(TransactionNotOk(TransactionStateToString(state_)));
    }

    state_ = TransactionState::kCommitted;

    if (!has_mutated_) {
        return Result<void>::ok();
    }

    return finish(client_, context_, options);
}

Result<void> Transaction::discard(const CallOptions& options) {
    auto context = begin_discard();
    if (!context) {
        return Result<void>::ok();
    }
    return finish(client_, *context, options);
}

std::optional<protocol::TxnContext> Transaction::begin_discard() {
    // kCommitted can't be discarded, kError is only entered after a discard
    // and repeated discards of kAborted have no effect.
    if (state_ != TransactionState::kOk) {
        return std::nullopt;
    }

    state_ = TransactionState::kAborted;

    if (!has_mutated_) {
        return std::nullopt;
    }

    context_.set_aborted(true);
    return context_;
}

Result<void> Transaction::finish(Client* client, const protocol::TxnContext& context,
                                 const CallOptions& options) {
    if (client->is_disposed()) {
        return Result<void>::fail(ObjectDisposed("Client"));
    }
    try {
        return client->execute(
            [&](Connection& connection) {
                connection.commit_or_abort(context, options);
                return Result<void>::ok();
            },
            [&](const RpcError& e) {
                GRAPHLINK_LOG_WARNING("%s of start_ts=%lu failed: %s",
                                      context.aborted() ? "abort" : "commit",
                                      static_cast<unsigned long>(context.start_ts()), e.what());
                return Result<void>::fail(e.to_error());
            });
    } catch (const ObjectDisposedError&) {
        // client disposed between the check above and the call
        return Result<void>::fail(ObjectDisposed("Client"));
    }
}

//
// ------------------------------------------------------
//              Disposal
// ------------------------------------------------------
//

void Transaction::release() {
    if (disposed_.exchange(true)) {
        return;
    }

    auto context = begin_discard();
    if (!context) {
        return;
    }

    Client* client = client_;
    client->run_in_background([client, context = std::move(*context)]() {
        auto result = finish(client, context, CallOptions{});
        if (result.is_failed()) {
            GRAPHLINK_LOG_WARNING("background discard failed: %s", result.describe().c_str());
        }
    });
}

std::future<Result<void>> Transaction::release_async() {
    std::optional<protocol::TxnContext> context;
    if (!disposed_.exchange(true)) {
        context = begin_discard();
    }

    if (!context) {
        std::promise<Result<void>> done;
        done.set_value(Result<void>::ok());
        return done.get_future();
    }

    Client* client = client_;
    return client->await_in_background([client, context = std::move(*context)]() {
        return finish(client, context, CallOptions{});
    });
}

} // namespace graphlink
