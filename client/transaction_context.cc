#include "transaction_context.hh"
#include "../common/log.h"

namespace graphlink {

Result<void> merge_context(protocol::TxnContext& local, const protocol::TxnContext* remote) {
    if (remote == nullptr) {
        return Result<void>::ok();
    }

    if (local.start_ts() == 0) {
        local.set_start_ts(remote->start_ts());
    } else if (local.start_ts() != remote->start_ts()) {
        GRAPHLINK_LOG_ERROR("start_ts mismatch: transaction has %lu, server returned %lu",
                            static_cast<unsigned long>(local.start_ts()),
                            static_cast<unsigned long>(remote->start_ts()));
        return Result<void>::fail(StartTsMismatch());
    }

    local.set_hash(remote->hash());

    for (const auto& key : remote->keys()) {
        local.add_keys(key);
    }
    for (const auto& pred : remote->preds()) {
        local.add_preds(pred);
    }

    return Result<void>::ok();
}

} // namespace graphlink
