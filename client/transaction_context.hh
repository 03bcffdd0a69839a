#pragma once

#include "../common/result.hh"

#include "graphlink.pb.h"

namespace graphlink {

/**
 * @brief
 * Merge the context returned by the server into the transaction's own.
 *
 * The first merge fixes start_ts; every later merge must carry the same
 * start_ts or kStartTsMismatch is returned and local is left untouched.
 * hash is replaced by the latest value, keys and preds accumulate.
 * A null remote (no context in the response) is a no-op.
 */
Result<void> merge_context(protocol::TxnContext& local, const protocol::TxnContext* remote);

} // namespace graphlink
