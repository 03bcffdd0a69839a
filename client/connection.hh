#pragma once

#include "call_options.hh"
#include "rpc_error.hh"

#include "graphlink.pb.h"

namespace graphlink {

/**
 * @brief
 * One backend endpoint. Every call either returns the server's response or
 * throws RpcError; server-side rejections (e.g. a commit conflict) are
 * RpcErrors too. Implementations must allow concurrent calls from many
 * transactions.
 */
class Connection {
public:
    virtual ~Connection() = default;

    virtual protocol::Response query(const protocol::Request& request,
                                     const CallOptions& options) = 0;
    virtual protocol::TxnContext commit_or_abort(const protocol::TxnContext& context,
                                                 const CallOptions& options) = 0;
    virtual protocol::Payload alter(const protocol::Operation& operation,
                                    const CallOptions& options) = 0;
    virtual protocol::Version check_version(const CallOptions& options) = 0;
    virtual protocol::Response login(const protocol::LoginRequest& request,
                                     const CallOptions& options) = 0;

    // Release the underlying transport. Calls after close() may reconnect.
    virtual void close() {}
};

} // namespace graphlink
