#include "rpc_error.hh"

namespace graphlink {

RpcError::RpcError(StatusCode code, const std::string& message)
    : std::runtime_error(std::string(StatusCodeToString(code)) + ": " + message),
      code_(code) {}

Error RpcError::to_error() const {
    return Error{ErrorCode::kTransport, what(), code_};
}

ObjectDisposedError::ObjectDisposedError(const std::string& object_name)
    : std::logic_error(object_name + " has already been disposed") {}

} // namespace graphlink
