#pragma once

#include <stdexcept>
#include <string>

#include "../common/result.hh"

namespace graphlink {

// Raised by a Connection when the remote call fails. Never crosses the
// public API: Client::execute converts it into a kTransport Error.
class RpcError : public std::runtime_error {
public:
    RpcError(StatusCode code, const std::string& message);

    StatusCode code() const { return code_; }
    Error to_error() const;

private:
    StatusCode code_;
};

// Raised by Client::execute after dispose(). Public entry points check for
// disposal first, so this only surfaces through a dispose race.
class ObjectDisposedError : public std::logic_error {
public:
    explicit ObjectDisposedError(const std::string& object_name);
};

} // namespace graphlink
