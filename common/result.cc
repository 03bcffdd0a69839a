#include "result.hh"

namespace graphlink {

const char* StatusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::kOk: return "OK";
        case StatusCode::kCancelled: return "CANCELLED";
        case StatusCode::kUnknown: return "UNKNOWN";
        case StatusCode::kInvalidArgument: return "INVALID_ARGUMENT";
        case StatusCode::kDeadlineExceeded: return "DEADLINE_EXCEEDED";
        case StatusCode::kNotFound: return "NOT_FOUND";
        case StatusCode::kAlreadyExists: return "ALREADY_EXISTS";
        case StatusCode::kPermissionDenied: return "PERMISSION_DENIED";
        case StatusCode::kResourceExhausted: return "RESOURCE_EXHAUSTED";
        case StatusCode::kFailedPrecondition: return "FAILED_PRECONDITION";
        case StatusCode::kAborted: return "ABORTED";
        case StatusCode::kOutOfRange: return "OUT_OF_RANGE";
        case StatusCode::kUnimplemented: return "UNIMPLEMENTED";
        case StatusCode::kInternal: return "INTERNAL";
        case StatusCode::kUnavailable: return "UNAVAILABLE";
        case StatusCode::kDataLoss: return "DATA_LOSS";
        case StatusCode::kUnauthenticated: return "UNAUTHENTICATED";
        default: return "UNKNOWN";
    }
}

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kTransport: return "Transport";
        case ErrorCode::kTransactionNotOk: return "TransactionNotOK";
        case ErrorCode::kStartTsMismatch: return "StartTsMismatch";
        case ErrorCode::kObjectDisposed: return "ObjectDisposed";
        case ErrorCode::kReadOnlyTransaction: return "ReadOnlyTransaction";
        default: return "Unknown";
    }
}

std::string Error::to_string() const {
    std::string out = ErrorCodeToString(code);
    if (code == ErrorCode::kTransport) {
        out += "(";
        out += StatusCodeToString(rpc_status);
        out += ")";
    }
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

Error TransactionNotOk(const std::string& state) {
    return Error{ErrorCode::kTransactionNotOk,
                 "Transaction is in state " + state + " and can't be used",
                 StatusCode::kOk};
}

Error StartTsMismatch() {
    return Error{ErrorCode::kStartTsMismatch,
                 "StartTs mismatch between transaction and server response",
                 StatusCode::kOk};
}

Error ObjectDisposed(const std::string& object_name) {
    return Error{ErrorCode::kObjectDisposed,
                 object_name + " has already been disposed",
                 StatusCode::kOk};
}

Error ReadOnlyTransaction() {
    return Error{ErrorCode::kReadOnlyTransaction,
                 "Read-only transactions can't mutate or commit",
                 StatusCode::kOk};
}

} // namespace graphlink
