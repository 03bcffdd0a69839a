#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace graphlink {

// Status codes a remote call can fail with. Values follow the gRPC
// numbering so servers can report them unchanged.
enum class StatusCode : int {
    kOk = 0,
    kCancelled = 1,
    kUnknown = 2,
    kInvalidArgument = 3,
    kDeadlineExceeded = 4,
    kNotFound = 5,
    kAlreadyExists = 6,
    kPermissionDenied = 7,
    kResourceExhausted = 8,
    kFailedPrecondition = 9,
    kAborted = 10,
    kOutOfRange = 11,
    kUnimplemented = 12,
    kInternal = 13,
    kUnavailable = 14,
    kDataLoss = 15,
    kUnauthenticated = 16,
};

const char* StatusCodeToString(StatusCode code);

enum class ErrorCode {
    kTransport,             // the remote call itself failed
    kTransactionNotOk,      // transaction already committed, aborted or in error
    kStartTsMismatch,       // server context belongs to another transaction
    kObjectDisposed,        // used after release/dispose
    kReadOnlyTransaction,   // mutate/commit on a read-only handle
};

const char* ErrorCodeToString(ErrorCode code);

struct Error {
    ErrorCode code;
    std::string message;
    // Only meaningful for kTransport.
    StatusCode rpc_status = StatusCode::kOk;

    std::string to_string() const;
};

Error TransactionNotOk(const std::string& state);
Error StartTsMismatch();
Error ObjectDisposed(const std::string& object_name);
Error ReadOnlyTransaction();

/**
 * @brief
 * Outcome of a fallible operation: an optional value plus the errors that
 * occurred. A result is failed as soon as it carries one error, even when a
 * value is present (a mutation whose context could not be merged keeps its
 * response for inspection).
 */
template <typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result fail(Error error) {
        Result r;
        r.errors_.push_back(std::move(error));
        return r;
    }

    static Result fail(std::vector<Error> errors) {
        Result r;
        r.errors_ = std::move(errors);
        return r;
    }

    Result& with_errors(const std::vector<Error>& errors) {
        errors_.insert(errors_.end(), errors.begin(), errors.end());
        return *this;
    }

    bool is_ok() const { return errors_.empty(); }
    bool is_failed() const { return !errors_.empty(); }
    bool has_value() const { return value_.has_value(); }

    const T& value() const {
        if (!value_) throw std::logic_error("Result has no value: " + describe());
        return *value_;
    }

    T& value() {
        if (!value_) throw std::logic_error("Result has no value: " + describe());
        return *value_;
    }

    const std::vector<Error>& errors() const { return errors_; }

    // First error; only valid on a failed result.
    const Error& error() const {
        if (errors_.empty()) throw std::logic_error("Result has no error");
        return errors_.front();
    }

    std::string describe() const {
        std::string out;
        for (const auto& e : errors_) {
            if (!out.empty()) out += "; ";
            out += e.to_string();
        }
        return out.empty() ? "ok" : out;
    }

private:
    Result() = default;

    std::optional<T> value_;
    std::vector<Error> errors_;
};

template <>
class Result<void> {
public:
    static Result ok() { return Result(); }

    static Result fail(Error error) {
        Result r;
        r.errors_.push_back(std::move(error));
        return r;
    }

    static Result fail(std::vector<Error> errors) {
        Result r;
        r.errors_ = std::move(errors);
        return r;
    }

    bool is_ok() const { return errors_.empty(); }
    bool is_failed() const { return !errors_.empty(); }

    const std::vector<Error>& errors() const { return errors_; }

    const Error& error() const {
        if (errors_.empty()) throw std::logic_error("Result has no error");
        return errors_.front();
    }

    std::string describe() const {
        std::string out;
        for (const auto& e : errors_) {
            if (!out.empty()) out += "; ";
            out += e.to_string();
        }
        return out.empty() ? "ok" : out;
    }

private:
    Result() = default;

    std::vector<Error> errors_;
};

} // namespace graphlink
