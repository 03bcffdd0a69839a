#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace graphlink {

// Shared cancellation flag. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { cancelled_->store(true, std::memory_order_release); }
    bool is_cancelled() const { return cancelled_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

// Per-call settings. An unset timeout falls back to the connection default.
struct CallOptions {
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<CancellationToken> cancellation;

    static CallOptions with_timeout(std::chrono::milliseconds t) {
        CallOptions options;
        options.timeout = t;
        return options;
    }
};

} // namespace graphlink
