#pragma once

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <folly/CancellationToken.h>

namespace xdsync {

/**
 * @brief Cancellable, deadline-bearing context governing one batch operation
 *
 * Copies share the same cancellation state. Cancelling unblocks every pending
 * barrier await with a cancelled_exception; it does not undo anything by itself.
 */
class batch_context {
public:
    using clock = std::chrono::steady_clock;
    
    explicit batch_context(std::chrono::milliseconds timeout)
        : _deadline(clock::now() + timeout)
        , _timeout(timeout)
        , _reason(std::make_shared<cancellation_reason>()) {}
    
    auto cancel(const std::string& reason = "context cancelled") -> void {
        {
            std::lock_guard<std::mutex> lock(_reason->mutex);
            if (_reason->text.empty()) {
                _reason->text = reason;
            }
        }
        _source.requestCancellation();
    }
    
    [[nodiscard]] auto is_cancelled() const -> bool {
        return _source.isCancellationRequested();
    }
    
    [[nodiscard]] auto get_cancellation_reason() const -> std::string {
        std::lock_guard<std::mutex> lock(_reason->mutex);
        return _reason->text;
    }
    
    [[nodiscard]] auto get_cancellation_token() const -> folly::CancellationToken {
        return _source.getToken();
    }
    
    [[nodiscard]] auto deadline() const -> clock::time_point { return _deadline; }
    [[nodiscard]] auto timeout() const -> std::chrono::milliseconds { return _timeout; }
    
    // Time left until the deadline, never negative
    [[nodiscard]] auto remaining() const -> std::chrono::milliseconds {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(_deadline - clock::now());
        return std::max(left, std::chrono::milliseconds{0});
    }

private:
    struct cancellation_reason {
        std::mutex mutex;
        std::string text;
    };
    
    folly::CancellationSource _source;
    clock::time_point _deadline;
    std::chrono::milliseconds _timeout;
    std::shared_ptr<cancellation_reason> _reason;
};

} // namespace xdsync
