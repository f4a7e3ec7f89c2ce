#pragma once

#include "batch_context.hpp"
#include "completion_exceptions.hpp"
#include "future.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <folly/CancellationToken.h>

namespace xdsync {

namespace detail {

// Shared between a completion_group and every completion handed out by it.
// Acknowledgments may arrive on any thread; all access goes through the mutex.
struct completion_group_state {
    std::mutex mutex;
    std::size_t registered{0};
    std::size_t pending{0};
    bool sealed{false};
    bool resolved{false};
    Promise<void> promise;
    
    // First resolution wins; later ones are no-ops
    auto resolve_locked(std::exception_ptr error) -> void {
        if (resolved) {
            return;
        }
        resolved = true;
        if (error) {
            promise.setException(error);
        } else {
            promise.setValue();
        }
    }
};

} // namespace detail

/**
 * @brief One pending acknowledgment registered with a completion_group
 *
 * Completed by the push channel when the data plane acknowledges or rejects
 * the associated resource. Only the first call to complete() has any effect.
 */
class completion {
public:
    completion(std::shared_ptr<detail::completion_group_state> state, std::string label)
        : _state(std::move(state))
        , _label(std::move(label)) {}
    
    completion(const completion&) = delete;
    completion& operator=(const completion&) = delete;
    
    // Returns false if this completion had already been completed
    auto complete(std::exception_ptr error = nullptr) -> bool {
        if (_completed.exchange(true)) {
            return false;
        }
        
        std::lock_guard<std::mutex> lock(_state->mutex);
        --_state->pending;
        if (error) {
            _state->resolve_locked(error);
        } else if (_state->sealed && _state->pending == 0) {
            _state->resolve_locked(nullptr);
        }
        return true;
    }
    
    [[nodiscard]] auto is_completed() const -> bool { return _completed.load(); }
    [[nodiscard]] auto label() const -> const std::string& { return _label; }

private:
    std::shared_ptr<detail::completion_group_state> _state;
    std::string _label;
    std::atomic<bool> _completed{false};
};

/**
 * @brief Acknowledgment barrier for one ordering phase of a batch
 *
 * Pushes register themselves with add_completion() while the phase is being
 * issued. await() then blocks until every registered completion succeeded,
 * the first failure was reported, the context deadline passed, or the context
 * was cancelled. A group with no registrations resolves immediately.
 *
 * The outcome is remembered: awaiting again returns (or rethrows) the same
 * result without waiting.
 */
class completion_group {
public:
    explicit completion_group(std::string purpose)
        : _state(std::make_shared<detail::completion_group_state>())
        , _future(_state->promise.getFuture())
        , _purpose(std::move(purpose)) {}
    
    completion_group(completion_group&&) = default;
    completion_group& operator=(completion_group&&) = default;
    completion_group(const completion_group&) = delete;
    completion_group& operator=(const completion_group&) = delete;
    
    /**
     * @brief Register one more pending acknowledgment
     *
     * @param label Identifies the resource for diagnostics
     * @throws std::logic_error if the group is already being awaited
     */
    auto add_completion(std::string label = {}) -> std::shared_ptr<completion> {
        std::lock_guard<std::mutex> lock(_state->mutex);
        if (_state->sealed) {
            throw std::logic_error("completion_group '" + _purpose + "' is sealed");
        }
        ++_state->registered;
        ++_state->pending;
        return std::make_shared<completion>(_state, std::move(label));
    }
    
    /**
     * @brief Block until the barrier resolves
     *
     * @throws push_rejected_exception (or whatever the push channel reported) on the first failure
     * @throws push_timeout_exception if the context deadline passes first
     * @throws cancelled_exception if the context is cancelled first
     */
    auto await(const batch_context& ctx) -> void {
        if (!_outcome.has_value()) {
            _outcome = wait_for_outcome(ctx);
        }
        if (*_outcome) {
            std::rethrow_exception(*_outcome);
        }
    }
    
    [[nodiscard]] auto get_registered_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(_state->mutex);
        return _state->registered;
    }
    
    [[nodiscard]] auto get_pending_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(_state->mutex);
        return _state->pending;
    }
    
    [[nodiscard]] auto is_resolved() const -> bool {
        std::lock_guard<std::mutex> lock(_state->mutex);
        return _state->resolved;
    }
    
    [[nodiscard]] auto purpose() const -> const std::string& { return _purpose; }

private:
    auto wait_for_outcome(const batch_context& ctx) -> std::exception_ptr {
        {
            std::lock_guard<std::mutex> lock(_state->mutex);
            _state->sealed = true;
            if (_state->pending == 0) {
                _state->resolve_locked(nullptr);
            }
        }
        
        // Runs inline if the context is already cancelled
        folly::CancellationCallback on_cancel(
            ctx.get_cancellation_token(),
            [state = _state, ctx]() {
                auto error = std::make_exception_ptr(cancelled_exception(ctx.get_cancellation_reason()));
                std::lock_guard<std::mutex> lock(state->mutex);
                state->resolve_locked(error);
            });
        
        auto started = std::chrono::steady_clock::now();
        if (!_future.wait(ctx.remaining())) {
            auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            std::lock_guard<std::mutex> lock(_state->mutex);
            _state->resolve_locked(std::make_exception_ptr(
                push_timeout_exception(_state->pending, waited)));
        }
        
        try {
            _future.get();
        } catch (const std::exception&) {
            return std::current_exception();
        }
        return nullptr;
    }
    
    std::shared_ptr<detail::completion_group_state> _state;
    Future<void> _future;
    std::string _purpose;
    std::optional<std::exception_ptr> _outcome;
};

} // namespace xdsync
