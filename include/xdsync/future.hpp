#pragma once

#include <chrono>
#include <exception>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <folly/futures/Future.h>
#include <folly/futures/Promise.h>
#include <folly/ExceptionWrapper.h>
#include <folly/Unit.h>

namespace xdsync {

namespace detail {

// Void/Unit type mapping so that Future<void> can be backed by folly::Future<Unit>
template<typename T>
struct void_to_unit {
    using type = T;
};

template<>
struct void_to_unit<void> {
    using type = folly::Unit;
};

template<typename T>
using void_to_unit_t = typename void_to_unit<T>::type;

} // namespace detail

template<typename T> class Future;

/**
 * @brief Promise wrapper around folly::Promise
 *
 * Move-only. Setting a value or an exception twice throws folly::PromiseAlreadySatisfied;
 * completion groups guard fulfillment with their own lock.
 *
 * @tparam T The value type (can be void)
 */
template<typename T>
class Promise {
public:
    using value_type = T;
    using folly_type = folly::Promise<detail::void_to_unit_t<T>>;

    Promise() = default;

    Promise(Promise&&) = default;
    Promise& operator=(Promise&&) = default;
    Promise(const Promise&) = delete;
    Promise& operator=(const Promise&) = delete;

    template<typename U = T>
    auto setValue(U&& value) -> void requires(!std::is_void_v<T>) {
        _folly_promise.setValue(std::forward<U>(value));
    }

    auto setValue() -> void requires(std::is_void_v<T>) {
        _folly_promise.setValue(folly::Unit{});
    }

    auto setException(std::exception_ptr ex) -> void {
        if (!ex) {
            throw std::invalid_argument("Exception pointer cannot be null");
        }
        _folly_promise.setException(folly::exception_wrapper(ex));
    }

    auto getFuture() -> Future<T> {
        return Future<T>(_folly_promise.getFuture());
    }

private:
    folly_type _folly_promise;
};

/**
 * @brief Future wrapper around folly::Future with transparent void/Unit handling
 *
 * @tparam T The value type (can be void)
 */
template<typename T>
class Future {
public:
    using value_type = T;
    using folly_type = folly::Future<detail::void_to_unit_t<T>>;

    explicit Future(folly_type ff) : _folly_future(std::move(ff)) {}

    // Blocking get; rethrows the stored exception
    auto get() -> T {
        if constexpr (std::is_void_v<T>) {
            std::move(_folly_future).get();
        } else {
            return std::move(_folly_future).get();
        }
    }

    // Blocks for at most timeout; returns whether the future became ready
    auto wait(std::chrono::milliseconds timeout) -> bool {
        return _folly_future.wait(timeout).isReady();
    }

private:
    folly_type _folly_future;
};

} // namespace xdsync
