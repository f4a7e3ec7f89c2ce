#pragma once

#include "batch_context.hpp"
#include "completion.hpp"
#include "logger.hpp"
#include "metrics.hpp"
#include "push_channel.hpp"
#include "reconciliation_plan.hpp"
#include "resource_set.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace xdsync {

// Progress of one batch through the reconciler
enum class batch_state : std::uint8_t {
    pending,
    deletes_issued,
    awaiting_delete_barrier,
    adds_issued,
    awaiting_cluster_barrier,
    awaiting_listener_barrier,
    committed,
    rolling_back,
    rolled_back
};

[[nodiscard]] inline auto batch_state_to_string(batch_state state) -> std::string_view {
    switch (state) {
        case batch_state::pending:                   return "pending";
        case batch_state::deletes_issued:            return "deletes_issued";
        case batch_state::awaiting_delete_barrier:   return "awaiting_delete_barrier";
        case batch_state::adds_issued:               return "adds_issued";
        case batch_state::awaiting_cluster_barrier:  return "awaiting_cluster_barrier";
        case batch_state::awaiting_listener_barrier: return "awaiting_listener_barrier";
        case batch_state::committed:                 return "committed";
        case batch_state::rolling_back:              return "rolling_back";
        case batch_state::rolled_back:               return "rolled_back";
    }
    return "unknown";
}

inline auto operator<<(std::ostream& os, batch_state state) -> std::ostream& {
    return os << batch_state_to_string(state);
}

namespace detail {

// Listener names the data plane answered for in one way during one batch.
// Written from acknowledgment threads.
class listener_ledger {
public:
    auto record(const std::string& listener_name) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _names.insert(listener_name);
    }

    [[nodiscard]] auto contains(const std::string& listener_name) const -> bool {
        std::lock_guard<std::mutex> lock(_mutex);
        return _names.contains(listener_name);
    }

private:
    mutable std::mutex _mutex;
    std::set<std::string> _names;
};

} // namespace detail

/**
 * @brief Drives the data plane from one resource set to another with
 * all-or-nothing semantics
 *
 * Deletions are issued first (listener, route, cluster, endpoint, secret),
 * then additions (secret, endpoint, cluster, route, listener). Only listener
 * changes, and cluster pushes that precede listener pushes, are awaited:
 * other resources may legitimately never be acknowledged when nothing refers
 * to them.
 *
 * Every push and delete contributes an undo action. If any awaited barrier
 * fails, the undo actions are applied newest first and the error is rethrown.
 *
 * Batches are serialized; the resource sets passed in are only used for the
 * duration of the call and their port callbacks are consumed by it.
 *
 * @tparam PushChannel Delivers changes to the data plane
 * @tparam Logger Diagnostic logger
 * @tparam Metrics Metrics sink
 */
template<
    typename PushChannel,
    typename Logger,
    typename Metrics = noop_metrics
>
requires
    push_channel<PushChannel> &&
    diagnostic_logger<Logger> &&
    metrics<Metrics>
class reconciler {
public:
    reconciler(PushChannel channel, Logger logger, Metrics metrics = Metrics{});

    reconciler(const reconciler&) = delete;
    reconciler& operator=(const reconciler&) = delete;

    /**
     * @brief Push every resource of a set
     *
     * @throws barrier_exception subclasses after rolling back
     */
    auto install(const batch_context& ctx, resource_set& set) -> void;

    /**
     * @brief Move from old_set to new_set
     *
     * Resources only in old_set are deleted, every resource in new_set is pushed.
     * A listener whose port changes is deleted and re-added, and its deletion
     * is acknowledged before anything is added.
     *
     * @throws barrier_exception subclasses after rolling back
     */
    auto update(const batch_context& ctx, resource_set& old_set, resource_set& new_set) -> void;

    /**
     * @brief Delete every resource of a set
     *
     * @throws barrier_exception subclasses after rolling back
     */
    auto uninstall(const batch_context& ctx, resource_set& set) -> void;

    [[nodiscard]] auto get_last_batch_state() const -> batch_state;

    [[nodiscard]] auto get_push_channel() -> PushChannel& { return _channel; }

private:
    auto execute(
        std::string_view operation,
        const batch_context& ctx,
        const reconciliation_plan& plan,
        resource_set& old_set,
        resource_set& new_set
    ) -> void;

    auto issue_deletes(
        const reconciliation_plan& plan,
        completion_group* listener_barrier,
        const std::shared_ptr<detail::listener_ledger>& acknowledged,
        revert_func_list& reverts
    ) -> void;

    auto issue_adds(
        std::string_view operation,
        const resource_set& new_set,
        const batch_context& ctx,
        completion_group* cluster_barrier,
        completion_group* listener_barrier,
        const std::shared_ptr<detail::listener_ledger>& rejected,
        revert_func_list& reverts
    ) -> void;

    auto await_barrier(std::string_view operation, completion_group& group, const batch_context& ctx) -> void;

    auto release_acknowledged_deletions(
        const batch_context& ctx,
        const reconciliation_plan& plan,
        resource_set& old_set,
        const detail::listener_ledger& acknowledged
    ) -> void;

    auto invoke_port_callback(
        const std::string& listener_name,
        const port_callback& callback,
        const batch_context& ctx,
        std::exception_ptr error
    ) -> void;

    auto transition(std::string_view operation, batch_state next) -> void;

    auto emit_outcome(std::string_view metric_name, std::string_view operation) -> void;

    PushChannel _channel;
    Logger _logger;
    Metrics _metrics;

    std::mutex _batch_mutex;
    std::atomic<batch_state> _last_state{batch_state::pending};
};

// ============================================================================
// Implementation
// ============================================================================

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
reconciler<PushChannel, Logger, Metrics>::reconciler(PushChannel channel, Logger logger, Metrics metrics)
    : _channel{std::move(channel)}
    , _logger{std::move(logger)}
    , _metrics{std::move(metrics)}
{
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::install(const batch_context& ctx, resource_set& set) -> void {
    resource_set nothing;
    auto plan = plan_reconciliation(nothing, set);
    execute("install", ctx, plan, nothing, set);
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::update(
    const batch_context& ctx,
    resource_set& old_set,
    resource_set& new_set
) -> void {
    auto plan = plan_reconciliation(old_set, new_set);

    // A retained listener's lease was committed when it was first pushed
    for (const auto& name : plan._retained_listeners) {
        new_set._port_callbacks.drop(name);
    }

    for (const auto& replacement : plan._replaced_listeners) {
        _logger.debug("Listener port changing", {
            {"listener", replacement._name},
            {"old_port", std::to_string(replacement._old_port)},
            {"new_port", std::to_string(replacement._new_port)}
        });
    }

    execute("update", ctx, plan, old_set, new_set);
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::uninstall(const batch_context& ctx, resource_set& set) -> void {
    resource_set nothing;
    auto plan = plan_reconciliation(set, nothing);
    execute("uninstall", ctx, plan, set, nothing);
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::get_last_batch_state() const -> batch_state {
    return _last_state.load(std::memory_order_acquire);
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::execute(
    std::string_view operation,
    const batch_context& ctx,
    const reconciliation_plan& plan,
    resource_set& old_set,
    resource_set& new_set
) -> void {
    std::lock_guard<std::mutex> batch_lock(_batch_mutex);
    _last_state.store(batch_state::pending, std::memory_order_release);

    _logger.info("Reconciling resources", {
        {"operation", operation},
        {"deletes", std::to_string(plan.delete_count())},
        {"upserts", std::to_string(new_set.size())},
        {"wait_for_delete", plan._wait_for_delete ? "true" : "false"}
    });

    // Open the barriers this batch needs
    auto has_listener_operations = !new_set._listeners.empty() || !plan._delete_listeners.empty();
    std::optional<completion_group> listener_group;
    std::optional<completion_group> delete_group;
    std::optional<completion_group> cluster_group;
    if (has_listener_operations) {
        listener_group.emplace("listener updates");
    }
    if (plan._wait_for_delete && !plan._delete_listeners.empty()) {
        delete_group.emplace("listener deletes");
    }
    if (!new_set._listeners.empty() && !new_set._clusters.empty()) {
        cluster_group.emplace("cluster updates");
    }

    auto* delete_barrier = delete_group ? &*delete_group : (listener_group ? &*listener_group : nullptr);
    auto acknowledged = std::make_shared<detail::listener_ledger>();
    auto rejected = std::make_shared<detail::listener_ledger>();
    revert_func_list reverts;

    try {
        issue_deletes(plan, delete_barrier, acknowledged, reverts);
        transition(operation, batch_state::deletes_issued);

        // A listener moving to a new port must be gone before it is re-added
        if (delete_group) {
            transition(operation, batch_state::awaiting_delete_barrier);
            await_barrier(operation, *delete_group, ctx);
            release_acknowledged_deletions(ctx, plan, old_set, *acknowledged);
        }

        issue_adds(operation, new_set, ctx,
            cluster_group ? &*cluster_group : nullptr,
            listener_group ? &*listener_group : nullptr,
            rejected,
            reverts);

        if (listener_group) {
            transition(operation, batch_state::awaiting_listener_barrier);
            await_barrier(operation, *listener_group, ctx);
        }
    } catch (const std::exception& e) {
        transition(operation, batch_state::rolling_back);
        auto error = std::current_exception();

        _logger.info("Reverting failed batch", {
            {"operation", operation},
            {"error", e.what()},
            {"reverts", std::to_string(reverts.size())}
        });

        // Deletions the data plane already acknowledged have freed their ports
        release_acknowledged_deletions(ctx, plan, old_set, *acknowledged);

        reverts.revert();

        // A lease is released only when its own listener was rejected.
        // Other leases may belong to listeners still live from an earlier batch.
        for (const auto& name : new_set._port_callbacks.names()) {
            if (!rejected->contains(name)) {
                new_set._port_callbacks.drop(name);
                continue;
            }
            if (auto callback = new_set._port_callbacks.consume(name)) {
                invoke_port_callback(name, *callback, ctx, error);
            }
        }

        transition(operation, batch_state::rolled_back);
        emit_outcome(metric_names::batch_rolled_back, operation);
        throw;
    }

    // Commit: release the ports of every deleted listener, including
    // deletions that were no-ops, then commit the new leases
    release_acknowledged_deletions(ctx, plan, old_set, *acknowledged);
    for (const auto& name : plan._delete_listeners) {
        if (auto callback = old_set._port_callbacks.consume(name)) {
            invoke_port_callback(name, *callback, ctx, nullptr);
        }
    }
    for (const auto& name : new_set._port_callbacks.names()) {
        if (auto callback = new_set._port_callbacks.consume(name)) {
            invoke_port_callback(name, *callback, ctx, nullptr);
        }
    }

    transition(operation, batch_state::committed);
    _logger.info("Reconciled resources", {{"operation", operation}});
    emit_outcome(metric_names::batch_committed, operation);
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::issue_deletes(
    const reconciliation_plan& plan,
    completion_group* listener_barrier,
    const std::shared_ptr<detail::listener_ledger>& acknowledged,
    revert_func_list& reverts
) -> void {
    for (const auto& name : plan._delete_listeners) {
        _logger.debug("Deleting listener", {{"listener", name}});
        reverts.push_back(_channel.delete_listener(name, listener_barrier,
            [acknowledged, name](std::exception_ptr error) {
                if (!error) {
                    acknowledged->record(name);
                }
            }));
    }

    // Deletions of other kinds are not awaited
    for (const auto& name : plan._delete_routes) {
        _logger.debug("Deleting route", {{"route", name}});
        reverts.push_back(_channel.delete_route(name, nullptr, nullptr));
    }
    for (const auto& name : plan._delete_clusters) {
        _logger.debug("Deleting cluster", {{"cluster", name}});
        reverts.push_back(_channel.delete_cluster(name, nullptr, nullptr));
    }
    for (const auto& name : plan._delete_endpoints) {
        _logger.debug("Deleting endpoints", {{"cluster", name}});
        reverts.push_back(_channel.delete_endpoint(name, nullptr, nullptr));
    }
    for (const auto& name : plan._delete_secrets) {
        _logger.debug("Deleting secret", {{"secret", name}});
        reverts.push_back(_channel.delete_secret(name, nullptr, nullptr));
    }
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::issue_adds(
    std::string_view operation,
    const resource_set& new_set,
    const batch_context& ctx,
    completion_group* cluster_barrier,
    completion_group* listener_barrier,
    const std::shared_ptr<detail::listener_ledger>& rejected,
    revert_func_list& reverts
) -> void {
    for (const auto& s : new_set._secrets) {
        _logger.debug("Upserting secret", {{"secret", s._name}});
        reverts.push_back(_channel.upsert_secret(s._name, s, nullptr, nullptr));
    }
    for (const auto& cla : new_set._endpoints) {
        _logger.debug("Upserting endpoints", {{"cluster", cla._cluster_name}});
        reverts.push_back(_channel.upsert_endpoint(cla._cluster_name, cla, nullptr, nullptr));
    }
    for (const auto& c : new_set._clusters) {
        _logger.debug("Upserting cluster", {{"cluster", c._name}});
        reverts.push_back(_channel.upsert_cluster(c._name, c, cluster_barrier, nullptr));
    }
    for (const auto& rc : new_set._routes) {
        _logger.debug("Upserting route", {{"route", rc._name}});
        reverts.push_back(_channel.upsert_route(rc._name, rc, nullptr, nullptr));
    }
    transition(operation, batch_state::adds_issued);

    // A listener may refer to the clusters above, which must be accepted first
    if (cluster_barrier != nullptr) {
        transition(operation, batch_state::awaiting_cluster_barrier);
        await_barrier(operation, *cluster_barrier, ctx);
    }

    for (const auto& l : new_set._listeners) {
        _logger.debug("Upserting listener", {{"listener", l._name}});
        reverts.push_back(_channel.upsert_listener(l._name, l, listener_barrier,
            [rejected, name = l._name](std::exception_ptr error) {
                if (error) {
                    rejected->record(name);
                }
            }));
    }
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::await_barrier(
    std::string_view operation,
    completion_group& group,
    const batch_context& ctx
) -> void {
    _logger.debug("Waiting for acknowledgments", {
        {"operation", operation},
        {"barrier", group.purpose()},
        {"pending", std::to_string(group.get_pending_count())}
    });

    auto started = std::chrono::steady_clock::now();
    std::exception_ptr failure;
    try {
        group.await(ctx);
    } catch (const std::exception&) {
        failure = std::current_exception();
    }
    auto waited = std::chrono::steady_clock::now() - started;

    _logger.debug("Barrier resolved", {
        {"operation", operation},
        {"barrier", group.purpose()},
        {"wait_ms", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(waited).count())},
        {"outcome", failure ? "failed" : "acknowledged"}
    });

    // Emit metrics
    auto metric = _metrics;
    metric.set_metric_name(metric_names::barrier_wait);
    metric.add_dimension(metric_names::barrier_dimension, group.purpose());
    metric.add_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(waited));
    metric.emit();

    if (failure) {
        std::rethrow_exception(failure);
    }
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::release_acknowledged_deletions(
    const batch_context& ctx,
    const reconciliation_plan& plan,
    resource_set& old_set,
    const detail::listener_ledger& acknowledged
) -> void {
    for (const auto& name : plan._delete_listeners) {
        if (!acknowledged.contains(name)) {
            continue;
        }
        if (auto callback = old_set._port_callbacks.consume(name)) {
            invoke_port_callback(name, *callback, ctx, nullptr);
        }
    }
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::invoke_port_callback(
    const std::string& listener_name,
    const port_callback& callback,
    const batch_context& ctx,
    std::exception_ptr error
) -> void {
    try {
        callback(ctx, error);
    } catch (const std::exception& e) {
        _logger.warning("Failure in port allocation callback", {
            {"listener", listener_name},
            {"error", e.what()}
        });
    }
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::transition(std::string_view operation, batch_state next) -> void {
    auto previous = _last_state.exchange(next, std::memory_order_acq_rel);
    _logger.debug("Batch state transition", {
        {"operation", operation},
        {"from", batch_state_to_string(previous)},
        {"to", batch_state_to_string(next)}
    });
}

template<typename PushChannel, typename Logger, typename Metrics>
requires push_channel<PushChannel> && diagnostic_logger<Logger> && metrics<Metrics>
auto reconciler<PushChannel, Logger, Metrics>::emit_outcome(std::string_view metric_name, std::string_view operation) -> void {
    auto metric = _metrics;
    metric.set_metric_name(metric_name);
    metric.add_dimension(metric_names::operation_dimension, operation);
    metric.add_one();
    metric.emit();
}

} // namespace xdsync
