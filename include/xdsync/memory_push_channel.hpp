#pragma once

#include "completion.hpp"
#include "completion_exceptions.hpp"
#include "push_channel.hpp"
#include "types.hpp"

#include <array>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <folly/Executor.h>

namespace xdsync {

enum class push_operation : std::uint8_t {
    upsert,
    remove
};

// What the simulated data plane does with one pushed change
enum class ack_decision : std::uint8_t {
    ack,
    reject,
    // Never answer, so the barrier can only time out or be cancelled
    drop
};

using ack_policy = std::function<ack_decision(resource_kind, const std::string&, push_operation)>;

inline auto ack_everything() -> ack_policy {
    return [](resource_kind, const std::string&, push_operation) { return ack_decision::ack; };
}

enum class push_event_type : std::uint8_t {
    dispatched,
    acked,
    rejected,
    dropped,
    reverted
};

inline auto operator<<(std::ostream& os, push_event_type type) -> std::ostream& {
    switch (type) {
        case push_event_type::dispatched: return os << "dispatched";
        case push_event_type::acked:      return os << "acked";
        case push_event_type::rejected:   return os << "rejected";
        case push_event_type::dropped:    return os << "dropped";
        case push_event_type::reverted:   return os << "reverted";
        default:                          return os << "unknown";
    }
}

struct push_event {
    std::uint64_t _sequence{0};
    push_event_type _type{push_event_type::dispatched};
    resource_kind _kind{resource_kind::listener};
    std::string _name;
    push_operation _operation{push_operation::upsert};
};

// Current resources of a channel, one map per kind indexed by resource_kind
using channel_snapshot = std::array<std::map<std::string, any_resource>, 5>;

/**
 * @brief Acking resource cache standing in for a proxy's xDS stream
 *
 * Changes take effect in the cache when issued. The answer for each change is
 * decided by the ack policy and delivered on the executor, or inline when no
 * executor is given. Upserting an identical resource and deleting an absent
 * one are no-ops: nothing is registered, dispatched or answered.
 *
 * Copies share one cache, so a test can keep a handle after moving the
 * channel into the reconciler.
 */
class memory_push_channel {
public:
    explicit memory_push_channel(
        std::shared_ptr<folly::Executor> executor = nullptr,
        ack_policy policy = ack_everything()
    )
        : _state(std::make_shared<state>())
        , _executor(std::move(executor)) {
        _state->policy = std::move(policy);
    }

    auto set_ack_policy(ack_policy policy) -> void {
        std::lock_guard<std::mutex> lock(_state->mutex);
        _state->policy = std::move(policy);
    }

    auto upsert_listener(const std::string& name, const listener& l, completion_group* group, result_callback on_result) -> revert_func {
        return upsert(name, any_resource{l}, group, std::move(on_result));
    }

    auto upsert_route(const std::string& name, const route_configuration& rc, completion_group* group, result_callback on_result) -> revert_func {
        return upsert(name, any_resource{rc}, group, std::move(on_result));
    }

    auto upsert_cluster(const std::string& name, const cluster& c, completion_group* group, result_callback on_result) -> revert_func {
        return upsert(name, any_resource{c}, group, std::move(on_result));
    }

    auto upsert_endpoint(const std::string& name, const cluster_load_assignment& cla, completion_group* group, result_callback on_result) -> revert_func {
        return upsert(name, any_resource{cla}, group, std::move(on_result));
    }

    auto upsert_secret(const std::string& name, const secret& s, completion_group* group, result_callback on_result) -> revert_func {
        return upsert(name, any_resource{s}, group, std::move(on_result));
    }

    auto delete_listener(const std::string& name, completion_group* group, result_callback on_result) -> revert_func {
        return remove(resource_kind::listener, name, group, std::move(on_result));
    }

    auto delete_route(const std::string& name, completion_group* group, result_callback on_result) -> revert_func {
        return remove(resource_kind::route, name, group, std::move(on_result));
    }

    auto delete_cluster(const std::string& name, completion_group* group, result_callback on_result) -> revert_func {
        return remove(resource_kind::cluster, name, group, std::move(on_result));
    }

    auto delete_endpoint(const std::string& name, completion_group* group, result_callback on_result) -> revert_func {
        return remove(resource_kind::endpoint, name, group, std::move(on_result));
    }

    auto delete_secret(const std::string& name, completion_group* group, result_callback on_result) -> revert_func {
        return remove(resource_kind::secret, name, group, std::move(on_result));
    }

    [[nodiscard]] auto get(resource_kind kind, const std::string& name) const -> std::optional<any_resource> {
        std::lock_guard<std::mutex> lock(_state->mutex);
        const auto& resources = _state->resources[index_of(kind)];
        auto it = resources.find(name);
        if (it == resources.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] auto contains(resource_kind kind, const std::string& name) const -> bool {
        std::lock_guard<std::mutex> lock(_state->mutex);
        return _state->resources[index_of(kind)].contains(name);
    }

    [[nodiscard]] auto count(resource_kind kind) const -> std::size_t {
        std::lock_guard<std::mutex> lock(_state->mutex);
        return _state->resources[index_of(kind)].size();
    }

    [[nodiscard]] auto snapshot() const -> channel_snapshot {
        std::lock_guard<std::mutex> lock(_state->mutex);
        return _state->resources;
    }

    [[nodiscard]] auto events() const -> std::vector<push_event> {
        std::lock_guard<std::mutex> lock(_state->mutex);
        return _state->events;
    }

    // Events of one type, in sequence order
    [[nodiscard]] auto events_of(push_event_type type) const -> std::vector<push_event> {
        std::lock_guard<std::mutex> lock(_state->mutex);
        std::vector<push_event> result;
        for (const auto& e : _state->events) {
            if (e._type == type) {
                result.push_back(e);
            }
        }
        return result;
    }

private:
    struct state {
        std::mutex mutex;
        channel_snapshot resources;
        std::vector<push_event> events;
        std::uint64_t next_sequence{1};
        ack_policy policy;

        auto record_locked(push_event_type type, resource_kind kind, const std::string& name, push_operation op) -> void {
            events.push_back(push_event{next_sequence++, type, kind, name, op});
        }
    };

    static auto index_of(resource_kind kind) -> std::size_t {
        return static_cast<std::size_t>(kind);
    }

    auto upsert(
        const std::string& name,
        any_resource resource,
        completion_group* group,
        result_callback on_result
    ) -> revert_func {
        auto kind = kind_of(resource);
        std::optional<any_resource> previous;
        {
            std::lock_guard<std::mutex> lock(_state->mutex);
            auto& resources = _state->resources[index_of(kind)];
            auto it = resources.find(name);
            if (it != resources.end()) {
                if (it->second == resource) {
                    return [] {};
                }
                previous = it->second;
                it->second = std::move(resource);
            } else {
                resources.emplace(name, std::move(resource));
            }
            _state->record_locked(push_event_type::dispatched, kind, name, push_operation::upsert);
        }

        dispatch(kind, name, push_operation::upsert, group, std::move(on_result));
        return make_revert(kind, name, std::move(previous));
    }

    auto remove(
        resource_kind kind,
        const std::string& name,
        completion_group* group,
        result_callback on_result
    ) -> revert_func {
        std::optional<any_resource> previous;
        {
            std::lock_guard<std::mutex> lock(_state->mutex);
            auto& resources = _state->resources[index_of(kind)];
            auto it = resources.find(name);
            if (it == resources.end()) {
                return [] {};
            }
            previous = std::move(it->second);
            resources.erase(it);
            _state->record_locked(push_event_type::dispatched, kind, name, push_operation::remove);
        }

        dispatch(kind, name, push_operation::remove, group, std::move(on_result));
        return make_revert(kind, name, std::move(previous));
    }

    auto make_revert(resource_kind kind, const std::string& name, std::optional<any_resource> previous) const -> revert_func {
        return [state = _state, kind, name, previous = std::move(previous)]() {
            std::lock_guard<std::mutex> lock(state->mutex);
            auto& resources = state->resources[index_of(kind)];
            if (previous) {
                resources.insert_or_assign(name, *previous);
            } else {
                resources.erase(name);
            }
            state->record_locked(push_event_type::reverted, kind, name,
                previous ? push_operation::upsert : push_operation::remove);
        };
    }

    // Registers with the group now and answers later
    auto dispatch(
        resource_kind kind,
        const std::string& name,
        push_operation op,
        completion_group* group,
        result_callback on_result
    ) -> void {
        std::shared_ptr<completion> pending;
        if (group != nullptr) {
            std::ostringstream label;
            label << kind << "/" << name;
            pending = group->add_completion(label.str());
        }

        auto deliver = [state = _state, kind, name, op, pending, on_result = std::move(on_result)]() {
            ack_policy policy;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                policy = state->policy;
            }
            auto decision = policy ? policy(kind, name, op) : ack_decision::ack;

            std::exception_ptr error;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                switch (decision) {
                    case ack_decision::drop:
                        state->record_locked(push_event_type::dropped, kind, name, op);
                        return;
                    case ack_decision::reject:
                        state->record_locked(push_event_type::rejected, kind, name, op);
                        error = std::make_exception_ptr(push_rejected_exception(
                            std::string{type_url_of(kind)}, name, "rejected by data plane"));
                        break;
                    case ack_decision::ack:
                        state->record_locked(push_event_type::acked, kind, name, op);
                        break;
                }
            }

            // The result callback runs before the barrier can resolve
            if (on_result) {
                on_result(error);
            }
            if (pending) {
                pending->complete(error);
            }
        };

        if (_executor) {
            _executor->add(std::move(deliver));
        } else {
            deliver();
        }
    }

    std::shared_ptr<state> _state;
    std::shared_ptr<folly::Executor> _executor;
};

static_assert(push_channel<memory_push_channel>,
    "memory_push_channel must satisfy push_channel concept");

} // namespace xdsync
