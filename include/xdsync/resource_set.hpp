#pragma once

#include "batch_context.hpp"
#include "types.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace xdsync {

/**
 * @brief Port lease lifecycle callback for one address-allocated listener
 *
 * Invoked with nullptr when the listener change it belongs to took effect,
 * or with the batch error when it did not. Throws if the port allocator
 * reported an error; callers log that as a warning.
 */
using port_callback = std::function<void(const batch_context&, std::exception_ptr)>;

/**
 * @brief One-shot callbacks keyed by listener name, owned by a single resource set
 *
 * Only touched by the thread processing the batch that owns the set.
 */
class port_callback_registry {
public:
    auto set(const std::string& listener_name, port_callback callback) -> void {
        _callbacks[listener_name] = std::move(callback);
    }

    // Removes the entry without invoking it; returns whether one existed
    auto drop(const std::string& listener_name) -> bool {
        return _callbacks.erase(listener_name) > 0;
    }

    // Removes and returns the entry so that it can be invoked exactly once
    auto consume(const std::string& listener_name) -> std::optional<port_callback> {
        auto it = _callbacks.find(listener_name);
        if (it == _callbacks.end()) {
            return std::nullopt;
        }
        auto callback = std::move(it->second);
        _callbacks.erase(it);
        return callback;
    }

    [[nodiscard]] auto contains(const std::string& listener_name) const -> bool {
        return _callbacks.contains(listener_name);
    }

    [[nodiscard]] auto names() const -> std::vector<std::string> {
        std::vector<std::string> result;
        result.reserve(_callbacks.size());
        for (const auto& [name, _] : _callbacks) {
            result.push_back(name);
        }
        return result;
    }

    [[nodiscard]] auto size() const -> std::size_t { return _callbacks.size(); }
    [[nodiscard]] auto empty() const -> bool { return _callbacks.empty(); }

private:
    std::map<std::string, port_callback> _callbacks;
};

/**
 * @brief Canonical container for one normalized configuration batch
 *
 * Names are unique per kind. Endpoints are keyed by their cluster name.
 * The set is handed to the reconciler by reference and is not retained
 * beyond one call; its port callbacks are consumed by that call.
 */
struct resource_set {
    std::vector<listener> _listeners;
    std::vector<route_configuration> _routes;
    std::vector<cluster> _clusters;
    std::vector<cluster_load_assignment> _endpoints;
    std::vector<secret> _secrets;

    port_callback_registry _port_callbacks;

    [[nodiscard]] auto empty() const -> bool {
        return _listeners.empty() && _routes.empty() && _clusters.empty() &&
            _endpoints.empty() && _secrets.empty();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        return _listeners.size() + _routes.size() + _clusters.size() +
            _endpoints.size() + _secrets.size();
    }

    [[nodiscard]] auto find_listener(const std::string& name) const -> const listener* {
        auto it = std::find_if(_listeners.begin(), _listeners.end(),
            [&name](const listener& l) { return l._name == name; });
        return it == _listeners.end() ? nullptr : &*it;
    }

    [[nodiscard]] auto count_of(resource_kind kind) const -> std::size_t {
        switch (kind) {
            case resource_kind::listener: return _listeners.size();
            case resource_kind::route:    return _routes.size();
            case resource_kind::cluster:  return _clusters.size();
            case resource_kind::endpoint: return _endpoints.size();
            case resource_kind::secret:   return _secrets.size();
        }
        return 0;
    }
};

// Names of one kind of resource in declaration order
template<typename Resource>
auto names_of(const std::vector<Resource>& resources) -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(resources.size());
    for (const auto& r : resources) {
        names.push_back(resource_name(r));
    }
    return names;
}

/**
 * @brief Whether updating from old_set to new_set adds or removes any listener
 *
 * Only names are compared; a listener present in both counts as neither added nor removed.
 */
inline auto listeners_added_or_deleted(const resource_set& old_set, const resource_set& new_set) -> bool {
    for (const auto& nl : new_set._listeners) {
        if (old_set.find_listener(nl._name) == nullptr) {
            return true;
        }
    }
    for (const auto& ol : old_set._listeners) {
        if (new_set.find_listener(ol._name) == nullptr) {
            return true;
        }
    }
    return false;
}

} // namespace xdsync
