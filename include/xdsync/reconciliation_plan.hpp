#pragma once

#include "resource_set.hpp"
#include "types.hpp"

#include <algorithm>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace xdsync {

// A listener present in both sets whose bound port changes
struct listener_replacement {
    std::string _name;
    std::uint32_t _old_port{0};
    std::uint32_t _new_port{0};

    auto operator==(const listener_replacement&) const -> bool = default;
};

/**
 * @brief Deletions and listener bookkeeping for moving from one set to another
 *
 * Additions are not listed: every resource of the new set is pushed, whether
 * or not it changed. Deletion lists keep the old set's declaration order.
 */
struct reconciliation_plan {
    // Includes the names of replaced listeners, which are deleted and then re-added
    std::vector<std::string> _delete_listeners;
    std::vector<std::string> _delete_routes;
    std::vector<std::string> _delete_clusters;
    std::vector<std::string> _delete_endpoints;
    std::vector<std::string> _delete_secrets;

    std::vector<listener_replacement> _replaced_listeners;

    // Listeners kept on the same port; their lease was committed by an earlier batch
    std::vector<std::string> _retained_listeners;

    // Deletions must be acknowledged before any addition is issued
    bool _wait_for_delete{false};

    [[nodiscard]] auto deletes_of(resource_kind kind) const -> const std::vector<std::string>& {
        switch (kind) {
            case resource_kind::listener: return _delete_listeners;
            case resource_kind::route:    return _delete_routes;
            case resource_kind::cluster:  return _delete_clusters;
            case resource_kind::endpoint: return _delete_endpoints;
            case resource_kind::secret:   return _delete_secrets;
        }
        return _delete_secrets;
    }

    [[nodiscard]] auto delete_count() const -> std::size_t {
        return _delete_listeners.size() + _delete_routes.size() + _delete_clusters.size() +
            _delete_endpoints.size() + _delete_secrets.size();
    }
};

namespace detail {

// Names of old_resources missing from new_resources
template<typename Resource>
auto removed_names(const std::vector<Resource>& old_resources, const std::vector<Resource>& new_resources)
    -> std::vector<std::string> {
    std::set<std::string> kept;
    for (const auto& r : new_resources) {
        kept.insert(resource_name(r));
    }

    std::vector<std::string> removed;
    for (const auto& r : old_resources) {
        if (!kept.contains(resource_name(r))) {
            removed.push_back(resource_name(r));
        }
    }
    return removed;
}

} // namespace detail

/**
 * @brief Compute the deletions needed to go from old_set to new_set
 *
 * A listener in both sets is replaced when the new listener has a socket
 * address whose port differs from the old listener's port (0 when it has
 * none); otherwise it is retained.
 */
inline auto plan_reconciliation(const resource_set& old_set, const resource_set& new_set) -> reconciliation_plan {
    reconciliation_plan plan;

    for (const auto& old_listener : old_set._listeners) {
        const auto* new_listener = new_set.find_listener(old_listener._name);
        if (new_listener == nullptr) {
            plan._delete_listeners.push_back(old_listener._name);
            continue;
        }

        auto old_port = old_listener.bound_port();
        auto has_new_port = new_listener->_address.has_value() && new_listener->_address->_socket_address.has_value();
        if (has_new_port && new_listener->bound_port() != old_port) {
            plan._replaced_listeners.push_back(listener_replacement{old_listener._name, old_port, new_listener->bound_port()});
            plan._delete_listeners.push_back(old_listener._name);
            plan._wait_for_delete = true;
        } else {
            plan._retained_listeners.push_back(old_listener._name);
        }
    }

    plan._delete_routes = detail::removed_names(old_set._routes, new_set._routes);
    plan._delete_clusters = detail::removed_names(old_set._clusters, new_set._clusters);
    plan._delete_endpoints = detail::removed_names(old_set._endpoints, new_set._endpoints);
    plan._delete_secrets = detail::removed_names(old_set._secrets, new_set._secrets);

    return plan;
}

} // namespace xdsync
