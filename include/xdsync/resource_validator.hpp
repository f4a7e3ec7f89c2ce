#pragma once

#include "types.hpp"

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace xdsync {

// Resource validator concept.
// validate() returns the rejection reason, or nullopt when the resource is acceptable.
template<typename V>
concept resource_validator = requires(
    const V validator,
    const listener& l,
    const route_configuration& rc,
    const cluster& c,
    const cluster_load_assignment& cla,
    const secret& s
) {
    { validator.validate(l) } -> std::same_as<std::optional<std::string>>;
    { validator.validate(rc) } -> std::same_as<std::optional<std::string>>;
    { validator.validate(c) } -> std::same_as<std::optional<std::string>>;
    { validator.validate(cla) } -> std::same_as<std::optional<std::string>>;
    { validator.validate(s) } -> std::same_as<std::optional<std::string>>;
};

// Accepts everything
class noop_resource_validator {
public:
    auto validate([[maybe_unused]] const listener& l) const -> std::optional<std::string> { return std::nullopt; }
    auto validate([[maybe_unused]] const route_configuration& rc) const -> std::optional<std::string> { return std::nullopt; }
    auto validate([[maybe_unused]] const cluster& c) const -> std::optional<std::string> { return std::nullopt; }
    auto validate([[maybe_unused]] const cluster_load_assignment& cla) const -> std::optional<std::string> { return std::nullopt; }
    auto validate([[maybe_unused]] const secret& s) const -> std::optional<std::string> { return std::nullopt; }
};

/**
 * @brief Checks the structural constraints the proxy enforces on the modeled fields
 *
 * Covers required names, port ranges and non-empty weighted cluster lists.
 * Fields kept as opaque JSON are not inspected.
 */
class structural_resource_validator {
public:
    auto validate(const listener& l) const -> std::optional<std::string> {
        if (l._name.empty()) {
            return "name: value length must be at least 1";
        }
        if (l._address) {
            if (auto reason = check_address(*l._address, "address")) {
                return reason;
            }
        }
        for (const auto& addr : l._additional_addresses) {
            if (auto reason = check_address(addr, "additional_addresses.address")) {
                return reason;
            }
        }
        for (const auto& f : l._listener_filters) {
            if (f._name.empty()) {
                return "listener_filters.name: value length must be at least 1";
            }
        }
        for (const auto& fc : l._filter_chains) {
            for (const auto& f : fc._filters) {
                if (f._name.empty()) {
                    return "filter_chains.filters.name: value length must be at least 1";
                }
                if (!f._typed_config) {
                    continue;
                }
                if (auto* hcm = std::get_if<http_connection_manager>(&*f._typed_config)) {
                    if (auto reason = check_http_connection_manager(*hcm)) {
                        return reason;
                    }
                } else if (auto* proxy = std::get_if<tcp_proxy>(&*f._typed_config)) {
                    if (auto* wc = std::get_if<weighted_clusters>(&proxy->_cluster_specifier)) {
                        if (auto reason = check_weighted_clusters(*wc)) {
                            return reason;
                        }
                    }
                }
            }
        }
        return std::nullopt;
    }

    auto validate(const route_configuration& rc) const -> std::optional<std::string> {
        for (const auto& vh : rc._virtual_hosts) {
            if (vh._name.empty()) {
                return "virtual_hosts.name: value length must be at least 1";
            }
            for (const auto& r : vh._routes) {
                if (!r._route) {
                    continue;
                }
                if (auto* c = std::get_if<cluster_ref>(&r._route->_cluster_specifier); c && c->_name.empty()) {
                    return "virtual_hosts.routes.route.cluster: value length must be at least 1";
                }
                if (auto* wc = std::get_if<weighted_clusters>(&r._route->_cluster_specifier)) {
                    if (auto reason = check_weighted_clusters(*wc)) {
                        return reason;
                    }
                }
                for (const auto& m : r._route->_request_mirror_policies) {
                    if (m._cluster.empty()) {
                        return "request_mirror_policies.cluster: value length must be at least 1";
                    }
                }
            }
        }
        return std::nullopt;
    }

    auto validate(const cluster& c) const -> std::optional<std::string> {
        if (c._name.empty()) {
            return "name: value length must be at least 1";
        }
        if (c._load_assignment && c._load_assignment->_cluster_name.empty()) {
            return "load_assignment.cluster_name: value length must be at least 1";
        }
        return std::nullopt;
    }

    auto validate(const cluster_load_assignment& cla) const -> std::optional<std::string> {
        if (cla._cluster_name.empty()) {
            return "cluster_name: value length must be at least 1";
        }
        return std::nullopt;
    }

    auto validate(const secret& s) const -> std::optional<std::string> {
        if (s._name.empty()) {
            return "name: value length must be at least 1";
        }
        return std::nullopt;
    }

private:
    static constexpr std::uint32_t max_port = 65535;

    static auto check_address(const address& addr, const std::string& field) -> std::optional<std::string> {
        if (!addr._socket_address) {
            return std::nullopt;
        }
        if (addr._socket_address->_address.empty()) {
            return field + ".socket_address.address: value length must be at least 1";
        }
        if (addr._socket_address->_port_value > max_port) {
            return field + ".socket_address.port_value: value must be less than or equal to 65535";
        }
        return std::nullopt;
    }

    static auto check_weighted_clusters(const weighted_clusters& wc) -> std::optional<std::string> {
        if (wc._clusters.empty()) {
            return "weighted_clusters.clusters: value must contain at least 1 item(s)";
        }
        for (const auto& entry : wc._clusters) {
            if (entry._name.empty()) {
                return "weighted_clusters.clusters.name: value length must be at least 1";
            }
        }
        return std::nullopt;
    }

    static auto check_http_connection_manager(const http_connection_manager& hcm) -> std::optional<std::string> {
        for (const auto& f : hcm._http_filters) {
            if (f._name.empty()) {
                return "http_filters.name: value length must be at least 1";
            }
        }
        if (hcm._rds && hcm._rds->_route_config_name.empty() && !hcm._rds->_config_source) {
            return "rds.config_source: value is required";
        }
        return std::nullopt;
    }
};

static_assert(resource_validator<noop_resource_validator>,
    "noop_resource_validator must satisfy resource_validator concept");
static_assert(resource_validator<structural_resource_validator>,
    "structural_resource_validator must satisfy resource_validator concept");

} // namespace xdsync
