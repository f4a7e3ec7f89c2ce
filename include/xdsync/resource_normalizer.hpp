#pragma once

#include "configuration.hpp"
#include "exceptions.hpp"
#include "logger.hpp"
#include "qualified_name.hpp"
#include "resource_codec.hpp"
#include "resource_set.hpp"
#include "resource_validator.hpp"
#include "types.hpp"

#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <boost/json.hpp>

namespace xdsync {

/**
 * @brief Turns a raw configuration batch into a canonical resource set
 *
 * Every resource and cross-reference name is qualified with the batch scope,
 * unset config sources are pointed at the control plane, and listeners whose
 * address is allocated by the agent get the agent's filters injected. All of
 * these rewrites are idempotent, so normalize() may be re-run on its own output.
 *
 * Errors are raised before anything is pushed, so a failed parse has no side
 * effects.
 *
 * @tparam Validator Per-kind resource validator, used when validation is configured
 * @tparam Logger Diagnostic logger
 */
template<resource_validator Validator, diagnostic_logger Logger>
class resource_normalizer {
public:
    resource_normalizer(reconciler_configuration config, Validator validator, Logger logger)
        : _config(std::move(config))
        , _validator(std::move(validator))
        , _logger(std::move(logger)) {}

    /**
     * @brief Decode and normalize a batch
     *
     * Entries with an empty type URL are skipped.
     *
     * @param ns Namespace of the configuration object the batch came from
     * @param name Name of the configuration object the batch came from
     * @throws unsupported_type_exception, type_mismatch_exception on undecodable entries
     * @throws missing_name_exception, duplicate_name_exception on naming violations
     * @throws validation_exception when validation is configured and a resource is rejected
     */
    auto parse_resources(
        std::string_view ns,
        std::string_view name,
        const std::vector<raw_resource>& raw_resources
    ) -> resource_set {
        resource_set set;
        for (const auto& raw : raw_resources) {
            if (raw._type_url.empty()) {
                _logger.debug("Skipping resource with empty type URL");
                continue;
            }

            auto decoded = _codec.decode(raw);
            std::visit([&set](auto&& resource) { append(set, std::move(resource)); }, std::move(decoded));
        }

        normalize(ns, name, set);

        _logger.info("Parsed resources", {
            {"namespace", ns},
            {"name", name},
            {"listeners", std::to_string(set._listeners.size())},
            {"routes", std::to_string(set._routes.size())},
            {"clusters", std::to_string(set._clusters.size())},
            {"endpoints", std::to_string(set._endpoints.size())},
            {"secrets", std::to_string(set._secrets.size())}
        });
        return set;
    }

    /**
     * @brief Apply every rewrite to an already decoded set and check it
     *
     * Running this on its own output leaves the set unchanged.
     */
    auto normalize(std::string_view ns, std::string_view name, resource_set& set) -> void {
        resource_scope scope{std::string{ns}, std::string{name}};

        for (auto& l : set._listeners) {
            require_name(type_urls::listener, l._name);
            normalize_listener(scope, l);
            check_resource(l);
            _logger.debug("Normalized listener", {{"listener", l._name}});
        }
        for (auto& rc : set._routes) {
            require_name(type_urls::route, rc._name);
            normalize_route_configuration(scope, rc);
            check_resource(rc);
            _logger.debug("Normalized route", {{"route", rc._name}});
        }
        for (auto& c : set._clusters) {
            require_name(type_urls::cluster, c._name);
            normalize_cluster(scope, c);
            check_resource(c);
            _logger.debug("Normalized cluster", {{"cluster", c._name}});
        }
        for (auto& cla : set._endpoints) {
            require_name(type_urls::endpoint, cla._cluster_name);
            qualify_in_place(scope, cla._cluster_name);
            check_resource(cla);
            _logger.debug("Normalized endpoints", {{"cluster", cla._cluster_name}});
        }
        for (auto& s : set._secrets) {
            require_name(type_urls::secret, s._name);
            qualify_in_place(scope, s._name);
            check_resource(s);
            _logger.debug("Normalized secret", {{"secret", s._name}});
        }

        check_unique(type_urls::listener, set._listeners);
        check_unique(type_urls::route, set._routes);
        check_unique(type_urls::cluster, set._clusters);
        check_unique(type_urls::endpoint, set._endpoints);
        check_unique(type_urls::secret, set._secrets);
    }

    /**
     * @brief Normalize one listener
     *
     * @return true if anything changed
     */
    auto normalize_listener(const resource_scope& scope, listener& l) const -> bool {
        bool updated = false;

        if (_config.enable_bpf_tproxy() && l._enable_reuse_port != std::optional<bool>{false}) {
            // SO_REUSEPORT does not work with BPF TPROXY
            l._enable_reuse_port = false;
            updated = true;
        }

        auto inject_filters = l.needs_allocated_address();

        if (!l._internal_listener) {
            bool found = false;
            for (const auto& lf : l._listener_filters) {
                if (lf._name == filter_names::bpf_metadata) {
                    found = true;
                    break;
                }
            }
            if (!found) {
                l._listener_filters.push_back(bpf_metadata_filter());
                updated = true;
            }
        }

        for (auto& fc : l._filter_chains) {
            if (fc._transport_socket && fill_in_transport_socket(scope, *fc._transport_socket)) {
                updated = true;
            }
            if (normalize_filter_chain(scope, fc, inject_filters)) {
                updated = true;
            }
        }

        if (qualify_in_place(scope, l._name, qualify_mode::force)) {
            updated = true;
        }
        return updated;
    }

    auto normalize_route_configuration(const resource_scope& scope, route_configuration& rc) const -> bool {
        bool updated = qualify_in_place(scope, rc._name, qualify_mode::force);

        for (auto& vh : rc._virtual_hosts) {
            if (qualify_in_place(scope, vh._name, qualify_mode::force)) {
                updated = true;
            }
            for (auto& r : vh._routes) {
                if (!r._route) {
                    continue;
                }
                auto& action = *r._route;
                if (auto* c = std::get_if<cluster_ref>(&action._cluster_specifier)) {
                    if (qualify_in_place(scope, c->_name)) {
                        updated = true;
                    }
                } else if (auto* wc = std::get_if<weighted_clusters>(&action._cluster_specifier)) {
                    if (qualify_weighted_clusters(scope, *wc)) {
                        updated = true;
                    }
                }
                for (auto& mirror : action._request_mirror_policies) {
                    if (qualify_in_place(scope, mirror._cluster)) {
                        updated = true;
                    }
                }
            }
        }
        return updated;
    }

    auto normalize_cluster(const resource_scope& scope, cluster& c) const -> bool {
        bool updated = false;

        if (c._transport_socket && fill_in_transport_socket(scope, *c._transport_socket)) {
            updated = true;
        }

        if (c._type == "EDS") {
            if (!c._eds_cluster_config) {
                c._eds_cluster_config = eds_cluster_config{};
                updated = true;
            }
            if (!c._eds_cluster_config->_eds_config) {
                c._eds_cluster_config->_eds_config = control_plane_config_source();
                updated = true;
            }
        }

        if (c._load_assignment && qualify_in_place(scope, c._load_assignment->_cluster_name)) {
            updated = true;
        }

        if (qualify_in_place(scope, c._name)) {
            updated = true;
        }
        return updated;
    }

    [[nodiscard]] auto configuration() const -> const reconciler_configuration& { return _config; }

private:
    static auto append(resource_set& set, listener&& l) -> void { set._listeners.push_back(std::move(l)); }
    static auto append(resource_set& set, route_configuration&& rc) -> void { set._routes.push_back(std::move(rc)); }
    static auto append(resource_set& set, cluster&& c) -> void { set._clusters.push_back(std::move(c)); }
    static auto append(resource_set& set, cluster_load_assignment&& cla) -> void { set._endpoints.push_back(std::move(cla)); }
    static auto append(resource_set& set, secret&& s) -> void { set._secrets.push_back(std::move(s)); }

    static auto require_name(std::string_view type_url, const std::string& name) -> void {
        if (name.empty()) {
            throw missing_name_exception(std::string{type_url});
        }
    }

    template<typename Resource>
    static auto check_unique(std::string_view type_url, const std::vector<Resource>& resources) -> void {
        std::set<std::string> seen;
        for (const auto& r : resources) {
            if (!seen.insert(resource_name(r)).second) {
                throw duplicate_name_exception(std::string{type_url}, resource_name(r));
            }
        }
    }

    template<typename Resource>
    auto check_resource(const Resource& resource) const -> void {
        if (!_config.validate()) {
            return;
        }
        if (auto reason = _validator.validate(resource)) {
            any_resource wrapped{resource};
            throw validation_exception(
                std::string{type_url_of(kind_of(wrapped))},
                resource_name(resource),
                *reason,
                _codec.to_json_string(wrapped));
        }
    }

    auto bpf_metadata_filter() const -> listener_filter {
        boost::json::object value;
        value["bpf_root"] = _config.bpf_root();
        value["is_ingress"] = false;
        value["use_original_source_address"] = _config.use_original_source_addr();
        value["is_l7lb"] = _config.is_l7lb();

        listener_filter filter;
        filter._name = std::string{filter_names::bpf_metadata};
        filter._typed_config = opaque_config{std::string{type_urls::bpf_metadata}, std::move(value)};
        return filter;
    }

    static auto network_policy_filter() -> network_filter {
        network_filter filter;
        filter._name = std::string{filter_names::network};
        filter._typed_config = opaque_config{std::string{type_urls::network_filter}, {}};
        return filter;
    }

    static auto l7_policy_filter() -> http_filter {
        http_filter filter;
        filter._name = std::string{filter_names::l7_policy};
        filter._extra["typed_config"] = boost::json::object{{"@type", type_urls::l7_policy}};
        return filter;
    }

    // Only the first terminal content filter of a chain is processed
    auto normalize_filter_chain(const resource_scope& scope, filter_chain& fc, bool inject_filters) const -> bool {
        auto terminal = fc._filters.find_if(
            [](const network_filter& f) { return f.is_terminal_content_filter(); });
        if (terminal == fc._filters.end()) {
            return false;
        }

        bool updated = false;
        if (auto* hcm = std::get_if<http_connection_manager>(&*terminal->_typed_config)) {
            updated = normalize_http_connection_manager(scope, *hcm, inject_filters);
        } else if (auto* proxy = std::get_if<tcp_proxy>(&*terminal->_typed_config)) {
            if (auto* c = std::get_if<cluster_ref>(&proxy->_cluster_specifier)) {
                updated = qualify_in_place(scope, c->_name);
            } else if (auto* wc = std::get_if<weighted_clusters>(&proxy->_cluster_specifier)) {
                updated = qualify_weighted_clusters(scope, *wc);
            }
        }

        if (inject_filters && !fc._filters.contains_name(filter_names::network)) {
            fc._filters.insert_before(
                [](const network_filter& f) { return f.is_terminal_content_filter(); },
                network_policy_filter());
            updated = true;
        }
        return updated;
    }

    auto normalize_http_connection_manager(
        const resource_scope& scope,
        http_connection_manager& hcm,
        bool inject_filters
    ) const -> bool {
        bool updated = false;
        if (hcm._rds) {
            if (!hcm._rds->_route_config_name.empty() &&
                qualify_in_place(scope, hcm._rds->_route_config_name, qualify_mode::force)) {
                updated = true;
            }
            if (!hcm._rds->_config_source) {
                hcm._rds->_config_source = control_plane_config_source();
                updated = true;
            }
        }
        if (hcm._route_config && normalize_route_configuration(scope, *hcm._route_config)) {
            updated = true;
        }
        if (inject_filters && !hcm._http_filters.contains_name(filter_names::l7_policy)) {
            if (hcm._http_filters.insert_before(
                    [](const http_filter& f) { return f._name == filter_names::http_router; },
                    l7_policy_filter())) {
                updated = true;
            }
        }
        return updated;
    }

    static auto qualify_weighted_clusters(const resource_scope& scope, weighted_clusters& wc) -> bool {
        bool updated = false;
        for (auto& entry : wc._clusters) {
            if (qualify_in_place(scope, entry._name)) {
                updated = true;
            }
        }
        return updated;
    }

    static auto fill_in_sds_secret_config(const resource_scope& scope, sds_secret_config& sc) -> bool {
        bool updated = false;
        if (!sc._sds_config) {
            sc._sds_config = control_plane_config_source();
            updated = true;
        }
        if (qualify_in_place(scope, sc._name)) {
            updated = true;
        }
        return updated;
    }

    static auto fill_in_tls_context(const resource_scope& scope, std::optional<common_tls_context>& ctx) -> bool {
        if (!ctx) {
            return false;
        }
        bool updated = false;
        for (auto& sc : ctx->_tls_certificate_sds_secret_configs) {
            if (fill_in_sds_secret_config(scope, sc)) {
                updated = true;
            }
        }
        if (ctx->_validation_context_sds_secret_config &&
            fill_in_sds_secret_config(scope, *ctx->_validation_context_sds_secret_config)) {
            updated = true;
        }
        return updated;
    }

    // TLS transport sockets get their SDS secret references qualified and sourced
    static auto fill_in_transport_socket(const resource_scope& scope, transport_socket& ts) -> bool {
        if (!ts._typed_config) {
            return false;
        }
        if (auto* downstream = std::get_if<downstream_tls_context>(&*ts._typed_config)) {
            return fill_in_tls_context(scope, downstream->_common_tls_context);
        }
        if (auto* upstream = std::get_if<upstream_tls_context>(&*ts._typed_config)) {
            return fill_in_tls_context(scope, upstream->_common_tls_context);
        }
        return false;
    }

    reconciler_configuration _config;
    Validator _validator;
    Logger _logger;
    resource_codec _codec;
};

} // namespace xdsync
