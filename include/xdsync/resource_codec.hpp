#pragma once

#include "exceptions.hpp"
#include "types.hpp"

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/json.hpp>

namespace xdsync {

namespace detail {

// A field whose JSON shape disagrees with the resource type being decoded
class shape_error : public std::runtime_error {
public:
    explicit shape_error(const std::string& message)
        : std::runtime_error(message) {}
};

inline auto optional_object(const boost::json::object& obj, std::string_view key) -> const boost::json::object* {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) {
        return nullptr;
    }
    if (!it->value().is_object()) {
        throw shape_error("field '" + std::string{key} + "' must be an object");
    }
    return &it->value().get_object();
}

inline auto optional_array(const boost::json::object& obj, std::string_view key) -> const boost::json::array* {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) {
        return nullptr;
    }
    if (!it->value().is_array()) {
        throw shape_error("field '" + std::string{key} + "' must be an array");
    }
    return &it->value().get_array();
}

inline auto as_object(const boost::json::value& value, std::string_view what) -> const boost::json::object& {
    if (!value.is_object()) {
        throw shape_error(std::string{what} + " must be an object");
    }
    return value.get_object();
}

inline auto string_field(const boost::json::object& obj, std::string_view key) -> std::string {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) {
        return {};
    }
    if (!it->value().is_string()) {
        throw shape_error("field '" + std::string{key} + "' must be a string");
    }
    return std::string{it->value().get_string()};
}

inline auto uint32_field(const boost::json::object& obj, std::string_view key) -> std::uint32_t {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) {
        return 0;
    }
    const auto& v = it->value();
    constexpr auto max = std::numeric_limits<std::uint32_t>::max();
    if (v.is_uint64() && v.get_uint64() <= max) {
        return static_cast<std::uint32_t>(v.get_uint64());
    }
    if (v.is_int64() && v.get_int64() >= 0 && static_cast<std::uint64_t>(v.get_int64()) <= max) {
        return static_cast<std::uint32_t>(v.get_int64());
    }
    throw shape_error("field '" + std::string{key} + "' must be an unsigned 32-bit integer");
}

inline auto optional_bool_field(const boost::json::object& obj, std::string_view key) -> std::optional<bool> {
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) {
        return std::nullopt;
    }
    if (!it->value().is_bool()) {
        throw shape_error("field '" + std::string{key} + "' must be a boolean");
    }
    return it->value().get_bool();
}

// Copy of every field not in known
inline auto extra_fields(const boost::json::object& obj, std::initializer_list<std::string_view> known) -> boost::json::object {
    boost::json::object extra;
    for (const auto& kv : obj) {
        bool is_known = false;
        for (auto k : known) {
            if (kv.key() == k) {
                is_known = true;
                break;
            }
        }
        if (!is_known) {
            extra.emplace(kv.key(), kv.value());
        }
    }
    return extra;
}

} // namespace detail

/**
 * @brief Decodes and encodes resources in their proto-JSON form (snake_case field names)
 *
 * Only the fields the reconciler reads or rewrites are modeled; every other
 * field is carried through in the `_extra` members so that decoding and
 * re-encoding preserves it.
 */
class resource_codec {
public:
    //=========================================================================
    // Decoding
    //=========================================================================

    /**
     * @brief Decode a raw resource according to its declared type URL
     *
     * @throws unsupported_type_exception if the type URL is not one of the five resource kinds
     * @throws type_mismatch_exception if the payload's shape disagrees with the declared type
     */
    auto decode(const raw_resource& raw) const -> any_resource {
        auto kind = kind_of_type_url(raw._type_url);
        if (!kind) {
            throw unsupported_type_exception(raw._type_url);
        }

        try {
            const auto& obj = detail::as_object(raw._value, "resource");
            auto embedded_type = detail::string_field(obj, "@type");
            if (!embedded_type.empty() && embedded_type != raw._type_url) {
                throw detail::shape_error("payload is a " + embedded_type);
            }

            switch (*kind) {
                case resource_kind::listener: return decode_listener(obj);
                case resource_kind::route:    return decode_route_configuration(obj);
                case resource_kind::cluster:  return decode_cluster(obj);
                case resource_kind::endpoint: return decode_cluster_load_assignment(obj);
                case resource_kind::secret:   return decode_secret(obj);
            }
        } catch (const detail::shape_error& e) {
            throw type_mismatch_exception(raw._type_url, e.what());
        }
        throw unsupported_type_exception(raw._type_url);
    }

    auto decode_listener(const boost::json::object& obj) const -> listener {
        listener l;
        l._name = detail::string_field(obj, "name");
        if (auto* addr = detail::optional_object(obj, "address")) {
            l._address = decode_address(*addr);
        }
        if (auto* additional = detail::optional_array(obj, "additional_addresses")) {
            for (const auto& entry : *additional) {
                const auto& entry_obj = detail::as_object(entry, "additional address");
                if (auto* addr = detail::optional_object(entry_obj, "address")) {
                    l._additional_addresses.push_back(decode_address(*addr));
                }
            }
        }
        l._internal_listener = detail::optional_object(obj, "internal_listener") != nullptr;
        l._enable_reuse_port = detail::optional_bool_field(obj, "enable_reuse_port");
        if (auto* filters = detail::optional_array(obj, "listener_filters")) {
            for (const auto& f : *filters) {
                l._listener_filters.push_back(decode_listener_filter(detail::as_object(f, "listener filter")));
            }
        }
        if (auto* chains = detail::optional_array(obj, "filter_chains")) {
            for (const auto& fc : *chains) {
                l._filter_chains.push_back(decode_filter_chain(detail::as_object(fc, "filter chain")));
            }
        }
        l._extra = detail::extra_fields(obj, {
            "@type", "name", "address", "additional_addresses", "internal_listener",
            "enable_reuse_port", "listener_filters", "filter_chains"
        });
        return l;
    }

    auto decode_route_configuration(const boost::json::object& obj) const -> route_configuration {
        route_configuration rc;
        rc._name = detail::string_field(obj, "name");
        if (auto* vhosts = detail::optional_array(obj, "virtual_hosts")) {
            for (const auto& vh : *vhosts) {
                rc._virtual_hosts.push_back(decode_virtual_host(detail::as_object(vh, "virtual host")));
            }
        }
        rc._extra = detail::extra_fields(obj, {"@type", "name", "virtual_hosts"});
        return rc;
    }

    auto decode_cluster(const boost::json::object& obj) const -> cluster {
        cluster c;
        c._name = detail::string_field(obj, "name");
        c._type = detail::string_field(obj, "type");
        if (auto* eds = detail::optional_object(obj, "eds_cluster_config")) {
            eds_cluster_config config;
            if (auto* source = detail::optional_object(*eds, "eds_config")) {
                config._eds_config = config_source{*source};
            }
            config._service_name = detail::string_field(*eds, "service_name");
            c._eds_cluster_config = std::move(config);
        }
        if (auto* la = detail::optional_object(obj, "load_assignment")) {
            c._load_assignment = decode_cluster_load_assignment(*la);
        }
        if (auto* ts = detail::optional_object(obj, "transport_socket")) {
            c._transport_socket = decode_transport_socket(*ts);
        }
        c._extra = detail::extra_fields(obj, {
            "@type", "name", "type", "eds_cluster_config", "load_assignment", "transport_socket"
        });
        return c;
    }

    auto decode_cluster_load_assignment(const boost::json::object& obj) const -> cluster_load_assignment {
        cluster_load_assignment cla;
        cla._cluster_name = detail::string_field(obj, "cluster_name");
        cla._extra = detail::extra_fields(obj, {"@type", "cluster_name"});
        return cla;
    }

    auto decode_secret(const boost::json::object& obj) const -> secret {
        secret s;
        s._name = detail::string_field(obj, "name");
        s._extra = detail::extra_fields(obj, {"@type", "name"});
        return s;
    }

    //=========================================================================
    // Encoding
    //=========================================================================

    auto encode(const any_resource& resource) const -> boost::json::object {
        auto obj = std::visit([this](const auto& r) { return encode(r); }, resource);
        obj["@type"] = type_url_of(kind_of(resource));
        return obj;
    }

    auto to_raw_resource(const any_resource& resource) const -> raw_resource {
        return raw_resource{std::string{type_url_of(kind_of(resource))}, encode(resource)};
    }

    // Compact JSON text, used for diagnostics
    auto to_json_string(const any_resource& resource) const -> std::string {
        return boost::json::serialize(encode(resource));
    }

    auto encode(const listener& l) const -> boost::json::object {
        boost::json::object obj = l._extra;
        obj["name"] = l._name;
        if (l._address) {
            obj["address"] = encode(*l._address);
        }
        if (!l._additional_addresses.empty()) {
            boost::json::array additional;
            for (const auto& addr : l._additional_addresses) {
                additional.push_back(boost::json::object{{"address", encode(addr)}});
            }
            obj["additional_addresses"] = std::move(additional);
        }
        if (l._internal_listener) {
            obj["internal_listener"] = boost::json::object{};
        }
        if (l._enable_reuse_port) {
            obj["enable_reuse_port"] = *l._enable_reuse_port;
        }
        if (!l._listener_filters.empty()) {
            boost::json::array filters;
            for (const auto& f : l._listener_filters) {
                boost::json::object fo = f._extra;
                fo["name"] = f._name;
                if (f._typed_config) {
                    fo["typed_config"] = encode(*f._typed_config);
                }
                filters.push_back(std::move(fo));
            }
            obj["listener_filters"] = std::move(filters);
        }
        if (!l._filter_chains.empty()) {
            boost::json::array chains;
            for (const auto& fc : l._filter_chains) {
                chains.push_back(encode(fc));
            }
            obj["filter_chains"] = std::move(chains);
        }
        return obj;
    }

    auto encode(const route_configuration& rc) const -> boost::json::object {
        boost::json::object obj = rc._extra;
        obj["name"] = rc._name;
        if (!rc._virtual_hosts.empty()) {
            boost::json::array vhosts;
            for (const auto& vh : rc._virtual_hosts) {
                boost::json::object vo = vh._extra;
                vo["name"] = vh._name;
                if (!vh._routes.empty()) {
                    boost::json::array routes;
                    for (const auto& r : vh._routes) {
                        boost::json::object ro = r._extra;
                        if (r._route) {
                            ro["route"] = encode(*r._route);
                        }
                        routes.push_back(std::move(ro));
                    }
                    vo["routes"] = std::move(routes);
                }
                vhosts.push_back(std::move(vo));
            }
            obj["virtual_hosts"] = std::move(vhosts);
        }
        return obj;
    }

    auto encode(const cluster& c) const -> boost::json::object {
        boost::json::object obj = c._extra;
        obj["name"] = c._name;
        if (!c._type.empty()) {
            obj["type"] = c._type;
        }
        if (c._eds_cluster_config) {
            boost::json::object eds;
            if (c._eds_cluster_config->_eds_config) {
                eds["eds_config"] = c._eds_cluster_config->_eds_config->_value;
            }
            if (!c._eds_cluster_config->_service_name.empty()) {
                eds["service_name"] = c._eds_cluster_config->_service_name;
            }
            obj["eds_cluster_config"] = std::move(eds);
        }
        if (c._load_assignment) {
            obj["load_assignment"] = encode(*c._load_assignment);
        }
        if (c._transport_socket) {
            obj["transport_socket"] = encode(*c._transport_socket);
        }
        return obj;
    }

    auto encode(const cluster_load_assignment& cla) const -> boost::json::object {
        boost::json::object obj = cla._extra;
        obj["cluster_name"] = cla._cluster_name;
        return obj;
    }

    auto encode(const secret& s) const -> boost::json::object {
        boost::json::object obj = s._extra;
        obj["name"] = s._name;
        return obj;
    }

private:
    auto decode_address(const boost::json::object& obj) const -> address {
        address addr;
        if (auto* sa = detail::optional_object(obj, "socket_address")) {
            socket_address socket;
            socket._address = detail::string_field(*sa, "address");
            socket._port_value = detail::uint32_field(*sa, "port_value");
            socket._extra = detail::extra_fields(*sa, {"address", "port_value"});
            addr._socket_address = std::move(socket);
        }
        addr._extra = detail::extra_fields(obj, {"socket_address"});
        return addr;
    }

    auto decode_opaque_config(const boost::json::object& obj) const -> opaque_config {
        return opaque_config{detail::string_field(obj, "@type"), detail::extra_fields(obj, {"@type"})};
    }

    auto decode_listener_filter(const boost::json::object& obj) const -> listener_filter {
        listener_filter f;
        f._name = detail::string_field(obj, "name");
        if (auto* tc = detail::optional_object(obj, "typed_config")) {
            f._typed_config = decode_opaque_config(*tc);
        }
        f._extra = detail::extra_fields(obj, {"name", "typed_config"});
        return f;
    }

    auto decode_filter_chain(const boost::json::object& obj) const -> filter_chain {
        filter_chain fc;
        if (auto* filters = detail::optional_array(obj, "filters")) {
            for (const auto& f : *filters) {
                fc._filters.push_back(decode_network_filter(detail::as_object(f, "network filter")));
            }
        }
        if (auto* ts = detail::optional_object(obj, "transport_socket")) {
            fc._transport_socket = decode_transport_socket(*ts);
        }
        fc._extra = detail::extra_fields(obj, {"filters", "transport_socket"});
        return fc;
    }

    auto decode_network_filter(const boost::json::object& obj) const -> network_filter {
        network_filter f;
        f._name = detail::string_field(obj, "name");
        if (auto* tc = detail::optional_object(obj, "typed_config")) {
            auto type_url = detail::string_field(*tc, "@type");
            if (type_url == type_urls::http_connection_manager) {
                f._typed_config = decode_http_connection_manager(*tc);
            } else if (type_url == type_urls::tcp_proxy) {
                f._typed_config = decode_tcp_proxy(*tc);
            } else {
                f._typed_config = decode_opaque_config(*tc);
            }
        }
        f._extra = detail::extra_fields(obj, {"name", "typed_config"});
        return f;
    }

    auto decode_http_connection_manager(const boost::json::object& obj) const -> http_connection_manager {
        http_connection_manager hcm;
        if (auto* rds = detail::optional_object(obj, "rds")) {
            rds_config config;
            config._route_config_name = detail::string_field(*rds, "route_config_name");
            if (auto* source = detail::optional_object(*rds, "config_source")) {
                config._config_source = config_source{*source};
            }
            hcm._rds = std::move(config);
        }
        if (auto* rc = detail::optional_object(obj, "route_config")) {
            hcm._route_config = decode_route_configuration(*rc);
        }
        if (auto* filters = detail::optional_array(obj, "http_filters")) {
            for (const auto& f : *filters) {
                const auto& fo = detail::as_object(f, "http filter");
                hcm._http_filters.push_back(http_filter{
                    detail::string_field(fo, "name"),
                    detail::extra_fields(fo, {"name"})
                });
            }
        }
        hcm._extra = detail::extra_fields(obj, {"@type", "rds", "route_config", "http_filters"});
        return hcm;
    }

    auto decode_tcp_proxy(const boost::json::object& obj) const -> tcp_proxy {
        tcp_proxy proxy;
        if (obj.contains("cluster")) {
            proxy._cluster_specifier = cluster_ref{detail::string_field(obj, "cluster")};
        } else if (auto* wc = detail::optional_object(obj, "weighted_clusters")) {
            proxy._cluster_specifier = decode_weighted_clusters(*wc);
        }
        proxy._extra = detail::extra_fields(obj, {"@type", "cluster", "weighted_clusters"});
        return proxy;
    }

    auto decode_weighted_clusters(const boost::json::object& obj) const -> weighted_clusters {
        weighted_clusters wc;
        if (auto* clusters = detail::optional_array(obj, "clusters")) {
            for (const auto& c : *clusters) {
                const auto& co = detail::as_object(c, "weighted cluster");
                wc._clusters.push_back(weighted_cluster_entry{
                    detail::string_field(co, "name"),
                    detail::uint32_field(co, "weight"),
                    detail::extra_fields(co, {"name", "weight"})
                });
            }
        }
        wc._extra = detail::extra_fields(obj, {"clusters"});
        return wc;
    }

    auto decode_transport_socket(const boost::json::object& obj) const -> transport_socket {
        transport_socket ts;
        ts._name = detail::string_field(obj, "name");
        if (auto* tc = detail::optional_object(obj, "typed_config")) {
            auto type_url = detail::string_field(*tc, "@type");
            if (type_url == type_urls::downstream_tls_context) {
                downstream_tls_context ctx;
                if (auto* common = detail::optional_object(*tc, "common_tls_context")) {
                    ctx._common_tls_context = decode_common_tls_context(*common);
                }
                ctx._extra = detail::extra_fields(*tc, {"@type", "common_tls_context"});
                ts._typed_config = std::move(ctx);
            } else if (type_url == type_urls::upstream_tls_context) {
                upstream_tls_context ctx;
                if (auto* common = detail::optional_object(*tc, "common_tls_context")) {
                    ctx._common_tls_context = decode_common_tls_context(*common);
                }
                ctx._extra = detail::extra_fields(*tc, {"@type", "common_tls_context"});
                ts._typed_config = std::move(ctx);
            } else {
                ts._typed_config = decode_opaque_config(*tc);
            }
        }
        return ts;
    }

    auto decode_common_tls_context(const boost::json::object& obj) const -> common_tls_context {
        common_tls_context ctx;
        if (auto* configs = detail::optional_array(obj, "tls_certificate_sds_secret_configs")) {
            for (const auto& sc : *configs) {
                ctx._tls_certificate_sds_secret_configs.push_back(
                    decode_sds_secret_config(detail::as_object(sc, "SDS secret config")));
            }
        }
        if (auto* vc = detail::optional_object(obj, "validation_context_sds_secret_config")) {
            ctx._validation_context_sds_secret_config = decode_sds_secret_config(*vc);
        }
        ctx._extra = detail::extra_fields(obj, {
            "tls_certificate_sds_secret_configs", "validation_context_sds_secret_config"
        });
        return ctx;
    }

    auto decode_sds_secret_config(const boost::json::object& obj) const -> sds_secret_config {
        sds_secret_config sc;
        sc._name = detail::string_field(obj, "name");
        if (auto* source = detail::optional_object(obj, "sds_config")) {
            sc._sds_config = config_source{*source};
        }
        return sc;
    }

    auto decode_virtual_host(const boost::json::object& obj) const -> virtual_host {
        virtual_host vh;
        vh._name = detail::string_field(obj, "name");
        if (auto* routes = detail::optional_array(obj, "routes")) {
            for (const auto& r : *routes) {
                const auto& ro = detail::as_object(r, "route");
                route_entry entry;
                if (auto* action = detail::optional_object(ro, "route")) {
                    entry._route = decode_route_action(*action);
                }
                entry._extra = detail::extra_fields(ro, {"route"});
                vh._routes.push_back(std::move(entry));
            }
        }
        vh._extra = detail::extra_fields(obj, {"name", "routes"});
        return vh;
    }

    auto decode_route_action(const boost::json::object& obj) const -> route_action {
        route_action action;
        if (obj.contains("cluster")) {
            action._cluster_specifier = cluster_ref{detail::string_field(obj, "cluster")};
        } else if (auto* wc = detail::optional_object(obj, "weighted_clusters")) {
            action._cluster_specifier = decode_weighted_clusters(*wc);
        } else {
            for (auto key : opaque_route_specifiers) {
                if (auto it = obj.find(key); it != obj.end()) {
                    action._cluster_specifier = boost::json::object{{key, it->value()}};
                    break;
                }
            }
        }
        if (auto* mirrors = detail::optional_array(obj, "request_mirror_policies")) {
            for (const auto& m : *mirrors) {
                const auto& mo = detail::as_object(m, "request mirror policy");
                action._request_mirror_policies.push_back(request_mirror_policy{
                    detail::string_field(mo, "cluster"),
                    detail::extra_fields(mo, {"cluster"})
                });
            }
        }
        action._extra = detail::extra_fields(obj, {
            "cluster", "weighted_clusters", "cluster_header", "cluster_specifier_plugin",
            "inline_cluster_specifier_plugin", "request_mirror_policies"
        });
        return action;
    }

    auto encode(const address& addr) const -> boost::json::object {
        boost::json::object obj = addr._extra;
        if (addr._socket_address) {
            boost::json::object sa = addr._socket_address->_extra;
            sa["address"] = addr._socket_address->_address;
            sa["port_value"] = addr._socket_address->_port_value;
            obj["socket_address"] = std::move(sa);
        }
        return obj;
    }

    auto encode(const opaque_config& config) const -> boost::json::object {
        boost::json::object obj = config._value;
        obj["@type"] = config._type_url;
        return obj;
    }

    auto encode(const filter_chain& fc) const -> boost::json::object {
        boost::json::object obj = fc._extra;
        if (!fc._filters.empty()) {
            boost::json::array filters;
            for (const auto& f : fc._filters) {
                boost::json::object fo = f._extra;
                fo["name"] = f._name;
                if (f._typed_config) {
                    fo["typed_config"] = std::visit([this](const auto& c) { return encode(c); }, *f._typed_config);
                }
                filters.push_back(std::move(fo));
            }
            obj["filters"] = std::move(filters);
        }
        if (fc._transport_socket) {
            obj["transport_socket"] = encode(*fc._transport_socket);
        }
        return obj;
    }

    auto encode(const http_connection_manager& hcm) const -> boost::json::object {
        boost::json::object obj = hcm._extra;
        obj["@type"] = type_urls::http_connection_manager;
        if (hcm._rds) {
            boost::json::object rds;
            rds["route_config_name"] = hcm._rds->_route_config_name;
            if (hcm._rds->_config_source) {
                rds["config_source"] = hcm._rds->_config_source->_value;
            }
            obj["rds"] = std::move(rds);
        }
        if (hcm._route_config) {
            obj["route_config"] = encode(*hcm._route_config);
        }
        if (!hcm._http_filters.empty()) {
            boost::json::array filters;
            for (const auto& f : hcm._http_filters) {
                boost::json::object fo = f._extra;
                fo["name"] = f._name;
                filters.push_back(std::move(fo));
            }
            obj["http_filters"] = std::move(filters);
        }
        return obj;
    }

    auto encode(const tcp_proxy& proxy) const -> boost::json::object {
        boost::json::object obj = proxy._extra;
        obj["@type"] = type_urls::tcp_proxy;
        if (auto* c = std::get_if<cluster_ref>(&proxy._cluster_specifier)) {
            obj["cluster"] = c->_name;
        } else if (auto* wc = std::get_if<weighted_clusters>(&proxy._cluster_specifier)) {
            obj["weighted_clusters"] = encode(*wc);
        }
        return obj;
    }

    auto encode(const weighted_clusters& wc) const -> boost::json::object {
        boost::json::object obj = wc._extra;
        boost::json::array clusters;
        for (const auto& entry : wc._clusters) {
            boost::json::object eo = entry._extra;
            eo["name"] = entry._name;
            if (entry._weight != 0) {
                eo["weight"] = entry._weight;
            }
            clusters.push_back(std::move(eo));
        }
        obj["clusters"] = std::move(clusters);
        return obj;
    }

    auto encode(const transport_socket& ts) const -> boost::json::object {
        boost::json::object obj;
        obj["name"] = ts._name;
        if (ts._typed_config) {
            obj["typed_config"] = std::visit([this](const auto& c) { return encode(c); }, *ts._typed_config);
        }
        return obj;
    }

    auto encode(const downstream_tls_context& ctx) const -> boost::json::object {
        boost::json::object obj = ctx._extra;
        obj["@type"] = type_urls::downstream_tls_context;
        if (ctx._common_tls_context) {
            obj["common_tls_context"] = encode(*ctx._common_tls_context);
        }
        return obj;
    }

    auto encode(const upstream_tls_context& ctx) const -> boost::json::object {
        boost::json::object obj = ctx._extra;
        obj["@type"] = type_urls::upstream_tls_context;
        if (ctx._common_tls_context) {
            obj["common_tls_context"] = encode(*ctx._common_tls_context);
        }
        return obj;
    }

    auto encode(const common_tls_context& ctx) const -> boost::json::object {
        boost::json::object obj = ctx._extra;
        if (!ctx._tls_certificate_sds_secret_configs.empty()) {
            boost::json::array configs;
            for (const auto& sc : ctx._tls_certificate_sds_secret_configs) {
                configs.push_back(encode(sc));
            }
            obj["tls_certificate_sds_secret_configs"] = std::move(configs);
        }
        if (ctx._validation_context_sds_secret_config) {
            obj["validation_context_sds_secret_config"] = encode(*ctx._validation_context_sds_secret_config);
        }
        return obj;
    }

    auto encode(const sds_secret_config& sc) const -> boost::json::object {
        boost::json::object obj;
        obj["name"] = sc._name;
        if (sc._sds_config) {
            obj["sds_config"] = sc._sds_config->_value;
        }
        return obj;
    }

    auto encode(const route_action& action) const -> boost::json::object {
        boost::json::object obj = action._extra;
        if (auto* c = std::get_if<cluster_ref>(&action._cluster_specifier)) {
            obj["cluster"] = c->_name;
        } else if (auto* wc = std::get_if<weighted_clusters>(&action._cluster_specifier)) {
            obj["weighted_clusters"] = encode(*wc);
        } else if (auto* other = std::get_if<boost::json::object>(&action._cluster_specifier)) {
            for (const auto& kv : *other) {
                obj[kv.key()] = kv.value();
            }
        }
        if (!action._request_mirror_policies.empty()) {
            boost::json::array mirrors;
            for (const auto& m : action._request_mirror_policies) {
                boost::json::object mo = m._extra;
                mo["cluster"] = m._cluster;
                mirrors.push_back(std::move(mo));
            }
            obj["request_mirror_policies"] = std::move(mirrors);
        }
        return obj;
    }

    static constexpr std::string_view opaque_route_specifiers[] = {
        "cluster_header", "cluster_specifier_plugin", "inline_cluster_specifier_plugin"
    };
};

} // namespace xdsync
