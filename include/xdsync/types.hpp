#pragma once

#include "filter_list.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/json.hpp>

namespace xdsync {

// The five resource kinds managed by the reconciler
enum class resource_kind : std::uint8_t {
    listener,
    route,
    cluster,
    endpoint,
    secret
};

inline auto operator<<(std::ostream& os, resource_kind kind) -> std::ostream& {
    switch (kind) {
        case resource_kind::listener:
            return os << "listener";
        case resource_kind::route:
            return os << "route";
        case resource_kind::cluster:
            return os << "cluster";
        case resource_kind::endpoint:
            return os << "endpoint";
        case resource_kind::secret:
            return os << "secret";
        default:
            return os << "unknown";
    }
}

namespace type_urls {

inline constexpr std::string_view listener = "type.googleapis.com/envoy.config.listener.v3.Listener";
inline constexpr std::string_view route = "type.googleapis.com/envoy.config.route.v3.RouteConfiguration";
inline constexpr std::string_view cluster = "type.googleapis.com/envoy.config.cluster.v3.Cluster";
inline constexpr std::string_view endpoint = "type.googleapis.com/envoy.config.endpoint.v3.ClusterLoadAssignment";
inline constexpr std::string_view secret = "type.googleapis.com/envoy.extensions.transport_sockets.tls.v3.Secret";

inline constexpr std::string_view http_connection_manager =
    "type.googleapis.com/envoy.extensions.filters.network.http_connection_manager.v3.HttpConnectionManager";
inline constexpr std::string_view tcp_proxy =
    "type.googleapis.com/envoy.extensions.filters.network.tcp_proxy.v3.TcpProxy";
inline constexpr std::string_view downstream_tls_context =
    "type.googleapis.com/envoy.extensions.transport_sockets.tls.v3.DownstreamTlsContext";
inline constexpr std::string_view upstream_tls_context =
    "type.googleapis.com/envoy.extensions.transport_sockets.tls.v3.UpstreamTlsContext";

inline constexpr std::string_view bpf_metadata = "type.googleapis.com/cilium.BpfMetadata";
inline constexpr std::string_view network_filter = "type.googleapis.com/cilium.NetworkFilter";
inline constexpr std::string_view l7_policy = "type.googleapis.com/cilium.L7Policy";

} // namespace type_urls

// Reserved filter names
namespace filter_names {

inline constexpr std::string_view bpf_metadata = "cilium.bpf_metadata";
inline constexpr std::string_view network = "cilium.network";
inline constexpr std::string_view l7_policy = "cilium.l7policy";
inline constexpr std::string_view http_router = "envoy.filters.http.router";

} // namespace filter_names

inline auto type_url_of(resource_kind kind) -> std::string_view {
    switch (kind) {
        case resource_kind::listener: return type_urls::listener;
        case resource_kind::route:    return type_urls::route;
        case resource_kind::cluster:  return type_urls::cluster;
        case resource_kind::endpoint: return type_urls::endpoint;
        case resource_kind::secret:   return type_urls::secret;
    }
    return {};
}

inline auto kind_of_type_url(std::string_view type_url) -> std::optional<resource_kind> {
    if (type_url == type_urls::listener) return resource_kind::listener;
    if (type_url == type_urls::route)    return resource_kind::route;
    if (type_url == type_urls::cluster)  return resource_kind::cluster;
    if (type_url == type_urls::endpoint) return resource_kind::endpoint;
    if (type_url == type_urls::secret)   return resource_kind::secret;
    return std::nullopt;
}

//=============================================================================
// Shared building blocks
//=============================================================================

// Where the proxy fetches a dynamically referenced resource from.
// Kept as the proto-JSON ConfigSource object.
struct config_source {
    boost::json::object _value;

    auto operator==(const config_source&) const -> bool = default;
};

// The control plane's own xDS source, filled in wherever a source is left unset
inline auto control_plane_config_source() -> config_source {
    boost::json::object grpc_service;
    grpc_service["envoy_grpc"] = boost::json::object{{"cluster_name", "xds-grpc-cilium"}};
    
    boost::json::object api_config_source;
    api_config_source["api_type"] = "GRPC";
    api_config_source["transport_api_version"] = "V3";
    api_config_source["set_node_on_first_message_only"] = true;
    api_config_source["grpc_services"] = boost::json::array{grpc_service};
    
    boost::json::object source;
    source["resource_api_version"] = "V3";
    source["api_config_source"] = std::move(api_config_source);
    return config_source{std::move(source)};
}

struct socket_address {
    std::string _address;
    std::uint32_t _port_value{0};
    boost::json::object _extra;

    auto operator==(const socket_address&) const -> bool = default;
};

// Only socket addresses are interpreted; pipes and internal addresses stay in _extra
struct address {
    std::optional<socket_address> _socket_address;
    boost::json::object _extra;

    auto operator==(const address&) const -> bool = default;
};

// A typed config this library does not interpret; kept verbatim
struct opaque_config {
    std::string _type_url;
    boost::json::object _value;

    auto operator==(const opaque_config&) const -> bool = default;
};

//=============================================================================
// Transport sockets
//=============================================================================

struct sds_secret_config {
    std::string _name;
    std::optional<config_source> _sds_config;

    auto operator==(const sds_secret_config&) const -> bool = default;
};

struct common_tls_context {
    std::vector<sds_secret_config> _tls_certificate_sds_secret_configs;
    std::optional<sds_secret_config> _validation_context_sds_secret_config;
    boost::json::object _extra;

    auto operator==(const common_tls_context&) const -> bool = default;
};

struct downstream_tls_context {
    std::optional<common_tls_context> _common_tls_context;
    boost::json::object _extra;

    auto operator==(const downstream_tls_context&) const -> bool = default;
};

struct upstream_tls_context {
    std::optional<common_tls_context> _common_tls_context;
    boost::json::object _extra;

    auto operator==(const upstream_tls_context&) const -> bool = default;
};

using transport_socket_config = std::variant<downstream_tls_context, upstream_tls_context, opaque_config>;

struct transport_socket {
    std::string _name;
    std::optional<transport_socket_config> _typed_config;

    auto operator==(const transport_socket&) const -> bool = default;
};

//=============================================================================
// Routes
//=============================================================================

struct weighted_cluster_entry {
    std::string _name;
    std::uint32_t _weight{0};
    boost::json::object _extra;

    auto operator==(const weighted_cluster_entry&) const -> bool = default;
};

struct weighted_clusters {
    std::vector<weighted_cluster_entry> _clusters;
    boost::json::object _extra;

    auto operator==(const weighted_clusters&) const -> bool = default;
};

struct cluster_ref {
    std::string _name;

    auto operator==(const cluster_ref&) const -> bool = default;
};

// Cluster specifier of a route action. Alternatives other than a single
// cluster or weighted clusters (e.g. cluster_header) are kept as opaque JSON.
using route_cluster_specifier = std::variant<std::monostate, cluster_ref, weighted_clusters, boost::json::object>;

struct request_mirror_policy {
    std::string _cluster;
    boost::json::object _extra;

    auto operator==(const request_mirror_policy&) const -> bool = default;
};

struct route_action {
    route_cluster_specifier _cluster_specifier;
    std::vector<request_mirror_policy> _request_mirror_policies;
    boost::json::object _extra;

    auto operator==(const route_action&) const -> bool = default;
};

struct route_entry {
    std::optional<route_action> _route;
    boost::json::object _extra;

    auto operator==(const route_entry&) const -> bool = default;
};

struct virtual_host {
    std::string _name;
    std::vector<route_entry> _routes;
    boost::json::object _extra;

    auto operator==(const virtual_host&) const -> bool = default;
};

struct route_configuration {
    std::string _name;
    std::vector<virtual_host> _virtual_hosts;
    boost::json::object _extra;

    auto operator==(const route_configuration&) const -> bool = default;
};

//=============================================================================
// Listener filters
//=============================================================================

struct http_filter {
    std::string _name;
    boost::json::object _extra;

    auto operator==(const http_filter&) const -> bool = default;
};

struct rds_config {
    std::string _route_config_name;
    std::optional<config_source> _config_source;

    auto operator==(const rds_config&) const -> bool = default;
};

struct http_connection_manager {
    std::optional<rds_config> _rds;
    std::optional<route_configuration> _route_config;
    filter_list<http_filter> _http_filters;
    boost::json::object _extra;

    auto operator==(const http_connection_manager&) const -> bool = default;
};

// Cluster specifier of a TCP proxy
using tcp_cluster_specifier = std::variant<std::monostate, cluster_ref, weighted_clusters>;

struct tcp_proxy {
    tcp_cluster_specifier _cluster_specifier;
    boost::json::object _extra;

    auto operator==(const tcp_proxy&) const -> bool = default;
};

using network_filter_config = std::variant<http_connection_manager, tcp_proxy, opaque_config>;

struct network_filter {
    std::string _name;
    std::optional<network_filter_config> _typed_config;
    boost::json::object _extra;

    auto operator==(const network_filter&) const -> bool = default;

    // HTTP connection manager and TCP proxy terminate a chain's content processing
    [[nodiscard]] auto is_terminal_content_filter() const -> bool {
        return _typed_config.has_value() &&
            (std::holds_alternative<http_connection_manager>(*_typed_config) ||
             std::holds_alternative<tcp_proxy>(*_typed_config));
    }
};

struct filter_chain {
    filter_list<network_filter> _filters;
    std::optional<transport_socket> _transport_socket;
    boost::json::object _extra;

    auto operator==(const filter_chain&) const -> bool = default;
};

struct listener_filter {
    std::string _name;
    std::optional<opaque_config> _typed_config;
    boost::json::object _extra;

    auto operator==(const listener_filter&) const -> bool = default;
};

//=============================================================================
// Top-level resources
//=============================================================================

struct listener {
    std::string _name;
    std::optional<address> _address;
    std::vector<address> _additional_addresses;
    bool _internal_listener{false};
    std::optional<bool> _enable_reuse_port;
    std::vector<listener_filter> _listener_filters;
    std::vector<filter_chain> _filter_chains;
    boost::json::object _extra;

    auto operator==(const listener&) const -> bool = default;


    // Port the listener is bound to, 0 when no address is set
    [[nodiscard]] auto bound_port() const -> std::uint32_t {
        if (_address.has_value() && _address->_socket_address.has_value()) {
            return _address->_socket_address->_port_value;
        }
        return 0;
    }

    // Listeners without an address that are not process-internal get their
    // address from the port allocator and carry the control plane's filters
    [[nodiscard]] auto needs_allocated_address() const -> bool {
        return !_address.has_value() && !_internal_listener;
    }
};

struct eds_cluster_config {
    std::optional<config_source> _eds_config;
    std::string _service_name;

    auto operator==(const eds_cluster_config&) const -> bool = default;
};

struct cluster_load_assignment {
    std::string _cluster_name;
    boost::json::object _extra;

    auto operator==(const cluster_load_assignment&) const -> bool = default;

};

struct cluster {
    std::string _name;
    std::string _type;
    std::optional<eds_cluster_config> _eds_cluster_config;
    std::optional<cluster_load_assignment> _load_assignment;
    std::optional<transport_socket> _transport_socket;
    boost::json::object _extra;

    auto operator==(const cluster&) const -> bool = default;

};

struct secret {
    std::string _name;
    boost::json::object _extra;

    auto operator==(const secret&) const -> bool = default;

};

// Key of a top-level resource within its kind (endpoints are keyed by cluster name)
inline auto resource_name(const route_configuration& route) -> const std::string& { return route._name; }
inline auto resource_name(const listener& l) -> const std::string& { return l._name; }
inline auto resource_name(const cluster& c) -> const std::string& { return c._name; }
inline auto resource_name(const cluster_load_assignment& e) -> const std::string& { return e._cluster_name; }
inline auto resource_name(const secret& s) -> const std::string& { return s._name; }

// Any one top-level resource, as stored by a push channel
using any_resource = std::variant<listener, route_configuration, cluster, cluster_load_assignment, secret>;

inline auto kind_of(const any_resource& resource) -> resource_kind {
    switch (resource.index()) {
        case 0: return resource_kind::listener;
        case 1: return resource_kind::route;
        case 2: return resource_kind::cluster;
        case 3: return resource_kind::endpoint;
        default: return resource_kind::secret;
    }
}

inline auto resource_name(const any_resource& resource) -> const std::string& {
    return std::visit([](const auto& r) -> const std::string& { return resource_name(r); }, resource);
}

// A resource as received in a batch, before decoding
struct raw_resource {
    std::string _type_url;
    boost::json::value _value;
};

} // namespace xdsync
