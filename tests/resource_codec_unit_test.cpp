#define BOOST_TEST_MODULE ResourceCodecUnitTest
#include <boost/test/unit_test.hpp>

#include <xdsync/exceptions.hpp>
#include <xdsync/resource_codec.hpp>
#include <xdsync/types.hpp>

#include <boost/json.hpp>

#include <string>
#include <variant>

namespace {
    auto raw(std::string_view type_url, std::string_view json) -> xdsync::raw_resource {
        return xdsync::raw_resource{std::string{type_url}, boost::json::parse(json)};
    }

    constexpr std::string_view http_listener_json = R"({
        "name": "http",
        "enable_reuse_port": true,
        "per_connection_buffer_limit_bytes": 32768,
        "filter_chains": [{
            "filters": [{
                "name": "envoy.filters.network.http_connection_manager",
                "typed_config": {
                    "@type": "type.googleapis.com/envoy.extensions.filters.network.http_connection_manager.v3.HttpConnectionManager",
                    "stat_prefix": "http",
                    "rds": {"route_config_name": "routes"},
                    "http_filters": [
                        {"name": "envoy.filters.http.router"}
                    ]
                }
            }]
        }]
    })";
}

BOOST_AUTO_TEST_SUITE(resource_codec_tests)

BOOST_AUTO_TEST_CASE(decode_listener_with_http_connection_manager) {
    xdsync::resource_codec codec;
    auto decoded = codec.decode(raw(xdsync::type_urls::listener, http_listener_json));

    BOOST_REQUIRE(std::holds_alternative<xdsync::listener>(decoded));
    const auto& l = std::get<xdsync::listener>(decoded);
    BOOST_CHECK_EQUAL(l._name, "http");
    BOOST_CHECK(!l._address.has_value());
    BOOST_CHECK(l.needs_allocated_address());
    BOOST_REQUIRE(l._enable_reuse_port.has_value());
    BOOST_CHECK(*l._enable_reuse_port);
    BOOST_CHECK(l._extra.contains("per_connection_buffer_limit_bytes"));

    BOOST_REQUIRE_EQUAL(l._filter_chains.size(), 1u);
    const auto& filter = l._filter_chains[0]._filters[0];
    BOOST_CHECK(filter.is_terminal_content_filter());
    const auto& hcm = std::get<xdsync::http_connection_manager>(*filter._typed_config);
    BOOST_REQUIRE(hcm._rds.has_value());
    BOOST_CHECK_EQUAL(hcm._rds->_route_config_name, "routes");
    BOOST_CHECK(!hcm._rds->_config_source.has_value());
    BOOST_CHECK_EQUAL(hcm._http_filters.size(), 1u);
    BOOST_CHECK(hcm._extra.contains("stat_prefix"));
}

BOOST_AUTO_TEST_CASE(decode_listener_with_address) {
    xdsync::resource_codec codec;
    auto decoded = codec.decode(raw(xdsync::type_urls::listener, R"({
        "name": "fixed",
        "address": {"socket_address": {"address": "0.0.0.0", "port_value": 8080}}
    })"));

    const auto& l = std::get<xdsync::listener>(decoded);
    BOOST_CHECK_EQUAL(l.bound_port(), 8080u);
    BOOST_CHECK_EQUAL(l._address->_socket_address->_address, "0.0.0.0");
    BOOST_CHECK(!l.needs_allocated_address());
}

BOOST_AUTO_TEST_CASE(decode_internal_listener) {
    xdsync::resource_codec codec;
    auto decoded = codec.decode(raw(xdsync::type_urls::listener, R"({
        "name": "internal",
        "internal_listener": {}
    })"));

    const auto& l = std::get<xdsync::listener>(decoded);
    BOOST_CHECK(l._internal_listener);
    BOOST_CHECK(!l.needs_allocated_address());
}

BOOST_AUTO_TEST_CASE(decode_tcp_proxy_with_weighted_clusters) {
    xdsync::resource_codec codec;
    auto decoded = codec.decode(raw(xdsync::type_urls::listener, R"({
        "name": "tcp",
        "filter_chains": [{
            "filters": [{
                "name": "envoy.filters.network.tcp_proxy",
                "typed_config": {
                    "@type": "type.googleapis.com/envoy.extensions.filters.network.tcp_proxy.v3.TcpProxy",
                    "stat_prefix": "tcp",
                    "weighted_clusters": {"clusters": [
                        {"name": "a", "weight": 30},
                        {"name": "b", "weight": 70}
                    ]}
                }
            }]
        }]
    })"));

    const auto& l = std::get<xdsync::listener>(decoded);
    const auto& proxy = std::get<xdsync::tcp_proxy>(*l._filter_chains[0]._filters[0]._typed_config);
    const auto& wc = std::get<xdsync::weighted_clusters>(proxy._cluster_specifier);
    BOOST_REQUIRE_EQUAL(wc._clusters.size(), 2u);
    BOOST_CHECK_EQUAL(wc._clusters[0]._name, "a");
    BOOST_CHECK_EQUAL(wc._clusters[1]._weight, 70u);
}

BOOST_AUTO_TEST_CASE(decode_route_configuration_specifiers) {
    xdsync::resource_codec codec;
    auto decoded = codec.decode(raw(xdsync::type_urls::route, R"({
        "name": "routes",
        "virtual_hosts": [{
            "name": "default",
            "domains": ["*"],
            "routes": [
                {"match": {"prefix": "/a"}, "route": {
                    "cluster": "backend",
                    "request_mirror_policies": [{"cluster": "shadow"}]
                }},
                {"match": {"prefix": "/b"}, "route": {"cluster_header": "x-cluster"}},
                {"match": {"prefix": "/c"}, "direct_response": {"status": 200}}
            ]
        }]
    })"));

    const auto& rc = std::get<xdsync::route_configuration>(decoded);
    BOOST_REQUIRE_EQUAL(rc._virtual_hosts.size(), 1u);
    const auto& vh = rc._virtual_hosts[0];
    BOOST_CHECK(vh._extra.contains("domains"));
    BOOST_REQUIRE_EQUAL(vh._routes.size(), 3u);

    const auto& first = *vh._routes[0]._route;
    BOOST_CHECK_EQUAL(std::get<xdsync::cluster_ref>(first._cluster_specifier)._name, "backend");
    BOOST_REQUIRE_EQUAL(first._request_mirror_policies.size(), 1u);
    BOOST_CHECK_EQUAL(first._request_mirror_policies[0]._cluster, "shadow");

    const auto& second = *vh._routes[1]._route;
    BOOST_CHECK(std::holds_alternative<boost::json::object>(second._cluster_specifier));

    BOOST_CHECK(!vh._routes[2]._route.has_value());
    BOOST_CHECK(vh._routes[2]._extra.contains("direct_response"));
}

BOOST_AUTO_TEST_CASE(decode_cluster_with_tls_and_eds) {
    xdsync::resource_codec codec;
    auto decoded = codec.decode(raw(xdsync::type_urls::cluster, R"({
        "name": "backend",
        "type": "EDS",
        "connect_timeout": "5s",
        "eds_cluster_config": {"service_name": "svc"},
        "transport_socket": {
            "name": "envoy.transport_sockets.tls",
            "typed_config": {
                "@type": "type.googleapis.com/envoy.extensions.transport_sockets.tls.v3.UpstreamTlsContext",
                "sni": "backend.local",
                "common_tls_context": {
                    "tls_certificate_sds_secret_configs": [{"name": "client-cert"}],
                    "validation_context_sds_secret_config": {"name": "ca"}
                }
            }
        }
    })"));

    const auto& c = std::get<xdsync::cluster>(decoded);
    BOOST_CHECK_EQUAL(c._type, "EDS");
    BOOST_REQUIRE(c._eds_cluster_config.has_value());
    BOOST_CHECK(!c._eds_cluster_config->_eds_config.has_value());
    BOOST_CHECK_EQUAL(c._eds_cluster_config->_service_name, "svc");
    BOOST_CHECK(c._extra.contains("connect_timeout"));

    const auto& tls = std::get<xdsync::upstream_tls_context>(*c._transport_socket->_typed_config);
    BOOST_CHECK(tls._extra.contains("sni"));
    BOOST_REQUIRE(tls._common_tls_context.has_value());
    BOOST_CHECK_EQUAL(tls._common_tls_context->_tls_certificate_sds_secret_configs[0]._name, "client-cert");
    BOOST_CHECK_EQUAL(tls._common_tls_context->_validation_context_sds_secret_config->_name, "ca");
}

BOOST_AUTO_TEST_CASE(decode_endpoints_and_secrets) {
    xdsync::resource_codec codec;

    auto endpoints = codec.decode(raw(xdsync::type_urls::endpoint, R"({
        "cluster_name": "backend",
        "endpoints": [{"lb_endpoints": []}]
    })"));
    BOOST_CHECK_EQUAL(std::get<xdsync::cluster_load_assignment>(endpoints)._cluster_name, "backend");
    BOOST_CHECK_EQUAL(xdsync::kind_of(endpoints), xdsync::resource_kind::endpoint);

    auto secret = codec.decode(raw(xdsync::type_urls::secret, R"({
        "name": "cert",
        "tls_certificate": {"certificate_chain": {"inline_string": "x"}}
    })"));
    BOOST_CHECK_EQUAL(xdsync::resource_name(secret), "cert");
    BOOST_CHECK(std::get<xdsync::secret>(secret)._extra.contains("tls_certificate"));
}

BOOST_AUTO_TEST_CASE(unknown_type_url_is_unsupported) {
    xdsync::resource_codec codec;

    try {
        codec.decode(raw("type.googleapis.com/envoy.config.core.v3.Unknown", R"({"name": "x"})"));
        BOOST_FAIL("Expected unsupported_type_exception");
    } catch (const xdsync::unsupported_type_exception& e) {
        BOOST_CHECK_EQUAL(e.get_type_url(), "type.googleapis.com/envoy.config.core.v3.Unknown");
    }
}

BOOST_AUTO_TEST_CASE(shape_disagreeing_with_type_is_a_mismatch) {
    xdsync::resource_codec codec;

    BOOST_CHECK_THROW(
        codec.decode(raw(xdsync::type_urls::listener, R"(["not", "an", "object"])")),
        xdsync::type_mismatch_exception);
    BOOST_CHECK_THROW(
        codec.decode(raw(xdsync::type_urls::listener, R"({"name": 42})")),
        xdsync::type_mismatch_exception);
    BOOST_CHECK_THROW(
        codec.decode(raw(xdsync::type_urls::cluster,
            R"({"@type": "type.googleapis.com/envoy.config.listener.v3.Listener", "name": "x"})")),
        xdsync::type_mismatch_exception);
    BOOST_CHECK_THROW(
        codec.decode(raw(xdsync::type_urls::listener,
            R"({"name": "x", "address": {"socket_address": {"address": "::", "port_value": -1}}})")),
        xdsync::type_mismatch_exception);
}

BOOST_AUTO_TEST_CASE(encode_preserves_unmodeled_fields) {
    xdsync::resource_codec codec;
    auto original = boost::json::parse(http_listener_json).as_object();
    auto decoded = codec.decode(xdsync::raw_resource{std::string{xdsync::type_urls::listener}, original});

    auto encoded = codec.encode(decoded);

    BOOST_CHECK_EQUAL(encoded.at("@type").as_string(), xdsync::type_urls::listener);
    BOOST_CHECK_EQUAL(encoded.at("per_connection_buffer_limit_bytes").to_number<std::int64_t>(), 32768);
    const auto& hcm = encoded.at("filter_chains").as_array()[0]
        .as_object().at("filters").as_array()[0]
        .as_object().at("typed_config").as_object();
    BOOST_CHECK_EQUAL(hcm.at("stat_prefix").as_string(), "http");
    BOOST_CHECK_EQUAL(hcm.at("@type").as_string(), xdsync::type_urls::http_connection_manager);

    // Decoding the encoded form yields the same resource
    auto redecoded = codec.decode(codec.to_raw_resource(decoded));
    BOOST_CHECK(std::get<xdsync::listener>(redecoded) == std::get<xdsync::listener>(decoded));
}

BOOST_AUTO_TEST_CASE(encode_additional_addresses) {
    xdsync::resource_codec codec;
    xdsync::listener l;
    l._name = "dual";
    l._address = xdsync::address{xdsync::socket_address{"127.0.0.1", 10000, {}}, {}};
    l._additional_addresses.push_back(xdsync::address{xdsync::socket_address{"::1", 10000, {}}, {}});

    auto encoded = codec.encode(xdsync::any_resource{l});

    const auto& additional = encoded.at("additional_addresses").as_array();
    BOOST_REQUIRE_EQUAL(additional.size(), 1u);
    BOOST_CHECK_EQUAL(
        additional[0].as_object().at("address").as_object()
            .at("socket_address").as_object().at("address").as_string(),
        "::1");
}

BOOST_AUTO_TEST_SUITE_END()
