#define BOOST_TEST_MODULE ResourceNormalizerUnitTest
#include <boost/test/unit_test.hpp>

#include <xdsync/configuration.hpp>
#include <xdsync/exceptions.hpp>
#include <xdsync/recording_logger.hpp>
#include <xdsync/resource_normalizer.hpp>
#include <xdsync/resource_validator.hpp>
#include <xdsync/types.hpp>

#include <boost/json.hpp>

#include <string>
#include <variant>
#include <vector>

namespace {
    using test_normalizer = xdsync::resource_normalizer<
        xdsync::structural_resource_validator,
        xdsync::recording_logger>;

    constexpr std::string_view test_namespace = "kube-system";
    constexpr std::string_view test_name = "ingress";

    auto raw(std::string_view type_url, std::string_view json) -> xdsync::raw_resource {
        return xdsync::raw_resource{std::string{type_url}, boost::json::parse(json)};
    }

    auto make_normalizer(xdsync::reconciler_configuration config = {}) -> test_normalizer {
        return test_normalizer{std::move(config), xdsync::structural_resource_validator{}, xdsync::recording_logger{}};
    }

    auto qualified(std::string_view name) -> std::string {
        return std::string{test_namespace} + "/" + std::string{test_name} + "/" + std::string{name};
    }

    constexpr std::string_view http_listener_json = R"({
        "name": "http",
        "filter_chains": [{
            "filters": [
                {"name": "envoy.filters.network.rbac", "typed_config": {"@type": "type.googleapis.com/envoy.extensions.filters.network.rbac.v3.RBAC"}},
                {"name": "envoy.filters.network.http_connection_manager", "typed_config": {
                    "@type": "type.googleapis.com/envoy.extensions.filters.network.http_connection_manager.v3.HttpConnectionManager",
                    "rds": {"route_config_name": "routes"},
                    "http_filters": [
                        {"name": "envoy.filters.http.cors"},
                        {"name": "envoy.filters.http.router"}
                    ]
                }}
            ]
        }]
    })";

    auto terminal_hcm(const xdsync::filter_chain& fc) -> const xdsync::http_connection_manager& {
        auto it = fc._filters.find_if([](const xdsync::network_filter& f) { return f.is_terminal_content_filter(); });
        return std::get<xdsync::http_connection_manager>(*it->_typed_config);
    }
}

BOOST_AUTO_TEST_SUITE(resource_normalizer_tests)

BOOST_AUTO_TEST_CASE(allocated_listener_gets_agent_filters) {
    auto normalizer = make_normalizer();
    auto set = normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::listener, http_listener_json)
    });

    BOOST_REQUIRE_EQUAL(set._listeners.size(), 1u);
    const auto& l = set._listeners[0];
    BOOST_CHECK_EQUAL(l._name, qualified("http"));

    BOOST_REQUIRE_EQUAL(l._listener_filters.size(), 1u);
    const auto& bpf = l._listener_filters[0];
    BOOST_CHECK_EQUAL(bpf._name, xdsync::filter_names::bpf_metadata);
    BOOST_REQUIRE(bpf._typed_config.has_value());
    BOOST_CHECK_EQUAL(bpf._typed_config->_type_url, xdsync::type_urls::bpf_metadata);
    BOOST_CHECK_EQUAL(bpf._typed_config->_value.at("bpf_root").as_string(), "/sys/fs/bpf");
    BOOST_CHECK(!bpf._typed_config->_value.at("is_ingress").as_bool());
    BOOST_CHECK(bpf._typed_config->_value.at("use_original_source_address").as_bool());
    BOOST_CHECK(!bpf._typed_config->_value.at("is_l7lb").as_bool());

    const auto& fc = l._filter_chains[0];
    BOOST_REQUIRE_EQUAL(fc._filters.size(), 3u);
    BOOST_CHECK_EQUAL(fc._filters.position_of("envoy.filters.network.rbac"), 0);
    BOOST_CHECK_EQUAL(fc._filters.position_of(xdsync::filter_names::network), 1);
    BOOST_CHECK_EQUAL(fc._filters.position_of("envoy.filters.network.http_connection_manager"), 2);

    const auto& hcm = terminal_hcm(fc);
    BOOST_CHECK_EQUAL(hcm._http_filters.position_of(xdsync::filter_names::l7_policy), 1);
    BOOST_CHECK_EQUAL(hcm._http_filters.position_of(xdsync::filter_names::http_router), 2);
    BOOST_REQUIRE(hcm._rds.has_value());
    BOOST_CHECK_EQUAL(hcm._rds->_route_config_name, qualified("routes"));
    BOOST_REQUIRE(hcm._rds->_config_source.has_value());
    BOOST_CHECK(*hcm._rds->_config_source == xdsync::control_plane_config_source());
}

BOOST_AUTO_TEST_CASE(addressed_listener_gets_only_bpf_metadata) {
    auto normalizer = make_normalizer();
    auto set = normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::listener, R"({
            "name": "fixed",
            "address": {"socket_address": {"address": "0.0.0.0", "port_value": 8080}},
            "filter_chains": [{"filters": [{"name": "envoy.filters.network.http_connection_manager", "typed_config": {
                "@type": "type.googleapis.com/envoy.extensions.filters.network.http_connection_manager.v3.HttpConnectionManager",
                "http_filters": [{"name": "envoy.filters.http.router"}]
            }}]}]
        })")
    });

    const auto& l = set._listeners[0];
    BOOST_CHECK_EQUAL(l._listener_filters.size(), 1u);
    const auto& fc = l._filter_chains[0];
    BOOST_CHECK(!fc._filters.contains_name(xdsync::filter_names::network));
    BOOST_CHECK(!terminal_hcm(fc)._http_filters.contains_name(xdsync::filter_names::l7_policy));
}

BOOST_AUTO_TEST_CASE(internal_listener_is_left_without_agent_filters) {
    auto normalizer = make_normalizer();
    auto set = normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::listener, R"({"name": "internal", "internal_listener": {}})")
    });

    BOOST_CHECK(set._listeners[0]._listener_filters.empty());
    BOOST_CHECK_EQUAL(set._listeners[0]._name, qualified("internal"));
}

BOOST_AUTO_TEST_CASE(bpf_tproxy_disables_reuse_port) {
    xdsync::reconciler_configuration config;
    config._enable_bpf_tproxy = true;
    config._is_l7lb = true;
    auto normalizer = make_normalizer(config);

    auto set = normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::listener, R"({"name": "l", "enable_reuse_port": true})")
    });

    const auto& l = set._listeners[0];
    BOOST_REQUIRE(l._enable_reuse_port.has_value());
    BOOST_CHECK(!*l._enable_reuse_port);
    BOOST_CHECK(l._listener_filters[0]._typed_config->_value.at("is_l7lb").as_bool());
}

BOOST_AUTO_TEST_CASE(only_first_terminal_filter_is_processed) {
    auto normalizer = make_normalizer();
    auto set = normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::listener, R"({
            "name": "two",
            "filter_chains": [{"filters": [
                {"name": "first", "typed_config": {
                    "@type": "type.googleapis.com/envoy.extensions.filters.network.tcp_proxy.v3.TcpProxy",
                    "cluster": "backend"
                }},
                {"name": "second", "typed_config": {
                    "@type": "type.googleapis.com/envoy.extensions.filters.network.tcp_proxy.v3.TcpProxy",
                    "cluster": "untouched"
                }}
            ]}]
        })")
    });

    const auto& filters = set._listeners[0]._filter_chains[0]._filters;
    BOOST_REQUIRE_EQUAL(filters.size(), 3u);
    BOOST_CHECK_EQUAL(filters[0]._name, xdsync::filter_names::network);
    const auto& first = std::get<xdsync::tcp_proxy>(*filters[1]._typed_config);
    const auto& second = std::get<xdsync::tcp_proxy>(*filters[2]._typed_config);
    BOOST_CHECK_EQUAL(std::get<xdsync::cluster_ref>(first._cluster_specifier)._name, qualified("backend"));
    BOOST_CHECK_EQUAL(std::get<xdsync::cluster_ref>(second._cluster_specifier)._name, "untouched");
}

BOOST_AUTO_TEST_CASE(route_names_and_cluster_references_are_qualified) {
    auto normalizer = make_normalizer();
    auto set = normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::route, R"({
            "name": "team/routes",
            "virtual_hosts": [{
                "name": "default",
                "routes": [
                    {"route": {"cluster": "backend", "request_mirror_policies": [{"cluster": "shadow"}]}},
                    {"route": {"cluster": "other-ns/other/backend"}},
                    {"route": {"weighted_clusters": {"clusters": [{"name": "a", "weight": 1}, {"name": "b", "weight": 1}]}}}
                ]
            }]
        })")
    });

    const auto& rc = set._routes[0];
    BOOST_CHECK_EQUAL(rc._name, qualified("team/routes"));
    const auto& vh = rc._virtual_hosts[0];
    BOOST_CHECK_EQUAL(vh._name, qualified("default"));

    const auto& first = *vh._routes[0]._route;
    BOOST_CHECK_EQUAL(std::get<xdsync::cluster_ref>(first._cluster_specifier)._name, qualified("backend"));
    BOOST_CHECK_EQUAL(first._request_mirror_policies[0]._cluster, qualified("shadow"));

    const auto& second = *vh._routes[1]._route;
    BOOST_CHECK_EQUAL(std::get<xdsync::cluster_ref>(second._cluster_specifier)._name, "other-ns/other/backend");

    const auto& third = std::get<xdsync::weighted_clusters>(vh._routes[2]._route->_cluster_specifier);
    BOOST_CHECK_EQUAL(third._clusters[0]._name, qualified("a"));
    BOOST_CHECK_EQUAL(third._clusters[1]._name, qualified("b"));
}

BOOST_AUTO_TEST_CASE(eds_cluster_gets_control_plane_source) {
    auto normalizer = make_normalizer();
    auto set = normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::cluster, R"({"name": "eds", "type": "EDS"})"),
        raw(xdsync::type_urls::cluster, R"({
            "name": "static",
            "type": "STATIC",
            "load_assignment": {"cluster_name": "static"}
        })")
    });

    const auto& eds = set._clusters[0];
    BOOST_CHECK_EQUAL(eds._name, qualified("eds"));
    BOOST_REQUIRE(eds._eds_cluster_config.has_value());
    BOOST_CHECK(*eds._eds_cluster_config->_eds_config == xdsync::control_plane_config_source());

    const auto& fixed = set._clusters[1];
    BOOST_CHECK(!fixed._eds_cluster_config.has_value());
    BOOST_CHECK_EQUAL(fixed._load_assignment->_cluster_name, qualified("static"));
}

BOOST_AUTO_TEST_CASE(tls_secret_references_are_sourced_and_qualified) {
    auto normalizer = make_normalizer();
    auto set = normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::cluster, R"({
            "name": "tls",
            "transport_socket": {"name": "envoy.transport_sockets.tls", "typed_config": {
                "@type": "type.googleapis.com/envoy.extensions.transport_sockets.tls.v3.UpstreamTlsContext",
                "common_tls_context": {
                    "tls_certificate_sds_secret_configs": [{"name": "client"}],
                    "validation_context_sds_secret_config": {"name": "ca"}
                }
            }}
        })"),
        raw(xdsync::type_urls::secret, R"({"name": "client"})")
    });

    const auto& tls = std::get<xdsync::upstream_tls_context>(*set._clusters[0]._transport_socket->_typed_config);
    const auto& cert = tls._common_tls_context->_tls_certificate_sds_secret_configs[0];
    BOOST_CHECK_EQUAL(cert._name, qualified("client"));
    BOOST_CHECK(cert._sds_config.has_value());
    BOOST_CHECK_EQUAL(tls._common_tls_context->_validation_context_sds_secret_config->_name, qualified("ca"));
    BOOST_CHECK_EQUAL(set._secrets[0]._name, qualified("client"));
}

BOOST_AUTO_TEST_CASE(endpoints_are_keyed_by_qualified_cluster_name) {
    auto normalizer = make_normalizer();
    auto set = normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::endpoint, R"({"cluster_name": "backend"})")
    });

    BOOST_CHECK_EQUAL(set._endpoints[0]._cluster_name, qualified("backend"));
}

BOOST_AUTO_TEST_CASE(empty_type_url_entries_are_skipped) {
    auto normalizer = make_normalizer();
    auto set = normalizer.parse_resources(test_namespace, test_name, {
        xdsync::raw_resource{"", boost::json::parse(R"({"name": "ignored"})")},
        raw(xdsync::type_urls::secret, R"({"name": "kept"})")
    });

    BOOST_CHECK_EQUAL(set.size(), 1u);
}

BOOST_AUTO_TEST_CASE(missing_name_is_rejected) {
    auto normalizer = make_normalizer();

    try {
        normalizer.parse_resources(test_namespace, test_name, {
            raw(xdsync::type_urls::cluster, R"({"type": "STATIC"})")
        });
        BOOST_FAIL("Expected missing_name_exception");
    } catch (const xdsync::missing_name_exception& e) {
        BOOST_CHECK_EQUAL(e.get_type_url(), xdsync::type_urls::cluster);
    }
}

BOOST_AUTO_TEST_CASE(duplicate_names_are_rejected_after_qualification) {
    auto normalizer = make_normalizer();

    BOOST_CHECK_THROW(
        normalizer.parse_resources(test_namespace, test_name, {
            raw(xdsync::type_urls::secret, R"({"name": "a"})"),
            raw(xdsync::type_urls::secret, R"({"name": "a"})")
        }),
        xdsync::duplicate_name_exception);

    try {
        normalizer.parse_resources(test_namespace, test_name, {
            raw(xdsync::type_urls::cluster, R"({"name": "backend"})"),
            raw(xdsync::type_urls::cluster, R"({"name": "kube-system/ingress/backend"})")
        });
        BOOST_FAIL("Expected duplicate_name_exception");
    } catch (const xdsync::duplicate_name_exception& e) {
        BOOST_CHECK_EQUAL(e.get_name(), qualified("backend"));
    }
}

BOOST_AUTO_TEST_CASE(same_name_in_different_kinds_is_allowed) {
    auto normalizer = make_normalizer();

    auto set = normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::cluster, R"({"name": "backend"})"),
        raw(xdsync::type_urls::endpoint, R"({"cluster_name": "backend"})")
    });
    BOOST_CHECK_EQUAL(set.size(), 2u);
}

BOOST_AUTO_TEST_CASE(validation_rejects_out_of_range_port) {
    xdsync::reconciler_configuration config;
    config._validate = true;
    auto normalizer = make_normalizer(config);

    try {
        normalizer.parse_resources(test_namespace, test_name, {
            raw(xdsync::type_urls::listener, R"({
                "name": "bad",
                "address": {"socket_address": {"address": "0.0.0.0", "port_value": 70000}}
            })")
        });
        BOOST_FAIL("Expected validation_exception");
    } catch (const xdsync::validation_exception& e) {
        BOOST_CHECK_EQUAL(e.get_name(), qualified("bad"));
        BOOST_CHECK(e.get_reason().find("port_value") != std::string::npos);
        BOOST_CHECK(e.get_content().find("70000") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(validation_disabled_accepts_structural_errors) {
    auto normalizer = make_normalizer();

    auto set = normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::listener, R"({
            "name": "bad",
            "address": {"socket_address": {"address": "0.0.0.0", "port_value": 70000}}
        })")
    });
    BOOST_CHECK_EQUAL(set._listeners.size(), 1u);
}

BOOST_AUTO_TEST_CASE(parse_logs_resource_counts) {
    xdsync::recording_logger logger;
    test_normalizer normalizer{xdsync::reconciler_configuration{}, xdsync::structural_resource_validator{}, logger};

    normalizer.parse_resources(test_namespace, test_name, {
        raw(xdsync::type_urls::secret, R"({"name": "a"})"),
        raw(xdsync::type_urls::secret, R"({"name": "b"})")
    });

    bool found = false;
    for (const auto& record : logger.records()) {
        if (record.message == "Parsed resources") {
            found = true;
            BOOST_CHECK(record.level == xdsync::log_level::info);
            BOOST_CHECK_EQUAL(record.field("secrets"), "2");
            BOOST_CHECK_EQUAL(record.field("namespace"), test_namespace);
        }
    }
    BOOST_CHECK(found);
}

BOOST_AUTO_TEST_SUITE_END()
