/**
 * Example: Reconciling a configuration object
 *
 * This example demonstrates:
 * 1. Parsing and normalizing the resources of one configuration object
 * 2. Binding proxy ports to listeners that carry no address
 * 3. Installing, updating and uninstalling the batch against an in-memory cache
 * 4. A rejected update rolling back to the installed state
 */

#include <xdsync/xdsync.hpp>

#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/init/Init.h>

#include <boost/json.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {
    constexpr std::string_view config_namespace = "default";
    constexpr std::string_view config_name = "envoy-lb";
    constexpr std::size_t executor_threads = 2;

    using normalizer_type = xdsync::resource_normalizer<xdsync::structural_resource_validator, xdsync::console_logger>;
    using binder_type = xdsync::port_allocation_binder<xdsync::memory_port_allocator, xdsync::console_logger>;
    using reconciler_type = xdsync::reconciler<xdsync::memory_push_channel, xdsync::console_logger>;

    auto make_listener(const std::string& name, const std::string& route) -> xdsync::raw_resource {
        auto hcm = boost::json::object{
            {"@type", std::string{xdsync::type_urls::http_connection_manager}},
            {"stat_prefix", name},
            {"rds", boost::json::object{{"route_config_name", route}}},
            {"http_filters", boost::json::array{
                boost::json::object{{"name", std::string{xdsync::filter_names::http_router}}}
            }}
        };
        auto listener = boost::json::object{
            {"name", name},
            {"filter_chains", boost::json::array{
                boost::json::object{{"filters", boost::json::array{
                    boost::json::object{
                        {"name", "envoy.filters.network.http_connection_manager"},
                        {"typed_config", hcm}
                    }
                }}}
            }}
        };
        return xdsync::raw_resource{std::string{xdsync::type_urls::listener}, listener};
    }

    auto make_route(const std::string& name, const std::string& cluster) -> xdsync::raw_resource {
        auto route = boost::json::object{
            {"name", name},
            {"virtual_hosts", boost::json::array{
                boost::json::object{
                    {"name", "default"},
                    {"domains", boost::json::array{"*"}},
                    {"routes", boost::json::array{
                        boost::json::object{
                            {"match", boost::json::object{{"prefix", "/"}}},
                            {"route", boost::json::object{{"cluster", cluster}}}
                        }
                    }}
                }
            }}
        };
        return xdsync::raw_resource{std::string{xdsync::type_urls::route}, route};
    }

    auto make_cluster(const std::string& name) -> xdsync::raw_resource {
        auto cluster = boost::json::object{
            {"name", name},
            {"type", "EDS"},
            {"connect_timeout", "5s"}
        };
        return xdsync::raw_resource{std::string{xdsync::type_urls::cluster}, cluster};
    }

    auto print_cache(xdsync::memory_push_channel& channel) -> void {
        std::cout << "  cache: "
                  << channel.count(xdsync::resource_kind::listener) << " listener(s), "
                  << channel.count(xdsync::resource_kind::route) << " route(s), "
                  << channel.count(xdsync::resource_kind::cluster) << " cluster(s)\n";
    }
}

class agent {
public:
    agent(const xdsync::reconciler_configuration& config, std::shared_ptr<folly::Executor> executor)
        : _allocator(std::make_shared<xdsync::memory_port_allocator>(config.min_port(), config.max_port()))
        , _channel(std::move(executor))
        , _normalizer(config, xdsync::structural_resource_validator{},
                      xdsync::console_logger{xdsync::log_level::info, "normalizer"})
        , _binder(_allocator, xdsync::console_logger{xdsync::log_level::info, "port-binder"},
                  config.ipv4_enabled(), config.ipv6_enabled())
        , _reconciler(_channel, xdsync::console_logger{xdsync::log_level::info, "reconciler"})
        , _timeout(config.batch_timeout()) {}

    auto build(const std::vector<xdsync::raw_resource>& raw, xdsync::allocation_intent intent) -> xdsync::resource_set {
        auto set = _normalizer.parse_resources(config_namespace, config_name, raw);
        _binder.bind(set, intent);
        return set;
    }

    auto install(const std::vector<xdsync::raw_resource>& raw) -> void {
        auto set = build(raw, xdsync::allocation_intent::apply);
        _reconciler.install(xdsync::batch_context{_timeout}, set);
    }

    auto update(const std::vector<xdsync::raw_resource>& old_raw, const std::vector<xdsync::raw_resource>& new_raw) -> void {
        auto old_set = build(old_raw, xdsync::allocation_intent::remove);
        auto new_set = build(new_raw, xdsync::allocation_intent::apply);
        _reconciler.update(xdsync::batch_context{_timeout}, old_set, new_set);
    }

    auto uninstall(const std::vector<xdsync::raw_resource>& raw) -> void {
        auto set = build(raw, xdsync::allocation_intent::remove);
        _reconciler.uninstall(xdsync::batch_context{_timeout}, set);
    }

    auto channel() -> xdsync::memory_push_channel& { return _channel; }
    auto allocator() -> xdsync::memory_port_allocator& { return *_allocator; }

private:
    std::shared_ptr<xdsync::memory_port_allocator> _allocator;
    xdsync::memory_push_channel _channel;
    normalizer_type _normalizer;
    binder_type _binder;
    reconciler_type _reconciler;
    std::chrono::milliseconds _timeout;
};

auto run_lifecycle(agent& a) -> bool {
    std::vector<xdsync::raw_resource> first{
        make_listener("web", "web-routes"),
        make_route("web-routes", "backend"),
        make_cluster("backend")
    };
    std::vector<xdsync::raw_resource> second{
        make_listener("web", "web-routes"),
        make_route("web-routes", "backend-v2"),
        make_cluster("backend-v2")
    };

    std::cout << "Scenario 1: install\n";
    a.install(first);
    print_cache(a.channel());
    auto scope = xdsync::resource_scope{std::string{config_namespace}, std::string{config_name}};
    auto listener_name = xdsync::qualify_resource_name(scope, "web").first;
    if (auto port = a.allocator().get_port(listener_name)) {
        std::cout << "  " << listener_name << " listens on port " << *port << "\n";
    }

    std::cout << "Scenario 2: update to a new backend\n";
    a.update(first, second);
    print_cache(a.channel());

    std::cout << "Scenario 3: rejected update rolls back\n";
    a.channel().set_ack_policy([](xdsync::resource_kind kind, const std::string&, xdsync::push_operation op) {
        return (kind == xdsync::resource_kind::cluster && op == xdsync::push_operation::upsert)
            ? xdsync::ack_decision::reject
            : xdsync::ack_decision::ack;
    });
    try {
        a.update(second, first);
        std::cerr << "  update was expected to fail\n";
        return false;
    } catch (const xdsync::push_rejected_exception& e) {
        std::cout << "  rejected: " << e.what() << "\n";
    }
    a.channel().set_ack_policy(xdsync::ack_everything());
    print_cache(a.channel());

    std::cout << "Scenario 4: uninstall\n";
    a.uninstall(second);
    print_cache(a.channel());

    return a.channel().snapshot() == xdsync::channel_snapshot{};
}

auto main(int argc, char* argv[]) -> int {
    folly::Init init(&argc, &argv);

    try {
        auto config = xdsync::reconciler_configuration{};
        if (argc > 1) {
            config = xdsync::parse_configuration(argv[1]);
        }

        auto executor = std::make_shared<folly::CPUThreadPoolExecutor>(executor_threads);
        auto ok = false;
        {
            agent a{config, executor};
            ok = run_lifecycle(a);
        }
        executor->join();

        std::cout << (ok ? "All scenarios passed\n" : "Scenarios failed\n");
        return ok ? 0 : 1;
    } catch (const xdsync::xdsync_exception& e) {
        std::cerr << "xdsync error: " << e.what() << "\n";
        return 1;
    }
}
