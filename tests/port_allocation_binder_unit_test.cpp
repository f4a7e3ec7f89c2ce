#define BOOST_TEST_MODULE PortAllocationBinderUnitTest
#include <boost/test/unit_test.hpp>

#include <xdsync/batch_context.hpp>
#include <xdsync/completion_exceptions.hpp>
#include <xdsync/exceptions.hpp>
#include <xdsync/port_allocation_binder.hpp>
#include <xdsync/port_allocator.hpp>
#include <xdsync/recording_logger.hpp>
#include <xdsync/resource_set.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace {
    using test_binder = xdsync::port_allocation_binder<xdsync::memory_port_allocator, xdsync::recording_logger>;

    constexpr std::uint16_t min_port = 15000;
    constexpr std::uint16_t max_port = 15002;

    auto addressless(const std::string& name) -> xdsync::listener {
        xdsync::listener l;
        l._name = name;
        return l;
    }

    auto addressed(const std::string& name, std::uint32_t port) -> xdsync::listener {
        xdsync::listener l;
        l._name = name;
        l._address = xdsync::address{xdsync::socket_address{"0.0.0.0", port, {}}, {}};
        return l;
    }

    auto invoke(xdsync::resource_set& set, const std::string& name, std::exception_ptr error = nullptr) -> void {
        auto callback = set._port_callbacks.consume(name);
        BOOST_REQUIRE(callback.has_value());
        xdsync::batch_context ctx{std::chrono::milliseconds{1000}};
        (*callback)(ctx, error);
    }
}

BOOST_AUTO_TEST_SUITE(memory_port_allocator_tests)

BOOST_AUTO_TEST_CASE(invalid_range_is_rejected) {
    BOOST_CHECK_THROW(xdsync::memory_port_allocator(0, 10), std::invalid_argument);
    BOOST_CHECK_THROW(xdsync::memory_port_allocator(20, 10), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(same_name_keeps_its_port_until_released) {
    xdsync::memory_port_allocator allocator{min_port, max_port};

    auto first = allocator.allocate_proxy_port("a", false, true);
    auto again = allocator.allocate_proxy_port("a", false, true);
    auto other = allocator.allocate_proxy_port("b", false, true);

    BOOST_CHECK_EQUAL(first, min_port);
    BOOST_CHECK_EQUAL(again, first);
    BOOST_CHECK_NE(other, first);
    BOOST_CHECK_EQUAL(allocator.get_leased_count(), 2u);

    allocator.release_proxy_port("a");
    BOOST_CHECK(allocator.get_state("a") == xdsync::lease_state::released);
    BOOST_CHECK(!allocator.get_port("a").has_value());
    BOOST_CHECK_EQUAL(allocator.allocate_proxy_port("c", false, true), min_port);
}

BOOST_AUTO_TEST_CASE(ack_commits_an_allocated_lease) {
    xdsync::memory_port_allocator allocator{min_port, max_port};
    xdsync::batch_context ctx{std::chrono::milliseconds{1000}};

    allocator.allocate_proxy_port("a", false, true);
    allocator.ack_proxy_port(ctx, "a");
    BOOST_CHECK(allocator.get_state("a") == xdsync::lease_state::committed);

    // Unknown names are accepted
    BOOST_CHECK_NO_THROW(allocator.ack_proxy_port(ctx, "unknown"));
    BOOST_CHECK_NO_THROW(allocator.release_proxy_port("unknown"));
    BOOST_CHECK_EQUAL(allocator.get_ack_count("unknown"), 1u);
}

BOOST_AUTO_TEST_CASE(exhausted_range_throws) {
    xdsync::memory_port_allocator allocator{min_port, max_port};
    allocator.allocate_proxy_port("a", false, true);
    allocator.allocate_proxy_port("b", false, true);
    allocator.allocate_proxy_port("c", false, true);

    BOOST_CHECK_THROW(allocator.allocate_proxy_port("d", false, true), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(port_allocation_binder_tests)

BOOST_AUTO_TEST_CASE(binds_only_eligible_listeners) {
    auto allocator = std::make_shared<xdsync::memory_port_allocator>(min_port, max_port);
    test_binder binder{allocator, xdsync::recording_logger{}};

    xdsync::resource_set set;
    set._listeners.push_back(addressless("allocated"));
    set._listeners.push_back(addressed("fixed", 8080));
    auto internal = addressless("internal");
    internal._internal_listener = true;
    set._listeners.push_back(internal);

    binder.bind(set, xdsync::allocation_intent::apply);

    BOOST_CHECK_EQUAL(set._listeners[0].bound_port(), min_port);
    BOOST_CHECK_EQUAL(set._listeners[0]._address->_socket_address->_address, xdsync::ipv4_loopback);
    BOOST_CHECK(set._listeners[0]._additional_addresses.empty());
    BOOST_CHECK_EQUAL(set._listeners[1].bound_port(), 8080u);
    BOOST_CHECK(!set._listeners[2]._address.has_value());

    BOOST_CHECK_EQUAL(set._port_callbacks.size(), 1u);
    BOOST_CHECK(set._port_callbacks.contains("allocated"));
    BOOST_CHECK_EQUAL(allocator->get_allocate_count("fixed"), 0u);
}

BOOST_AUTO_TEST_CASE(dual_stack_adds_secondary_address) {
    auto allocator = std::make_shared<xdsync::memory_port_allocator>(min_port, max_port);
    test_binder binder{allocator, xdsync::recording_logger{}, true, true};

    xdsync::resource_set set;
    set._listeners.push_back(addressless("dual"));
    binder.bind(set, xdsync::allocation_intent::apply);

    const auto& l = set._listeners[0];
    BOOST_CHECK_EQUAL(l._address->_socket_address->_address, xdsync::ipv4_loopback);
    BOOST_REQUIRE_EQUAL(l._additional_addresses.size(), 1u);
    BOOST_CHECK_EQUAL(l._additional_addresses[0]._socket_address->_address, xdsync::ipv6_loopback);
    BOOST_CHECK_EQUAL(l._additional_addresses[0]._socket_address->_port_value, l.bound_port());
}

BOOST_AUTO_TEST_CASE(ipv6_only_uses_ipv6_loopback_as_primary) {
    auto allocator = std::make_shared<xdsync::memory_port_allocator>(min_port, max_port);
    test_binder binder{allocator, xdsync::recording_logger{}, false, true};

    xdsync::resource_set set;
    set._listeners.push_back(addressless("v6"));
    binder.bind(set, xdsync::allocation_intent::apply);

    BOOST_CHECK_EQUAL(set._listeners[0]._address->_socket_address->_address, xdsync::ipv6_loopback);
    BOOST_CHECK(set._listeners[0]._additional_addresses.empty());
}

BOOST_AUTO_TEST_CASE(apply_callback_acks_on_success_and_releases_on_failure) {
    auto allocator = std::make_shared<xdsync::memory_port_allocator>(min_port, max_port);
    test_binder binder{allocator, xdsync::recording_logger{}};

    xdsync::resource_set set;
    set._listeners.push_back(addressless("ok"));
    set._listeners.push_back(addressless("failed"));
    binder.bind(set, xdsync::allocation_intent::apply);

    invoke(set, "ok");
    invoke(set, "failed", std::make_exception_ptr(xdsync::push_rejected_exception("type", "failed", "nack")));

    BOOST_CHECK(allocator->get_state("ok") == xdsync::lease_state::committed);
    BOOST_CHECK_EQUAL(allocator->get_ack_count("ok"), 1u);
    BOOST_CHECK(allocator->get_state("failed") == xdsync::lease_state::released);
    BOOST_CHECK_EQUAL(allocator->get_ack_count("failed"), 0u);
    BOOST_CHECK(set._port_callbacks.empty());
}

BOOST_AUTO_TEST_CASE(remove_callback_always_releases) {
    auto allocator = std::make_shared<xdsync::memory_port_allocator>(min_port, max_port);
    test_binder binder{allocator, xdsync::recording_logger{}};

    xdsync::resource_set set;
    set._listeners.push_back(addressless("gone"));
    binder.bind(set, xdsync::allocation_intent::remove);

    invoke(set, "gone");

    BOOST_CHECK(allocator->get_state("gone") == xdsync::lease_state::released);
    BOOST_CHECK_EQUAL(allocator->get_ack_count("gone"), 0u);
    BOOST_CHECK_EQUAL(allocator->get_leased_count(), 0u);
}

BOOST_AUTO_TEST_CASE(rebinding_the_same_listener_reuses_its_port) {
    auto allocator = std::make_shared<xdsync::memory_port_allocator>(min_port, max_port);
    test_binder binder{allocator, xdsync::recording_logger{}};

    xdsync::resource_set installed;
    installed._listeners.push_back(addressless("l"));
    binder.bind(installed, xdsync::allocation_intent::apply);

    xdsync::resource_set reparsed;
    reparsed._listeners.push_back(addressless("l"));
    binder.bind(reparsed, xdsync::allocation_intent::remove);

    BOOST_CHECK_EQUAL(installed._listeners[0].bound_port(), reparsed._listeners[0].bound_port());
    BOOST_CHECK_EQUAL(allocator->get_leased_count(), 1u);
}

BOOST_AUTO_TEST_CASE(failed_allocation_leaves_set_untouched) {
    auto allocator = std::make_shared<xdsync::memory_port_allocator>(min_port, min_port);
    xdsync::recording_logger logger;
    test_binder binder{allocator, logger};

    xdsync::resource_set set;
    set._listeners.push_back(addressless("first"));
    set._listeners.push_back(addressless("second"));

    try {
        binder.bind(set, xdsync::allocation_intent::apply);
        BOOST_FAIL("Expected port_allocation_exception");
    } catch (const xdsync::port_allocation_exception& e) {
        BOOST_CHECK_EQUAL(e.get_listener_name(), "second");
    }

    BOOST_CHECK(!set._listeners[0]._address.has_value());
    BOOST_CHECK(!set._listeners[1]._address.has_value());
    BOOST_CHECK(set._port_callbacks.empty());
    BOOST_CHECK_EQUAL(logger.count(xdsync::log_level::error), 1u);

    // The lease taken before the failure stays allocated and is reused by the next bind
    BOOST_CHECK(allocator->get_state("first") == xdsync::lease_state::allocated);
    BOOST_CHECK_EQUAL(allocator->get_release_count("first"), 0u);

    xdsync::resource_set retry;
    retry._listeners.push_back(addressless("first"));
    binder.bind(retry, xdsync::allocation_intent::apply);
    BOOST_CHECK_EQUAL(retry._listeners[0].bound_port(), min_port);
    BOOST_CHECK(retry._port_callbacks.contains("first"));
}

BOOST_AUTO_TEST_SUITE_END()
