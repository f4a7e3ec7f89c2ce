#pragma once

#include "batch_context.hpp"
#include "exceptions.hpp"
#include "logger.hpp"
#include "port_allocator.hpp"
#include "resource_set.hpp"
#include "types.hpp"

#include <cstdint>
#include <exception>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace xdsync {

// Which side of a change a resource set is bound for
enum class allocation_intent : std::uint8_t {
    // Installed set, or the new side of an update: commit the lease on success
    apply,
    // Uninstalled set, or the old side of an update: release the lease
    remove
};

inline constexpr std::string_view ipv4_loopback = "127.0.0.1";
inline constexpr std::string_view ipv6_loopback = "::1";

/**
 * @brief Gives address-less listeners a leased local port and ties the lease
 * to the outcome of the listener's push or delete
 *
 * Leases are requested for every eligible listener before the set is touched,
 * so a failed allocation leaves the set exactly as it was.
 */
template<port_allocator PortAllocator, diagnostic_logger Logger>
class port_allocation_binder {
public:
    port_allocation_binder(
        std::shared_ptr<PortAllocator> allocator,
        Logger logger,
        bool ipv4_enabled = true,
        bool ipv6_enabled = false
    )
        : _allocator(std::move(allocator))
        , _logger(std::move(logger))
        , _ipv4_enabled(ipv4_enabled)
        , _ipv6_enabled(ipv6_enabled) {}

    /**
     * @brief Allocate ports for the set's eligible listeners and register their callbacks
     *
     * The set is modified only if every allocation succeeds. Leases already
     * taken by this call before a failing allocation are not released: they
     * stay allocated, with no callback, until a later bind for the same
     * listener name registers one.
     *
     * @throws port_allocation_exception if any allocation fails or yields port 0
     */
    auto bind(resource_set& set, allocation_intent intent) -> void {
        std::vector<std::pair<listener*, std::uint16_t>> leases;

        for (auto& l : set._listeners) {
            if (!l.needs_allocated_address()) {
                continue;
            }

            std::uint16_t port = 0;
            try {
                port = _allocator->allocate_proxy_port(l._name, false, true);
            } catch (const std::exception& e) {
                _logger.error("Listener port allocation failed", {
                    {"listener", l._name},
                    {"error", e.what()}
                });
                throw port_allocation_exception(l._name, e.what());
            }
            if (port == 0) {
                _logger.error("Listener port allocation returned port 0", {{"listener", l._name}});
                throw port_allocation_exception(l._name, "allocated port 0");
            }
            leases.emplace_back(&l, port);
        }

        for (auto& [l, port] : leases) {
            attach_addresses(*l, port);
            set._port_callbacks.set(l->_name, make_callback(l->_name, intent));

            _logger.debug("Bound listener to proxy port", {
                {"listener", l->_name},
                {"port", std::to_string(port)},
                {"intent", intent == allocation_intent::apply ? "apply" : "remove"}
            });
        }
    }

    [[nodiscard]] auto allocator() const -> const std::shared_ptr<PortAllocator>& { return _allocator; }

private:
    // The first enabled family is the primary address
    auto attach_addresses(listener& l, std::uint16_t port) const -> void {
        std::vector<address> addresses;
        if (_ipv4_enabled) {
            addresses.push_back(local_address(ipv4_loopback, port));
        }
        if (_ipv6_enabled) {
            addresses.push_back(local_address(ipv6_loopback, port));
        }
        if (addresses.empty()) {
            return;
        }

        l._address = std::move(addresses.front());
        l._additional_addresses.assign(
            std::make_move_iterator(addresses.begin() + 1),
            std::make_move_iterator(addresses.end()));
    }

    static auto local_address(std::string_view ip, std::uint16_t port) -> address {
        address addr;
        addr._socket_address = socket_address{std::string{ip}, port, {}};
        return addr;
    }

    auto make_callback(const std::string& listener_name, allocation_intent intent) const -> port_callback {
        if (intent == allocation_intent::apply) {
            return [allocator = _allocator, listener_name](const batch_context& ctx, std::exception_ptr error) {
                if (error) {
                    allocator->release_proxy_port(listener_name);
                } else {
                    allocator->ack_proxy_port(ctx, listener_name);
                }
            };
        }
        return [allocator = _allocator, listener_name](
            [[maybe_unused]] const batch_context& ctx,
            [[maybe_unused]] std::exception_ptr error
        ) {
            allocator->release_proxy_port(listener_name);
        };
    }

    std::shared_ptr<PortAllocator> _allocator;
    Logger _logger;
    bool _ipv4_enabled;
    bool _ipv6_enabled;
};

} // namespace xdsync
