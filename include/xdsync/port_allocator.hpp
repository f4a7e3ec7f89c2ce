#pragma once

#include "batch_context.hpp"
#include "exceptions.hpp"

#include <concepts>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace xdsync {

// Port allocator concept.
// Leases proxy ports keyed by listener name. ack and release are idempotent
// and accept names that hold no lease.
template<typename A>
concept port_allocator = requires(
    A allocator,
    const std::string& name,
    bool ingress,
    bool local_only,
    const batch_context& ctx
) {
    { allocator.allocate_proxy_port(name, ingress, local_only) } -> std::same_as<std::uint16_t>;
    { allocator.ack_proxy_port(ctx, name) } -> std::same_as<void>;
    { allocator.release_proxy_port(name) } -> std::same_as<void>;
};

enum class lease_state : std::uint8_t {
    allocated,
    committed,
    released
};

/**
 * @brief Port allocator leasing from a fixed range in memory
 *
 * The same name keeps the same port while its lease is allocated or committed.
 * Released ports are reused lowest first. Thread-safe.
 */
class memory_port_allocator {
public:
    memory_port_allocator(std::uint16_t min_port, std::uint16_t max_port)
        : _min_port(min_port)
        , _max_port(max_port) {
        if (min_port == 0 || min_port > max_port) {
            throw std::invalid_argument("invalid port range");
        }
    }

    /**
     * @brief Lease a port for the named listener
     *
     * @throws std::runtime_error when the range is exhausted
     */
    auto allocate_proxy_port(const std::string& name, [[maybe_unused]] bool ingress, [[maybe_unused]] bool local_only) -> std::uint16_t {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_allocate_calls[name];

        auto it = _leases.find(name);
        if (it != _leases.end() && it->second._state != lease_state::released) {
            return it->second._port;
        }

        for (std::uint32_t port = _min_port; port <= _max_port; ++port) {
            auto candidate = static_cast<std::uint16_t>(port);
            if (_in_use.contains(candidate)) {
                continue;
            }
            _in_use.insert(candidate);
            _leases[name] = lease{candidate, lease_state::allocated};
            return candidate;
        }
        throw std::runtime_error("no free proxy port for " + name);
    }

    auto ack_proxy_port([[maybe_unused]] const batch_context& ctx, const std::string& name) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_ack_calls[name];
        auto it = _leases.find(name);
        if (it != _leases.end() && it->second._state == lease_state::allocated) {
            it->second._state = lease_state::committed;
        }
    }

    auto release_proxy_port(const std::string& name) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        ++_release_calls[name];
        auto it = _leases.find(name);
        if (it != _leases.end() && it->second._state != lease_state::released) {
            it->second._state = lease_state::released;
            _in_use.erase(it->second._port);
        }
    }

    [[nodiscard]] auto get_state(const std::string& name) const -> std::optional<lease_state> {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _leases.find(name);
        if (it == _leases.end()) {
            return std::nullopt;
        }
        return it->second._state;
    }

    [[nodiscard]] auto get_port(const std::string& name) const -> std::optional<std::uint16_t> {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _leases.find(name);
        if (it == _leases.end() || it->second._state == lease_state::released) {
            return std::nullopt;
        }
        return it->second._port;
    }

    [[nodiscard]] auto get_allocate_count(const std::string& name) const -> std::size_t {
        return count_of(_allocate_calls, name);
    }

    [[nodiscard]] auto get_ack_count(const std::string& name) const -> std::size_t {
        return count_of(_ack_calls, name);
    }

    [[nodiscard]] auto get_release_count(const std::string& name) const -> std::size_t {
        return count_of(_release_calls, name);
    }

    [[nodiscard]] auto get_leased_count() const -> std::size_t {
        std::lock_guard<std::mutex> lock(_mutex);
        return _in_use.size();
    }

private:
    struct lease {
        std::uint16_t _port{0};
        lease_state _state{lease_state::allocated};
    };

    auto count_of(const std::map<std::string, std::size_t>& calls, const std::string& name) const -> std::size_t {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = calls.find(name);
        return it == calls.end() ? 0 : it->second;
    }

    std::uint16_t _min_port;
    std::uint16_t _max_port;
    mutable std::mutex _mutex;
    std::map<std::string, lease> _leases;
    std::set<std::uint16_t> _in_use;
    std::map<std::string, std::size_t> _allocate_calls;
    std::map<std::string, std::size_t> _ack_calls;
    std::map<std::string, std::size_t> _release_calls;
};

static_assert(port_allocator<memory_port_allocator>,
    "memory_port_allocator must satisfy port_allocator concept");

} // namespace xdsync
