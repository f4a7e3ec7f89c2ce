#pragma once

#include "exceptions.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <boost/json.hpp>

namespace xdsync {

// Agent-wide settings that shape how batches are normalized, bound and reconciled
struct reconciler_configuration {
    bool _validate{false};
    bool _enable_bpf_tproxy{false};
    bool _ipv4_enabled{true};
    bool _ipv6_enabled{false};
    bool _is_l7lb{false};
    bool _use_original_source_addr{true};
    std::string _bpf_root{"/sys/fs/bpf"};
    std::chrono::milliseconds _batch_timeout{30'000};
    std::uint16_t _min_port{10000};
    std::uint16_t _max_port{20000};

    auto validate() const -> bool { return _validate; }
    auto enable_bpf_tproxy() const -> bool { return _enable_bpf_tproxy; }
    auto ipv4_enabled() const -> bool { return _ipv4_enabled; }
    auto ipv6_enabled() const -> bool { return _ipv6_enabled; }
    auto is_l7lb() const -> bool { return _is_l7lb; }
    auto use_original_source_addr() const -> bool { return _use_original_source_addr; }
    auto bpf_root() const -> const std::string& { return _bpf_root; }
    auto batch_timeout() const -> std::chrono::milliseconds { return _batch_timeout; }
    auto min_port() const -> std::uint16_t { return _min_port; }
    auto max_port() const -> std::uint16_t { return _max_port; }
};

inline auto validate_configuration(const reconciler_configuration& config) -> void {
    if (!config._ipv4_enabled && !config._ipv6_enabled) {
        throw configuration_exception("at least one of ipv4_enabled and ipv6_enabled must be set");
    }

    if (config._batch_timeout.count() <= 0) {
        throw configuration_exception("batch_timeout must be positive");
    }

    if (config._min_port == 0) {
        throw configuration_exception("min_port must be greater than 0");
    }

    if (config._min_port > config._max_port) {
        throw configuration_exception("min_port must not exceed max_port");
    }

    if (config._bpf_root.empty()) {
        throw configuration_exception("bpf_root must not be empty");
    }
}

namespace detail {

inline auto read_bool(const boost::json::object& obj, std::string_view key, bool& field) -> void {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    if (!it->value().is_bool()) {
        throw configuration_exception(std::string{key} + " must be a boolean");
    }
    field = it->value().get_bool();
}

inline auto read_port(const boost::json::object& obj, std::string_view key, std::uint16_t& field) -> void {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return;
    }
    const auto& v = it->value();
    if (!v.is_int64() && !v.is_uint64()) {
        throw configuration_exception(std::string{key} + " must be an integer");
    }
    auto port = v.is_int64() ? v.get_int64() : static_cast<std::int64_t>(v.get_uint64());
    if (port < 0 || port > 65535) {
        throw configuration_exception(std::string{key} + " must be a port number");
    }
    field = static_cast<std::uint16_t>(port);
}

} // namespace detail

/**
 * @brief Load a configuration from its JSON form
 *
 * Recognized keys: validate, enable_bpf_tproxy, ipv4_enabled, ipv6_enabled,
 * is_l7lb, use_original_source_addr, bpf_root, batch_timeout_ms, min_port,
 * max_port. Missing keys keep their defaults. The result is validated.
 *
 * @throws configuration_exception on a malformed or invalid configuration
 */
inline auto load_configuration(const boost::json::value& json) -> reconciler_configuration {
    if (!json.is_object()) {
        throw configuration_exception("configuration must be a JSON object");
    }
    const auto& obj = json.get_object();

    reconciler_configuration config;
    detail::read_bool(obj, "validate", config._validate);
    detail::read_bool(obj, "enable_bpf_tproxy", config._enable_bpf_tproxy);
    detail::read_bool(obj, "ipv4_enabled", config._ipv4_enabled);
    detail::read_bool(obj, "ipv6_enabled", config._ipv6_enabled);
    detail::read_bool(obj, "is_l7lb", config._is_l7lb);
    detail::read_bool(obj, "use_original_source_addr", config._use_original_source_addr);

    if (auto it = obj.find("bpf_root"); it != obj.end()) {
        if (!it->value().is_string()) {
            throw configuration_exception("bpf_root must be a string");
        }
        config._bpf_root = std::string{it->value().get_string()};
    }

    if (auto it = obj.find("batch_timeout_ms"); it != obj.end()) {
        if (!it->value().is_int64() && !it->value().is_uint64()) {
            throw configuration_exception("batch_timeout_ms must be an integer");
        }
        auto ms = it->value().is_int64()
            ? it->value().get_int64()
            : static_cast<std::int64_t>(it->value().get_uint64());
        config._batch_timeout = std::chrono::milliseconds{ms};
    }

    detail::read_port(obj, "min_port", config._min_port);
    detail::read_port(obj, "max_port", config._max_port);

    validate_configuration(config);
    return config;
}

// Parses JSON text and loads it
inline auto parse_configuration(std::string_view json_text) -> reconciler_configuration {
    boost::system::error_code ec;
    auto json = boost::json::parse(json_text, ec);
    if (ec) {
        throw configuration_exception("could not parse configuration: " + ec.message());
    }
    return load_configuration(json);
}

} // namespace xdsync
