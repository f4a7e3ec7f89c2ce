#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace xdsync {

enum class qualify_mode : std::uint8_t {
    // Leave names that already contain a '/' alone
    if_unqualified,
    // Scope the name even if it already contains a '/' (but never twice with the same scope)
    force
};

// The namespace/name scope of the configuration object a batch came from
struct resource_scope {
    std::string _namespace;
    std::string _name;

    [[nodiscard]] auto empty() const -> bool { return _namespace.empty() && _name.empty(); }

    [[nodiscard]] auto prefix() const -> std::string {
        std::string result;
        result.reserve(_namespace.size() + _name.size() + 2);
        result.append(_namespace).append("/").append(_name).append("/");
        return result;
    }
};

/**
 * @brief Qualify a resource name or reference with the batch scope
 *
 * The result is `namespace/name/resource`. The same rule (and mode) must be
 * used at a resource's definition and at every reference to it.
 *
 * Empty names and empty scopes leave the name unchanged. A name that already
 * starts with this scope's prefix is returned as is in both modes, which
 * makes qualification idempotent.
 *
 * @return The qualified name and whether it differs from the input
 */
inline auto qualify_resource_name(
    const resource_scope& scope,
    std::string_view resource_name,
    qualify_mode mode = qualify_mode::if_unqualified
) -> std::pair<std::string, bool> {
    if (resource_name.empty() || scope.empty()) {
        return {std::string{resource_name}, false};
    }

    auto prefix = scope.prefix();
    if (resource_name.starts_with(prefix)) {
        return {std::string{resource_name}, false};
    }
    if (mode == qualify_mode::if_unqualified && resource_name.find('/') != std::string_view::npos) {
        return {std::string{resource_name}, false};
    }

    return {prefix.append(resource_name), true};
}

// Qualifies the field in place; returns whether it changed
inline auto qualify_in_place(
    const resource_scope& scope,
    std::string& field,
    qualify_mode mode = qualify_mode::if_unqualified
) -> bool {
    auto [qualified, updated] = qualify_resource_name(scope, field, mode);
    if (updated) {
        field = std::move(qualified);
    }
    return updated;
}

} // namespace xdsync
