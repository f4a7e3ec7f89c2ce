#pragma once

#include "completion.hpp"
#include "types.hpp"

#include <concepts>
#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace xdsync {

// Undoes exactly one upsert or delete issued through a push channel
using revert_func = std::function<void()>;

// Receives the data plane's verdict on one pushed resource: nullptr on ACK,
// the rejection on NACK. Never invoked for a no-op push.
using result_callback = std::function<void(std::exception_ptr)>;

/**
 * @brief Undo log of one batch
 *
 * revert() applies the actions newest first, so that a name deleted and
 * re-added within the batch ends up with its pre-batch value.
 */
class revert_func_list {
public:
    auto push_back(revert_func func) -> void {
        _funcs.push_back(std::move(func));
    }

    auto revert() -> void {
        for (auto it = _funcs.rbegin(); it != _funcs.rend(); ++it) {
            if (*it) {
                (*it)();
            }
        }
        _funcs.clear();
    }

    [[nodiscard]] auto size() const -> std::size_t { return _funcs.size(); }
    [[nodiscard]] auto empty() const -> bool { return _funcs.empty(); }

private:
    std::vector<revert_func> _funcs;
};

// Push channel concept.
// Each call takes effect in the channel's cache immediately and returns its undo
// action. When a group is given, the channel registers one completion with it
// (unless the call is a no-op) and completes it once the data plane answers.
template<typename C>
concept push_channel = requires(
    C channel,
    const std::string& name,
    const listener& l,
    const route_configuration& rc,
    const cluster& c,
    const cluster_load_assignment& cla,
    const secret& s,
    completion_group* group,
    result_callback on_result
) {
    { channel.upsert_listener(name, l, group, on_result) } -> std::same_as<revert_func>;
    { channel.upsert_route(name, rc, group, on_result) } -> std::same_as<revert_func>;
    { channel.upsert_cluster(name, c, group, on_result) } -> std::same_as<revert_func>;
    { channel.upsert_endpoint(name, cla, group, on_result) } -> std::same_as<revert_func>;
    { channel.upsert_secret(name, s, group, on_result) } -> std::same_as<revert_func>;

    { channel.delete_listener(name, group, on_result) } -> std::same_as<revert_func>;
    { channel.delete_route(name, group, on_result) } -> std::same_as<revert_func>;
    { channel.delete_cluster(name, group, on_result) } -> std::same_as<revert_func>;
    { channel.delete_endpoint(name, group, on_result) } -> std::same_as<revert_func>;
    { channel.delete_secret(name, group, on_result) } -> std::same_as<revert_func>;
};

} // namespace xdsync
