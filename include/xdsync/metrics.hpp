#pragma once

#include <concepts>
#include <string_view>
#include <cstdint>
#include <chrono>

namespace xdsync {

// Names and dimensions of the metrics the reconciler emits
namespace metric_names {

inline constexpr std::string_view batch_committed = "xdsync.batch.committed";
inline constexpr std::string_view batch_rolled_back = "xdsync.batch.rolled_back";
inline constexpr std::string_view barrier_wait = "xdsync.barrier.wait";

inline constexpr std::string_view operation_dimension = "operation";
inline constexpr std::string_view barrier_dimension = "barrier";

} // namespace metric_names

// Metrics concept for collecting and reporting reconciliation metrics.
// A metric object is copied, named, filled and emitted once per event.
template<typename M>
concept metrics = requires(
    M metric,
    std::string_view name,
    std::string_view dimension_name,
    std::string_view dimension_value,
    std::int64_t count,
    std::chrono::nanoseconds duration,
    double value
) {
    requires std::copy_constructible<M>;

    { metric.set_metric_name(name) } -> std::same_as<void>;
    { metric.add_dimension(dimension_name, dimension_value) } -> std::same_as<void>;
    { metric.add_one() } -> std::same_as<void>;
    { metric.add_count(count) } -> std::same_as<void>;
    { metric.add_duration(duration) } -> std::same_as<void>;
    { metric.add_value(value) } -> std::same_as<void>;
    { metric.emit() } -> std::same_as<void>;
};

// No-op metrics for callers that do not collect metrics
class noop_metrics {
public:
    auto set_metric_name([[maybe_unused]] std::string_view name) -> void {}
    auto add_dimension(
        [[maybe_unused]] std::string_view dimension_name,
        [[maybe_unused]] std::string_view dimension_value
    ) -> void {}
    auto add_one() -> void {}
    auto add_count([[maybe_unused]] std::int64_t count) -> void {}
    auto add_duration([[maybe_unused]] std::chrono::nanoseconds duration) -> void {}
    auto add_value([[maybe_unused]] double value) -> void {}
    auto emit() -> void {}
};

static_assert(metrics<noop_metrics>, "noop_metrics must satisfy metrics concept");

} // namespace xdsync
