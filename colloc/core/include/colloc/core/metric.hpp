#pragma once

/// @file metric.hpp
/// @brief Observability event emitted for allocation state and anomalies.
/// @ingroup core_metrics

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace colloc::core {

/// @brief Kind of an observability event.
/// @ingroup core_metrics
enum class MetricType {
    Gauge,   ///< Instantaneous value (all allocation events).
    Counter  ///< Monotonic count (anomaly events).
};

/// @brief Return the exposition name of a metric type.
/// @param type Metric type.
/// @return `"gauge"` or `"counter"`.
[[nodiscard]] std::string_view to_string(MetricType type) noexcept;

/// @brief Ordered label set attached to a metric.
///
/// An ordered map keeps text and JSON output reproducible.
using Labels = std::map<std::string, std::string>;

/// @brief A single observability event.
///
/// The flat `{name, value, type, labels}` sequence is the only exported
/// form of allocation state.
///
/// @ingroup core_metrics
/// @see encode_allocations, CacheBandwidthAllocation::to_metrics
struct Metric {
    std::string name;                   ///< Metric family name (e.g. `"allocation"`).
    double value{0.0};                  ///< Event value.
    MetricType type{MetricType::Gauge}; ///< Event kind.
    Labels labels;                      ///< Identifying labels.

    bool operator==(const Metric& rhs) const = default;
};

/// @brief Flat list of observability events.
using Metrics = std::vector<Metric>;

/// @name Label keys
/// @{
inline constexpr std::string_view kLabelAllocationType = "allocation_type";
inline constexpr std::string_view kLabelGroupName = "group_name";
inline constexpr std::string_view kLabelDomainId = "domain_id";
inline constexpr std::string_view kLabelTaskId = "task_id";
/// @}

/// Metric family name used for every allocation event.
inline constexpr std::string_view kAllocationMetricName = "allocation";

} // namespace colloc::core
