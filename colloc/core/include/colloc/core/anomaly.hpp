#pragma once

/// @file anomaly.hpp
/// @brief Resource-contention anomalies reported by a policy.
/// @ingroup core_allocator

#include <colloc/core/allocation.hpp>
#include <colloc/core/metric.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace colloc::core {

/// @brief Shared resource on which workloads contend.
/// @ingroup core_allocator
enum class ContendedResource {
    Llc,              ///< Last-level cache.
    MemoryBandwidth,  ///< Memory bandwidth.
    Cpus              ///< CPU time.
};

/// @brief Return the label value of a contended resource.
/// @param resource Contended resource.
/// @return `"cache"`, `"memory bandwidth"` or `"cpus"`.
[[nodiscard]] std::string_view to_string(ContendedResource resource) noexcept;

/// @brief One workload suffering contention caused by others.
///
/// @ingroup core_allocator
/// @see anomalies_to_metrics
struct ContentionAnomaly {
    ContendedResource resource{ContendedResource::Llc};
    WorkloadId contended_workload_id;
    std::vector<WorkloadId> contending_workload_ids;
    /// Extra metrics the detector attaches to the anomaly.
    Metrics metrics;

    /// @brief Stable identifier of the anomaly.
    ///
    /// Derived from the sorted set of every workload involved, so the
    /// same contention reported twice maps to the same identifier.
    ///
    /// @return 16-digit lowercase hexadecimal digest.
    [[nodiscard]] std::string uuid() const;
};

/// @brief Encode anomalies as metrics.
///
/// Each anomaly yields one `anomaly` counter with value 1 per contending
/// workload, labeled `contended_task_id`, `contending_task_id`,
/// `resource`, `uuid` and `type`, followed by its extra metrics labeled
/// with `uuid` and `type`.
///
/// @param anomalies Anomalies to encode.
/// @return Flat list of metrics.
[[nodiscard]] Metrics anomalies_to_metrics(const std::vector<ContentionAnomaly>& anomalies);

} // namespace colloc::core
