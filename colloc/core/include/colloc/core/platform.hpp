#pragma once

/// @file platform.hpp
/// @brief Read-only context handed to an Allocator each cycle.
///
/// The engine threads these values through to the policy without
/// interpreting them.
///
/// @ingroup core_allocator

#include <colloc/core/allocation.hpp>
#include <colloc/core/metric.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace colloc::core {

/// @brief Cache and memory-bandwidth partitioning capabilities of the node.
/// @ingroup core_allocator
struct RdtInformation {
    std::string cache_bitmask;        ///< Full cache-way mask, e.g. `"fffff"`.
    int min_cache_bits{1};            ///< Minimum number of contiguous ways per group.
    int num_closids{0};               ///< Number of control groups the hardware supports.
    int mb_bandwidth_granularity{0};  ///< Bandwidth step in percent.
    int mb_min_bandwidth{0};          ///< Minimum bandwidth in percent.
};

/// @brief Snapshot of the node topology and utilization.
/// @ingroup core_allocator
struct Platform {
    int sockets{0};                               ///< Number of sockets.
    int cores{0};                                 ///< Number of physical cores.
    int cpus{0};                                  ///< Number of logical CPUs.
    std::string cpu_model;                        ///< CPU model name.
    std::unordered_map<int, uint64_t> cpus_usage; ///< Per-CPU usage counters.
    uint64_t total_memory_used{0};                ///< Memory in use, bytes.
    double timestamp{0.0};                        ///< Snapshot time, seconds since epoch.
    std::optional<RdtInformation> rdt_information; ///< Absent without partitioning support.
};

/// @brief Named measurements of one workload.
using Measurements = std::unordered_map<std::string, double>;

/// @brief Measurements of all workloads.
using WorkloadMeasurements = std::unordered_map<WorkloadId, Measurements>;

/// @brief Resource limits of all workloads (resource name -> amount).
using WorkloadResources = std::unordered_map<WorkloadId, std::unordered_map<std::string, double>>;

/// @brief Labels of all workloads.
using WorkloadLabels = std::unordered_map<WorkloadId, Labels>;

/// @brief Everything an Allocator may read during one cycle.
/// @ingroup core_allocator
struct AllocationContext {
    Platform platform;
    WorkloadMeasurements measurements;
    WorkloadResources resources;
    WorkloadLabels labels;
};

} // namespace colloc::core
