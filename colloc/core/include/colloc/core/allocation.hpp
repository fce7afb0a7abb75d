#pragma once

/// @file allocation.hpp
/// @brief Allocation values and the per-workload allocation maps.
///
/// An allocation value is a closed sum type over the value shapes the
/// engine understands: a plain scalar (CPU quota or shares fraction) or a
/// CacheBandwidthAllocation. Code that handles values visits the variant,
/// so adding an alternative makes every dispatch site fail to compile
/// until it is handled.
///
/// @ingroup core_allocation

#include <colloc/core/cache_bandwidth_allocation.hpp>
#include <colloc/core/resource_kind.hpp>

#include <string>
#include <unordered_map>
#include <variant>

namespace colloc::core {

/// @brief Opaque identifier of one collocated workload.
using WorkloadId = std::string;

/// @brief Allocation of one resource kind for one workload.
///
/// `double` holds scalar allocations (normally ResourceKind::Quota and
/// ResourceKind::Shares); CacheBandwidthAllocation normally sits under
/// ResourceKind::CacheBandwidth. Consumers dispatch on the alternative,
/// not on the kind key.
///
/// @ingroup core_allocation
using AllocationValue = std::variant<double, CacheBandwidthAllocation>;

/// @brief Allocations of one workload, one entry per kind specified.
/// @ingroup core_allocation
using AllocationMap = std::unordered_map<ResourceKind, AllocationValue>;

/// @brief Allocations of all workloads.
///
/// The same type serves as current, desired, target and changeset state.
///
/// @ingroup core_allocation
using WorkloadAllocations = std::unordered_map<WorkloadId, AllocationMap>;

} // namespace colloc::core
