#pragma once

/// @file metrics_encoder.hpp
/// @brief Flattening of allocation state into observability events.
/// @ingroup core_metrics

#include <colloc/core/allocation.hpp>
#include <colloc/core/metric.hpp>

namespace colloc::core {

/// @brief Encode the allocations of all workloads as metrics.
///
/// The value shape decides the encoding. Scalar values become one
/// `allocation` gauge labeled with `allocation_type` (the kind key) and
/// `task_id`. Cache/bandwidth values are encoded by
/// CacheBandwidthAllocation::to_metrics under any kind key and additionally
/// labeled with `task_id`.
///
/// @param allocations Allocations to encode.
/// @return Flat list of metrics, grouped per workload.
/// @throws ParseError If a schema string is malformed.
[[nodiscard]] Metrics encode_allocations(const WorkloadAllocations& allocations);

} // namespace colloc::core
