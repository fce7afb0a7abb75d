#pragma once

/// @file cycle.hpp
/// @brief One reconciliation cycle: policy decision, reconciliation, encoding.
/// @ingroup core_allocator

#include <colloc/core/allocator.hpp>
#include <colloc/core/changeset.hpp>
#include <colloc/core/platform.hpp>

namespace colloc::core {

/// @brief Outcome of one reconciliation cycle.
/// @ingroup core_allocator
struct CycleResult {
    WorkloadAllocations target;     ///< State to persist as "current" for the next cycle.
    WorkloadAllocations changeset;  ///< State to hand to the resource-control writer.
    Metrics metrics;                ///< Target allocations, anomalies and policy metrics.
};

/// @brief Run one cycle of @p allocator against the allocations in effect.
///
/// Calls Allocator::allocate, reconciles its desired allocations with
/// @p current and encodes the target state, the anomalies and the
/// allocator's own metrics, in that order.
///
/// @param allocator Policy deciding the desired allocations.
/// @param context   Read-only inputs forwarded to the policy.
/// @param current   Allocations in effect.
/// @return Target, changeset and metrics.
/// @throws UnsupportedValueType, ParseError On malformed allocation values.
[[nodiscard]] CycleResult run_allocation_cycle(Allocator& allocator,
                                               const AllocationContext& context,
                                               const WorkloadAllocations& current);

} // namespace colloc::core
