#pragma once

#include <colloc/core/allocation.hpp>
#include <colloc/core/anomaly.hpp>
#include <colloc/core/metric.hpp>
#include <colloc/core/platform.hpp>

#include <vector>

namespace colloc::core {

/// @brief Output of one Allocator::allocate call.
/// @ingroup core_allocator
struct AllocationDecision {
    WorkloadAllocations allocations;           ///< Desired allocations (possibly partial).
    std::vector<ContentionAnomaly> anomalies;  ///< Anomalies detected this cycle.
    Metrics metrics;                           ///< Policy-specific metrics.
};

/// @brief Abstract interface for allocation policies.
/// @ingroup core_allocator
///
/// The external control loop calls allocate() once per cycle. The
/// returned allocations are only a request: reconcile_all turns them into
/// the target state and the changeset that is actually written.
///
/// @see NopAllocator, run_allocation_cycle
class Allocator {
public:
    /// @brief Decide the desired allocations for this cycle.
    ///
    /// Implementations are free to ignore any of the inputs.
    ///
    /// @param platform     Node topology snapshot.
    /// @param measurements Per-workload measurements.
    /// @param resources    Per-workload resource limits.
    /// @param labels       Per-workload labels.
    /// @param current      Allocations currently in effect.
    /// @return Desired allocations, anomalies and metrics.
    virtual AllocationDecision allocate(const Platform& platform,
                                        const WorkloadMeasurements& measurements,
                                        const WorkloadResources& resources,
                                        const WorkloadLabels& labels,
                                        const WorkloadAllocations& current) = 0;

    virtual ~Allocator() = default;
};

/// @brief Allocator that never requests anything.
/// @ingroup core_allocator
///
/// Always returns no allocations, no anomalies and no metrics, so the
/// resulting changeset is empty.
class NopAllocator : public Allocator {
public:
    AllocationDecision allocate(const Platform& platform,
                                const WorkloadMeasurements& measurements,
                                const WorkloadResources& resources,
                                const WorkloadLabels& labels,
                                const WorkloadAllocations& current) override;
};

} // namespace colloc::core
