#pragma once

/// @file changeset.hpp
/// @brief Computation of target allocation state and minimal changesets.
///
/// Given the allocations currently in effect and the allocations a policy
/// wants, the calculator returns the full state to keep in effect (target)
/// and only the part that must be written to the resource-control
/// mechanism (changeset). Inputs are never modified.
///
/// @ingroup core_changeset

#include <colloc/core/allocation.hpp>

namespace colloc::core {

/// @brief Relative tolerance under which two scalar allocations are equal.
inline constexpr double kScalarChangeTolerance = 1e-2;

/// @brief Target and changeset of a single workload.
/// @ingroup core_changeset
struct WorkloadReconciliation {
    AllocationMap target;     ///< Allocations to keep in effect.
    AllocationMap changeset;  ///< Allocations that must be written.
};

/// @brief Target and changeset across all workloads.
/// @ingroup core_changeset
struct Reconciliation {
    WorkloadAllocations target;     ///< Allocations to keep in effect.
    WorkloadAllocations changeset;  ///< Allocations that must be written; never target state.
};

/// @brief Relative closeness test for scalar allocations.
///
/// Equivalent to `|a - b| <= rel_tol * max(|a|, |b|)`.
///
/// @param a       First value.
/// @param b       Second value.
/// @param rel_tol Relative tolerance.
/// @return `true` if the values are considered unchanged.
[[nodiscard]] bool scalars_close(double a, double b,
                                 double rel_tol = kScalarChangeTolerance) noexcept;

/// @brief Reconcile the allocations of one workload.
///
/// The target starts as a copy of @p current. Each desired cache/bandwidth
/// value is merged with the current ResourceKind::CacheBandwidth entry and
/// recorded in the changeset only if the merge changed a schema. Each
/// desired scalar is recorded (in target and changeset) unless it is
/// within kScalarChangeTolerance of the current value. Kinds present only
/// in @p current are carried into the target and never into the changeset.
///
/// @param current Allocations in effect.
/// @param desired Allocations requested by the policy.
/// @return Target and changeset for the workload.
/// @throws UnsupportedValueType If a current entry has the wrong shape
///         for the comparison or merge it takes part in.
[[nodiscard]] WorkloadReconciliation reconcile_workload(const AllocationMap& current,
                                                        const AllocationMap& desired);

/// @brief Reconcile the allocations of all workloads.
///
/// Workloads present in both inputs go through reconcile_workload and
/// keep a changeset entry only if it is non-empty. Workloads only in
/// @p current are carried forward unchanged. Workloads only in
/// @p desired are first-time allocations: their entry becomes both target
/// and changeset verbatim.
///
/// @param current Allocations in effect.
/// @param desired Allocations requested by the policy.
/// @return Target and changeset for all workloads.
/// @throws UnsupportedValueType If a current entry has the wrong shape
///         for the comparison or merge it takes part in.
///
/// @see reconcile_workload
[[nodiscard]] Reconciliation reconcile_all(const WorkloadAllocations& current,
                                           const WorkloadAllocations& desired);

} // namespace colloc::core
