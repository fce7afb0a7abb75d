#pragma once

/// @file configuration.hpp
/// @brief Node-level constants used to turn normalized allocations into cgroup values.
/// @ingroup core_allocator

#include <cstdint>
#include <optional>
#include <string>

namespace colloc::core {

/// @brief Allocation constants consumed by the engine and its appliers.
///
/// @ingroup core_allocator
/// @see io::load_allocation_configuration
struct AllocationConfiguration {
    /// Value of `cpu.cfs_period_us` used as quota denominator.
    int64_t cpu_quota_period{1000};
    /// Shares written for a normalized allocation of 0.0.
    int64_t cpu_shares_min{2};
    /// Shares written for a normalized allocation of 1.0.
    int64_t cpu_shares_max{10000};
    /// Cache row applied to the root group at start-up (nullopt: all ways).
    std::optional<std::string> default_cache_schema;
    /// Bandwidth row applied to the root group at start-up (nullopt: maximum).
    std::optional<std::string> default_bandwidth_schema;

    /// @brief Convert a normalized share fraction into a share count.
    /// @param normalized Fraction in [0, 1]; clamped.
    /// @return Share count in [cpu_shares_min, cpu_shares_max].
    [[nodiscard]] int64_t shares_count(double normalized) const noexcept;

    /// @brief Convert a normalized quota fraction into a quota for one period.
    /// @param normalized Fraction of all CPUs in [0, 1]; clamped.
    /// @param cpus       Number of logical CPUs on the node.
    /// @return Quota in the unit of cpu_quota_period.
    [[nodiscard]] int64_t quota(double normalized, int cpus) const noexcept;

    /// @brief Check the invariants between the fields.
    /// @throws ReconcileError If the period is not positive, the share
    ///         bounds are inverted or negative.
    /// @throws ParseError If a default schema string is malformed.
    void validate() const;
};

} // namespace colloc::core
