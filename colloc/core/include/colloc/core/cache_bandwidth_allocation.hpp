#pragma once

/// @file cache_bandwidth_allocation.hpp
/// @brief Cache-way and memory-bandwidth partition of one resource-control group.
/// @ingroup core_allocation

#include <colloc/core/metric.hpp>

#include <optional>
#include <string>

namespace colloc::core {

struct CacheBandwidthMerge;

/// @brief Partition directives for one resource-control group.
///
/// Both schema strings are optional: an absent schema leaves the
/// corresponding partitioning untouched. A value with neither schema is
/// empty and encodes to no metrics. Instances are value objects;
/// equality is structural and merging never mutates an operand.
///
/// Two values belong to the same group iff their group names compare
/// equal, two absent names included.
///
/// @ingroup core_allocation
class CacheBandwidthAllocation {
public:
    /// @brief Construct an empty allocation for the workload's default group.
    CacheBandwidthAllocation() = default;

    /// @brief Construct an allocation from its three optional fields.
    /// @param group_name       Control group name, or nullopt for the workload's own group.
    /// @param cache_schema     Cache-way mask row, e.g. `"L3:0=fff;1=ff0"`.
    /// @param bandwidth_schema Bandwidth row, e.g. `"MB:0=50;1=100"`.
    CacheBandwidthAllocation(std::optional<std::string> group_name,
                             std::optional<std::string> cache_schema,
                             std::optional<std::string> bandwidth_schema);

    /// @brief Control group name, absent for the workload's default group.
    [[nodiscard]] const std::optional<std::string>& group_name() const noexcept { return group_name_; }

    /// @brief Raw cache-way mask row, absent when cache partitioning is left unchanged.
    [[nodiscard]] const std::optional<std::string>& cache_schema() const noexcept { return cache_schema_; }

    /// @brief Raw bandwidth row, absent when bandwidth partitioning is left unchanged.
    [[nodiscard]] const std::optional<std::string>& bandwidth_schema() const noexcept { return bandwidth_schema_; }

    /// @brief Whether neither schema carries a directive.
    ///
    /// A present but empty schema string counts as absent.
    [[nodiscard]] bool empty() const noexcept;

    /// @brief Whether @p other designates the same control group.
    [[nodiscard]] bool same_group(const CacheBandwidthAllocation& other) const noexcept {
        return group_name_ == other.group_name_;
    }

    /// @brief Merge this (new) value with the value currently in effect.
    ///
    /// Without a current value, or when the group differs, this value
    /// replaces the group wholesale and is returned as both target and
    /// changeset. Otherwise the target takes each schema from this value
    /// when present and from @p current otherwise, and the changeset holds
    /// the group name plus only the schemas that differ textually from
    /// @p current.
    ///
    /// An empty schema string in this value means "no change" for that
    /// resource: the target keeps the schema of @p current and the
    /// changeset never records the empty string.
    ///
    /// @param current Value in effect for the workload, or `nullptr`.
    /// @return Target and changeset values.
    [[nodiscard]] CacheBandwidthMerge merge_with_current(const CacheBandwidthAllocation* current) const;

    /// @brief Encode this value as allocation metrics.
    ///
    /// For every cache domain two gauges are produced (`rdt_l3_cache_ways`
    /// and `rdt_l3_mask`), for every bandwidth domain one (`rdt_mb`), each
    /// labeled with `group_name` and `domain_id`. The bandwidth unit
    /// (percent or MB/s) is not distinguished.
    ///
    /// @return Metrics describing this value; empty for an empty value.
    /// @throws ParseError If a schema string is malformed.
    [[nodiscard]] Metrics to_metrics() const;

    bool operator==(const CacheBandwidthAllocation& rhs) const = default;

private:
    std::optional<std::string> group_name_;
    std::optional<std::string> cache_schema_;
    std::optional<std::string> bandwidth_schema_;
};

/// @brief Result of merging a new partition with the one in effect.
///
/// @ingroup core_allocation
/// @see CacheBandwidthAllocation::merge_with_current
struct CacheBandwidthMerge {
    CacheBandwidthAllocation target;     ///< Value in effect after the merge.
    CacheBandwidthAllocation changeset;  ///< Fields that must be written.
};

} // namespace colloc::core
