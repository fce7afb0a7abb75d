#pragma once

/// @file resource_kind.hpp
/// @brief Closed taxonomy of the resource axes that can be allocated.
/// @ingroup core_types

#include <optional>
#include <string_view>

namespace colloc::core {

/// @brief Resource axis being allocated to a workload.
///
/// New axes are added here; the rest of the engine dispatches on the
/// allocation value alternative, not on subtypes.
///
/// @ingroup core_types
enum class ResourceKind {
    Quota,          ///< CPU quota, as a fraction of the available CPU time.
    Shares,         ///< CPU shares, normalized to [0, 1].
    CacheBandwidth  ///< Combined last-level-cache and memory-bandwidth partition.
};

/// @brief Return the stable name of a resource kind.
///
/// The name is used as the `allocation_type` label and as the JSON key.
///
/// @param kind Resource kind.
/// @return `"cpu_quota"`, `"cpu_shares"` or `"rdt"`.
[[nodiscard]] std::string_view to_string(ResourceKind kind) noexcept;

/// @brief Look up a resource kind by its stable name.
/// @param name Name as returned by to_string(ResourceKind).
/// @return The kind, or `std::nullopt` for an unknown name.
[[nodiscard]] std::optional<ResourceKind> resource_kind_from_string(std::string_view name) noexcept;

} // namespace colloc::core
