#include <colloc/core/changeset.hpp>
#include <colloc/core/error.hpp>

#include <absl/log/log.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace colloc::core {

namespace {

std::string describe(const AllocationMap& allocations) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [kind, value] : allocations) {
        oss << (first ? "" : ", ") << to_string(kind) << ": ";
        first = false;
        if (const auto* scalar = std::get_if<double>(&value)) {
            oss << *scalar;
        } else if (const auto* cb = std::get_if<CacheBandwidthAllocation>(&value)) {
            oss << "{name=" << cb->group_name().value_or("<default>")
                << ", l3=" << cb->cache_schema().value_or("<none>")
                << ", mb=" << cb->bandwidth_schema().value_or("<none>") << "}";
        }
    }
    oss << "}";
    return oss.str();
}

[[noreturn]] void throw_mismatch(ResourceKind kind, std::string_view role) {
    throw UnsupportedValueType(std::string(role) + " allocation of type '" +
                               std::string(to_string(kind)) +
                               "' does not hold the expected value type");
}

const CacheBandwidthAllocation* current_cache_bandwidth(const AllocationMap& current) {
    // Only one mergeable kind exists: a merge always looks at the
    // CacheBandwidth entry in effect.
    auto it = current.find(ResourceKind::CacheBandwidth);
    if (it == current.end()) {
        return nullptr;
    }
    const auto* value = std::get_if<CacheBandwidthAllocation>(&it->second);
    if (value == nullptr) {
        throw_mismatch(ResourceKind::CacheBandwidth, "current");
    }
    return value;
}

} // anonymous namespace

bool scalars_close(double a, double b, double rel_tol) noexcept {
    if (a == b) {
        return true;
    }
    return std::fabs(a - b) <= rel_tol * std::max(std::fabs(a), std::fabs(b));
}

WorkloadReconciliation reconcile_workload(const AllocationMap& current,
                                          const AllocationMap& desired) {
    // Current becomes the target, then desired values are applied on top
    WorkloadReconciliation result{current, {}};

    for (const auto& [kind, desired_value] : desired) {
        std::visit(
            [&result, &current, kind = kind](const auto& value) {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, CacheBandwidthAllocation>) {
                    // Merged under CacheBandwidth whatever key it arrived under
                    auto merged = value.merge_with_current(current_cache_bandwidth(current));
                    result.target[ResourceKind::CacheBandwidth] = merged.target;
                    if (!merged.changeset.empty()) {
                        result.changeset[ResourceKind::CacheBandwidth] = std::move(merged.changeset);
                    }
                } else {
                    bool changed = true;
                    if (auto it = current.find(kind); it != current.end()) {
                        const auto* current_value = std::get_if<double>(&it->second);
                        if (current_value == nullptr) {
                            throw_mismatch(kind, "current");
                        }
                        changed = !scalars_close(*current_value, value);
                    }
                    if (changed) {
                        result.target[kind] = value;
                        result.changeset[kind] = value;
                    }
                }
            },
            desired_value);
    }

    if (!result.changeset.empty()) {
        VLOG(1) << "reconcile_workload: current=" << describe(current)
                << " desired=" << describe(desired)
                << " target=" << describe(result.target)
                << " changeset=" << describe(result.changeset);
    }

    return result;
}

Reconciliation reconcile_all(const WorkloadAllocations& current,
                             const WorkloadAllocations& desired) {
    Reconciliation result;

    for (const auto& [workload_id, current_allocations] : current) {
        auto it = desired.find(workload_id);
        if (it == desired.end()) {
            // Nothing requested: keep what is in effect
            result.target.emplace(workload_id, current_allocations);
            continue;
        }

        auto reconciled = reconcile_workload(current_allocations, it->second);
        result.target.emplace(workload_id, std::move(reconciled.target));
        if (!reconciled.changeset.empty()) {
            result.changeset.emplace(workload_id, std::move(reconciled.changeset));
        }
    }

    // First-time allocations: nothing to merge against
    for (const auto& [workload_id, desired_allocations] : desired) {
        if (current.contains(workload_id)) {
            continue;
        }
        result.target.emplace(workload_id, desired_allocations);
        result.changeset.emplace(workload_id, desired_allocations);
    }

    VLOG(1) << "reconcile_all: " << current.size() << " current, " << desired.size()
            << " desired, " << result.target.size() << " target, "
            << result.changeset.size() << " with changes";

    return result;
}

} // namespace colloc::core
