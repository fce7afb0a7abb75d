#include <colloc/core/configuration.hpp>
#include <colloc/core/error.hpp>
#include <colloc/core/schemata.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace colloc::core {

int64_t AllocationConfiguration::shares_count(double normalized) const noexcept {
    double fraction = std::clamp(normalized, 0.0, 1.0);
    return cpu_shares_min +
           static_cast<int64_t>(fraction * static_cast<double>(cpu_shares_max - cpu_shares_min));
}

int64_t AllocationConfiguration::quota(double normalized, int cpus) const noexcept {
    double fraction = std::clamp(normalized, 0.0, 1.0);
    return static_cast<int64_t>(
        fraction * static_cast<double>(cpu_quota_period) * static_cast<double>(std::max(cpus, 1)));
}

void AllocationConfiguration::validate() const {
    if (cpu_quota_period <= 0) {
        throw ReconcileError("cpu_quota_period must be positive, got " +
                             std::to_string(cpu_quota_period));
    }
    if (cpu_shares_min < 0) {
        throw ReconcileError("cpu_shares_min must be non-negative, got " +
                             std::to_string(cpu_shares_min));
    }
    if (cpu_shares_min > cpu_shares_max) {
        throw ReconcileError("cpu_shares_min (" + std::to_string(cpu_shares_min) +
                             ") exceeds cpu_shares_max (" + std::to_string(cpu_shares_max) + ")");
    }
    // Decoding throws ParseError on a malformed row
    if (default_cache_schema) {
        (void)decode_domain_map(*default_cache_schema);
    }
    if (default_bandwidth_schema) {
        (void)decode_domain_map(*default_bandwidth_schema);
    }
}

} // namespace colloc::core
