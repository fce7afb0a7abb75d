#include <colloc/core/cache_bandwidth_allocation.hpp>
#include <colloc/core/schemata.hpp>

#include <absl/log/log.h>

#include <map>
#include <utility>

namespace colloc::core {

namespace {

// A present but empty schema requests no change, like an absent one.
bool has_directive(const std::optional<std::string>& schema) {
    return schema.has_value() && !schema->empty();
}

// Domains in id order so the encoded metrics do not depend on hashing.
std::map<std::string, std::string> sorted_domains(const std::string& schema) {
    DomainMap domains = decode_domain_map(schema);
    return {domains.begin(), domains.end()};
}

std::string describe(const std::optional<std::string>& field) {
    return field ? "'" + *field + "'" : "<none>";
}

Metric allocation_metric(std::string_view allocation_type, double value,
                         const std::string& group_name, const std::string& domain_id) {
    return Metric{
        std::string(kAllocationMetricName),
        value,
        MetricType::Gauge,
        Labels{
            {std::string(kLabelAllocationType), std::string(allocation_type)},
            {std::string(kLabelGroupName), group_name},
            {std::string(kLabelDomainId), domain_id},
        }};
}

} // anonymous namespace

CacheBandwidthAllocation::CacheBandwidthAllocation(std::optional<std::string> group_name,
                                                   std::optional<std::string> cache_schema,
                                                   std::optional<std::string> bandwidth_schema)
    : group_name_(std::move(group_name))
    , cache_schema_(std::move(cache_schema))
    , bandwidth_schema_(std::move(bandwidth_schema)) {}

bool CacheBandwidthAllocation::empty() const noexcept {
    return !has_directive(cache_schema_) && !has_directive(bandwidth_schema_);
}

CacheBandwidthMerge CacheBandwidthAllocation::merge_with_current(
    const CacheBandwidthAllocation* current) const {
    // New group or nothing in effect: overwrite, no merge
    if (current == nullptr || !same_group(*current)) {
        VLOG(2) << "cache/bandwidth: overwriting group " << describe(group_name_);
        return CacheBandwidthMerge{*this, *this};
    }

    VLOG(2) << "cache/bandwidth: merging with current allocation of group "
            << describe(group_name_);

    CacheBandwidthMerge result{
        CacheBandwidthAllocation(
            current->group_name_,
            has_directive(cache_schema_) ? cache_schema_ : current->cache_schema_,
            has_directive(bandwidth_schema_) ? bandwidth_schema_ : current->bandwidth_schema_),
        CacheBandwidthAllocation(group_name_, std::nullopt, std::nullopt)};

    if (has_directive(cache_schema_) && cache_schema_ != current->cache_schema_) {
        result.changeset.cache_schema_ = cache_schema_;
    }
    if (has_directive(bandwidth_schema_) && bandwidth_schema_ != current->bandwidth_schema_) {
        result.changeset.bandwidth_schema_ = bandwidth_schema_;
    }
    return result;
}

Metrics CacheBandwidthAllocation::to_metrics() const {
    Metrics metrics;
    if (empty()) {
        return metrics;
    }

    const std::string group_name = group_name_.value_or("");

    if (has_directive(cache_schema_)) {
        for (const auto& [domain_id, mask] : sorted_domains(*cache_schema_)) {
            metrics.push_back(allocation_metric(
                "rdt_l3_cache_ways", static_cast<double>(count_enabled_bits(mask)),
                group_name, domain_id));
            metrics.push_back(allocation_metric(
                "rdt_l3_mask", static_cast<double>(parse_hex_mask(mask)),
                group_name, domain_id));
        }
    }

    if (has_directive(bandwidth_schema_)) {
        // Unit (MB/s or percent) is not carried by the row; encode the bare number
        for (const auto& [domain_id, raw_value] : sorted_domains(*bandwidth_schema_)) {
            metrics.push_back(allocation_metric(
                "rdt_mb", static_cast<double>(parse_decimal_value(raw_value)),
                group_name, domain_id));
        }
    }

    return metrics;
}

} // namespace colloc::core
