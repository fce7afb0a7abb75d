#include <colloc/core/metrics_encoder.hpp>

#include <string>
#include <utility>
#include <type_traits>
#include <variant>

namespace colloc::core {

Metrics encode_allocations(const WorkloadAllocations& allocations) {
    Metrics metrics;

    for (const auto& [workload_id, workload_allocations] : allocations) {
        for (const auto& [kind, allocation_value] : workload_allocations) {
            // The value shape decides the encoding; the kind only labels scalars
            std::visit(
                [&metrics, kind = kind, &workload_id = workload_id](const auto& value) {
                    using T = std::decay_t<decltype(value)>;
                    if constexpr (std::is_same_v<T, CacheBandwidthAllocation>) {
                        for (auto& metric : value.to_metrics()) {
                            metric.labels[std::string(kLabelTaskId)] = workload_id;
                            metrics.push_back(std::move(metric));
                        }
                    } else {
                        metrics.push_back(Metric{
                            std::string(kAllocationMetricName),
                            value,
                            MetricType::Gauge,
                            Labels{
                                {std::string(kLabelAllocationType), std::string(to_string(kind))},
                                {std::string(kLabelTaskId), workload_id},
                            }});
                    }
                },
                allocation_value);
        }
    }

    return metrics;
}

} // namespace colloc::core
