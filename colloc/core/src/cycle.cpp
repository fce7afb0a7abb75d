#include <colloc/core/cycle.hpp>
#include <colloc/core/anomaly.hpp>
#include <colloc/core/metrics_encoder.hpp>

#include <absl/log/log.h>

#include <iterator>
#include <utility>

namespace colloc::core {

CycleResult run_allocation_cycle(Allocator& allocator,
                                 const AllocationContext& context,
                                 const WorkloadAllocations& current) {
    AllocationDecision decision = allocator.allocate(
        context.platform, context.measurements, context.resources, context.labels, current);

    Reconciliation reconciliation = reconcile_all(current, decision.allocations);

    CycleResult result{std::move(reconciliation.target), std::move(reconciliation.changeset), {}};
    result.metrics = encode_allocations(result.target);

    Metrics anomaly_metrics = anomalies_to_metrics(decision.anomalies);
    result.metrics.insert(result.metrics.end(),
                          std::make_move_iterator(anomaly_metrics.begin()),
                          std::make_move_iterator(anomaly_metrics.end()));
    result.metrics.insert(result.metrics.end(),
                          std::make_move_iterator(decision.metrics.begin()),
                          std::make_move_iterator(decision.metrics.end()));

    if (!decision.anomalies.empty()) {
        LOG(INFO) << "allocation cycle: " << decision.anomalies.size() << " anomalies detected";
    }

    return result;
}

} // namespace colloc::core
