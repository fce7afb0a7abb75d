#include <colloc/core/anomaly.hpp>

#include <cstdint>
#include <iomanip>
#include <set>
#include <sstream>

namespace colloc::core {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

constexpr std::string_view ANOMALY_METRIC_NAME = "anomaly";
constexpr std::string_view CONTENTION_TYPE = "contention";

} // anonymous namespace

std::string_view to_string(ContendedResource resource) noexcept {
    switch (resource) {
        case ContendedResource::Llc: return "cache";
        case ContendedResource::MemoryBandwidth: return "memory bandwidth";
        case ContendedResource::Cpus: return "cpus";
    }
    return "unknown";
}

std::string ContentionAnomaly::uuid() const {
    std::set<WorkloadId> involved(contending_workload_ids.begin(), contending_workload_ids.end());
    involved.insert(contended_workload_id);

    // FNV-1a over the sorted ids
    uint64_t hash = FNV_OFFSET_BASIS;
    for (const auto& id : involved) {
        for (char c : id) {
            hash ^= static_cast<unsigned char>(c);
            hash *= FNV_PRIME;
        }
        // NUL separator
        hash *= FNV_PRIME;
    }

    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return oss.str();
}

Metrics anomalies_to_metrics(const std::vector<ContentionAnomaly>& anomalies) {
    Metrics metrics;

    for (const auto& anomaly : anomalies) {
        const std::string uuid = anomaly.uuid();

        for (const auto& contending_id : anomaly.contending_workload_ids) {
            metrics.push_back(Metric{
                std::string(ANOMALY_METRIC_NAME),
                1.0,
                MetricType::Counter,
                Labels{
                    {"contended_task_id", anomaly.contended_workload_id},
                    {"contending_task_id", contending_id},
                    {"resource", std::string(to_string(anomaly.resource))},
                    {"uuid", uuid},
                    {"type", std::string(CONTENTION_TYPE)},
                }});
        }

        for (auto metric : anomaly.metrics) {
            metric.labels["uuid"] = uuid;
            metric.labels["type"] = std::string(CONTENTION_TYPE);
            metrics.push_back(std::move(metric));
        }
    }

    return metrics;
}

} // namespace colloc::core
