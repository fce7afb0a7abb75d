#include <colloc/core/anomaly.hpp>

#include <gtest/gtest.h>

using namespace colloc::core;

namespace {

Metric anomaly_metric(const std::string& contending, const std::string& uuid) {
    return Metric{"anomaly", 1.0, MetricType::Counter,
                  Labels{{"contended_task_id", "t0"},
                         {"contending_task_id", contending},
                         {"resource", "cache"},
                         {"uuid", uuid},
                         {"type", "contention"}}};
}

} // anonymous namespace

TEST(AnomalyTest, NoAnomaliesNoMetrics) {
    EXPECT_TRUE(anomalies_to_metrics({}).empty());
}

TEST(AnomalyTest, OneMetricPerContendingWorkload) {
    ContentionAnomaly anomaly{ContendedResource::Llc, "t0", {"t2", "t1"}, {}};
    auto metrics = anomalies_to_metrics({anomaly});

    ASSERT_EQ(metrics.size(), 2u);
    EXPECT_EQ(metrics[0], anomaly_metric("t2", anomaly.uuid()));
    EXPECT_EQ(metrics[1], anomaly_metric("t1", anomaly.uuid()));
}

TEST(AnomalyTest, ExtraMetricsAreTaggedWithUuid) {
    Metric cpi{"cpi", 2.5, MetricType::Gauge, Labels{{"task_id", "t0"}}};
    ContentionAnomaly anomaly{ContendedResource::MemoryBandwidth, "t0", {"t1"}, {cpi}};
    auto metrics = anomalies_to_metrics({anomaly});

    ASSERT_EQ(metrics.size(), 2u);
    EXPECT_EQ(metrics[0].labels.at("resource"), "memory bandwidth");
    EXPECT_EQ(metrics[1].name, "cpi");
    EXPECT_EQ(metrics[1].labels.at("uuid"), anomaly.uuid());
    EXPECT_EQ(metrics[1].labels.at("type"), "contention");
    EXPECT_EQ(metrics[1].labels.at("task_id"), "t0");
}

TEST(AnomalyTest, UuidIsStableAndOrderIndependent) {
    ContentionAnomaly a{ContendedResource::Cpus, "t0", {"t1", "t2"}, {}};
    ContentionAnomaly b{ContendedResource::Cpus, "t0", {"t2", "t1"}, {}};
    ContentionAnomaly c{ContendedResource::Cpus, "t0", {"t3"}, {}};

    EXPECT_EQ(a.uuid(), b.uuid());
    EXPECT_NE(a.uuid(), c.uuid());
    EXPECT_EQ(a.uuid().size(), 16u);
}

TEST(AnomalyTest, ResourceNames) {
    EXPECT_EQ(to_string(ContendedResource::Llc), "cache");
    EXPECT_EQ(to_string(ContendedResource::MemoryBandwidth), "memory bandwidth");
    EXPECT_EQ(to_string(ContendedResource::Cpus), "cpus");
}
