#include <colloc/core/metrics_encoder.hpp>
#include <colloc/core/error.hpp>

#include <gtest/gtest.h>

#include <algorithm>

using namespace colloc::core;

TEST(EncodeAllocationsTest, EmptyInput) {
    EXPECT_TRUE(encode_allocations({}).empty());
}

TEST(EncodeAllocationsTest, ScalarBecomesGauge) {
    auto metrics = encode_allocations({{"t1", {{ResourceKind::Shares, 0.2}}}});
    ASSERT_EQ(metrics.size(), 1u);
    Metric expected{"allocation", 0.2, MetricType::Gauge,
                    Labels{{"allocation_type", "cpu_shares"}, {"task_id", "t1"}}};
    EXPECT_EQ(metrics[0], expected);
}

TEST(EncodeAllocationsTest, CacheBandwidthLabeledWithTask) {
    WorkloadAllocations allocations{
        {"t1", {{ResourceKind::CacheBandwidth,
                 CacheBandwidthAllocation("be", "L3:0=ff", "MB:0=30")}}}};
    auto metrics = encode_allocations(allocations);
    ASSERT_EQ(metrics.size(), 3u);
    for (const auto& metric : metrics) {
        EXPECT_EQ(metric.labels.at("task_id"), "t1");
        EXPECT_EQ(metric.labels.at("group_name"), "be");
        EXPECT_EQ(metric.labels.at("domain_id"), "0");
    }
}

TEST(EncodeAllocationsTest, EmptyCacheBandwidthEncodesNothing) {
    WorkloadAllocations allocations{
        {"t1", {{ResourceKind::CacheBandwidth, CacheBandwidthAllocation("g", std::nullopt, std::nullopt)}}}};
    EXPECT_TRUE(encode_allocations(allocations).empty());
}

TEST(EncodeAllocationsTest, AllWorkloadsAndKinds) {
    WorkloadAllocations allocations{
        {"t1", {{ResourceKind::Shares, 0.2}, {ResourceKind::Quota, 0.5}}},
        {"t2", {{ResourceKind::Quota, 1.0}}},
    };
    auto metrics = encode_allocations(allocations);
    EXPECT_EQ(metrics.size(), 3u);

    auto it = std::find_if(metrics.begin(), metrics.end(), [](const Metric& m) {
        return m.labels.at("task_id") == "t2";
    });
    ASSERT_NE(it, metrics.end());
    EXPECT_EQ(it->labels.at("allocation_type"), "cpu_quota");
    EXPECT_DOUBLE_EQ(it->value, 1.0);
}

TEST(EncodeAllocationsTest, ValueShapeSelectsEncoding) {
    auto cache = encode_allocations(
        {{"t1", {{ResourceKind::Quota, CacheBandwidthAllocation("g", "L3:0=f", std::nullopt)}}}});
    ASSERT_EQ(cache.size(), 2u);
    for (const auto& metric : cache) {
        EXPECT_EQ(metric.labels.count("allocation_type"), 0u);
        EXPECT_EQ(metric.labels.at("task_id"), "t1");
    }

    auto scalar = encode_allocations({{"t1", {{ResourceKind::CacheBandwidth, 0.3}}}});
    ASSERT_EQ(scalar.size(), 1u);
    EXPECT_EQ(scalar[0].name, "allocation");
    EXPECT_EQ(scalar[0].labels.at("allocation_type"), "rdt");
    EXPECT_DOUBLE_EQ(scalar[0].value, 0.3);
}

TEST(EncodeAllocationsTest, MalformedSchemaPropagates) {
    WorkloadAllocations allocations{
        {"t1", {{ResourceKind::CacheBandwidth,
                 CacheBandwidthAllocation("g", "L3:0=f;0=f", std::nullopt)}}}};
    EXPECT_THROW((void)encode_allocations(allocations), ParseError);
}
