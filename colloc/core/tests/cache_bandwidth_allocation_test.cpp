#include <colloc/core/cache_bandwidth_allocation.hpp>
#include <colloc/core/error.hpp>

#include <gtest/gtest.h>

#include <algorithm>

using namespace colloc::core;

namespace {

CacheBandwidthAllocation cb(std::optional<std::string> name,
                            std::optional<std::string> l3 = std::nullopt,
                            std::optional<std::string> mb = std::nullopt) {
    return CacheBandwidthAllocation(std::move(name), std::move(l3), std::move(mb));
}

Metric gauge(const std::string& type, double value, const std::string& group,
             const std::string& domain) {
    return Metric{"allocation", value, MetricType::Gauge,
                  Labels{{"allocation_type", type}, {"group_name", group}, {"domain_id", domain}}};
}

} // anonymous namespace

// ============================================================================
// Merge
// ============================================================================

TEST(CacheBandwidthMergeTest, NoCurrentReplaces) {
    auto desired = cb("g", "L3:0=ff", "MB:0=50");
    auto merged = desired.merge_with_current(nullptr);
    EXPECT_EQ(merged.target, desired);
    EXPECT_EQ(merged.changeset, desired);
}

TEST(CacheBandwidthMergeTest, GroupSwitchOverwrites) {
    auto current = cb("g1", "L3:0=ff", "MB:0=50");
    auto desired = cb("g2", std::nullopt, "MB:0=30");
    auto merged = desired.merge_with_current(&current);
    EXPECT_EQ(merged.target, desired);
    EXPECT_EQ(merged.changeset, desired);
}

TEST(CacheBandwidthMergeTest, DefaultGroupToNamedGroupOverwrites) {
    auto current = cb(std::nullopt, "L3:0=ff");
    auto desired = cb("g");
    auto merged = desired.merge_with_current(&current);
    EXPECT_EQ(merged.target, desired);
    EXPECT_EQ(merged.changeset, desired);
}

TEST(CacheBandwidthMergeTest, SameGroupPartialMerge) {
    auto current = cb("g", "A", "B");
    auto desired = cb("g", "C");
    auto merged = desired.merge_with_current(&current);
    EXPECT_EQ(merged.target, cb("g", "C", "B"));
    EXPECT_EQ(merged.changeset, cb("g", "C"));
    EXPECT_FALSE(merged.changeset.bandwidth_schema().has_value());
}

TEST(CacheBandwidthMergeTest, SameGroupIdenticalYieldsEmptyChangeset) {
    auto current = cb("g", "L3:0=ff", "MB:0=50");
    auto merged = current.merge_with_current(&current);
    EXPECT_EQ(merged.target, current);
    EXPECT_TRUE(merged.changeset.empty());
    EXPECT_EQ(merged.changeset.group_name(), std::optional<std::string>("g"));
}

TEST(CacheBandwidthMergeTest, BothAbsentGroupsAreTheSameGroup) {
    auto current = cb(std::nullopt, "L3:0=ff", "MB:0=50");
    auto desired = cb(std::nullopt, std::nullopt, "MB:0=20");
    auto merged = desired.merge_with_current(&current);
    EXPECT_EQ(merged.target, cb(std::nullopt, "L3:0=ff", "MB:0=20"));
    EXPECT_EQ(merged.changeset, cb(std::nullopt, std::nullopt, "MB:0=20"));
}

TEST(CacheBandwidthMergeTest, ComparisonIsTextual) {
    // Same masks, different spelling: still a change
    auto current = cb("g", "L3:0=ff;1=ff");
    auto desired = cb("g", "L3:1=ff;0=ff");
    auto merged = desired.merge_with_current(&current);
    EXPECT_EQ(merged.changeset, cb("g", "L3:1=ff;0=ff"));
}

TEST(CacheBandwidthMergeTest, EmptySchemaRequestsNoChange) {
    auto current = cb("g", "L3:0=ff", "MB:0=50");
    auto desired = cb("g", "", "MB:0=40");
    auto merged = desired.merge_with_current(&current);
    EXPECT_EQ(merged.target, cb("g", "L3:0=ff", "MB:0=40"));
    EXPECT_EQ(merged.changeset, cb("g", std::nullopt, "MB:0=40"));
}

TEST(CacheBandwidthMergeTest, OperandsAreNotModified) {
    const auto current = cb("g", "A", "B");
    const auto desired = cb("g", "C");
    (void)desired.merge_with_current(&current);
    EXPECT_EQ(current, cb("g", "A", "B"));
    EXPECT_EQ(desired, cb("g", "C"));
}

// ============================================================================
// Metrics
// ============================================================================

TEST(CacheBandwidthMetricsTest, EmptyValueHasNoMetrics) {
    EXPECT_TRUE(cb("g").to_metrics().empty());
    EXPECT_TRUE(cb("g", "", "").to_metrics().empty());
}

TEST(CacheBandwidthMetricsTest, CacheEmitsWaysAndMask) {
    auto metrics = cb("be", "L3:0=f202").to_metrics();
    ASSERT_EQ(metrics.size(), 2u);
    EXPECT_EQ(metrics[0], gauge("rdt_l3_cache_ways", 7, "be", "0"));
    EXPECT_EQ(metrics[1], gauge("rdt_l3_mask", 0xf202, "be", "0"));
}

TEST(CacheBandwidthMetricsTest, BandwidthEmitsBareNumber) {
    auto metrics = cb("be", std::nullopt, "MB:0=20;1=2048").to_metrics();
    ASSERT_EQ(metrics.size(), 2u);
    EXPECT_EQ(metrics[0], gauge("rdt_mb", 20, "be", "0"));
    EXPECT_EQ(metrics[1], gauge("rdt_mb", 2048, "be", "1"));
}

TEST(CacheBandwidthMetricsTest, DefaultGroupHasEmptyGroupLabel) {
    auto metrics = cb(std::nullopt, std::nullopt, "MB:0=50").to_metrics();
    ASSERT_EQ(metrics.size(), 1u);
    EXPECT_EQ(metrics[0].labels.at("group_name"), "");
}

TEST(CacheBandwidthMetricsTest, CacheAndBandwidthAcrossDomains) {
    auto metrics = cb("g", "L3:0=ff;1=f", "MB:0=50;1=50").to_metrics();
    EXPECT_EQ(metrics.size(), 6u);
    for (const auto& metric : metrics) {
        EXPECT_EQ(metric.type, MetricType::Gauge);
        EXPECT_EQ(metric.name, "allocation");
    }
    auto ways = std::count_if(metrics.begin(), metrics.end(), [](const Metric& m) {
        return m.labels.at("allocation_type") == "rdt_l3_cache_ways";
    });
    EXPECT_EQ(ways, 2);
}

TEST(CacheBandwidthMetricsTest, MalformedSchemaFails) {
    EXPECT_THROW((void)cb("g", "L3:0=ff;0=ff").to_metrics(), ParseError);
    EXPECT_THROW((void)cb("g", std::nullopt, "MB:0").to_metrics(), ParseError);
}
