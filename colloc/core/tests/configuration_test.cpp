#include <colloc/core/configuration.hpp>
#include <colloc/core/error.hpp>
#include <colloc/core/resource_kind.hpp>

#include <gtest/gtest.h>

using namespace colloc::core;

TEST(AllocationConfigurationTest, Defaults) {
    AllocationConfiguration config;
    EXPECT_EQ(config.cpu_quota_period, 1000);
    EXPECT_EQ(config.cpu_shares_min, 2);
    EXPECT_EQ(config.cpu_shares_max, 10000);
    EXPECT_FALSE(config.default_cache_schema.has_value());
    EXPECT_FALSE(config.default_bandwidth_schema.has_value());
    EXPECT_NO_THROW(config.validate());
}

TEST(AllocationConfigurationTest, SharesCount) {
    AllocationConfiguration config;
    EXPECT_EQ(config.shares_count(0.0), 2);
    EXPECT_EQ(config.shares_count(1.0), 10000);
    EXPECT_EQ(config.shares_count(0.5), 2 + 4999);
    EXPECT_EQ(config.shares_count(-1.0), 2);
    EXPECT_EQ(config.shares_count(7.0), 10000);
}

TEST(AllocationConfigurationTest, Quota) {
    AllocationConfiguration config;
    EXPECT_EQ(config.quota(1.0, 4), 4000);
    EXPECT_EQ(config.quota(0.5, 4), 2000);
    EXPECT_EQ(config.quota(0.0, 4), 0);
    EXPECT_EQ(config.quota(2.0, 1), 1000);
}

TEST(AllocationConfigurationTest, InvalidPeriod) {
    AllocationConfiguration config;
    config.cpu_quota_period = 0;
    EXPECT_THROW(config.validate(), ReconcileError);
}

TEST(AllocationConfigurationTest, InvertedShares) {
    AllocationConfiguration config;
    config.cpu_shares_min = 100;
    config.cpu_shares_max = 10;
    EXPECT_THROW(config.validate(), ReconcileError);
}

TEST(AllocationConfigurationTest, MalformedDefaultSchema) {
    AllocationConfiguration config;
    config.default_cache_schema = "L3:0=fff";
    EXPECT_NO_THROW(config.validate());
    config.default_bandwidth_schema = "MB:0";
    EXPECT_THROW(config.validate(), ParseError);
}

TEST(ResourceKindTest, Names) {
    EXPECT_EQ(to_string(ResourceKind::Quota), "cpu_quota");
    EXPECT_EQ(to_string(ResourceKind::Shares), "cpu_shares");
    EXPECT_EQ(to_string(ResourceKind::CacheBandwidth), "rdt");
}

TEST(ResourceKindTest, Lookup) {
    EXPECT_EQ(resource_kind_from_string("cpu_shares"), ResourceKind::Shares);
    EXPECT_EQ(resource_kind_from_string("rdt"), ResourceKind::CacheBandwidth);
    EXPECT_FALSE(resource_kind_from_string("memory").has_value());
}
