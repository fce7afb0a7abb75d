#include <colloc/core/changeset.hpp>
#include <colloc/core/metrics_encoder.hpp>

#include <benchmark/benchmark.h>

#include <string>

using namespace colloc::core;

namespace {

// n workloads with quota, shares and a cache/bandwidth group each
WorkloadAllocations make_allocations(int64_t n, double quota, const std::string& l3) {
    WorkloadAllocations allocations;
    for (int64_t i = 0; i < n; ++i) {
        std::string id = "task-" + std::to_string(i);
        allocations[id] = {
            {ResourceKind::Quota, quota},
            {ResourceKind::Shares, 0.5},
            {ResourceKind::CacheBandwidth,
             CacheBandwidthAllocation("group-" + std::to_string(i % 4), l3, "MB:0=50;1=50")},
        };
    }
    return allocations;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BM_ReconcileAll_NoChange: desired == current
// ---------------------------------------------------------------------------

static void BM_ReconcileAll_NoChange(benchmark::State& state) {
    auto current = make_allocations(state.range(0), 0.5, "L3:0=ff;1=ff");
    auto desired = current;

    for (auto _ : state) {
        auto result = reconcile_all(current, desired);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ReconcileAll_NoChange)->Arg(100)->Arg(1000);

// ---------------------------------------------------------------------------
// BM_ReconcileAll_AllChanged: every quota and cache mask differs
// ---------------------------------------------------------------------------

static void BM_ReconcileAll_AllChanged(benchmark::State& state) {
    auto current = make_allocations(state.range(0), 0.5, "L3:0=ff;1=ff");
    auto desired = make_allocations(state.range(0), 0.8, "L3:0=f;1=f");

    for (auto _ : state) {
        auto result = reconcile_all(current, desired);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ReconcileAll_AllChanged)->Arg(100)->Arg(1000);

// ---------------------------------------------------------------------------
// BM_EncodeAllocations
// ---------------------------------------------------------------------------

static void BM_EncodeAllocations(benchmark::State& state) {
    auto allocations = make_allocations(state.range(0), 0.5, "L3:0=ff;1=ff");

    for (auto _ : state) {
        auto metrics = encode_allocations(allocations);
        benchmark::DoNotOptimize(metrics);
    }
}
BENCHMARK(BM_EncodeAllocations)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
