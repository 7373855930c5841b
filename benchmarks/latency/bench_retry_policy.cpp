/**
 * @file bench_retry_policy.cpp
 * @brief Benchmarks for request classification and backoff computation
 */

#include <benchmark/benchmark.h>

#include <edgefirst/sync/retry/retry_policy.h>

#include <string>
#include <vector>

namespace edgefirst::sync::benchmark {

static void BM_Retry_Classify(::benchmark::State& state) {
    const std::vector<std::string> urls = {
        "https://edgefirst.studio/api",
        "https://test.edgefirst.studio/api/rpc",
        "https://bucket.s3.amazonaws.com/key?X-Amz-Signature=abc",
        "https://edgefirst.studio/static/app.js",
    };

    for (auto _ : state) {
        for (const auto& url : urls) {
            ::benchmark::DoNotOptimize(classify(url));
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(urls.size()) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Retry_Classify);

static void BM_Retry_NextDelay(::benchmark::State& state) {
    sync_config config;
    auto policy = retry_policy::for_class(request_class::object_storage, config);

    uint32_t attempt = 1;
    for (auto _ : state) {
        ::benchmark::DoNotOptimize(next_delay(policy, attempt));
        attempt = attempt % 10 + 1;
    }
}
BENCHMARK(BM_Retry_NextDelay);

}  // namespace edgefirst::sync::benchmark

BENCHMARK_MAIN();
