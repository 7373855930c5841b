/**
 * @file bench_transfer_throughput.cpp
 * @brief Benchmarks for part planning, part I/O and in-memory multipart uploads
 */

#include <benchmark/benchmark.h>

#include <edgefirst/sync/core/file_io.h>
#include <edgefirst/sync/core/logging.h>
#include <edgefirst/sync/transfer/part_planner.h>
#include <edgefirst/sync/transfer/transfer_engine.h>

#include "utils/benchmark_helpers.h"

#include <memory>
#include <mutex>

namespace edgefirst::sync::benchmark {

namespace {

/**
 * @brief Object storage that accepts every PUT and discards the body
 */
class discard_http_client : public http_client_interface {
public:
    auto get(const std::string&, const header_map&) -> result<http_response> override {
        return http_response{404, {}, {}};
    }

    auto post(const std::string&, const std::string&, const header_map&)
        -> result<http_response> override {
        return http_response{404, {}, {}};
    }

    auto put(const std::string& url, const std::vector<uint8_t>& body, const header_map&)
        -> result<http_response> override {
        ::benchmark::DoNotOptimize(body.data());
        return http_response{200, {{"ETag", "\"" + std::to_string(url.size()) + "\""}}, {}};
    }

    auto head(const std::string&, const header_map&) -> result<http_response> override {
        return http_response{404, {}, {}};
    }
};

class local_endpoint : public multipart_endpoint {
public:
    auto create_multipart_upload(const std::string& key, uint64_t, uint64_t part_count)
        -> result<multipart_upload> override {
        multipart_upload upload{key, "bench", {}};
        for (uint64_t n = 1; n <= part_count; ++n) {
            upload.urls.push_back("https://storage.local/bench/" + std::to_string(n));
        }
        return upload;
    }

    auto complete_multipart_upload(const multipart_upload&, const std::vector<completed_part>&)
        -> result<void> override {
        return {};
    }

    auto abort_multipart_upload(const multipart_upload&) -> result<void> override {
        return {};
    }

    auto create_download_urls() -> result<std::map<std::string, std::string>> override {
        return std::map<std::string, std::string>{};
    }
};

}  // namespace

/**
 * @brief Planning cost for a large object
 */
static void BM_PartPlanner_Plan(::benchmark::State& state) {
    const auto total = static_cast<uint64_t>(state.range(0)) * sizes::GB;
    const auto part_size = static_cast<uint64_t>(state.range(1));

    for (auto _ : state) {
        auto parts = plan(total, part_size);
        ::benchmark::DoNotOptimize(parts);
    }
    state.SetItemsProcessed(static_cast<int64_t>(planned_part_count(total, part_size)) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_PartPlanner_Plan)
    ->Args({1, sizes::default_part})
    ->Args({100, sizes::default_part})
    ->Args({100, 100 * sizes::MB});

/**
 * @brief Positional reads of every part of a file
 */
static void BM_FileHandle_ReadParts(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto part_size = static_cast<uint64_t>(state.range(1));

    temp_file_manager temp_files;
    auto path = temp_files.create_random_file("read_parts.bin", file_size, 42);
    auto file = file_handle::open_read(path);
    if (!file) {
        state.SkipWithError(file.error().describe().c_str());
        return;
    }
    auto parts = plan(file_size, part_size);

    for (auto _ : state) {
        for (const auto& p : parts.value()) {
            auto data = file.value().read_at(p.offset, p.length);
            if (!data) {
                state.SkipWithError("read failed");
                return;
            }
            ::benchmark::DoNotOptimize(data.value().data());
        }
    }
    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_FileHandle_ReadParts)
    ->Args({sizes::medium_file, sizes::min_part})
    ->Args({sizes::medium_file, sizes::default_part})
    ->Args({sizes::large_file, sizes::max_part})
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Whole multipart upload against in-memory storage, by worker count
 */
static void BM_Engine_Upload(::benchmark::State& state) {
    get_logger().set_level(log_level::error);

    temp_file_manager temp_files;
    auto path = temp_files.create_random_file("upload.bin", sizes::large_file, 7);

    sync_config config;
    config.part_size = sizes::max_part;
    config.max_tasks = static_cast<std::size_t>(state.range(0));

    auto engine = transfer_engine::builder()
                      .with_config(config)
                      .with_http_client(std::make_shared<discard_http_client>())
                      .with_endpoint(std::make_shared<local_endpoint>())
                      .build();
    if (!engine) {
        state.SkipWithError(engine.error().describe().c_str());
        return;
    }

    for (auto _ : state) {
        auto uploaded = engine.value().upload(path, "upload.bin");
        if (!uploaded) {
            state.SkipWithError(uploaded.error().describe().c_str());
            return;
        }
    }
    state.SetBytesProcessed(static_cast<int64_t>(sizes::large_file) *
                            static_cast<int64_t>(state.iterations()));
    state.SetLabel(format_bytes(sizes::large_file));
}
BENCHMARK(BM_Engine_Upload)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->Unit(::benchmark::kMillisecond);

}  // namespace edgefirst::sync::benchmark

BENCHMARK_MAIN();
