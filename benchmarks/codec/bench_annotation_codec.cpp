/**
 * @file bench_annotation_codec.cpp
 * @brief Benchmarks for converting samples to and from the columnar table
 */

#include <benchmark/benchmark.h>

#include <edgefirst/sync/codec/annotation_codec.h>
#include <edgefirst/sync/codec/arrow_io.h>
#include <edgefirst/sync/codec/geometry.h>
#include <edgefirst/sync/core/logging.h>

#include "utils/benchmark_helpers.h"

namespace edgefirst::sync::benchmark {

static void BM_Codec_SamplesToTable(::benchmark::State& state) {
    get_logger().set_level(log_level::error);
    auto samples = test_data_generator::generate_samples(
        static_cast<std::size_t>(state.range(0)), 8, 42);

    for (auto _ : state) {
        auto table = samples_to_table(samples);
        if (!table) {
            state.SkipWithError(table.error().message.c_str());
            return;
        }
        ::benchmark::DoNotOptimize(table.value().row_count());
    }
    state.SetItemsProcessed(state.range(0) * static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Codec_SamplesToTable)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_Codec_TableToSamples(::benchmark::State& state) {
    get_logger().set_level(log_level::error);
    auto samples = test_data_generator::generate_samples(
        static_cast<std::size_t>(state.range(0)), 8, 42);
    auto table = samples_to_table(samples);
    if (!table) {
        state.SkipWithError(table.error().message.c_str());
        return;
    }

    for (auto _ : state) {
        auto back = table_to_samples(table.value());
        ::benchmark::DoNotOptimize(back);
    }
    state.SetItemsProcessed(static_cast<int64_t>(table.value().row_count()) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Codec_TableToSamples)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_Geometry_FlattenMask(::benchmark::State& state) {
    const auto points = static_cast<std::size_t>(state.range(0));
    mask m;
    for (int p = 0; p < 4; ++p) {
        polygon outline;
        for (std::size_t i = 0; i < points; ++i) {
            outline.emplace_back(static_cast<float>(i) / static_cast<float>(points), 0.5F);
        }
        m.polygons.push_back(std::move(outline));
    }

    for (auto _ : state) {
        auto flat = geometry::flatten_mask(m);
        auto back = geometry::unflatten_mask(flat);
        ::benchmark::DoNotOptimize(back);
    }
    state.SetItemsProcessed(static_cast<int64_t>(points * 4) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Geometry_FlattenMask)->Arg(16)->Arg(256)->Arg(4096);

static void BM_ArrowIo_WriteRead(::benchmark::State& state) {
    if (!arrow_io_available()) {
        state.SkipWithError("built without Apache Arrow");
        return;
    }
    get_logger().set_level(log_level::error);
    auto table = samples_to_table(test_data_generator::generate_samples(
        static_cast<std::size_t>(state.range(0)), 8, 42));
    temp_file_manager temp_files;
    auto path = temp_files.base_dir() / "bench.arrow";

    for (auto _ : state) {
        auto written = write_arrow_file(table.value(), path);
        auto read = read_arrow_file(path);
        if (!written || !read) {
            state.SkipWithError("arrow round trip failed");
            return;
        }
        ::benchmark::DoNotOptimize(read.value().row_count());
    }
    state.SetItemsProcessed(static_cast<int64_t>(table.value().row_count()) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_ArrowIo_WriteRead)->Arg(1000)->Arg(10000)->Unit(::benchmark::kMillisecond);

}  // namespace edgefirst::sync::benchmark

BENCHMARK_MAIN();
