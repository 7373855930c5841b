/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef EDGEFIRST_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H
#define EDGEFIRST_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H

#include <edgefirst/sync/codec/annotation_types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace edgefirst::sync::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<uint8_t>;

    /**
     * @brief Generate a sequence of annotated samples
     * @param count Number of samples
     * @param annotations_per_sample Boxes per sample; every third also gets a mask
     * @param seed Random seed (0 for random)
     */
    static auto generate_samples(std::size_t count, std::size_t annotations_per_sample,
                                 uint32_t seed = 0) -> std::vector<sample>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Format bytes as human-readable string (e.g. "1.50 GB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 8 * MB;
constexpr std::size_t large_file = 64 * MB;

constexpr std::size_t min_part = 256 * KB;
constexpr std::size_t default_part = 1 * MB;
constexpr std::size_t max_part = 8 * MB;
}  // namespace sizes

}  // namespace edgefirst::sync::benchmark

#endif  // EDGEFIRST_SYNC_BENCHMARKS_BENCHMARK_HELPERS_H
