/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace edgefirst::sync::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<uint8_t> {
    std::vector<uint8_t> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }

    return data;
}

auto test_data_generator::generate_samples(std::size_t count,
                                           std::size_t annotations_per_sample,
                                           uint32_t seed) -> std::vector<sample> {
    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_real_distribution<float> unit(0.0F, 0.5F);

    static const std::vector<std::string> labels = {"person", "car", "bicycle", "deer", "sign"};

    std::vector<sample> samples;
    samples.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        sample s;
        std::ostringstream name;
        name << "drive_" << std::setw(3) << std::setfill('0') << i << ".camera.jpeg";
        s.image_name = name.str();
        s.sequence_name = "drive";
        s.group = i % 5 == 0 ? "val" : "train";
        s.size = image_size{1920, 1080};
        s.location = gps_location{45.0F + unit(gen), -73.0F - unit(gen)};

        for (std::size_t a = 0; a < annotations_per_sample; ++a) {
            annotation ann;
            ann.label_index = static_cast<uint64_t>(a % labels.size());
            ann.label = labels[a % labels.size()];
            ann.object_id = "obj-" + std::to_string(a);
            ann.box = box2d{unit(gen), unit(gen), unit(gen), unit(gen)};
            if (a % 3 == 0) {
                polygon outline;
                for (int p = 0; p < 16; ++p) {
                    outline.emplace_back(unit(gen), unit(gen));
                }
                ann.segmentation = mask{{outline, outline}};
            }
            s.annotations.push_back(std::move(ann));
        }
        samples.push_back(std::move(s));
    }
    return samples;
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() / "edgefirst_sync_benchmarks";
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

auto temp_file_manager::create_random_file(
    const std::string& name,
    std::size_t size,
    uint32_t seed) -> std::filesystem::path {
    auto data = test_data_generator::generate_random_data(size, seed);
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_files_.push_back(path);
    return path;
}

auto temp_file_manager::base_dir() const -> const std::filesystem::path& {
    return base_dir_;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

// Utility functions

auto format_bytes(uint64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= sizes::GB) {
        oss << static_cast<double>(bytes) / sizes::GB << " GB";
    } else if (bytes >= sizes::MB) {
        oss << static_cast<double>(bytes) / sizes::MB << " MB";
    } else if (bytes >= sizes::KB) {
        oss << static_cast<double>(bytes) / sizes::KB << " KB";
    } else {
        oss << bytes << " B";
    }

    return oss.str();
}

}  // namespace edgefirst::sync::benchmark
