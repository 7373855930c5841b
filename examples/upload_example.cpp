/**
 * @file upload_example.cpp
 * @brief Multipart upload of one or more files into a snapshot
 *
 * This example demonstrates:
 * - Building a transfer engine from environment configuration
 * - Draining a progress channel while an upload runs
 * - Reporting failures with their part index and HTTP status
 */

#include <edgefirst/sync/sync.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace edgefirst::sync;

namespace {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

void print_usage(const char* program) {
    std::cout << "Upload Example - edgefirst_sync" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <local_file> [<local_file> ...]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -s, --snapshot <name>   Snapshot name (default: file name of the first file)" << std::endl;
    std::cout << "  -p, --part-size <MiB>   Part size in MiB (default: from environment)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "The server URL and token are read from EDGEFIRST_SERVER and EDGEFIRST_TOKEN." << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string snapshot_name;
    std::optional<uint64_t> part_size_mib;
    std::vector<std::filesystem::path> files;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-s" || arg == "--snapshot") {
            if (++i >= argc) {
                std::cerr << "Error: --snapshot requires an argument" << std::endl;
                return 1;
            }
            snapshot_name = argv[i];
        } else if (arg == "-p" || arg == "--part-size") {
            if (++i >= argc) {
                std::cerr << "Error: --part-size requires an argument" << std::endl;
                return 1;
            }
            try {
                part_size_mib = std::stoull(argv[i]);
            } catch (const std::exception& e) {
                std::cerr << "Error: invalid part size: " << e.what() << std::endl;
                return 1;
            }
        } else if (arg[0] != '-') {
            files.emplace_back(arg);
        }
    }

    if (files.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (snapshot_name.empty()) {
        snapshot_name = files.front().stem().string();
    }

    auto config = sync_config::from_environment();
    if (part_size_mib) {
        config.part_size = *part_size_mib * 1024 * 1024;
    }

    auto engine = transfer_engine::builder()
                      .with_config(config)
                      .with_snapshot_name(snapshot_name)
                      .build();
    if (!engine) {
        std::cerr << "Error: " << engine.error().describe() << std::endl;
        return 1;
    }

    int failures = 0;
    for (const auto& file : files) {
        auto progress = std::make_shared<progress_channel>(config.progress_capacity);
        std::atomic<bool> done{false};

        std::thread reporter([&] {
            while (!done.load()) {
                if (auto update = progress->wait_pop_for(std::chrono::milliseconds(200))) {
                    std::cout << "\r  " << file.filename().string() << ": "
                              << std::fixed << std::setprecision(1) << update->percentage()
                              << "% (" << format_bytes(update->bytes_done) << " / "
                              << format_bytes(update->bytes_total) << ")" << std::flush;
                }
            }
        });

        auto start = std::chrono::steady_clock::now();
        auto uploaded = engine.value().upload(file, file.filename().string(), 0, progress);
        done = true;
        progress->close();
        reporter.join();
        std::cout << std::endl;

        if (!uploaded) {
            ++failures;
            std::cerr << "  Upload failed: " << uploaded.error().describe() << std::endl;
            continue;
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::cout << "  Uploaded in " << elapsed.count() << " ms" << std::endl;
    }

    return failures == 0 ? 0 : 1;
}
