/**
 * @file download_example.cpp
 * @brief Download one file, or every file, of a snapshot
 *
 * This example demonstrates:
 * - Ranged multipart downloads into a local directory
 * - Batch download with per-file results
 */

#include <edgefirst/sync/sync.h>

#include <filesystem>
#include <iostream>
#include <string>

using namespace edgefirst::sync;

namespace {

void print_usage(const char* program) {
    std::cout << "Download Example - edgefirst_sync" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " <snapshot_id> <output_dir> [<key>]" << std::endl;
    std::cout << std::endl;
    std::cout << "Without <key> every file of the snapshot is downloaded." << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    int64_t snapshot_id = 0;
    try {
        snapshot_id = std::stoll(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid snapshot id: " << e.what() << std::endl;
        return 1;
    }
    const std::filesystem::path output_dir = argv[2];

    auto engine = transfer_engine::builder()
                      .with_config(sync_config::from_environment())
                      .with_snapshot_id(snapshot_id)
                      .build();
    if (!engine) {
        std::cerr << "Error: " << engine.error().describe() << std::endl;
        return 1;
    }

    if (argc > 3) {
        const std::string key = argv[3];
        auto downloaded = engine.value().download(key, output_dir / key);
        if (!downloaded) {
            std::cerr << "Download failed: " << downloaded.error().describe() << std::endl;
            return 1;
        }
        std::cout << "Downloaded " << key << std::endl;
        return 0;
    }

    auto summary = engine.value().download_all(output_dir);
    if (!summary) {
        std::cerr << "Download failed: " << summary.error().describe() << std::endl;
        return 1;
    }

    std::cout << "Downloaded " << summary.value().completed.size() << " files" << std::endl;
    for (const auto& [key, err] : summary.value().failed) {
        std::cerr << "  " << key << ": " << err.describe() << std::endl;
    }
    return summary.value().ok() ? 0 : 1;
}
