/**
 * @file annotation_convert_example.cpp
 * @brief Convert annotated samples to an Arrow file and back
 *
 * This example demonstrates:
 * - Building samples with boxes and a segmentation mask
 * - Batch conversion with a validation report
 * - Writing and reading the Arrow IPC container
 */

#include <edgefirst/sync/sync.h>

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace edgefirst::sync;

namespace {

auto make_samples() -> std::vector<sample> {
    std::vector<sample> samples;
    for (uint32_t frame = 0; frame < 3; ++frame) {
        sample s;
        s.image_name = "deer_00" + std::to_string(frame) + ".camera.jpeg";
        s.sequence_name = "deer";
        s.group = "train";
        s.size = image_size{1920, 1080};

        annotation deer;
        deer.label = "deer";
        deer.object_id = "deer-1";
        deer.box = box2d{0.1F + 0.05F * static_cast<float>(frame), 0.4F, 0.2F, 0.3F};
        deer.segmentation = mask{{polygon{{0.12F, 0.42F}, {0.28F, 0.42F}, {0.2F, 0.68F}}}};
        s.annotations.push_back(deer);

        if (frame == 2) {
            annotation broken;
            broken.label = "fox";
            broken.box = box2d{0.9F, 0.9F, 0.5F, 1.5F};
            s.annotations.push_back(broken);
        }
        samples.push_back(std::move(s));
    }
    return samples;
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::filesystem::path output = argc > 1 ? argv[1] : "annotations.arrow";

    annotation_codec codec;
    auto table = codec.to_table(make_samples());
    if (!table) {
        std::cerr << "Conversion failed: " << table.error().describe() << std::endl;
        return 1;
    }
    std::cout << "Rows: " << table.value().row_count() << std::endl;
    std::cout << "Report: " << codec.report().summary() << std::endl;

    if (!arrow_io_available()) {
        std::cout << "Built without Apache Arrow; skipping file output" << std::endl;
        return 0;
    }

    if (auto written = write_arrow_file(table.value(), output); !written) {
        std::cerr << "Write failed: " << written.error().describe() << std::endl;
        return 1;
    }
    auto read = read_arrow_file(output);
    if (!read) {
        std::cerr << "Read failed: " << read.error().describe() << std::endl;
        return 1;
    }

    auto samples = table_to_samples(read.value());
    if (!samples) {
        std::cerr << "Grouping failed: " << samples.error().describe() << std::endl;
        return 1;
    }
    for (const auto& s : samples.value()) {
        std::cout << s.image_name << ": " << s.annotations.size() << " annotation(s)" << std::endl;
    }
    return 0;
}
