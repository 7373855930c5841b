/**
 * @file dataset_layout.cpp
 * @brief On-disk dataset layout: "<name>.arrow" beside a "<name>/" sensor container
 */

#include "edgefirst/sync/codec/dataset_layout.h"

#include "edgefirst/sync/codec/annotation_codec.h"
#include "edgefirst/sync/codec/arrow_io.h"
#include "edgefirst/sync/core/logging.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <set>
#include <sstream>

namespace edgefirst::sync {

namespace fs = std::filesystem;

namespace {

auto lower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto extension_of(const fs::path& path) -> std::string {
    auto ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    return lower(ext);
}

auto frame_key(std::string_view name, std::optional<uint32_t> frame) -> std::string {
    std::ostringstream out;
    out << name;
    if (frame) {
        out << '_' << std::setw(3) << std::setfill('0') << *frame;
    }
    return lower(out.str());
}

/// Regular files below @p root, sorted; an absent root has none
auto list_files(const fs::path& root) -> result<std::vector<fs::path>> {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return files;
    }

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return unexpected{error{error_code::file_read_error,
            "cannot list " + root.string() + ": " + ec.message()}};
    }

    std::sort(files.begin(), files.end());
    return files;
}

auto resolve_with_index(const annotation_table& table, const file_index& index)
    -> std::vector<resolved_file> {
    sequence_resolver resolver;
    std::set<std::pair<std::string, std::optional<uint32_t>>> seen;
    std::vector<resolved_file> resolved;

    for (std::size_t r = 0; r < table.row_count(); ++r) {
        const auto& name = table.name[r];
        const auto& frame = table.frame[r];
        if (name.empty() || !seen.emplace(name, frame).second) {
            continue;
        }

        resolved_file file;
        file.name = name;
        file.frame = frame;
        file.path = index.find(name, frame);
        file.expected_path = resolver.join_path(name, frame);
        resolved.push_back(std::move(file));
    }
    return resolved;
}

auto validate_with_index(const annotation_table& table, const file_index& index,
                         const std::vector<fs::path>& files) -> std::vector<layout_issue> {
    std::vector<layout_issue> issues;
    std::set<fs::path> referenced;

    for (auto& file : resolve_with_index(table, index)) {
        if (file.path) {
            referenced.insert(*file.path);
            continue;
        }
        layout_issue issue;
        issue.kind = layout_issue_kind::missing_file;
        issue.name = std::move(file.name);
        issue.path = std::move(file.expected_path);
        issues.push_back(std::move(issue));
    }

    for (const auto& path : files) {
        if (is_sensor_file(path) && referenced.count(path) == 0) {
            layout_issue issue;
            issue.kind = layout_issue_kind::unreferenced_file;
            issue.path = path;
            issues.push_back(std::move(issue));
        }
    }
    return issues;
}

}  // namespace

// ============================================================================
// Paths
// ============================================================================

auto is_sensor_file(const fs::path& path) -> bool {
    auto ext = extension_of(path);
    return ext == "jpg" || ext == "jpeg" || ext == "png" || ext == "pcd" || ext == "bin";
}

auto dataset_arrow_path(const fs::path& dataset_dir) -> std::optional<fs::path> {
    auto name = dataset_dir.filename();
    if (name.empty()) {
        name = dataset_dir.parent_path().filename();
    }
    if (name.empty() || name == "." || name == "..") {
        return std::nullopt;
    }
    return dataset_dir / (name.string() + ".arrow");
}

auto sensor_container_path(const fs::path& dataset_dir) -> std::optional<fs::path> {
    auto name = dataset_dir.filename();
    if (name.empty()) {
        name = dataset_dir.parent_path().filename();
    }
    if (name.empty() || name == "." || name == "..") {
        return std::nullopt;
    }
    return dataset_dir / name;
}

auto parse_image_filename(const fs::path& path, const fs::path& root,
                          const sequence_options& options) -> split_name {
    sequence_resolver resolver(options);
    const auto filename = path.filename().string();
    if (!options.detect_sequences) {
        return split_name{resolver.stem(filename), std::nullopt};
    }

    std::optional<std::string> directory;
    auto relative = path.lexically_relative(root);
    if (!relative.empty() && relative.has_parent_path()) {
        directory = relative.parent_path().filename().string();
    }
    return resolver.split(filename, directory);
}

// ============================================================================
// file_index
// ============================================================================

auto file_index::build(const fs::path& root) -> result<file_index> {
    auto files = list_files(root);
    if (!files) {
        return unexpected{files.error()};
    }
    file_index index;
    for (const auto& path : files.value()) {
        index.add(path);
    }
    return index;
}

void file_index::add(const fs::path& path) {
    files_.push_back(path);

    const auto filename = path.filename().string();
    by_name_.insert_or_assign(lower(filename), path);

    sequence_resolver detector(sequence_options{true});
    by_name_.emplace(lower(detector.stem(filename)), path);
    auto parts = detector.split(filename);
    if (parts.frame) {
        by_frame_.emplace(std::make_pair(lower(parts.name), *parts.frame), path);
    }
}

auto file_index::find(std::string_view name, std::optional<uint32_t> frame) const
    -> std::optional<fs::path> {
    const auto key = frame_key(name, frame);

    for (auto ext : image_extensions) {
        if (auto it = by_name_.find(key + "." + std::string(ext)); it != by_name_.end()) {
            return it->second;
        }
    }
    if (auto it = by_name_.find(key); it != by_name_.end()) {
        return it->second;
    }
    if (frame) {
        if (auto it = by_frame_.find(std::make_pair(lower(name), *frame));
            it != by_frame_.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Resolution
// ============================================================================

auto expected_paths(const annotation_table& table) -> std::map<std::string, fs::path> {
    sequence_resolver resolver;
    std::map<std::string, fs::path> paths;
    for (std::size_t r = 0; r < table.row_count(); ++r) {
        const auto& name = table.name[r];
        if (name.empty() || paths.count(name) != 0) {
            continue;
        }
        paths.emplace(name, resolver.join_path(name, table.frame[r]));
    }
    return paths;
}

auto resolve_files(const annotation_table& table, const fs::path& sensor_container)
    -> result<std::vector<resolved_file>> {
    auto index = file_index::build(sensor_container);
    if (!index) {
        return unexpected{index.error()};
    }
    return resolve_with_index(table, index.value());
}

auto resolve_arrow_files(const fs::path& arrow_path)
    -> result<std::map<std::string, fs::path>> {
    auto table = read_arrow_file(arrow_path);
    if (!table) {
        return unexpected{table.error()};
    }
    return expected_paths(table.value());
}

auto resolve_files_with_container(const fs::path& arrow_path, const fs::path& sensor_container)
    -> result<std::vector<resolved_file>> {
    auto table = read_arrow_file(arrow_path);
    if (!table) {
        return unexpected{table.error()};
    }
    return resolve_files(table.value(), sensor_container);
}

// ============================================================================
// Validation
// ============================================================================

auto layout_issue::describe() const -> std::string {
    switch (kind) {
        case layout_issue_kind::missing_arrow_file:
            return "missing Arrow file: " + path.string();
        case layout_issue_kind::missing_sensor_container:
            return "missing sensor container directory: " + path.string();
        case layout_issue_kind::missing_file:
            return "missing file for sample '" + name + "': " + path.string();
        case layout_issue_kind::unreferenced_file:
            return "unreferenced file in container: " + path.string();
    }
    return "unknown layout issue";
}

auto validate_container(const annotation_table& table, const fs::path& sensor_container)
    -> result<std::vector<layout_issue>> {
    auto files = list_files(sensor_container);
    if (!files) {
        return unexpected{files.error()};
    }
    file_index index;
    for (const auto& path : files.value()) {
        index.add(path);
    }
    return validate_with_index(table, index, files.value());
}

auto validate_dataset_structure(const fs::path& dataset_dir)
    -> result<std::vector<layout_issue>> {
    auto arrow_path = dataset_arrow_path(dataset_dir);
    auto container = sensor_container_path(dataset_dir);
    if (!arrow_path || !container) {
        return unexpected{error{error_code::invalid_argument,
            "invalid dataset directory: " + dataset_dir.string()}};
    }

    std::error_code ec;
    if (!fs::is_regular_file(*arrow_path, ec)) {
        return std::vector<layout_issue>{
            layout_issue{layout_issue_kind::missing_arrow_file, {}, *arrow_path}};
    }
    if (!fs::is_directory(*container, ec)) {
        return std::vector<layout_issue>{
            layout_issue{layout_issue_kind::missing_sensor_container, {}, *container}};
    }

    auto table = read_arrow_file(*arrow_path);
    if (!table) {
        return unexpected{table.error()};
    }
    auto issues = validate_container(table.value(), *container);
    if (issues && !issues.value().empty()) {
        EDGEFIRST_LOG_WARN(log_category::codec,
            dataset_dir.string() + ": " + std::to_string(issues.value().size()) +
            " layout issue(s)");
    }
    return issues;
}

// ============================================================================
// Folder import
// ============================================================================

auto samples_from_folder(const fs::path& folder, const sequence_options& options)
    -> result<std::vector<sample>> {
    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        return unexpected{error{error_code::file_not_found,
            "not a directory: " + folder.string()}};
    }

    auto files = list_files(folder);
    if (!files) {
        return unexpected{files.error()};
    }

    std::vector<sample> samples;
    for (const auto& path : files.value()) {
        if (!is_sensor_file(path)) {
            continue;
        }
        auto parts = parse_image_filename(path, folder, options);

        sample s;
        s.image_name = path.filename().string();
        if (parts.frame) {
            s.sequence_name = parts.name;
        }
        auto ext = extension_of(path);
        s.files.push_back(sample_file{ext == "pcd" || ext == "bin" ? ext : std::string("image"),
                                      path.lexically_relative(folder).generic_string()});
        samples.push_back(std::move(s));
    }

    if (samples.empty()) {
        return unexpected{error{error_code::invalid_argument,
            "no image files found in " + folder.string()}};
    }
    return samples;
}

auto generate_arrow_from_folder(const fs::path& folder, const fs::path& output,
                                const sequence_options& options) -> result<std::size_t> {
    auto samples = samples_from_folder(folder, options);
    if (!samples) {
        return unexpected{samples.error()};
    }

    codec_options codec;
    codec.sequences = options;
    auto table = samples_to_table(samples.value(), codec);
    if (!table) {
        return unexpected{table.error()};
    }

    if (output.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(output.parent_path(), ec);
        if (ec) {
            return unexpected{error{error_code::file_write_error,
                "cannot create " + output.parent_path().string() + ": " + ec.message()}};
        }
    }
    if (auto written = write_arrow_file(table.value(), output); !written) {
        return unexpected{written.error()};
    }

    EDGEFIRST_LOG_INFO(log_category::codec,
        "Wrote " + std::to_string(samples.value().size()) + " samples from " + folder.string() +
        " to " + output.string());
    return samples.value().size();
}

}  // namespace edgefirst::sync
