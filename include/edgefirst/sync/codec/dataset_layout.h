/**
 * @file dataset_layout.h
 * @brief On-disk dataset layout: "<name>.arrow" beside a "<name>/" sensor container
 *
 * Sequence frames live under a directory named after the sequence:
 *
 * @code
 * deer_walk/
 *   deer_walk.arrow
 *   deer_walk/
 *     deer/deer_001.camera.jpeg
 *     still.png
 * @endcode
 */

#ifndef EDGEFIRST_SYNC_CODEC_DATASET_LAYOUT_H
#define EDGEFIRST_SYNC_CODEC_DATASET_LAYOUT_H

#include "edgefirst/sync/codec/annotation_table.h"
#include "edgefirst/sync/codec/annotation_types.h"
#include "edgefirst/sync/codec/sequence_name.h"
#include "edgefirst/sync/core/types.h"

#include <array>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace edgefirst::sync {

/// Suffixes tried, in order, when looking up an image for a sample
inline constexpr std::array<std::string_view, 6> image_extensions = {
    "jpg", "jpeg", "png", "camera.jpeg", "camera.png", "camera.jpg"};

/**
 * @brief True for files a sensor container may hold (jpg, jpeg, png, pcd, bin)
 */
[[nodiscard]] auto is_sensor_file(const std::filesystem::path& path) -> bool;

/**
 * @brief "<dir>/<dirname>.arrow"; nullopt when the directory has no name
 */
[[nodiscard]] auto dataset_arrow_path(const std::filesystem::path& dataset_dir)
    -> std::optional<std::filesystem::path>;

/**
 * @brief "<dir>/<dirname>"; nullopt when the directory has no name
 */
[[nodiscard]] auto sensor_container_path(const std::filesystem::path& dataset_dir)
    -> std::optional<std::filesystem::path>;

/**
 * @brief (name, frame) for an image under @p root
 *
 * Without sequence detection the stem is the name. With it, a file inside a
 * sub-directory is first matched against the directory name, then a trailing
 * "_<digits>" is read as the frame.
 */
[[nodiscard]] auto parse_image_filename(const std::filesystem::path& path,
                                        const std::filesystem::path& root,
                                        const sequence_options& options = sequence_options{})
    -> split_name;

/**
 * @brief Lookup of sensor files by name and frame
 *
 * Keys are lower-case. Each file is indexed by its file name, by its stem
 * without the ".camera" marker, and, when the stem ends in "_<digits>", by
 * (prefix, frame). The last key finds frames regardless of zero padding, so
 * "clip_0007.camera.jpeg" is found for ("clip", 7).
 */
class file_index {
public:
    /**
     * @brief Index every regular file below @p root
     *
     * A missing root gives an empty index.
     */
    [[nodiscard]] static auto build(const std::filesystem::path& root) -> result<file_index>;

    void add(const std::filesystem::path& path);

    /**
     * @brief Exact file name with each image extension, then stem, then frame key
     */
    [[nodiscard]] auto find(std::string_view name, std::optional<uint32_t> frame) const
        -> std::optional<std::filesystem::path>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return files_.size(); }

private:
    std::vector<std::filesystem::path> files_;
    std::map<std::string, std::filesystem::path> by_name_;
    std::map<std::pair<std::string, uint32_t>, std::filesystem::path> by_frame_;
};

/**
 * @brief A sample reference from a table matched against the container
 */
struct resolved_file {
    std::string name;
    std::optional<uint32_t> frame;

    /// File found on disk, if any
    std::optional<std::filesystem::path> path;

    /// Where the file is expected, relative to the container
    std::filesystem::path expected_path;
};

/**
 * @brief Expected container-relative path for each sample name
 *
 * The first row of each name wins, matching a sequence to its first frame.
 */
[[nodiscard]] auto expected_paths(const annotation_table& table)
    -> std::map<std::string, std::filesystem::path>;

/**
 * @brief One entry per distinct (name, frame), in first-appearance order
 */
[[nodiscard]] auto resolve_files(const annotation_table& table,
                                 const std::filesystem::path& sensor_container)
    -> result<std::vector<resolved_file>>;

/**
 * @brief expected_paths() for an Arrow file
 */
[[nodiscard]] auto resolve_arrow_files(const std::filesystem::path& arrow_path)
    -> result<std::map<std::string, std::filesystem::path>>;

/**
 * @brief resolve_files() for an Arrow file
 */
[[nodiscard]] auto resolve_files_with_container(const std::filesystem::path& arrow_path,
                                                const std::filesystem::path& sensor_container)
    -> result<std::vector<resolved_file>>;

enum class layout_issue_kind {
    missing_arrow_file,
    missing_sensor_container,
    missing_file,
    unreferenced_file,
};

struct layout_issue {
    layout_issue_kind kind = layout_issue_kind::missing_file;

    /// Sample name, for missing_file
    std::string name;

    std::filesystem::path path;

    [[nodiscard]] auto describe() const -> std::string;
};

/**
 * @brief Missing files and unreferenced sensor files in a container
 */
[[nodiscard]] auto validate_container(const annotation_table& table,
                                      const std::filesystem::path& sensor_container)
    -> result<std::vector<layout_issue>>;

/**
 * @brief Check a dataset directory against the layout
 *
 * A missing Arrow file or container is reported alone, since nothing else can
 * be checked. An empty list means the dataset is complete.
 */
[[nodiscard]] auto validate_dataset_structure(const std::filesystem::path& dataset_dir)
    -> result<std::vector<layout_issue>>;

/**
 * @brief One unannotated sample per sensor file below @p folder, sorted by path
 *
 * Fails with invalid_argument when the folder holds no sensor files.
 */
[[nodiscard]] auto samples_from_folder(const std::filesystem::path& folder,
                                       const sequence_options& options = sequence_options{})
    -> result<std::vector<sample>>;

/**
 * @brief Write an Arrow file with one null-annotation row per sensor file
 *
 * @return Number of samples written
 */
[[nodiscard]] auto generate_arrow_from_folder(const std::filesystem::path& folder,
                                              const std::filesystem::path& output,
                                              const sequence_options& options = sequence_options{})
    -> result<std::size_t>;

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_CODEC_DATASET_LAYOUT_H
