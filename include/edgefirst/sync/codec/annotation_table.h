/**
 * @file annotation_table.h
 * @brief Columnar dataset form: one row per annotation
 */

#ifndef EDGEFIRST_SYNC_CODEC_ANNOTATION_TABLE_H
#define EDGEFIRST_SYNC_CODEC_ANNOTATION_TABLE_H

#include "edgefirst/sync/core/types.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace edgefirst::sync {

/**
 * @brief Column names of the columnar container
 */
namespace columns {
inline constexpr std::string_view name = "name";
inline constexpr std::string_view frame = "frame";
inline constexpr std::string_view object_id = "object_id";
inline constexpr std::string_view label = "label";
inline constexpr std::string_view label_index = "label_index";
inline constexpr std::string_view group = "group";
inline constexpr std::string_view mask = "mask";
inline constexpr std::string_view box2d = "box2d";
inline constexpr std::string_view box3d = "box3d";
inline constexpr std::string_view size = "size";
inline constexpr std::string_view location = "location";
inline constexpr std::string_view pose = "pose";
inline constexpr std::string_view degradation = "degradation";

/// Names older producers used for object_id
inline constexpr std::array<std::string_view, 2> object_id_aliases = {
    "object_reference", "objectReference"};

/// Every column in schema order
inline constexpr std::array<std::string_view, 13> all = {
    name, frame, object_id, label, label_index, group, mask,
    box2d, box3d, size, location, pose, degradation};
}  // namespace columns

/**
 * @brief Canonical column a stored column name maps to
 *
 * Legacy object-id names map to "object_id"; unknown names give nullopt.
 */
[[nodiscard]] auto canonical_column(std::string_view stored) -> std::optional<std::string_view>;

/**
 * @brief Index of the column in @p stored_names that provides @p canonical
 *
 * The canonical name is preferred over an alias when both are present.
 */
[[nodiscard]] auto find_column(const std::vector<std::string>& stored_names,
                               std::string_view canonical) -> std::optional<std::size_t>;

/**
 * @brief One row of the table
 */
struct table_row {
    std::string name;
    std::optional<uint32_t> frame;
    std::optional<std::string> object_id;
    std::optional<std::string> label;
    std::optional<uint64_t> label_index;
    std::optional<std::string> group;
    std::optional<std::vector<float>> mask;
    std::optional<std::vector<float>> box2d;
    std::optional<std::vector<float>> box3d;
    std::optional<std::vector<uint32_t>> size;
    std::optional<std::vector<float>> location;
    std::optional<std::vector<float>> pose;
    std::optional<std::string> degradation;

    /**
     * @brief No annotation-level field is set: the row only carries a sample
     */
    [[nodiscard]] auto is_sample_only() const noexcept -> bool {
        return !object_id && !label && !label_index && !mask && !box2d && !box3d;
    }

    auto operator==(const table_row&) const -> bool = default;
};

/**
 * @brief Column-oriented annotation table
 *
 * Every column vector holds row_count() entries. Tables read from older
 * files may lack optional columns; has_column() reports which ones were
 * present, and absent columns read as null.
 */
class annotation_table {
public:
    annotation_table();

    void append(const table_row& row);

    [[nodiscard]] auto row(std::size_t index) const -> table_row;

    [[nodiscard]] auto row_count() const noexcept -> std::size_t { return name.size(); }

    [[nodiscard]] auto empty() const noexcept -> bool { return name.empty(); }

    void reserve(std::size_t rows);

    /**
     * @brief Whether the column was present in the source (all are for new tables)
     */
    [[nodiscard]] auto has_column(std::string_view column) const -> bool;

    void set_column_present(std::string_view column, bool present);

    /**
     * @brief Check that all columns have the same length
     */
    [[nodiscard]] auto validate_shape() const -> result<void>;

    std::vector<std::string> name;
    std::vector<std::optional<uint32_t>> frame;
    std::vector<std::optional<std::string>> object_id;
    std::vector<std::optional<std::string>> label;
    std::vector<std::optional<uint64_t>> label_index;
    std::vector<std::optional<std::string>> group;
    std::vector<std::optional<std::vector<float>>> mask;
    std::vector<std::optional<std::vector<float>>> box2d;
    std::vector<std::optional<std::vector<float>>> box3d;
    std::vector<std::optional<std::vector<uint32_t>>> size;
    std::vector<std::optional<std::vector<float>>> location;
    std::vector<std::optional<std::vector<float>>> pose;
    std::vector<std::optional<std::string>> degradation;

private:
    std::array<bool, columns::all.size()> present_;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_CODEC_ANNOTATION_TABLE_H
