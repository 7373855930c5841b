/**
 * @file annotation_types.h
 * @brief Nested dataset model: samples and their annotations
 */

#ifndef EDGEFIRST_SYNC_CODEC_ANNOTATION_TYPES_H
#define EDGEFIRST_SYNC_CODEC_ANNOTATION_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace edgefirst::sync {

/**
 * @brief Axis-aligned rectangle, normalized to [0, 1], top-left origin
 */
struct box2d {
    float left = 0.0F;
    float top = 0.0F;
    float width = 0.0F;
    float height = 0.0F;

    [[nodiscard]] auto center_x() const noexcept -> float { return left + width / 2.0F; }
    [[nodiscard]] auto center_y() const noexcept -> float { return top + height / 2.0F; }

    [[nodiscard]] static auto from_center(float cx, float cy, float w, float h) noexcept -> box2d {
        return box2d{cx - w / 2.0F, cy - h / 2.0F, w, h};
    }

    auto operator==(const box2d&) const -> bool = default;
};

/**
 * @brief Cuboid described by its center and extents
 */
struct box3d {
    float x = 0.0F;
    float y = 0.0F;
    float z = 0.0F;
    float width = 0.0F;
    float height = 0.0F;
    float length = 0.0F;

    auto operator==(const box3d&) const -> bool = default;
};

using point2d = std::pair<float, float>;
using polygon = std::vector<point2d>;

/**
 * @brief Segmentation mask as one or more polygons of normalized points
 */
struct mask {
    std::vector<polygon> polygons;

    auto operator==(const mask&) const -> bool = default;
};

/**
 * @brief One labeled object instance
 */
struct annotation {
    std::optional<std::string> object_id;
    std::optional<std::string> label;
    std::optional<uint64_t> label_index;
    std::optional<box2d> box;
    std::optional<box3d> cuboid;
    std::optional<mask> segmentation;

    /**
     * @brief True when no label, id or geometry is set
     */
    [[nodiscard]] auto empty() const noexcept -> bool {
        return !object_id && !label && !label_index && !box && !cuboid && !segmentation;
    }

    auto operator==(const annotation&) const -> bool = default;
};

struct image_size {
    uint32_t width = 0;
    uint32_t height = 0;

    auto operator==(const image_size&) const -> bool = default;
};

struct gps_location {
    float latitude = 0.0F;
    float longitude = 0.0F;

    auto operator==(const gps_location&) const -> bool = default;
};

struct orientation {
    float yaw = 0.0F;
    float pitch = 0.0F;
    float roll = 0.0F;

    auto operator==(const orientation&) const -> bool = default;
};

/**
 * @brief Sensor payload belonging to a sample (image, lidar, radar, ...)
 */
struct sample_file {
    std::string type;
    std::string path;

    auto operator==(const sample_file&) const -> bool = default;
};

/**
 * @brief One dataset entry with its metadata and annotations
 */
struct sample {
    /**
     * @brief Full image file name, e.g. "deer_003.camera.jpeg"
     *
     * Samples read from a table carry the normalized name built by
     * sequence_resolver::join(): frames padded to three digits, ".camera.jpeg"
     * suffix. "clip_0007.png" therefore reads back as "clip_007.camera.jpeg".
     * Use file_index (dataset_layout.h) to find the file actually on disk.
     */
    std::string image_name;

    /// Sequence the sample belongs to, if any
    std::optional<std::string> sequence_name;

    /// Split label such as "train" or "val"
    std::optional<std::string> group;

    /// Sensor payloads; not part of the columnar form
    std::vector<sample_file> files;

    std::optional<image_size> size;
    std::optional<gps_location> location;
    std::optional<orientation> pose;

    /// Visual quality label
    std::optional<std::string> degradation;

    std::vector<annotation> annotations;

    auto operator==(const sample&) const -> bool = default;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_CODEC_ANNOTATION_TYPES_H
