/**
 * @file geometry.h
 * @brief Conversions between nested geometry and flat column values
 */

#ifndef EDGEFIRST_SYNC_CODEC_GEOMETRY_H
#define EDGEFIRST_SYNC_CODEC_GEOMETRY_H

#include "edgefirst/sync/codec/annotation_types.h"

#include <optional>
#include <string>
#include <vector>

namespace edgefirst::sync::geometry {

inline constexpr std::size_t box2d_arity = 4;
inline constexpr std::size_t box3d_arity = 6;
inline constexpr std::size_t size_arity = 2;
inline constexpr std::size_t location_arity = 2;
inline constexpr std::size_t pose_arity = 3;

/// Slack for float rounding between corner and center form
inline constexpr float box2d_tolerance = 1e-5F;

/**
 * @brief [center_x, center_y, width, height]
 */
[[nodiscard]] auto box2d_to_column(const box2d& box) -> std::vector<float>;

/**
 * @brief Inverse of box2d_to_column; nullopt on wrong arity
 */
[[nodiscard]] auto box2d_from_column(const std::vector<float>& values) -> std::optional<box2d>;

/**
 * @brief [x, y, z, width, height, length]
 */
[[nodiscard]] auto box3d_to_column(const box3d& box) -> std::vector<float>;

[[nodiscard]] auto box3d_from_column(const std::vector<float>& values) -> std::optional<box3d>;

/**
 * @brief Flatten polygons into one list with a single NaN between polygons
 *
 * A single polygon produces no separator. Zero polygons produce an empty list.
 */
[[nodiscard]] auto flatten_mask(const mask& m) -> std::vector<float>;

/**
 * @brief Split a flattened mask back into polygons
 *
 * Values are consumed one at a time so the single-NaN separator is found
 * wherever it falls. An x without a matching y is dropped.
 */
[[nodiscard]] auto unflatten_mask(const std::vector<float>& values) -> mask;

/**
 * @brief Describe the first problem in a box2d column value, if any
 *
 * The center-form value is converted to corner form and checked with
 * check_box2d, so both conversion directions accept the same boxes.
 */
[[nodiscard]] auto check_box2d_column(const std::vector<float>& values)
    -> std::optional<std::string>;

/**
 * @brief Width and height in [0, 1], and the box lies inside the unit square
 *
 * Edges may overshoot the square by box2d_tolerance.
 */
[[nodiscard]] auto check_box2d(const box2d& box) -> std::optional<std::string>;

[[nodiscard]] auto check_box3d_column(const std::vector<float>& values)
    -> std::optional<std::string>;

[[nodiscard]] auto check_box3d(const box3d& box) -> std::optional<std::string>;

/**
 * @brief Non-finite or out-of-range coordinates, or an odd-length run
 */
[[nodiscard]] auto check_mask_column(const std::vector<float>& values)
    -> std::optional<std::string>;

[[nodiscard]] auto check_mask(const mask& m) -> std::optional<std::string>;

/**
 * @brief Arity and finiteness check for plain float vectors
 */
[[nodiscard]] auto check_vector(const std::vector<float>& values, std::size_t arity)
    -> std::optional<std::string>;

}  // namespace edgefirst::sync::geometry

#endif  // EDGEFIRST_SYNC_CODEC_GEOMETRY_H
