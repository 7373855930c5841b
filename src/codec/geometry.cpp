/**
 * @file geometry.cpp
 * @brief Conversions between nested geometry and flat column values
 */

#include "edgefirst/sync/codec/geometry.h"

#include <cmath>
#include <limits>

namespace edgefirst::sync::geometry {

namespace {

auto in_unit_range(float v) -> bool {
    return v >= 0.0F && v <= 1.0F;
}

auto arity_message(std::size_t expected, std::size_t actual) -> std::string {
    return "expected " + std::to_string(expected) + " values, found " + std::to_string(actual);
}

}  // namespace

auto box2d_to_column(const box2d& box) -> std::vector<float> {
    return {box.center_x(), box.center_y(), box.width, box.height};
}

auto box2d_from_column(const std::vector<float>& values) -> std::optional<box2d> {
    if (values.size() != box2d_arity) {
        return std::nullopt;
    }
    return box2d::from_center(values[0], values[1], values[2], values[3]);
}

auto box3d_to_column(const box3d& box) -> std::vector<float> {
    return {box.x, box.y, box.z, box.width, box.height, box.length};
}

auto box3d_from_column(const std::vector<float>& values) -> std::optional<box3d> {
    if (values.size() != box3d_arity) {
        return std::nullopt;
    }
    return box3d{values[0], values[1], values[2], values[3], values[4], values[5]};
}

auto flatten_mask(const mask& m) -> std::vector<float> {
    std::vector<float> out;
    for (std::size_t i = 0; i < m.polygons.size(); ++i) {
        if (i > 0) {
            out.push_back(std::numeric_limits<float>::quiet_NaN());
        }
        for (const auto& [x, y] : m.polygons[i]) {
            out.push_back(x);
            out.push_back(y);
        }
    }
    return out;
}

auto unflatten_mask(const std::vector<float>& values) -> mask {
    mask out;
    polygon current;

    std::size_t i = 0;
    while (i < values.size()) {
        if (std::isnan(values[i])) {
            if (!current.empty()) {
                out.polygons.push_back(std::move(current));
                current.clear();
            }
            i += 1;
        } else if (i + 1 < values.size() && !std::isnan(values[i + 1])) {
            current.emplace_back(values[i], values[i + 1]);
            i += 2;
        } else {
            // x without y
            i += 1;
        }
    }

    if (!current.empty()) {
        out.polygons.push_back(std::move(current));
    }
    return out;
}

auto check_box2d_column(const std::vector<float>& values) -> std::optional<std::string> {
    if (values.size() != box2d_arity) {
        return "box2d " + arity_message(box2d_arity, values.size());
    }
    for (float v : values) {
        if (!std::isfinite(v)) {
            return std::string("box2d contains a non-finite value");
        }
    }
    return check_box2d(box2d::from_center(values[0], values[1], values[2], values[3]));
}

auto check_box2d(const box2d& box) -> std::optional<std::string> {
    for (float v : {box.left, box.top, box.width, box.height}) {
        if (!std::isfinite(v)) {
            return std::string("box2d contains a non-finite value");
        }
    }
    if (!in_unit_range(box.width) || !in_unit_range(box.height)) {
        return "box2d size " + std::to_string(box.width) + " x " + std::to_string(box.height) +
               " is outside [0, 1]";
    }
    // The extent must stay inside the image in both the corner and center forms.
    if (box.left < -box2d_tolerance || box.top < -box2d_tolerance ||
        box.left + box.width > 1.0F + box2d_tolerance ||
        box.top + box.height > 1.0F + box2d_tolerance) {
        return "box2d extent [" + std::to_string(box.left) + ", " +
               std::to_string(box.left + box.width) + "] x [" + std::to_string(box.top) + ", " +
               std::to_string(box.top + box.height) + "] is outside [0, 1]";
    }
    return std::nullopt;
}

auto check_box3d_column(const std::vector<float>& values) -> std::optional<std::string> {
    if (values.size() != box3d_arity) {
        return "box3d " + arity_message(box3d_arity, values.size());
    }
    for (float v : values) {
        if (!std::isfinite(v)) {
            return std::string("box3d contains a non-finite value");
        }
    }
    return std::nullopt;
}

auto check_box3d(const box3d& box) -> std::optional<std::string> {
    return check_box3d_column(box3d_to_column(box));
}

auto check_mask_column(const std::vector<float>& values) -> std::optional<std::string> {
    std::size_t run = 0;
    for (float v : values) {
        if (std::isnan(v)) {
            if (run % 2 != 0) {
                return std::string("mask polygon has an odd number of coordinates");
            }
            run = 0;
            continue;
        }
        if (!std::isfinite(v)) {
            return std::string("mask contains an infinite coordinate");
        }
        if (!in_unit_range(v)) {
            return "mask coordinate " + std::to_string(v) + " is outside [0, 1]";
        }
        ++run;
    }
    if (run % 2 != 0) {
        return std::string("mask polygon has an odd number of coordinates");
    }
    return std::nullopt;
}

auto check_mask(const mask& m) -> std::optional<std::string> {
    for (const auto& poly : m.polygons) {
        if (poly.empty()) {
            return std::string("mask contains an empty polygon");
        }
        for (const auto& [x, y] : poly) {
            if (!std::isfinite(x) || !std::isfinite(y)) {
                return std::string("mask contains a non-finite coordinate");
            }
            if (!in_unit_range(x) || !in_unit_range(y)) {
                return "mask point (" + std::to_string(x) + ", " + std::to_string(y) +
                       ") is outside [0, 1]";
            }
        }
    }
    return std::nullopt;
}

auto check_vector(const std::vector<float>& values, std::size_t arity)
    -> std::optional<std::string> {
    if (values.size() != arity) {
        return arity_message(arity, values.size());
    }
    for (float v : values) {
        if (!std::isfinite(v)) {
            return std::string("contains a non-finite value");
        }
    }
    return std::nullopt;
}

}  // namespace edgefirst::sync::geometry
