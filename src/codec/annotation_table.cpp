/**
 * @file annotation_table.cpp
 * @brief Columnar dataset form: one row per annotation
 */

#include "edgefirst/sync/codec/annotation_table.h"

#include <algorithm>

namespace edgefirst::sync {

namespace {

auto column_slot(std::string_view column) -> std::optional<std::size_t> {
    auto it = std::find(columns::all.begin(), columns::all.end(), column);
    if (it == columns::all.end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(columns::all.begin(), it));
}

}  // namespace

auto canonical_column(std::string_view stored) -> std::optional<std::string_view> {
    if (auto slot = column_slot(stored)) {
        return columns::all[*slot];
    }
    for (auto alias : columns::object_id_aliases) {
        if (stored == alias) {
            return columns::object_id;
        }
    }
    return std::nullopt;
}

auto find_column(const std::vector<std::string>& stored_names, std::string_view canonical)
    -> std::optional<std::size_t> {
    std::optional<std::size_t> alias_match;
    for (std::size_t i = 0; i < stored_names.size(); ++i) {
        if (stored_names[i] == canonical) {
            return i;
        }
        if (!alias_match && canonical_column(stored_names[i]) == canonical) {
            alias_match = i;
        }
    }
    return alias_match;
}

annotation_table::annotation_table() {
    present_.fill(true);
}

void annotation_table::reserve(std::size_t rows) {
    name.reserve(rows);
    frame.reserve(rows);
    object_id.reserve(rows);
    label.reserve(rows);
    label_index.reserve(rows);
    group.reserve(rows);
    mask.reserve(rows);
    box2d.reserve(rows);
    box3d.reserve(rows);
    size.reserve(rows);
    location.reserve(rows);
    pose.reserve(rows);
    degradation.reserve(rows);
}

void annotation_table::append(const table_row& row) {
    name.push_back(row.name);
    frame.push_back(row.frame);
    object_id.push_back(row.object_id);
    label.push_back(row.label);
    label_index.push_back(row.label_index);
    group.push_back(row.group);
    mask.push_back(row.mask);
    box2d.push_back(row.box2d);
    box3d.push_back(row.box3d);
    size.push_back(row.size);
    location.push_back(row.location);
    pose.push_back(row.pose);
    degradation.push_back(row.degradation);
}

auto annotation_table::row(std::size_t index) const -> table_row {
    table_row out;
    out.name = name.at(index);
    out.frame = frame.at(index);
    out.object_id = object_id.at(index);
    out.label = label.at(index);
    out.label_index = label_index.at(index);
    out.group = group.at(index);
    out.mask = mask.at(index);
    out.box2d = box2d.at(index);
    out.box3d = box3d.at(index);
    out.size = size.at(index);
    out.location = location.at(index);
    out.pose = pose.at(index);
    out.degradation = degradation.at(index);
    return out;
}

auto annotation_table::has_column(std::string_view column) const -> bool {
    auto canonical = canonical_column(column);
    if (!canonical) {
        return false;
    }
    return present_[*column_slot(*canonical)];
}

void annotation_table::set_column_present(std::string_view column, bool present) {
    if (auto canonical = canonical_column(column)) {
        present_[*column_slot(*canonical)] = present;
    }
}

auto annotation_table::validate_shape() const -> result<void> {
    const auto rows = name.size();
    const std::array<std::pair<std::string_view, std::size_t>, 12> lengths = {{
        {columns::frame, frame.size()},
        {columns::object_id, object_id.size()},
        {columns::label, label.size()},
        {columns::label_index, label_index.size()},
        {columns::group, group.size()},
        {columns::mask, mask.size()},
        {columns::box2d, box2d.size()},
        {columns::box3d, box3d.size()},
        {columns::size, size.size()},
        {columns::location, location.size()},
        {columns::pose, pose.size()},
        {columns::degradation, degradation.size()},
    }};
    for (const auto& [column, length] : lengths) {
        if (length != rows) {
            return unexpected{error{error_code::invalid_row_grouping,
                "column '" + std::string(column) + "' has " + std::to_string(length) +
                " rows, expected " + std::to_string(rows)}};
        }
    }
    return {};
}

}  // namespace edgefirst::sync
