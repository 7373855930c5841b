/**
 * @file annotation_codec.cpp
 * @brief Conversion between nested samples and the columnar annotation table
 */

#include "edgefirst/sync/codec/annotation_codec.h"

#include "edgefirst/sync/codec/geometry.h"
#include "edgefirst/sync/core/logging.h"

#include <map>
#include <sstream>
#include <utility>

namespace edgefirst::sync {

namespace {

using group_key = std::pair<std::string, std::optional<uint32_t>>;

auto size_to_column(const image_size& size) -> std::vector<uint32_t> {
    return {size.width, size.height};
}

auto location_to_column(const gps_location& location) -> std::vector<float> {
    return {location.latitude, location.longitude};
}

auto pose_to_column(const orientation& pose) -> std::vector<float> {
    return {pose.yaw, pose.pitch, pose.roll};
}

auto make_issue(error_code code, std::string field, std::string message) -> validation_issue {
    validation_issue issue;
    issue.code = code;
    issue.field = std::move(field);
    issue.message = std::move(message);
    return issue;
}

}  // namespace

// ============================================================================
// validation_issue / validation_report
// ============================================================================

auto validation_issue::describe() const -> std::string {
    std::ostringstream out;
    bool located = false;
    auto separator = [&]() {
        if (located) {
            out << ", ";
        }
        located = true;
    };
    if (sample_index) {
        separator();
        out << "sample " << *sample_index;
    }
    if (row_index) {
        separator();
        out << "row " << *row_index;
    }
    if (annotation_index) {
        separator();
        out << "annotation " << *annotation_index;
    }
    if (located) {
        out << ": ";
    }
    if (!field.empty()) {
        out << field << ": ";
    }
    out << message;
    return out.str();
}

auto validation_report::summary() const -> std::string {
    if (issues.empty()) {
        return "no validation issues";
    }
    std::ostringstream out;
    out << issues.size() << (issues.size() == 1 ? " validation issue: " : " validation issues: ");
    for (std::size_t i = 0; i < issues.size(); ++i) {
        if (i > 0) {
            out << "; ";
        }
        out << issues[i].describe();
    }
    return out.str();
}

// ============================================================================
// annotation_codec
// ============================================================================

annotation_codec::annotation_codec(codec_options options)
    : options_(std::move(options)), resolver_(options_.sequences) {}

auto annotation_codec::record(validation_issue issue) -> bool {
    report_.issues.push_back(std::move(issue));
    return options_.fail_fast;
}

auto annotation_codec::first_issue_error() const -> error {
    const auto& issue = report_.issues.front();
    return error{issue.code, issue.describe()};
}

auto annotation_codec::convert_sample(const sample& s, std::size_t index,
                                      annotation_table& table) -> bool {
    auto sample_issue = [&](error_code code, std::string field, std::string message) {
        auto issue = make_issue(code, std::move(field), std::move(message));
        issue.sample_index = index;
        return record(std::move(issue));
    };

    if (s.image_name.empty()) {
        return sample_issue(error_code::validation_failed, std::string(columns::name),
                            "sample has an empty image name");
    }

    auto parts = resolver_.split(s.image_name, s.sequence_name);
    if (parts.name.empty()) {
        return sample_issue(error_code::validation_failed, std::string(columns::name),
                            "image name '" + s.image_name + "' has an empty stem");
    }

    table_row base;
    base.name = std::move(parts.name);
    base.frame = parts.frame;
    base.group = s.group;
    base.degradation = s.degradation;
    if (s.size) {
        base.size = size_to_column(*s.size);
    }
    if (s.location) {
        auto values = location_to_column(*s.location);
        if (auto problem = geometry::check_vector(values, geometry::location_arity)) {
            if (sample_issue(error_code::invalid_geometry, std::string(columns::location),
                             *problem)) {
                return true;
            }
        } else {
            base.location = std::move(values);
        }
    }
    if (s.pose) {
        auto values = pose_to_column(*s.pose);
        if (auto problem = geometry::check_vector(values, geometry::pose_arity)) {
            if (sample_issue(error_code::invalid_geometry, std::string(columns::pose), *problem)) {
                return true;
            }
        } else {
            base.pose = std::move(values);
        }
    }

    std::size_t emitted = 0;
    for (std::size_t a = 0; a < s.annotations.size(); ++a) {
        const auto& ann = s.annotations[a];
        if (ann.empty()) {
            continue;
        }

        auto annotation_issue = [&](std::string_view field, std::string message) {
            auto issue = make_issue(error_code::invalid_geometry, std::string(field),
                                    std::move(message));
            issue.sample_index = index;
            issue.annotation_index = a;
            return record(std::move(issue));
        };

        std::optional<std::string> problem;
        std::string_view field;
        if (ann.box) {
            problem = geometry::check_box2d(*ann.box);
            field = columns::box2d;
        }
        if (!problem && ann.cuboid) {
            problem = geometry::check_box3d(*ann.cuboid);
            field = columns::box3d;
        }
        if (!problem && ann.segmentation) {
            problem = geometry::check_mask(*ann.segmentation);
            field = columns::mask;
        }
        if (problem) {
            if (annotation_issue(field, *problem)) {
                return true;
            }
            continue;
        }

        table_row row = base;
        row.object_id = ann.object_id;
        row.label = ann.label;
        row.label_index = ann.label_index;
        if (ann.box) {
            row.box2d = geometry::box2d_to_column(*ann.box);
        }
        if (ann.cuboid) {
            row.box3d = geometry::box3d_to_column(*ann.cuboid);
        }
        if (ann.segmentation) {
            row.mask = geometry::flatten_mask(*ann.segmentation);
        }
        table.append(row);
        ++emitted;
    }

    // The sample survives even when none of its annotations produced a row.
    if (emitted == 0) {
        table.append(base);
    }
    return false;
}

auto annotation_codec::to_table(const std::vector<sample>& samples) -> result<annotation_table> {
    report_ = validation_report{};

    annotation_table table;
    table.reserve(samples.size());

    for (std::size_t i = 0; i < samples.size(); ++i) {
        if (convert_sample(samples[i], i, table)) {
            return unexpected{first_issue_error()};
        }
    }

    EDGEFIRST_LOG_DEBUG(log_category::codec,
        "Converted " + std::to_string(samples.size()) + " samples to " +
        std::to_string(table.row_count()) + " rows");
    if (!report_.ok()) {
        EDGEFIRST_LOG_WARN(log_category::codec,
            "Skipped invalid annotations: " + report_.summary());
    }
    return table;
}

auto annotation_codec::to_samples(const annotation_table& table)
    -> result<std::vector<sample>> {
    report_ = validation_report{};

    if (auto shape = table.validate_shape(); !shape) {
        return unexpected{shape.error()};
    }

    std::vector<sample> samples;
    std::map<group_key, std::size_t> index_of;

    for (std::size_t r = 0; r < table.row_count(); ++r) {
        auto row = table.row(r);

        auto row_issue = [&](error_code code, std::string_view field, std::string message,
                             std::optional<std::size_t> annotation = std::nullopt) {
            auto issue = make_issue(code, std::string(field), std::move(message));
            issue.row_index = r;
            issue.annotation_index = annotation;
            return record(std::move(issue));
        };

        if (row.name.empty()) {
            if (row_issue(error_code::validation_failed, columns::name, "row has an empty name")) {
                return unexpected{first_issue_error()};
            }
            continue;
        }

        group_key key{row.name, row.frame};
        auto [it, inserted] = index_of.try_emplace(key, samples.size());
        if (inserted) {
            sample fresh;
            fresh.image_name = resolver_.join(row.name, row.frame);
            if (row.frame) {
                fresh.sequence_name = row.name;
            }
            samples.push_back(std::move(fresh));
        }
        auto& target = samples[it->second];

        // Sample-level values must agree across the rows of one sample.
        bool stop = false;
        auto merge = [&](auto& slot, const auto& value, std::string_view field) {
            if (!value || stop) {
                return;
            }
            if (!slot) {
                slot = value;
            } else if (*slot != *value) {
                stop = row_issue(error_code::invalid_row_grouping, field,
                                 "conflicting sample-level value for '" + row.name + "'");
            }
        };

        std::optional<image_size> size;
        if (row.size) {
            if (row.size->size() != geometry::size_arity) {
                stop = row_issue(error_code::invalid_geometry, columns::size,
                                 "expected 2 values, found " + std::to_string(row.size->size()));
            } else {
                size = image_size{(*row.size)[0], (*row.size)[1]};
            }
        }
        std::optional<gps_location> location;
        if (row.location && !stop) {
            if (auto problem = geometry::check_vector(*row.location, geometry::location_arity)) {
                stop = row_issue(error_code::invalid_geometry, columns::location, *problem);
            } else {
                location = gps_location{(*row.location)[0], (*row.location)[1]};
            }
        }
        std::optional<orientation> pose;
        if (row.pose && !stop) {
            if (auto problem = geometry::check_vector(*row.pose, geometry::pose_arity)) {
                stop = row_issue(error_code::invalid_geometry, columns::pose, *problem);
            } else {
                pose = orientation{(*row.pose)[0], (*row.pose)[1], (*row.pose)[2]};
            }
        }

        merge(target.group, row.group, columns::group);
        merge(target.degradation, row.degradation, columns::degradation);
        merge(target.size, size, columns::size);
        merge(target.location, location, columns::location);
        merge(target.pose, pose, columns::pose);
        if (stop) {
            return unexpected{first_issue_error()};
        }

        if (row.is_sample_only()) {
            continue;
        }

        const auto annotation_index = target.annotations.size();
        annotation ann;
        ann.object_id = row.object_id;
        ann.label = row.label;
        ann.label_index = row.label_index;

        std::optional<std::string> problem;
        std::string_view field;
        if (row.box2d) {
            problem = geometry::check_box2d_column(*row.box2d);
            field = columns::box2d;
            if (!problem) {
                ann.box = geometry::box2d_from_column(*row.box2d);
            }
        }
        if (!problem && row.box3d) {
            problem = geometry::check_box3d_column(*row.box3d);
            field = columns::box3d;
            if (!problem) {
                ann.cuboid = geometry::box3d_from_column(*row.box3d);
            }
        }
        if (!problem && row.mask) {
            problem = geometry::check_mask_column(*row.mask);
            field = columns::mask;
            if (!problem) {
                ann.segmentation = geometry::unflatten_mask(*row.mask);
            }
        }
        if (problem) {
            if (row_issue(error_code::invalid_geometry, field, *problem, annotation_index)) {
                return unexpected{first_issue_error()};
            }
            continue;
        }

        target.annotations.push_back(std::move(ann));
    }

    EDGEFIRST_LOG_DEBUG(log_category::codec,
        "Grouped " + std::to_string(table.row_count()) + " rows into " +
        std::to_string(samples.size()) + " samples");
    if (!report_.ok()) {
        EDGEFIRST_LOG_WARN(log_category::codec, "Skipped invalid rows: " + report_.summary());
    }
    return samples;
}

// ============================================================================
// Strict conversions
// ============================================================================

auto samples_to_table(const std::vector<sample>& samples, const codec_options& options)
    -> result<annotation_table> {
    annotation_codec codec(options);
    auto table = codec.to_table(samples);
    if (!table) {
        return table;
    }
    if (!codec.report().ok()) {
        return unexpected{error{error_code::validation_failed, codec.report().summary()}};
    }
    return table;
}

auto table_to_samples(const annotation_table& table, const codec_options& options)
    -> result<std::vector<sample>> {
    annotation_codec codec(options);
    auto samples = codec.to_samples(table);
    if (!samples) {
        return samples;
    }
    if (!codec.report().ok()) {
        return unexpected{error{error_code::validation_failed, codec.report().summary()}};
    }
    return samples;
}

}  // namespace edgefirst::sync
