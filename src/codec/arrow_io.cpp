/**
 * @file arrow_io.cpp
 * @brief Arrow IPC file container for the annotation table
 */

#include "edgefirst/sync/codec/arrow_io.h"

#include "edgefirst/sync/config/feature_flags.h"
#include "edgefirst/sync/core/logging.h"

#if EDGEFIRST_SYNC_HAS_ARROW
#include <arrow/api.h>
#include <arrow/io/file.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <arrow/util/config.h>
#endif

#include <array>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace edgefirst::sync {

#if EDGEFIRST_SYNC_HAS_ARROW

namespace {

// ============================================================================
// Writing
// ============================================================================

auto make_schema() -> std::shared_ptr<arrow::Schema> {
    auto f32 = arrow::float32();
    return arrow::schema({
        arrow::field(std::string(columns::name), arrow::utf8(), false),
        arrow::field(std::string(columns::frame), arrow::uint32()),
        arrow::field(std::string(columns::object_id), arrow::utf8()),
        arrow::field(std::string(columns::label), arrow::utf8()),
        arrow::field(std::string(columns::label_index), arrow::uint64()),
        arrow::field(std::string(columns::group), arrow::utf8()),
        arrow::field(std::string(columns::mask), arrow::list(f32)),
        arrow::field(std::string(columns::box2d), arrow::fixed_size_list(f32, 4)),
        arrow::field(std::string(columns::box3d), arrow::fixed_size_list(f32, 6)),
        arrow::field(std::string(columns::size), arrow::fixed_size_list(arrow::uint32(), 2)),
        arrow::field(std::string(columns::location), arrow::fixed_size_list(f32, 2)),
        arrow::field(std::string(columns::pose), arrow::fixed_size_list(f32, 3)),
        arrow::field(std::string(columns::degradation), arrow::utf8()),
    });
}

auto append(arrow::StringBuilder& builder, const std::optional<std::string>& value)
    -> arrow::Status {
    return value ? builder.Append(*value) : builder.AppendNull();
}

template <typename Builder, typename T>
auto append(Builder& builder, const std::optional<T>& value) -> arrow::Status {
    return value ? builder.Append(*value) : builder.AppendNull();
}

template <typename ListBuilder, typename ValueBuilder, typename T>
auto append_list(ListBuilder& builder, ValueBuilder& values,
                 const std::optional<std::vector<T>>& value) -> arrow::Status {
    if (!value) {
        return builder.AppendNull();
    }
    ARROW_RETURN_NOT_OK(builder.Append());
    return values.AppendValues(value->data(), static_cast<int64_t>(value->size()));
}

template <typename ValueBuilder, typename T>
auto append_fixed(arrow::FixedSizeListBuilder& builder, ValueBuilder& values,
                  const std::optional<std::vector<T>>& value, std::string_view column)
    -> arrow::Status {
    if (value && static_cast<int32_t>(value->size()) != builder.list_size()) {
        return arrow::Status::Invalid("column '", std::string(column), "' expects ",
                                      builder.list_size(), " values, found ", value->size());
    }
    return append_list(builder, values, value);
}

struct fixed_column {
    std::shared_ptr<arrow::FloatBuilder> values;
    std::unique_ptr<arrow::FixedSizeListBuilder> list;

    fixed_column(arrow::MemoryPool* pool, int32_t width)
        : values(std::make_shared<arrow::FloatBuilder>(pool)),
          list(std::make_unique<arrow::FixedSizeListBuilder>(pool, values, width)) {}
};

auto build_batch(const annotation_table& table)
    -> arrow::Result<std::shared_ptr<arrow::RecordBatch>> {
    auto* pool = arrow::default_memory_pool();

    arrow::StringBuilder name(pool);
    arrow::UInt32Builder frame(pool);
    arrow::StringBuilder object_id(pool);
    arrow::StringBuilder label(pool);
    arrow::UInt64Builder label_index(pool);
    arrow::StringBuilder group(pool);
    auto mask_values = std::make_shared<arrow::FloatBuilder>(pool);
    arrow::ListBuilder mask(pool, mask_values);
    fixed_column box2d(pool, 4);
    fixed_column box3d(pool, 6);
    auto size_values = std::make_shared<arrow::UInt32Builder>(pool);
    arrow::FixedSizeListBuilder size(pool, size_values, 2);
    fixed_column location(pool, 2);
    fixed_column pose(pool, 3);
    arrow::StringBuilder degradation(pool);

    for (std::size_t r = 0; r < table.row_count(); ++r) {
        ARROW_RETURN_NOT_OK(name.Append(table.name[r]));
        ARROW_RETURN_NOT_OK(append(frame, table.frame[r]));
        ARROW_RETURN_NOT_OK(append(object_id, table.object_id[r]));
        ARROW_RETURN_NOT_OK(append(label, table.label[r]));
        ARROW_RETURN_NOT_OK(append(label_index, table.label_index[r]));
        ARROW_RETURN_NOT_OK(append(group, table.group[r]));
        ARROW_RETURN_NOT_OK(append_list(mask, *mask_values, table.mask[r]));
        ARROW_RETURN_NOT_OK(
            append_fixed(*box2d.list, *box2d.values, table.box2d[r], columns::box2d));
        ARROW_RETURN_NOT_OK(
            append_fixed(*box3d.list, *box3d.values, table.box3d[r], columns::box3d));
        ARROW_RETURN_NOT_OK(append_fixed(size, *size_values, table.size[r], columns::size));
        ARROW_RETURN_NOT_OK(
            append_fixed(*location.list, *location.values, table.location[r], columns::location));
        ARROW_RETURN_NOT_OK(append_fixed(*pose.list, *pose.values, table.pose[r], columns::pose));
        ARROW_RETURN_NOT_OK(append(degradation, table.degradation[r]));
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays(columns::all.size());
    ARROW_RETURN_NOT_OK(name.Finish(&arrays[0]));
    ARROW_RETURN_NOT_OK(frame.Finish(&arrays[1]));
    ARROW_RETURN_NOT_OK(object_id.Finish(&arrays[2]));
    ARROW_RETURN_NOT_OK(label.Finish(&arrays[3]));
    ARROW_RETURN_NOT_OK(label_index.Finish(&arrays[4]));
    ARROW_RETURN_NOT_OK(group.Finish(&arrays[5]));
    ARROW_RETURN_NOT_OK(mask.Finish(&arrays[6]));
    ARROW_RETURN_NOT_OK(box2d.list->Finish(&arrays[7]));
    ARROW_RETURN_NOT_OK(box3d.list->Finish(&arrays[8]));
    ARROW_RETURN_NOT_OK(size.Finish(&arrays[9]));
    ARROW_RETURN_NOT_OK(location.list->Finish(&arrays[10]));
    ARROW_RETURN_NOT_OK(pose.list->Finish(&arrays[11]));
    ARROW_RETURN_NOT_OK(degradation.Finish(&arrays[12]));

    return arrow::RecordBatch::Make(make_schema(), static_cast<int64_t>(table.row_count()),
                                    std::move(arrays));
}

auto write_batch(const std::shared_ptr<arrow::RecordBatch>& batch, const std::string& path)
    -> arrow::Status {
    ARROW_ASSIGN_OR_RAISE(auto output, arrow::io::FileOutputStream::Open(path));
    ARROW_ASSIGN_OR_RAISE(auto writer, arrow::ipc::MakeFileWriter(output, batch->schema()));
    ARROW_RETURN_NOT_OK(writer->WriteRecordBatch(*batch));
    ARROW_RETURN_NOT_OK(writer->Close());
    return output->Close();
}

// ============================================================================
// Reading
// ============================================================================

auto is_string_type(const arrow::DataType& type) -> bool {
    switch (type.id()) {
        case arrow::Type::STRING:
        case arrow::Type::LARGE_STRING:
#if ARROW_VERSION_MAJOR >= 16
        case arrow::Type::STRING_VIEW:
#endif
            return true;
        case arrow::Type::DICTIONARY:
            return is_string_type(
                *static_cast<const arrow::DictionaryType&>(type).value_type());
        default:
            return false;
    }
}

auto is_list_type(const arrow::DataType& type, bool numeric_child) -> bool {
    switch (type.id()) {
        case arrow::Type::LIST:
        case arrow::Type::LARGE_LIST:
        case arrow::Type::FIXED_SIZE_LIST: {
            auto child = type.field(0)->type();
            return numeric_child ? arrow::is_integer(child->id())
                                 : arrow::is_floating(child->id());
        }
        default:
            return false;
    }
}

auto read_string(const arrow::Array& array, int64_t i) -> std::optional<std::string> {
    if (array.IsNull(i)) {
        return std::nullopt;
    }
    switch (array.type_id()) {
        case arrow::Type::STRING:
            return static_cast<const arrow::StringArray&>(array).GetString(i);
        case arrow::Type::LARGE_STRING:
            return static_cast<const arrow::LargeStringArray&>(array).GetString(i);
#if ARROW_VERSION_MAJOR >= 16
        case arrow::Type::STRING_VIEW:
            return std::string(static_cast<const arrow::StringViewArray&>(array).GetView(i));
#endif
        case arrow::Type::DICTIONARY: {
            const auto& dict = static_cast<const arrow::DictionaryArray&>(array);
            return read_string(*dict.dictionary(), dict.GetValueIndex(i));
        }
        default:
            return std::nullopt;
    }
}

/// Integer cell widened to int64, or nullopt when the value does not fit
auto integer_at(const arrow::Array& array, int64_t i) -> std::optional<int64_t> {
    switch (array.type_id()) {
        case arrow::Type::UINT8:
            return static_cast<const arrow::UInt8Array&>(array).Value(i);
        case arrow::Type::UINT16:
            return static_cast<const arrow::UInt16Array&>(array).Value(i);
        case arrow::Type::UINT32:
            return static_cast<const arrow::UInt32Array&>(array).Value(i);
        case arrow::Type::UINT64: {
            auto v = static_cast<const arrow::UInt64Array&>(array).Value(i);
            if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return std::nullopt;
            }
            return static_cast<int64_t>(v);
        }
        case arrow::Type::INT8:
            return static_cast<const arrow::Int8Array&>(array).Value(i);
        case arrow::Type::INT16:
            return static_cast<const arrow::Int16Array&>(array).Value(i);
        case arrow::Type::INT32:
            return static_cast<const arrow::Int32Array&>(array).Value(i);
        case arrow::Type::INT64:
            return static_cast<const arrow::Int64Array&>(array).Value(i);
        default:
            return std::nullopt;
    }
}

template <typename T>
auto read_unsigned(const arrow::Array& array, int64_t i, std::string_view column)
    -> result<std::optional<T>> {
    if (array.IsNull(i)) {
        return std::optional<T>{};
    }
    auto value = integer_at(array, i);
    if (!value || *value < 0 ||
        static_cast<uint64_t>(*value) > std::numeric_limits<T>::max()) {
        return unexpected{error{error_code::invalid_argument,
            "column '" + std::string(column) + "' row " + std::to_string(i) +
            " holds a value out of range"}};
    }
    return std::optional<T>{static_cast<T>(*value)};
}

struct list_slice {
    std::shared_ptr<arrow::Array> values;
    int64_t offset = 0;
    int64_t length = 0;
};

auto slice_at(const arrow::Array& array, int64_t i) -> list_slice {
    switch (array.type_id()) {
        case arrow::Type::LIST: {
            const auto& list = static_cast<const arrow::ListArray&>(array);
            return {list.values(), list.value_offset(i), list.value_length(i)};
        }
        case arrow::Type::LARGE_LIST: {
            const auto& list = static_cast<const arrow::LargeListArray&>(array);
            return {list.values(), list.value_offset(i), list.value_length(i)};
        }
        case arrow::Type::FIXED_SIZE_LIST: {
            const auto& list = static_cast<const arrow::FixedSizeListArray&>(array);
            return {list.values(), list.value_offset(i), list.value_length(i)};
        }
        default:
            return {};
    }
}

auto read_floats(const arrow::Array& array, int64_t i) -> std::optional<std::vector<float>> {
    if (array.IsNull(i)) {
        return std::nullopt;
    }
    auto slice = slice_at(array, i);
    std::vector<float> out;
    out.reserve(static_cast<std::size_t>(slice.length));
    for (int64_t k = slice.offset; k < slice.offset + slice.length; ++k) {
        if (slice.values->IsNull(k)) {
            out.push_back(std::numeric_limits<float>::quiet_NaN());
        } else if (slice.values->type_id() == arrow::Type::DOUBLE) {
            out.push_back(static_cast<float>(
                static_cast<const arrow::DoubleArray&>(*slice.values).Value(k)));
        } else {
            out.push_back(static_cast<const arrow::FloatArray&>(*slice.values).Value(k));
        }
    }
    return out;
}

auto read_sizes(const arrow::Array& array, int64_t i, std::string_view column)
    -> result<std::optional<std::vector<uint32_t>>> {
    if (array.IsNull(i)) {
        return std::optional<std::vector<uint32_t>>{};
    }
    auto slice = slice_at(array, i);
    std::vector<uint32_t> out;
    for (int64_t k = slice.offset; k < slice.offset + slice.length; ++k) {
        auto value = read_unsigned<uint32_t>(*slice.values, k, column);
        if (!value) {
            return unexpected{value.error()};
        }
        if (!value.value()) {
            return unexpected{error{error_code::invalid_argument,
                "column '" + std::string(column) + "' has a null element"}};
        }
        out.push_back(*value.value());
    }
    return std::optional<std::vector<uint32_t>>{std::move(out)};
}

using column_map = std::array<std::optional<int>, columns::all.size()>;

auto resolve_columns(const arrow::Schema& schema) -> result<column_map> {
    std::vector<std::string> names;
    for (const auto& f : schema.fields()) {
        names.push_back(f->name());
    }

    column_map map;
    for (std::size_t c = 0; c < columns::all.size(); ++c) {
        if (auto idx = find_column(names, columns::all[c])) {
            map[c] = static_cast<int>(*idx);
        }
    }
    if (!map[0]) {
        return unexpected{error{error_code::missing_column, "required column 'name' is missing"}};
    }

    auto check = [&](std::size_t c, bool ok) -> result<void> {
        if (map[c] && !ok) {
            return unexpected{error{error_code::invalid_argument,
                "column '" + std::string(columns::all[c]) + "' has unsupported type " +
                schema.field(*map[c])->type()->ToString()}};
        }
        return {};
    };
    auto type_of = [&](std::size_t c) -> const arrow::DataType& {
        return *schema.field(*map[c])->type();
    };

    for (std::size_t c = 0; c < columns::all.size(); ++c) {
        if (!map[c]) {
            continue;
        }
        const auto column = columns::all[c];
        bool ok = false;
        if (column == columns::frame || column == columns::label_index) {
            ok = arrow::is_integer(type_of(c).id());
        } else if (column == columns::size) {
            ok = is_list_type(type_of(c), true);
        } else if (column == columns::mask || column == columns::box2d ||
                   column == columns::box3d || column == columns::location ||
                   column == columns::pose) {
            ok = is_list_type(type_of(c), false);
        } else {
            ok = is_string_type(type_of(c));
        }
        if (auto checked = check(c, ok); !checked) {
            return unexpected{checked.error()};
        }
    }
    return map;
}

auto decode_batch(const arrow::RecordBatch& batch, const column_map& map,
                  annotation_table& table) -> result<void> {
    auto column = [&](std::string_view name) -> const arrow::Array* {
        for (std::size_t c = 0; c < columns::all.size(); ++c) {
            if (columns::all[c] == name && map[c]) {
                return batch.column(*map[c]).get();
            }
        }
        return nullptr;
    };

    const auto* name = column(columns::name);
    const auto* frame = column(columns::frame);
    const auto* object_id = column(columns::object_id);
    const auto* label = column(columns::label);
    const auto* label_index = column(columns::label_index);
    const auto* group = column(columns::group);
    const auto* mask = column(columns::mask);
    const auto* box2d = column(columns::box2d);
    const auto* box3d = column(columns::box3d);
    const auto* size = column(columns::size);
    const auto* location = column(columns::location);
    const auto* pose = column(columns::pose);
    const auto* degradation = column(columns::degradation);

    for (int64_t i = 0; i < batch.num_rows(); ++i) {
        table_row row;
        row.name = read_string(*name, i).value_or(std::string{});

        if (frame) {
            auto value = read_unsigned<uint32_t>(*frame, i, columns::frame);
            if (!value) {
                return unexpected{value.error()};
            }
            row.frame = value.value();
        }
        if (label_index) {
            auto value = read_unsigned<uint64_t>(*label_index, i, columns::label_index);
            if (!value) {
                return unexpected{value.error()};
            }
            row.label_index = value.value();
        }
        if (size) {
            auto value = read_sizes(*size, i, columns::size);
            if (!value) {
                return unexpected{value.error()};
            }
            row.size = std::move(value.value());
        }

        if (object_id) row.object_id = read_string(*object_id, i);
        if (label) row.label = read_string(*label, i);
        if (group) row.group = read_string(*group, i);
        if (degradation) row.degradation = read_string(*degradation, i);
        if (mask) row.mask = read_floats(*mask, i);
        if (box2d) row.box2d = read_floats(*box2d, i);
        if (box3d) row.box3d = read_floats(*box3d, i);
        if (location) row.location = read_floats(*location, i);
        if (pose) row.pose = read_floats(*pose, i);

        table.append(row);
    }
    return {};
}

}  // namespace

auto arrow_io_available() noexcept -> bool {
    return true;
}

auto write_arrow_file(const annotation_table& table, const std::filesystem::path& path)
    -> result<void> {
    if (auto shape = table.validate_shape(); !shape) {
        return shape;
    }

    auto batch = build_batch(table);
    if (!batch.ok()) {
        return unexpected{error{error_code::validation_failed, batch.status().ToString()}};
    }

    auto status = write_batch(*batch, path.string());
    if (!status.ok()) {
        EDGEFIRST_LOG_ERROR(log_category::codec,
            "Failed to write " + path.string() + ": " + status.ToString());
        return unexpected{error{error_code::file_write_error, status.ToString()}};
    }

    EDGEFIRST_LOG_DEBUG(log_category::codec,
        "Wrote " + std::to_string(table.row_count()) + " rows to " + path.string());
    return {};
}

auto read_arrow_file(const std::filesystem::path& path) -> result<annotation_table> {
    auto file = arrow::io::ReadableFile::Open(path.string());
    if (!file.ok()) {
        return unexpected{error{error_code::file_open_error, file.status().ToString()}};
    }
    auto reader = arrow::ipc::RecordBatchFileReader::Open(*file);
    if (!reader.ok()) {
        return unexpected{error{error_code::file_read_error, reader.status().ToString()}};
    }

    auto map = resolve_columns(*(*reader)->schema());
    if (!map) {
        return unexpected{map.error()};
    }

    annotation_table table;
    for (std::size_t c = 0; c < columns::all.size(); ++c) {
        table.set_column_present(columns::all[c], map.value()[c].has_value());
    }

    for (int b = 0; b < (*reader)->num_record_batches(); ++b) {
        auto batch = (*reader)->ReadRecordBatch(b);
        if (!batch.ok()) {
            return unexpected{error{error_code::file_read_error, batch.status().ToString()}};
        }
        if (auto decoded = decode_batch(**batch, map.value(), table); !decoded) {
            return unexpected{decoded.error()};
        }
    }

    EDGEFIRST_LOG_DEBUG(log_category::codec,
        "Read " + std::to_string(table.row_count()) + " rows from " + path.string());
    return table;
}

#else  // !EDGEFIRST_SYNC_HAS_ARROW

auto arrow_io_available() noexcept -> bool {
    return false;
}

auto write_arrow_file(const annotation_table& /*table*/, const std::filesystem::path& /*path*/)
    -> result<void> {
    return unexpected{error{error_code::not_supported, "built without Apache Arrow"}};
}

auto read_arrow_file(const std::filesystem::path& /*path*/) -> result<annotation_table> {
    return unexpected{error{error_code::not_supported, "built without Apache Arrow"}};
}

#endif  // EDGEFIRST_SYNC_HAS_ARROW

}  // namespace edgefirst::sync
