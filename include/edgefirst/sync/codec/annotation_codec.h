/**
 * @file annotation_codec.h
 * @brief Conversion between nested samples and the columnar annotation table
 */

#ifndef EDGEFIRST_SYNC_CODEC_ANNOTATION_CODEC_H
#define EDGEFIRST_SYNC_CODEC_ANNOTATION_CODEC_H

#include "edgefirst/sync/codec/annotation_table.h"
#include "edgefirst/sync/codec/annotation_types.h"
#include "edgefirst/sync/codec/sequence_name.h"
#include "edgefirst/sync/core/types.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace edgefirst::sync {

/**
 * @brief One problem found while converting
 *
 * Samples-to-table conversion fills sample_index; table-to-samples fills
 * row_index. annotation_index is set when the issue belongs to a single
 * annotation.
 */
struct validation_issue {
    error_code code = error_code::validation_failed;
    std::optional<std::size_t> sample_index;
    std::optional<std::size_t> row_index;
    std::optional<std::size_t> annotation_index;
    std::string field;
    std::string message;

    [[nodiscard]] auto describe() const -> std::string;
};

struct validation_report {
    std::vector<validation_issue> issues;

    [[nodiscard]] auto ok() const noexcept -> bool { return issues.empty(); }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return issues.size(); }

    /**
     * @brief Issue count followed by every issue, separated by "; "
     */
    [[nodiscard]] auto summary() const -> std::string;
};

struct codec_options {
    /// Return an error at the first issue instead of collecting them
    bool fail_fast = false;

    sequence_options sequences;
};

/**
 * @brief Converts samples to rows and rows back to samples
 *
 * Invalid annotations and rows are skipped and recorded in report(); the rest
 * of the input is still converted. With fail_fast the first issue is returned
 * as the error instead.
 *
 * @code
 * annotation_codec codec;
 * auto table = codec.to_table(samples);
 * if (table && !codec.report().ok()) {
 *     std::cerr << codec.report().summary() << "\n";
 * }
 * @endcode
 */
class annotation_codec {
public:
    explicit annotation_codec(codec_options options = codec_options{});

    /**
     * @brief One row per annotation, one null-annotation row per empty sample
     */
    [[nodiscard]] auto to_table(const std::vector<sample>& samples) -> result<annotation_table>;

    /**
     * @brief Group rows by (name, frame) in first-appearance order
     *
     * Fails with invalid_row_grouping when the columns have different lengths.
     */
    [[nodiscard]] auto to_samples(const annotation_table& table) -> result<std::vector<sample>>;

    /**
     * @brief Issues from the most recent conversion
     */
    [[nodiscard]] auto report() const noexcept -> const validation_report& { return report_; }

    [[nodiscard]] auto options() const noexcept -> const codec_options& { return options_; }

private:
    /// Records the issue; returns true when conversion must stop
    auto record(validation_issue issue) -> bool;

    [[nodiscard]] auto first_issue_error() const -> error;

    auto convert_sample(const sample& s, std::size_t index, annotation_table& table) -> bool;

    codec_options options_;
    sequence_resolver resolver_;
    validation_report report_;
};

/**
 * @brief Strict conversion: any validation issue fails the call
 *
 * The error is validation_failed and its message lists every issue.
 */
[[nodiscard]] auto samples_to_table(const std::vector<sample>& samples,
                                    const codec_options& options = codec_options{})
    -> result<annotation_table>;

/**
 * @brief Strict conversion: any validation issue fails the call
 */
[[nodiscard]] auto table_to_samples(const annotation_table& table,
                                    const codec_options& options = codec_options{})
    -> result<std::vector<sample>>;

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_CODEC_ANNOTATION_CODEC_H
