/**
 * @file arrow_io.h
 * @brief Arrow IPC file container for the annotation table
 */

#ifndef EDGEFIRST_SYNC_CODEC_ARROW_IO_H
#define EDGEFIRST_SYNC_CODEC_ARROW_IO_H

#include "edgefirst/sync/codec/annotation_table.h"
#include "edgefirst/sync/core/types.h"

#include <filesystem>

namespace edgefirst::sync {

/**
 * @brief Whether this build can read and write Arrow files
 */
[[nodiscard]] auto arrow_io_available() noexcept -> bool;

/**
 * @brief Write the table as an Arrow IPC file
 *
 * Geometry columns are written as fixed-size float32 lists, mask as a
 * variable-size float32 list. Returns not_supported when built without Arrow.
 */
[[nodiscard]] auto write_arrow_file(const annotation_table& table,
                                    const std::filesystem::path& path) -> result<void>;

/**
 * @brief Read an Arrow IPC file written by this library or an older producer
 *
 * Only the name column is required. Missing optional columns read as null
 * and are reported by annotation_table::has_column(). Dictionary-encoded and
 * large strings, and variable-size lists, are accepted.
 */
[[nodiscard]] auto read_arrow_file(const std::filesystem::path& path)
    -> result<annotation_table>;

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_CODEC_ARROW_IO_H
