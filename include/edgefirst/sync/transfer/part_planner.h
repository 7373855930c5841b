/**
 * @file part_planner.h
 * @brief Splits a byte range into fixed-size parts
 */

#ifndef EDGEFIRST_SYNC_TRANSFER_PART_PLANNER_H
#define EDGEFIRST_SYNC_TRANSFER_PART_PLANNER_H

#include "edgefirst/sync/core/types.h"
#include "edgefirst/sync/transfer/transfer_types.h"

#include <cstdint>
#include <vector>

namespace edgefirst::sync {

/**
 * @brief Plan the parts of a transfer
 *
 * Parts are contiguous, ordered, cover [0, total_size) and the last one
 * takes the remainder. At least one part is always produced; an empty file
 * yields a single zero-length part.
 *
 * @return error_code::invalid_part_size when part_size is 0
 */
[[nodiscard]] auto plan(uint64_t total_size, uint64_t part_size)
    -> result<std::vector<part>>;

/**
 * @brief Number of parts plan() will produce (0 for an invalid part size)
 */
[[nodiscard]] constexpr auto planned_part_count(uint64_t total_size, uint64_t part_size)
    -> uint64_t {
    if (part_size == 0) return 0;
    if (total_size == 0) return 1;
    return total_size / part_size + (total_size % part_size != 0 ? 1 : 0);
}

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_TRANSFER_PART_PLANNER_H
