/**
 * @file part_planner.cpp
 * @brief Splits a byte range into fixed-size parts
 */

#include "edgefirst/sync/transfer/part_planner.h"

#include <algorithm>

namespace edgefirst::sync {

auto plan(uint64_t total_size, uint64_t part_size) -> result<std::vector<part>> {
    if (part_size == 0) {
        return unexpected{error{error_code::invalid_part_size, "part size must be positive"}};
    }

    const auto count = planned_part_count(total_size, part_size);

    std::vector<part> parts;
    parts.reserve(static_cast<std::size_t>(count));

    for (uint64_t i = 0; i < count; ++i) {
        part p;
        p.index = i;
        p.offset = i * part_size;
        p.length = std::min(part_size, total_size - p.offset);
        parts.push_back(std::move(p));
    }

    return parts;
}

}  // namespace edgefirst::sync
