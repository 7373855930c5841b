/**
 * @file transfer_types.h
 * @brief Transfer task, part and progress types
 */

#ifndef EDGEFIRST_SYNC_TRANSFER_TRANSFER_TYPES_H
#define EDGEFIRST_SYNC_TRANSFER_TRANSFER_TYPES_H

#include "edgefirst/sync/core/types.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace edgefirst::sync {

/**
 * @brief Direction of a transfer
 */
enum class transfer_direction {
    upload,
    download,
};

[[nodiscard]] constexpr auto to_string(transfer_direction dir) -> const char* {
    switch (dir) {
        case transfer_direction::upload:
            return "upload";
        case transfer_direction::download:
            return "download";
    }
    return "unknown";
}

/**
 * @brief State of a single part
 */
enum class part_status {
    pending,
    in_flight,
    done,
    failed,
};

[[nodiscard]] constexpr auto to_string(part_status status) -> const char* {
    switch (status) {
        case part_status::pending:
            return "pending";
        case part_status::in_flight:
            return "in_flight";
        case part_status::done:
            return "done";
        case part_status::failed:
            return "failed";
    }
    return "unknown";
}

/**
 * @brief One contiguous byte range of a transfer
 */
struct part {
    /// Zero-based position in the transfer
    uint64_t index = 0;

    /// Byte offset of the first byte
    uint64_t offset = 0;

    /// Number of bytes
    uint64_t length = 0;

    /// Attempts made so far
    uint32_t attempts = 0;

    /// Multipart completion token (uploads only)
    std::optional<std::string> completion_token;

    part_status status = part_status::pending;

    /**
     * @brief Offset of the last byte (inclusive); meaningless when length is 0
     */
    [[nodiscard]] auto last_byte() const noexcept -> uint64_t {
        return length == 0 ? offset : offset + length - 1;
    }
};

/**
 * @brief Overall state of a transfer task
 */
enum class transfer_status {
    pending,
    in_progress,
    completed,
    failed,
};

[[nodiscard]] constexpr auto to_string(transfer_status status) -> const char* {
    switch (status) {
        case transfer_status::pending:
            return "pending";
        case transfer_status::in_progress:
            return "in_progress";
        case transfer_status::completed:
            return "completed";
        case transfer_status::failed:
            return "failed";
    }
    return "unknown";
}

/**
 * @brief One file moving between local disk and object storage
 */
struct transfer_task {
    transfer_direction direction = transfer_direction::upload;
    std::filesystem::path local_path;
    std::string remote_key;
    uint64_t total_size = 0;
    uint64_t part_size = 0;
    std::vector<part> parts;
    transfer_status status = transfer_status::pending;

    /// Set when status is failed
    std::optional<error> failure;

    [[nodiscard]] auto parts_done() const -> uint64_t {
        uint64_t count = 0;
        for (const auto& p : parts) {
            if (p.status == part_status::done) ++count;
        }
        return count;
    }

    [[nodiscard]] auto bytes_done() const -> uint64_t {
        uint64_t bytes = 0;
        for (const auto& p : parts) {
            if (p.status == part_status::done) bytes += p.length;
        }
        return bytes;
    }
};

/**
 * @brief Progress update emitted after every part resolution
 */
struct transfer_progress {
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;
    uint64_t parts_done = 0;
    uint64_t parts_total = 0;

    [[nodiscard]] auto percentage() const noexcept -> double {
        if (bytes_total == 0) {
            return parts_total == 0 ? 0.0 : 100.0 * static_cast<double>(parts_done) /
                                                 static_cast<double>(parts_total);
        }
        return 100.0 * static_cast<double>(bytes_done) / static_cast<double>(bytes_total);
    }

    auto operator==(const transfer_progress&) const -> bool = default;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_TRANSFER_TRANSFER_TYPES_H
