/**
 * @file file_io.h
 * @brief Positional file I/O for concurrent part transfers
 */

#ifndef EDGEFIRST_SYNC_CORE_FILE_IO_H
#define EDGEFIRST_SYNC_CORE_FILE_IO_H

#include "edgefirst/sync/core/types.h"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace edgefirst::sync {

/**
 * @brief RAII file descriptor with offset-based reads and writes
 *
 * read_at() and write_at() do not move a shared file position, so several
 * threads may use one handle at once as long as their byte ranges are
 * disjoint.
 */
class file_handle {
public:
    file_handle() = default;
    ~file_handle();

    file_handle(const file_handle&) = delete;
    auto operator=(const file_handle&) -> file_handle& = delete;
    file_handle(file_handle&& other) noexcept;
    auto operator=(file_handle&& other) noexcept -> file_handle&;

    /**
     * @brief Open an existing file for reading
     */
    [[nodiscard]] static auto open_read(const std::filesystem::path& path)
        -> result<file_handle>;

    /**
     * @brief Create or truncate a file and size it to @p size bytes
     */
    [[nodiscard]] static auto create(const std::filesystem::path& path, uint64_t size)
        -> result<file_handle>;

    /**
     * @brief Read exactly @p length bytes starting at @p offset
     */
    [[nodiscard]] auto read_at(uint64_t offset, uint64_t length) const
        -> result<std::vector<uint8_t>>;

    /**
     * @brief Write all of @p data starting at @p offset
     */
    [[nodiscard]] auto write_at(uint64_t offset, const std::vector<uint8_t>& data) const
        -> result<void>;

    /**
     * @brief Flush written data to stable storage
     */
    [[nodiscard]] auto sync() const -> result<void>;

    [[nodiscard]] auto size() const -> result<uint64_t>;

    [[nodiscard]] auto is_open() const noexcept -> bool { return fd_ >= 0; }

    void close() noexcept;

private:
    file_handle(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}

    int fd_ = -1;
    std::filesystem::path path_;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_CORE_FILE_IO_H
