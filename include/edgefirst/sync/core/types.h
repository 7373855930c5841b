/**
 * @file types.h
 * @brief Core type definitions for edgefirst_sync
 */

#ifndef EDGEFIRST_SYNC_CORE_TYPES_H
#define EDGEFIRST_SYNC_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace edgefirst::sync {

/**
 * @brief Error codes for transfer and codec operations
 */
enum class error_code {
    success = 0,

    // Validation errors (-100 to -119)
    invalid_part_size = -100,
    invalid_file_size = -101,
    invalid_geometry = -102,
    invalid_row_grouping = -103,
    invalid_configuration = -104,
    missing_column = -105,
    validation_failed = -106,
    invalid_argument = -107,

    // File errors (-120 to -139)
    file_not_found = -120,
    file_open_error = -121,
    file_read_error = -122,
    file_write_error = -123,

    // Transient network errors (-140 to -159)
    connection_failed = -140,
    request_timeout = -141,
    http_status_error = -142,
    max_retries_exceeded = -143,

    // Authentication errors (-160 to -169)
    unauthorized = -160,
    forbidden = -161,

    // Protocol errors (-170 to -189)
    rpc_error = -170,
    invalid_response = -171,
    invalid_etag = -172,
    remote_object_not_found = -173,

    // Transfer errors (-190 to -209)
    transfer_failed = -190,
    transfer_cancelled = -191,
    multipart_abort_failed = -192,
    session_already_run = -193,

    // Internal errors (-210 to -229)
    internal_error = -210,
    not_supported = -211,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_part_size:
            return "invalid part size";
        case error_code::invalid_file_size:
            return "invalid file size";
        case error_code::invalid_geometry:
            return "invalid geometry";
        case error_code::invalid_row_grouping:
            return "invalid row grouping";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::missing_column:
            return "missing column";
        case error_code::validation_failed:
            return "validation failed";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_open_error:
            return "file open error";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::request_timeout:
            return "request timeout";
        case error_code::http_status_error:
            return "http status error";
        case error_code::max_retries_exceeded:
            return "max retries exceeded";
        case error_code::unauthorized:
            return "unauthorized";
        case error_code::forbidden:
            return "forbidden";
        case error_code::rpc_error:
            return "rpc error";
        case error_code::invalid_response:
            return "invalid response";
        case error_code::invalid_etag:
            return "invalid etag";
        case error_code::remote_object_not_found:
            return "remote object not found";
        case error_code::transfer_failed:
            return "transfer failed";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::multipart_abort_failed:
            return "multipart abort failed";
        case error_code::session_already_run:
            return "session already run";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_supported:
            return "not supported";
        default:
            return "unknown error";
    }
}

[[nodiscard]] constexpr auto is_validation_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -100 && value >= -119;
}

[[nodiscard]] constexpr auto is_authentication_error(error_code code) -> bool {
    return code == error_code::unauthorized || code == error_code::forbidden;
}

/**
 * @brief Errors that may clear up if the same request is sent again
 */
[[nodiscard]] constexpr auto is_transient_error(error_code code) -> bool {
    return code == error_code::connection_failed ||
           code == error_code::request_timeout;
}

/**
 * @brief Error type with code, message and optional transfer context
 *
 * Terminal transfer failures fill in the HTTP status, part index and attempt
 * count where they are known.
 */
struct error {
    error_code code;
    std::string message;
    std::optional<int> http_status;
    std::optional<uint64_t> part_index;
    uint32_t attempts = 0;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    auto with_status(int status) -> error& {
        http_status = status;
        return *this;
    }

    auto with_part(uint64_t index) -> error& {
        part_index = index;
        return *this;
    }

    auto with_attempts(uint32_t count) -> error& {
        attempts = count;
        return *this;
    }

    /**
     * @brief Message followed by whichever context fields are set
     */
    [[nodiscard]] auto describe() const -> std::string {
        std::string out = std::string(to_string(code)) + ": " + message;
        if (part_index) {
            out += " [part " + std::to_string(*part_index) + "]";
        }
        if (http_status) {
            out += " [status " + std::to_string(*http_status) + "]";
        }
        if (attempts > 0) {
            out += " [attempts " + std::to_string(attempts) + "]";
        }
        return out;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_CORE_TYPES_H
