// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "edgefirst/sync/config/feature_flags.h"

#if EDGEFIRST_SYNC_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace edgefirst::sync {

/**
 * @brief Log categories
 */
struct log_category {
    static constexpr std::string_view transfer = "edgefirst_sync.transfer";
    static constexpr std::string_view session = "edgefirst_sync.session";
    static constexpr std::string_view pool = "edgefirst_sync.pool";
    static constexpr std::string_view retry = "edgefirst_sync.retry";
    static constexpr std::string_view rpc = "edgefirst_sync.rpc";
    static constexpr std::string_view codec = "edgefirst_sync.codec";
    static constexpr std::string_view config = "edgefirst_sync.config";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Escape a string for embedding in a JSON string literal
 */
inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

/**
 * @brief Configuration for sensitive information masking
 *
 * Pre-signed object storage URLs carry their signature in the query string,
 * and RPC requests carry a bearer token; both grant access on their own.
 */
struct masking_config {
    bool mask_url_queries = true;
    bool mask_tokens = true;
    bool mask_paths = false;
    char mask_char = '*';
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, true, '*', 4};
    }

    static masking_config none() {
        return {false, false, false, '*', 4};
    }
};

class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string out = input;
        if (config_.mask_tokens) {
            out = mask_bearer_tokens(out);
        }
        if (config_.mask_url_queries) {
            out = mask_url_queries(out);
        }
        return out;
    }

    /**
     * @brief Replace everything after '?' in a URL
     */
    [[nodiscard]] auto mask_url(const std::string& url) const -> std::string {
        if (!config_.mask_url_queries) {
            return url;
        }
        auto q = url.find('?');
        if (q == std::string::npos || q + 1 == url.size()) {
            return url;
        }
        return url.substr(0, q + 1) + std::string(3, config_.mask_char);
    }

    [[nodiscard]] auto mask_token(const std::string& token) const -> std::string {
        if (!config_.mask_tokens || token.size() <= config_.visible_chars) {
            return token;
        }
        return token.substr(0, config_.visible_chars) +
               std::string(token.size() - config_.visible_chars, config_.mask_char);
    }

    /**
     * @brief Keep the file name, mask the directory part
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }
        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }
        return std::string(last_sep, config_.mask_char) + path.substr(last_sep);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = config;
    }

private:
    [[nodiscard]] auto mask_bearer_tokens(const std::string& input) const -> std::string {
        static const std::regex token_pattern(R"(Bearer\s+([A-Za-z0-9._~+/=-]+))");
        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), token_pattern);
        std::sregex_iterator end;
        size_t last_pos = 0;
        for (; it != end; ++it) {
            out += input.substr(last_pos, static_cast<size_t>(it->position(1)) - last_pos);
            out += mask_token((*it)[1].str());
            last_pos = static_cast<size_t>(it->position(1) + it->length(1));
        }
        out += input.substr(last_pos);
        return out;
    }

    [[nodiscard]] auto mask_url_queries(const std::string& input) const -> std::string {
        static const std::regex url_pattern(R"(https?://[^\s"?]+\?[^\s"]*)");
        std::string out;
        std::sregex_iterator it(input.begin(), input.end(), url_pattern);
        std::sregex_iterator end;
        size_t last_pos = 0;
        for (; it != end; ++it) {
            out += input.substr(last_pos, static_cast<size_t>(it->position()) - last_pos);
            out += mask_url(it->str());
            last_pos = static_cast<size_t>(it->position() + it->length());
        }
        out += input.substr(last_pos);
        return out;
    }

    masking_config config_;
};

/**
 * @brief Structured log context for transfer and codec operations
 */
struct transfer_log_context {
    std::string remote_key;
    std::string local_path;
    std::optional<std::string> url;
    std::optional<uint64_t> total_bytes;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> part_index;
    std::optional<uint64_t> total_parts;
    std::optional<uint32_t> attempt;
    std::optional<int> http_status;
    std::optional<double> progress_percent;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";
        bool first = true;

        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << escape_json(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!remote_key.empty()) add_field("remote_key", remote_key);
        if (!local_path.empty()) {
            add_field("local_path", masker ? masker->mask_path(local_path) : local_path);
        }
        if (url) add_field("url", masker ? masker->mask_url(*url) : *url);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (part_index) add_uint("part_index", *part_index);
        if (total_parts) add_uint("total_parts", *total_parts);
        if (attempt) add_uint("attempt", *attempt);
        if (http_status) {
            if (!first) oss << ",";
            oss << "\"http_status\":" << *http_status;
            first = false;
        }
        if (progress_percent) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2)
                << "\"progress_percent\":" << *progress_percent;
            first = false;
        }
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << timestamp << "\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\"" << escape_json(masker ? masker->mask(message) : message) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << escape_json(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder for structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::session)
 *     .with_message("Upload completed")
 *     .with_remote_key("snapshots/42/data.zip")
 *     .with_total_bytes(1048576)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = iso8601_now();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_remote_key(std::string_view key) -> log_entry_builder& {
        ctx().remote_key = std::string(key);
        return *this;
    }

    auto with_local_path(std::string_view path) -> log_entry_builder& {
        ctx().local_path = std::string(path);
        return *this;
    }

    auto with_url(std::string_view url) -> log_entry_builder& {
        ctx().url = std::string(url);
        return *this;
    }

    auto with_total_bytes(uint64_t bytes) -> log_entry_builder& {
        ctx().total_bytes = bytes;
        return *this;
    }

    auto with_part(uint64_t index, uint64_t total) -> log_entry_builder& {
        ctx().part_index = index;
        ctx().total_parts = total;
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        ctx().attempt = attempt;
        return *this;
    }

    auto with_http_status(int status) -> log_entry_builder& {
        ctx().http_status = status;
        return *this;
    }

    auto with_error_message(std::string_view message) -> log_entry_builder& {
        ctx().error_message = std::string(message);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& context) -> log_entry_builder& {
        entry_.context = context;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    auto ctx() -> transfer_log_context& {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
        return *entry_.context;
    }

    [[nodiscard]] static auto iso8601_now() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger
 *
 * Routes records to logger_system when it is compiled in, to stderr otherwise.
 * Callbacks receive every record that passes the level filter.
 */
class sync_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    sync_logger() = default;
    ~sync_logger() = default;

    sync_logger(const sync_logger&) = delete;
    sync_logger& operator=(const sync_logger&) = delete;

    /**
     * @brief Initialize the backend; later calls are no-ops
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if EDGEFIRST_SYNC_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();
        if (built) {
            logger_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#if EDGEFIRST_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if EDGEFIRST_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return level >= min_level_.load();
    }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string masked_message = masker.mask(std::string(message));

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked_message, context);
            }
        }

        auto builder = log_entry_builder()
            .with_level(level)
            .with_category(category)
            .with_message(message);
        if (file || line > 0 || function) {
            builder.with_source_location(file, line, function);
        }
        if (context) {
            builder.with_context(*context);
        }
        auto entry = builder.build();

        std::string rendered;
        if (format == log_output_format::json) {
            rendered = entry.to_json_with_masking(&masker);
        } else {
            std::ostringstream oss;
            oss << entry.timestamp << " [" << log_level_to_string(level) << "] ["
                << category << "] " << masked_message;
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            rendered = oss.str();
        }

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, entry.to_json_with_masking(&masker));
            }
        }

        write(level, rendered, file, line, function);
    }

    void flush() {
#if EDGEFIRST_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write(log_level level, const std::string& rendered,
               [[maybe_unused]] const char* file,
               [[maybe_unused]] int line,
               [[maybe_unused]] const char* function) {
#if EDGEFIRST_SYNC_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), rendered, file, line, function);
            } else {
                logger_->log(to_logger_level(level), rendered);
            }
            return;
        }
#else
        (void)level;
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << rendered << "\n";
    }

#if EDGEFIRST_SYNC_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};

    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline sync_logger& get_logger() {
    static sync_logger instance;
    return instance;
}

#define EDGEFIRST_LOG(level, category, message) \
    edgefirst::sync::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define EDGEFIRST_LOG_CTX(level, category, message, context) \
    edgefirst::sync::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define EDGEFIRST_LOG_TRACE(category, message) \
    EDGEFIRST_LOG(edgefirst::sync::log_level::trace, category, message)

#define EDGEFIRST_LOG_DEBUG(category, message) \
    EDGEFIRST_LOG(edgefirst::sync::log_level::debug, category, message)

#define EDGEFIRST_LOG_INFO(category, message) \
    EDGEFIRST_LOG(edgefirst::sync::log_level::info, category, message)

#define EDGEFIRST_LOG_WARN(category, message) \
    EDGEFIRST_LOG(edgefirst::sync::log_level::warn, category, message)

#define EDGEFIRST_LOG_ERROR(category, message) \
    EDGEFIRST_LOG(edgefirst::sync::log_level::error, category, message)

#define EDGEFIRST_LOG_DEBUG_CTX(category, message, ctx) \
    EDGEFIRST_LOG_CTX(edgefirst::sync::log_level::debug, category, message, ctx)

#define EDGEFIRST_LOG_INFO_CTX(category, message, ctx) \
    EDGEFIRST_LOG_CTX(edgefirst::sync::log_level::info, category, message, ctx)

#define EDGEFIRST_LOG_WARN_CTX(category, message, ctx) \
    EDGEFIRST_LOG_CTX(edgefirst::sync::log_level::warn, category, message, ctx)

#define EDGEFIRST_LOG_ERROR_CTX(category, message, ctx) \
    EDGEFIRST_LOG_CTX(edgefirst::sync::log_level::error, category, message, ctx)

}  // namespace edgefirst::sync
