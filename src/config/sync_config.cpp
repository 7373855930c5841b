/**
 * @file sync_config.cpp
 * @brief Runtime configuration and environment overrides
 */

#include "edgefirst/sync/config/sync_config.h"
#include "edgefirst/sync/core/logging.h"

#include <charconv>
#include <cstdlib>
#include <thread>

namespace edgefirst::sync {

namespace {

template <typename T>
auto parse_unsigned(const std::string& text) -> std::optional<T> {
    T value{};
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

void warn_unparsable(std::string_view name, const std::string& value) {
    EDGEFIRST_LOG_WARN(log_category::config,
        "Ignoring " + std::string(name) + "='" + value + "': not a non-negative integer");
}

}  // namespace

auto process_environment() -> env_lookup {
    return [](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(name).c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

auto server_url_for(std::string_view server_name) -> std::string {
    if (server_name.empty() || server_name == "saas") {
        return "https://edgefirst.studio";
    }
    return "https://" + std::string(server_name) + ".edgefirst.studio";
}

auto sync_config::from_environment(const env_lookup& lookup) -> sync_config {
    sync_config config;
    config.max_tasks = default_max_tasks(std::thread::hardware_concurrency());

    if (auto timeout = lookup(env_var::timeout)) {
        if (auto seconds = parse_unsigned<uint64_t>(*timeout); seconds && *seconds > 0) {
            config.request_timeout = std::chrono::seconds(*seconds);
        } else {
            warn_unparsable(env_var::timeout, *timeout);
        }
    }

    if (auto retries = lookup(env_var::max_retries)) {
        if (auto parsed = parse_unsigned<uint32_t>(*retries)) {
            config.max_retries = *parsed;
            config.object_storage_max_retries = *parsed;
        } else {
            warn_unparsable(env_var::max_retries, *retries);
        }
    }

    if (auto tasks = lookup(env_var::max_tasks)) {
        if (auto parsed = parse_unsigned<std::size_t>(*tasks); parsed && *parsed > 0) {
            config.max_tasks = *parsed;
        } else {
            warn_unparsable(env_var::max_tasks, *tasks);
        }
    }

    if (auto server = lookup(env_var::server)) {
        config.server_url = server_url_for(*server);
    }

    if (auto token = lookup(env_var::token)) {
        config.token = *token;
    }

    EDGEFIRST_LOG_DEBUG(log_category::config,
        "Retry configuration - max_retries=" + std::to_string(config.max_retries) +
        ", timeout=" + std::to_string(
            std::chrono::duration_cast<std::chrono::seconds>(config.request_timeout).count()) +
        "s, max_tasks=" + std::to_string(config.max_tasks));

    return config;
}

auto sync_config::validate() const -> result<void> {
    if (request_timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
            "request timeout must be positive"}};
    }
    if (part_size == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "part size must be positive"}};
    }
    if (max_tasks == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "worker pool capacity must be positive"}};
    }
    if (progress_capacity == 0) {
        return unexpected{error{error_code::invalid_configuration,
            "progress capacity must be positive"}};
    }
    if (backoff_multiplier < 1.0) {
        return unexpected{error{error_code::invalid_configuration,
            "backoff multiplier must be at least 1.0"}};
    }
    if (server_url.empty()) {
        return unexpected{error{error_code::invalid_configuration,
            "server url must not be empty"}};
    }
    return {};
}

}  // namespace edgefirst::sync
