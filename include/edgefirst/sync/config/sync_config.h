/**
 * @file sync_config.h
 * @brief Runtime configuration and environment overrides
 */

#ifndef EDGEFIRST_SYNC_CONFIG_SYNC_CONFIG_H
#define EDGEFIRST_SYNC_CONFIG_SYNC_CONFIG_H

#include "edgefirst/sync/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace edgefirst::sync {

/**
 * @brief Environment variable names honoured by sync_config::from_environment
 */
struct env_var {
    static constexpr std::string_view timeout = "EDGEFIRST_TIMEOUT";
    static constexpr std::string_view max_retries = "EDGEFIRST_MAX_RETRIES";
    static constexpr std::string_view max_tasks = "MAX_TASKS";
    static constexpr std::string_view server = "EDGEFIRST_SERVER";
    static constexpr std::string_view token = "EDGEFIRST_TOKEN";
};

/**
 * @brief Lookup function for environment values (injectable for tests)
 */
using env_lookup = std::function<std::optional<std::string>(std::string_view)>;

/**
 * @brief Reads from the process environment
 */
[[nodiscard]] auto process_environment() -> env_lookup;

/**
 * @brief Default pool capacity: half the CPUs, clamped to [2, 8]
 * @param cpu_count Available hardware threads (0 means unknown, treated as 4)
 */
[[nodiscard]] constexpr auto default_max_tasks(std::size_t cpu_count) -> std::size_t {
    std::size_t cpus = cpu_count == 0 ? 4 : cpu_count;
    std::size_t half = cpus / 2;
    if (half < 2) return 2;
    if (half > 8) return 8;
    return half;
}

/**
 * @brief Resolve a server name to the platform base URL
 *
 * "" and "saas" map to https://edgefirst.studio; any other name maps to
 * https://<name>.edgefirst.studio.
 */
[[nodiscard]] auto server_url_for(std::string_view server_name) -> std::string;

/**
 * @brief Client configuration
 *
 * @code
 * auto config = sync_config::from_environment();
 * config.part_size = 16 * 1024 * 1024;
 * if (auto valid = config.validate(); !valid) { ... }
 * @endcode
 */
struct sync_config {
    static constexpr uint64_t default_part_size = 100ULL * 1024 * 1024;
    static constexpr uint32_t default_max_retries = 3;
    static constexpr std::chrono::seconds default_timeout{30};
    static constexpr std::size_t default_progress_capacity = 64;

    /// Per-attempt request timeout
    std::chrono::milliseconds request_timeout = default_timeout;

    /// Retry ceiling for platform API calls
    uint32_t max_retries = default_max_retries;

    /// Retry ceiling for object storage part requests
    uint32_t object_storage_max_retries = default_max_retries;

    /// Concurrent part transfers across all sessions sharing a pool
    std::size_t max_tasks = default_max_tasks(0);

    /// Fixed part size for multipart transfers
    uint64_t part_size = default_part_size;

    /// Platform base URL (RPC endpoint is <server_url>/api)
    std::string server_url = "https://edgefirst.studio";

    /// Bearer token used when no token provider is supplied
    std::string token;

    /// Pending progress updates kept before the oldest is dropped
    std::size_t progress_capacity = default_progress_capacity;

    /// Initial backoff delay before the first retry
    std::chrono::milliseconds initial_backoff{500};

    /// Upper bound on a single backoff delay (before the timeout cap)
    std::chrono::milliseconds max_backoff{10000};

    /// Growth factor between consecutive backoff delays
    double backoff_multiplier = 2.0;

    /**
     * @brief Build a configuration from environment overrides
     *
     * Unparsable values keep the default and are reported as warnings.
     */
    [[nodiscard]] static auto from_environment(const env_lookup& lookup = process_environment())
        -> sync_config;

    [[nodiscard]] auto validate() const -> result<void>;

    [[nodiscard]] auto rpc_url() const -> std::string {
        return server_url + "/api";
    }
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_CONFIG_SYNC_CONFIG_H
