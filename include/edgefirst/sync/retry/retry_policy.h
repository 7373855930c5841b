/**
 * @file retry_policy.h
 * @brief Request classification and backoff scheduling
 *
 * Requests are split into two closed classes: calls against the platform's
 * own API and requests against object storage (pre-signed part URLs). Each
 * class has its own set of retryable outcomes.
 */

#ifndef EDGEFIRST_SYNC_RETRY_RETRY_POLICY_H
#define EDGEFIRST_SYNC_RETRY_RETRY_POLICY_H

#include "edgefirst/sync/config/sync_config.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace edgefirst::sync {

/**
 * @brief Retry class of an HTTP request
 */
enum class request_class {
    remote_api,
    object_storage,
};

[[nodiscard]] constexpr auto to_string(request_class cls) -> const char* {
    switch (cls) {
        case request_class::remote_api:
            return "remote_api";
        case request_class::object_storage:
            return "object_storage";
    }
    return "unknown";
}

/**
 * @brief Classify a URL
 *
 * remote_api when the scheme is http or https, the host is edgefirst.studio
 * or a subdomain of it, and the path is /api or below. Everything else,
 * including URLs that fail to parse, is object_storage.
 */
[[nodiscard]] auto classify(std::string_view url) -> request_class;

/**
 * @brief Outcome of one attempt: an HTTP status, or a transport error
 */
struct attempt_outcome {
    std::optional<int> status;

    [[nodiscard]] static auto http(int code) -> attempt_outcome {
        return attempt_outcome{code};
    }

    [[nodiscard]] static auto transport_error() -> attempt_outcome {
        return attempt_outcome{std::nullopt};
    }

    [[nodiscard]] auto is_transport_error() const noexcept -> bool {
        return !status.has_value();
    }
};

/**
 * @brief Whether an HTTP status may succeed when sent again
 */
[[nodiscard]] auto is_retryable_status(request_class cls, int status) -> bool;

/**
 * @brief Retry parameters for one request class
 */
struct retry_policy {
    request_class cls = request_class::object_storage;

    /// Retries after the first attempt
    uint32_t max_retries = 3;

    /// Upper bound on any single delay
    std::chrono::milliseconds timeout{30000};

    std::chrono::milliseconds initial_delay{500};
    std::chrono::milliseconds max_delay{10000};
    double backoff_multiplier = 2.0;

    /**
     * @brief Policy for @p cls using the ceilings from @p config
     */
    [[nodiscard]] static auto for_class(request_class cls, const sync_config& config)
        -> retry_policy;

    /**
     * @brief Policy for the class @p url falls into
     */
    [[nodiscard]] static auto for_url(std::string_view url, const sync_config& config)
        -> retry_policy;
};

/**
 * @brief Decide whether to retry after attempt number @p attempt (1-based)
 *
 * remote_api never retries 401 or 403.
 */
[[nodiscard]] auto should_retry(const retry_policy& policy,
                                const attempt_outcome& outcome,
                                uint32_t attempt) -> bool;

/**
 * @brief Delay before the retry that follows attempt @p attempt, with jitter
 */
[[nodiscard]] auto next_delay(const retry_policy& policy, uint32_t attempt)
    -> std::chrono::milliseconds;

/**
 * @brief Deterministic variant taking the jitter factor (clamped to [0.5, 1.5])
 */
[[nodiscard]] auto next_delay(const retry_policy& policy, uint32_t attempt,
                              double jitter_factor) -> std::chrono::milliseconds;

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_RETRY_RETRY_POLICY_H
