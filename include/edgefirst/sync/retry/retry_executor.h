/**
 * @file retry_executor.h
 * @brief Runs one HTTP request under a retry policy
 */

#ifndef EDGEFIRST_SYNC_RETRY_RETRY_EXECUTOR_H
#define EDGEFIRST_SYNC_RETRY_RETRY_EXECUTOR_H

#include "edgefirst/sync/core/cancellation.h"
#include "edgefirst/sync/retry/retry_policy.h"
#include "edgefirst/sync/transport/http_client.h"

#include <functional>
#include <string>

namespace edgefirst::sync {

/**
 * @brief Retry loop around a single logical request
 *
 * The request callback performs one attempt. A result holding a response is
 * checked against the acceptance predicate (2xx by default); a rejected
 * status is retried or mapped to a terminal error. An error result whose code
 * is transient (see is_transient_error) is retried like a transport failure;
 * any other error is returned immediately.
 *
 * Terminal errors carry the attempt count and, where one was received, the
 * last HTTP status:
 * - 401 -> unauthorized, 403 -> forbidden
 * - other non-retryable status -> http_status_error
 * - retry budget exhausted -> max_retries_exceeded
 * - cancellation during a backoff sleep -> transfer_cancelled
 *
 * @code
 * retry_executor exec(retry_policy::for_url(url, config), token);
 * auto response = exec.execute([&] { return client.put(url, body, headers); });
 * @endcode
 */
class retry_executor {
public:
    using request_fn = std::function<result<http_response>()>;
    using accept_fn = std::function<bool(const http_response&)>;

    explicit retry_executor(retry_policy policy,
                            cancellation_token token = cancellation_token{});

    /**
     * @brief Replace the default 2xx acceptance check
     */
    auto with_acceptor(accept_fn accept) -> retry_executor&;

    /**
     * @brief Label used in log records (key, part or method name)
     */
    auto with_description(std::string description) -> retry_executor&;

    [[nodiscard]] auto execute(const request_fn& request) -> result<http_response>;

    /**
     * @brief Attempts made by the most recent execute() call
     */
    [[nodiscard]] auto attempts() const noexcept -> uint32_t { return attempts_; }

    [[nodiscard]] auto policy() const noexcept -> const retry_policy& { return policy_; }

private:
    [[nodiscard]] auto status_error(int status, bool exhausted) const -> error;

    retry_policy policy_;
    cancellation_token token_;
    accept_fn accept_;
    std::string description_;
    uint32_t attempts_ = 0;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_RETRY_RETRY_EXECUTOR_H
