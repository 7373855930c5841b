/**
 * @file retry_executor.cpp
 * @brief Runs one HTTP request under a retry policy
 */

#include "edgefirst/sync/retry/retry_executor.h"

#include "edgefirst/sync/core/logging.h"

namespace edgefirst::sync {

retry_executor::retry_executor(retry_policy policy, cancellation_token token)
    : policy_(policy),
      token_(std::move(token)),
      accept_([](const http_response& response) { return response.is_success(); }) {}

auto retry_executor::with_acceptor(accept_fn accept) -> retry_executor& {
    accept_ = std::move(accept);
    return *this;
}

auto retry_executor::with_description(std::string description) -> retry_executor& {
    description_ = std::move(description);
    return *this;
}

auto retry_executor::status_error(int status, bool exhausted) const -> error {
    error err;
    if (status == 401) {
        err = error{error_code::unauthorized, "request rejected with 401 Unauthorized"};
    } else if (status == 403) {
        err = error{error_code::forbidden, "request rejected with 403 Forbidden"};
    } else if (exhausted) {
        err = error{error_code::max_retries_exceeded,
            "retry budget exhausted, last status " + std::to_string(status)};
    } else {
        err = error{error_code::http_status_error,
            "unexpected HTTP status " + std::to_string(status)};
    }
    if (!description_.empty()) {
        err.message = description_ + ": " + err.message;
    }
    err.with_status(status).with_attempts(attempts_);
    return err;
}

auto retry_executor::execute(const request_fn& request) -> result<http_response> {
    attempts_ = 0;
    std::optional<int> last_status;

    while (true) {
        if (token_.is_cancelled()) {
            error err{error_code::transfer_cancelled, "request cancelled"};
            err.with_attempts(attempts_);
            if (last_status) err.with_status(*last_status);
            return unexpected{err};
        }

        ++attempts_;
        auto response = request();

        attempt_outcome outcome;
        std::string cause;
        if (response) {
            auto& value = response.value();
            if (accept_(value)) {
                return response;
            }
            last_status = value.status_code;
            outcome = attempt_outcome::http(value.status_code);
            cause = "HTTP " + std::to_string(value.status_code);
        } else {
            auto err = response.error();
            if (!is_transient_error(err.code)) {
                err.with_attempts(attempts_);
                if (last_status && !err.http_status) err.with_status(*last_status);
                return unexpected{err};
            }
            outcome = attempt_outcome::transport_error();
            cause = err.message;
        }

        if (!should_retry(policy_, outcome, attempts_)) {
            if (outcome.is_transport_error()) {
                error err{error_code::max_retries_exceeded,
                    (description_.empty() ? std::string() : description_ + ": ") +
                    "retry budget exhausted, last error: " + cause};
                err.with_attempts(attempts_);
                if (last_status) err.with_status(*last_status);
                return unexpected{err};
            }
            return unexpected{status_error(
                *outcome.status, is_retryable_status(policy_.cls, *outcome.status))};
        }

        auto delay = next_delay(policy_, attempts_);

        transfer_log_context ctx;
        ctx.remote_key = description_;
        ctx.attempt = attempts_;
        ctx.http_status = outcome.status;
        ctx.error_message = cause;
        EDGEFIRST_LOG_WARN_CTX(log_category::retry,
            std::string("Retrying ") + to_string(policy_.cls) + " request in " +
            std::to_string(delay.count()) + "ms", ctx);

        if (token_.wait_for(delay)) {
            error err{error_code::transfer_cancelled, "request cancelled during backoff"};
            err.with_attempts(attempts_);
            if (last_status) err.with_status(*last_status);
            return unexpected{err};
        }
    }
}

}  // namespace edgefirst::sync
