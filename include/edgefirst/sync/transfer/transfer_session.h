/**
 * @file transfer_session.h
 * @brief State machine driving one upload or download
 */

#ifndef EDGEFIRST_SYNC_TRANSFER_TRANSFER_SESSION_H
#define EDGEFIRST_SYNC_TRANSFER_TRANSFER_SESSION_H

#include "edgefirst/sync/config/sync_config.h"
#include "edgefirst/sync/core/cancellation.h"
#include "edgefirst/sync/core/types.h"
#include "edgefirst/sync/rpc/multipart_endpoint.h"
#include "edgefirst/sync/transfer/progress_channel.h"
#include "edgefirst/sync/transfer/transfer_types.h"
#include "edgefirst/sync/transfer/worker_pool.h"
#include "edgefirst/sync/transport/http_client.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace edgefirst::sync {

/**
 * @brief Session lifecycle
 *
 * planning -> transferring -> finalizing -> completed, or failed from any
 * non-terminal state.
 */
enum class session_state {
    planning,
    transferring,
    finalizing,
    completed,
    failed,
};

[[nodiscard]] constexpr auto to_string(session_state state) -> const char* {
    switch (state) {
        case session_state::planning:
            return "planning";
        case session_state::transferring:
            return "transferring";
        case session_state::finalizing:
            return "finalizing";
        case session_state::completed:
            return "completed";
        case session_state::failed:
            return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto is_terminal(session_state state) -> bool {
    return state == session_state::completed || state == session_state::failed;
}

/**
 * @brief Collaborators a session needs
 */
struct session_dependencies {
    std::shared_ptr<http_client_interface> http;
    std::shared_ptr<multipart_endpoint> endpoint;
    std::shared_ptr<transfer_worker_pool> pool;
    sync_config config;
};

[[nodiscard]] auto make_upload_task(const std::filesystem::path& local_path,
                                    std::string remote_key,
                                    uint64_t part_size) -> transfer_task;

[[nodiscard]] auto make_download_task(std::string remote_key,
                                      const std::filesystem::path& local_path,
                                      uint64_t part_size) -> transfer_task;

/**
 * @brief Runs a single transfer task to a terminal state
 *
 * A session runs once. A failed session is not retried as a whole; the
 * caller starts a new one.
 *
 * Cancellation lets parts that are already running finish, submits no new
 * parts and skips finalizing. An open multipart upload is aborted on the
 * platform.
 */
class transfer_session {
public:
    transfer_session(session_dependencies deps,
                     transfer_task task,
                     std::shared_ptr<progress_channel> progress = nullptr,
                     cancellation_token token = cancellation_token{});

    ~transfer_session();

    transfer_session(const transfer_session&) = delete;
    auto operator=(const transfer_session&) -> transfer_session& = delete;

    /**
     * @brief Drive the task to completion
     * @return error_code::session_already_run on a second call
     */
    [[nodiscard]] auto run() -> result<void>;

    void cancel();

    [[nodiscard]] auto cancellation() const -> cancellation_token { return token_; }

    [[nodiscard]] auto state() const -> session_state;

    /**
     * @brief Copy of the task with current per-part status
     */
    [[nodiscard]] auto task() const -> transfer_task;

    [[nodiscard]] auto progress() const -> transfer_progress;

private:
    struct part_job_state;

    auto run_upload() -> result<void>;
    auto run_download() -> result<void>;

    auto upload_part(part_job_state& shared, std::size_t slot, const std::string& url)
        -> result<std::string>;
    auto download_part(part_job_state& shared, std::size_t slot, const std::string& url)
        -> result<void>;

    auto probe_size(const std::string& url) -> result<uint64_t>;

    void set_state(session_state next);
    void mark_part(std::size_t slot, part_status status, uint32_t attempts,
                   std::optional<std::string> token = std::nullopt);
    auto fail(error err) -> result<void>;
    void publish_progress();
    auto stop_requested(const part_job_state& shared) const -> bool;

    session_dependencies deps_;
    std::shared_ptr<progress_channel> progress_;
    cancellation_token token_;

    mutable std::mutex mutex_;
    transfer_task task_;
    session_state state_ = session_state::planning;
    std::atomic<bool> started_{false};
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_TRANSFER_TRANSFER_SESSION_H
