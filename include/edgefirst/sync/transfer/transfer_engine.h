/**
 * @file transfer_engine.h
 * @brief Entry point for uploads and downloads
 */

#ifndef EDGEFIRST_SYNC_TRANSFER_TRANSFER_ENGINE_H
#define EDGEFIRST_SYNC_TRANSFER_TRANSFER_ENGINE_H

#include "edgefirst/sync/config/sync_config.h"
#include "edgefirst/sync/core/cancellation.h"
#include "edgefirst/sync/core/types.h"
#include "edgefirst/sync/rpc/multipart_endpoint.h"
#include "edgefirst/sync/rpc/studio_rpc_client.h"
#include "edgefirst/sync/transfer/progress_channel.h"
#include "edgefirst/sync/transfer/worker_pool.h"
#include "edgefirst/sync/transport/http_client.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace edgefirst::sync {

/**
 * @brief One file of a bulk upload
 */
struct upload_request {
    std::filesystem::path local_path;
    std::string remote_key;

    /// Overrides the configured part size when set
    std::optional<uint64_t> part_size;
};

/**
 * @brief Summary of a bulk operation
 */
struct batch_result {
    /// Keys that transferred successfully
    std::vector<std::string> completed;

    /// Keys that failed, with their errors
    std::vector<std::pair<std::string, error>> failed;

    [[nodiscard]] auto ok() const noexcept -> bool { return failed.empty(); }
};

/**
 * @brief Upload and download façade
 *
 * All transfers started from one engine share its worker pool, so the pool
 * capacity bounds concurrent part requests across every session.
 *
 * @code
 * auto engine = transfer_engine::builder()
 *     .with_config(sync_config::from_environment())
 *     .build();
 * if (!engine) { ... }
 *
 * auto progress = std::make_shared<progress_channel>();
 * auto uploaded = engine.value().upload("frames.mcap", "frames.mcap", 0, progress);
 * @endcode
 */
class transfer_engine {
public:
    class builder {
    public:
        builder();

        auto with_config(sync_config config) -> builder&;
        auto with_http_client(std::shared_ptr<http_client_interface> http) -> builder&;
        auto with_endpoint(std::shared_ptr<multipart_endpoint> endpoint) -> builder&;
        auto with_worker_pool(std::shared_ptr<transfer_worker_pool> pool) -> builder&;

        /**
         * @brief Credential source for the default JSON-RPC endpoint
         *
         * Defaults to the token in the configuration.
         */
        auto with_token_provider(token_provider tokens) -> builder&;

        /**
         * @brief Snapshot name for the default JSON-RPC endpoint
         */
        auto with_snapshot_name(std::string name) -> builder&;

        /**
         * @brief Snapshot id for the default JSON-RPC endpoint
         */
        auto with_snapshot_id(int64_t id) -> builder&;

        [[nodiscard]] auto build() -> result<transfer_engine>;

    private:
        sync_config config_;
        std::shared_ptr<http_client_interface> http_;
        std::shared_ptr<multipart_endpoint> endpoint_;
        std::shared_ptr<transfer_worker_pool> pool_;
        token_provider tokens_;
        std::string snapshot_name_;
        std::optional<int64_t> snapshot_id_;
    };

    /**
     * @brief Upload a local file as @p remote_key
     * @param part_size Bytes per part; 0 uses the configured part size
     */
    [[nodiscard]] auto upload(const std::filesystem::path& local_path,
                              const std::string& remote_key,
                              uint64_t part_size = 0,
                              std::shared_ptr<progress_channel> progress = nullptr,
                              cancellation_token token = cancellation_token{}) -> result<void>;

    /**
     * @brief Download @p remote_key to @p local_path
     */
    [[nodiscard]] auto download(const std::string& remote_key,
                                const std::filesystem::path& local_path,
                                std::shared_ptr<progress_channel> progress = nullptr,
                                cancellation_token token = cancellation_token{}) -> result<void>;

    /**
     * @brief Download every object the endpoint exposes into @p local_dir
     *
     * Files keep their key as relative path. Progress counts files in
     * parts_done/parts_total and accumulates bytes.
     */
    [[nodiscard]] auto download_all(const std::filesystem::path& local_dir,
                                    std::shared_ptr<progress_channel> progress = nullptr,
                                    cancellation_token token = cancellation_token{})
        -> result<batch_result>;

    /**
     * @brief Upload several files concurrently
     */
    [[nodiscard]] auto upload_all(const std::vector<upload_request>& requests,
                                  std::shared_ptr<progress_channel> progress = nullptr,
                                  cancellation_token token = cancellation_token{})
        -> result<batch_result>;

    [[nodiscard]] auto config() const -> const sync_config& { return config_; }
    [[nodiscard]] auto pool() const -> std::shared_ptr<transfer_worker_pool> { return pool_; }
    [[nodiscard]] auto endpoint() const -> std::shared_ptr<multipart_endpoint> { return endpoint_; }

private:
    transfer_engine(sync_config config,
                    std::shared_ptr<http_client_interface> http,
                    std::shared_ptr<multipart_endpoint> endpoint,
                    std::shared_ptr<transfer_worker_pool> pool);

    sync_config config_;
    std::shared_ptr<http_client_interface> http_;
    std::shared_ptr<multipart_endpoint> endpoint_;
    std::shared_ptr<transfer_worker_pool> pool_;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_TRANSFER_TRANSFER_ENGINE_H
