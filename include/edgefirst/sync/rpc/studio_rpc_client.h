/**
 * @file studio_rpc_client.h
 * @brief JSON-RPC 2.0 client for the platform snapshot API
 */

#ifndef EDGEFIRST_SYNC_RPC_STUDIO_RPC_CLIENT_H
#define EDGEFIRST_SYNC_RPC_STUDIO_RPC_CLIENT_H

#include "edgefirst/sync/config/sync_config.h"
#include "edgefirst/sync/core/cancellation.h"
#include "edgefirst/sync/rpc/multipart_endpoint.h"
#include "edgefirst/sync/transport/http_client.h"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace edgefirst::sync {

/**
 * @brief Supplies the bearer credential; called once per request
 */
using token_provider = std::function<result<std::string>()>;

/**
 * @brief Token provider returning a fixed credential
 */
[[nodiscard]] auto static_token(std::string token) -> token_provider;

/**
 * @brief Snapshot endpoint over JSON-RPC
 *
 * Every call is `POST <server>/api` with
 * `{"id":0,"jsonrpc":"2.0","method":...,"params":...}` and runs under the
 * remote_api retry policy.
 *
 * @code
 * auto rpc = std::make_shared<studio_rpc_client>(http, config, static_token(config.token));
 * rpc->set_snapshot_name("recording-2025-06-01");
 * auto upload = rpc->create_multipart_upload("frames.mcap", size, parts);
 * @endcode
 */
class studio_rpc_client : public multipart_endpoint {
public:
    studio_rpc_client(std::shared_ptr<http_client_interface> http,
                      sync_config config,
                      token_provider tokens);

    /**
     * @brief Snapshot name sent with upload requests
     */
    void set_snapshot_name(std::string name);

    /**
     * @brief Snapshot used for download URLs
     *
     * Set automatically from the server's reply to an upload request.
     */
    void set_snapshot_id(int64_t id);

    [[nodiscard]] auto snapshot_id() const -> std::optional<int64_t>;

    void set_cancellation_token(cancellation_token token);

    /**
     * @brief Perform one JSON-RPC call
     * @param method RPC method name
     * @param params_json Serialized params value
     * @return Raw JSON text of the "result" member
     */
    [[nodiscard]] auto call(std::string_view method, const std::string& params_json)
        -> result<std::string>;

    [[nodiscard]] auto create_multipart_upload(const std::string& key,
                                               uint64_t size,
                                               uint64_t part_count)
        -> result<multipart_upload> override;

    [[nodiscard]] auto complete_multipart_upload(const multipart_upload& upload,
                                                 const std::vector<completed_part>& parts)
        -> result<void> override;

    [[nodiscard]] auto abort_multipart_upload(const multipart_upload& upload)
        -> result<void> override;

    [[nodiscard]] auto create_download_urls()
        -> result<std::map<std::string, std::string>> override;

private:
    std::shared_ptr<http_client_interface> http_;
    sync_config config_;
    token_provider tokens_;
    cancellation_token cancel_;

    mutable std::mutex mutex_;
    std::string snapshot_name_;
    std::optional<int64_t> snapshot_id_;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_RPC_STUDIO_RPC_CLIENT_H
