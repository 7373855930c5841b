/**
 * @file multipart_endpoint.h
 * @brief Platform operations that issue and close pre-signed multipart URLs
 */

#ifndef EDGEFIRST_SYNC_RPC_MULTIPART_ENDPOINT_H
#define EDGEFIRST_SYNC_RPC_MULTIPART_ENDPOINT_H

#include "edgefirst/sync/core/types.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace edgefirst::sync {

/**
 * @brief An open multipart upload with one pre-signed URL per part
 */
struct multipart_upload {
    std::string key;
    std::string upload_id;
    std::vector<std::string> urls;
};

/**
 * @brief Completion token of one uploaded part
 */
struct completed_part {
    /// Zero-based part index
    uint64_t index = 0;

    /// ETag returned by object storage, without quotes
    std::string etag;
};

/**
 * @brief Metadata collaborator interface used by transfer sessions
 *
 * Implementations must be safe to call from several sessions at once.
 */
class multipart_endpoint {
public:
    virtual ~multipart_endpoint() = default;

    /**
     * @brief Open a multipart upload for @p key
     * @param key Remote object key
     * @param size Total object size in bytes
     * @param part_count Number of parts the caller planned
     */
    virtual auto create_multipart_upload(const std::string& key,
                                         uint64_t size,
                                         uint64_t part_count) -> result<multipart_upload> = 0;

    /**
     * @brief Close a multipart upload
     * @param parts One entry per part, sorted by index
     */
    virtual auto complete_multipart_upload(const multipart_upload& upload,
                                           const std::vector<completed_part>& parts)
        -> result<void> = 0;

    /**
     * @brief Discard an unfinished multipart upload and its stored parts
     */
    virtual auto abort_multipart_upload(const multipart_upload& upload) -> result<void> = 0;

    /**
     * @brief Pre-signed download URL of every object, keyed by remote key
     */
    virtual auto create_download_urls() -> result<std::map<std::string, std::string>> = 0;
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_RPC_MULTIPART_ENDPOINT_H
