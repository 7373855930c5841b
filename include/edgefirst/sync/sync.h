/**
 * @file sync.h
 * @brief Main header for the edgefirst_sync library
 * @version 0.1.0
 *
 * Include this header to access multipart transfers and the annotation codec.
 *
 * @code
 * #include <edgefirst/sync/sync.h>
 *
 * using namespace edgefirst::sync;
 *
 * auto engine = transfer_engine::builder()
 *     .with_config(sync_config::from_environment())
 *     .with_snapshot_name("drive-2025-06")
 *     .build();
 *
 * auto table = samples_to_table(samples);
 * @endcode
 */

#ifndef EDGEFIRST_SYNC_SYNC_H
#define EDGEFIRST_SYNC_SYNC_H

#include <cstdint>
#include <string>

// Core
#include "edgefirst/sync/core/types.h"
#include "edgefirst/sync/core/cancellation.h"
#include "edgefirst/sync/core/logging.h"
#include "edgefirst/sync/config/sync_config.h"

// Transfers
#include "edgefirst/sync/retry/retry_policy.h"
#include "edgefirst/sync/transfer/transfer_engine.h"
#include "edgefirst/sync/transfer/progress_channel.h"

// Annotation codec
#include "edgefirst/sync/codec/annotation_codec.h"
#include "edgefirst/sync/codec/arrow_io.h"
#include "edgefirst/sync/codec/dataset_layout.h"

namespace edgefirst::sync {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_SYNC_H
