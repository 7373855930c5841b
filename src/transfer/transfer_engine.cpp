/**
 * @file transfer_engine.cpp
 * @brief Entry point for uploads and downloads
 */

#include "edgefirst/sync/transfer/transfer_engine.h"

#include "edgefirst/sync/core/logging.h"
#include "edgefirst/sync/transfer/transfer_session.h"

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>

namespace edgefirst::sync {

namespace {

/**
 * @brief Serves a download URL map fetched once for a batch
 */
class cached_download_endpoint : public multipart_endpoint {
public:
    cached_download_endpoint(std::shared_ptr<multipart_endpoint> inner,
                             std::map<std::string, std::string> urls)
        : inner_(std::move(inner)), urls_(std::move(urls)) {}

    auto create_multipart_upload(const std::string& key, uint64_t size, uint64_t part_count)
        -> result<multipart_upload> override {
        return inner_->create_multipart_upload(key, size, part_count);
    }

    auto complete_multipart_upload(const multipart_upload& upload,
                                   const std::vector<completed_part>& parts)
        -> result<void> override {
        return inner_->complete_multipart_upload(upload, parts);
    }

    auto abort_multipart_upload(const multipart_upload& upload) -> result<void> override {
        return inner_->abort_multipart_upload(upload);
    }

    auto create_download_urls() -> result<std::map<std::string, std::string>> override {
        return urls_;
    }

private:
    std::shared_ptr<multipart_endpoint> inner_;
    std::map<std::string, std::string> urls_;
};

// Runs fn(0..count-1) on at most `limit` threads
template <typename Fn>
void run_bounded(std::size_t count, std::size_t limit, Fn&& fn) {
    std::atomic<std::size_t> next{0};
    std::vector<std::future<void>> runners;
    const auto threads = std::min(count, std::max<std::size_t>(limit, 1));
    runners.reserve(threads);
    for (std::size_t t = 0; t < threads; ++t) {
        runners.push_back(std::async(std::launch::async, [&] {
            for (auto i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                fn(i);
            }
        }));
    }
    for (auto& runner : runners) {
        runner.get();
    }
}

// Keys become relative paths under the target directory
auto is_safe_relative_key(const std::string& key) -> bool {
    std::filesystem::path path(key);
    if (key.empty() || path.is_absolute()) {
        return false;
    }
    return std::none_of(path.begin(), path.end(),
                        [](const std::filesystem::path& part) { return part == ".."; });
}

}  // namespace

// ============================================================================
// Builder
// ============================================================================

transfer_engine::builder::builder() = default;

auto transfer_engine::builder::with_config(sync_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto transfer_engine::builder::with_http_client(std::shared_ptr<http_client_interface> http)
    -> builder& {
    http_ = std::move(http);
    return *this;
}

auto transfer_engine::builder::with_endpoint(std::shared_ptr<multipart_endpoint> endpoint)
    -> builder& {
    endpoint_ = std::move(endpoint);
    return *this;
}

auto transfer_engine::builder::with_worker_pool(std::shared_ptr<transfer_worker_pool> pool)
    -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto transfer_engine::builder::with_token_provider(token_provider tokens) -> builder& {
    tokens_ = std::move(tokens);
    return *this;
}

auto transfer_engine::builder::with_snapshot_name(std::string name) -> builder& {
    snapshot_name_ = std::move(name);
    return *this;
}

auto transfer_engine::builder::with_snapshot_id(int64_t id) -> builder& {
    snapshot_id_ = id;
    return *this;
}

auto transfer_engine::builder::build() -> result<transfer_engine> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected{valid.error()};
    }

    auto http = http_ ? http_ : make_http_client(config_.request_timeout);

    auto endpoint = endpoint_;
    if (!endpoint) {
        auto rpc = std::make_shared<studio_rpc_client>(http, config_, tokens_);
        rpc->set_snapshot_name(snapshot_name_);
        if (snapshot_id_) {
            rpc->set_snapshot_id(*snapshot_id_);
        }
        endpoint = std::move(rpc);
    }

    auto pool = pool_ ? pool_ : std::make_shared<transfer_worker_pool>(config_.max_tasks);

    EDGEFIRST_LOG_INFO(log_category::transfer,
        "Transfer engine ready: server=" + config_.server_url +
        ", pool capacity=" + std::to_string(pool->capacity()) +
        ", part size=" + std::to_string(config_.part_size));

    return transfer_engine(config_, std::move(http), std::move(endpoint), std::move(pool));
}

// ============================================================================
// Engine
// ============================================================================

transfer_engine::transfer_engine(sync_config config,
                                 std::shared_ptr<http_client_interface> http,
                                 std::shared_ptr<multipart_endpoint> endpoint,
                                 std::shared_ptr<transfer_worker_pool> pool)
    : config_(std::move(config)),
      http_(std::move(http)),
      endpoint_(std::move(endpoint)),
      pool_(std::move(pool)) {}

auto transfer_engine::upload(const std::filesystem::path& local_path,
                             const std::string& remote_key,
                             uint64_t part_size,
                             std::shared_ptr<progress_channel> progress,
                             cancellation_token token) -> result<void> {
    session_dependencies deps{http_, endpoint_, pool_, config_};
    transfer_session session(
        std::move(deps),
        make_upload_task(local_path, remote_key, part_size == 0 ? config_.part_size : part_size),
        std::move(progress), std::move(token));
    return session.run();
}

auto transfer_engine::download(const std::string& remote_key,
                               const std::filesystem::path& local_path,
                               std::shared_ptr<progress_channel> progress,
                               cancellation_token token) -> result<void> {
    session_dependencies deps{http_, endpoint_, pool_, config_};
    transfer_session session(std::move(deps),
                             make_download_task(remote_key, local_path, config_.part_size),
                             std::move(progress), std::move(token));
    return session.run();
}

auto transfer_engine::download_all(const std::filesystem::path& local_dir,
                                   std::shared_ptr<progress_channel> progress,
                                   cancellation_token token) -> result<batch_result> {
    auto urls = endpoint_->create_download_urls();
    if (!urls) {
        return unexpected{urls.error()};
    }

    std::vector<std::string> keys;
    keys.reserve(urls.value().size());
    for (const auto& [key, url] : urls.value()) {
        keys.push_back(key);
    }

    EDGEFIRST_LOG_INFO(log_category::transfer,
        "Downloading " + std::to_string(keys.size()) + " files to " + local_dir.string());

    auto cached = std::make_shared<cached_download_endpoint>(endpoint_, std::move(urls.value()));

    batch_result summary;
    std::mutex summary_mutex;
    uint64_t bytes_done = 0;

    run_bounded(keys.size(), config_.max_tasks, [&](std::size_t i) {
        const auto& key = keys[i];
        if (!is_safe_relative_key(key)) {
            std::lock_guard<std::mutex> lock(summary_mutex);
            summary.failed.emplace_back(key, error{error_code::invalid_argument,
                "refusing to write key outside the target directory: " + key});
            return;
        }

        session_dependencies deps{http_, cached, pool_, config_};
        transfer_session session(std::move(deps),
                                 make_download_task(key, local_dir / key, config_.part_size),
                                 nullptr, token);
        auto outcome = session.run();

        std::lock_guard<std::mutex> lock(summary_mutex);
        if (outcome) {
            summary.completed.push_back(key);
            bytes_done += session.task().total_size;
        } else {
            summary.failed.emplace_back(key, outcome.error());
        }
        if (progress) {
            progress->push(transfer_progress{
                bytes_done, 0,
                static_cast<uint64_t>(summary.completed.size() + summary.failed.size()),
                static_cast<uint64_t>(keys.size())});
        }
    });

    if (!summary.ok()) {
        EDGEFIRST_LOG_WARN(log_category::transfer,
            std::to_string(summary.failed.size()) + " of " + std::to_string(keys.size()) +
            " downloads failed");
    }
    return summary;
}

auto transfer_engine::upload_all(const std::vector<upload_request>& requests,
                                 std::shared_ptr<progress_channel> progress,
                                 cancellation_token token) -> result<batch_result> {
    batch_result summary;
    std::mutex summary_mutex;
    uint64_t bytes_done = 0;

    run_bounded(requests.size(), config_.max_tasks, [&](std::size_t i) {
        const auto& request = requests[i];
        session_dependencies deps{http_, endpoint_, pool_, config_};
        transfer_session session(
            std::move(deps),
            make_upload_task(request.local_path, request.remote_key,
                             request.part_size.value_or(config_.part_size)),
            nullptr, token);
        auto outcome = session.run();

        std::lock_guard<std::mutex> lock(summary_mutex);
        if (outcome) {
            summary.completed.push_back(request.remote_key);
            bytes_done += session.task().total_size;
        } else {
            summary.failed.emplace_back(request.remote_key, outcome.error());
        }
        if (progress) {
            progress->push(transfer_progress{
                bytes_done, 0,
                static_cast<uint64_t>(summary.completed.size() + summary.failed.size()),
                static_cast<uint64_t>(requests.size())});
        }
    });

    if (!summary.ok()) {
        EDGEFIRST_LOG_WARN(log_category::transfer,
            std::to_string(summary.failed.size()) + " of " + std::to_string(requests.size()) +
            " uploads failed");
    }
    return summary;
}

}  // namespace edgefirst::sync
