/**
 * @file transfer_session.cpp
 * @brief State machine driving one upload or download
 */

#include "edgefirst/sync/transfer/transfer_session.h"

#include "edgefirst/sync/core/file_io.h"
#include "edgefirst/sync/core/logging.h"
#include "edgefirst/sync/retry/retry_executor.h"
#include "edgefirst/sync/transfer/part_planner.h"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <exception>
#include <future>
#include <system_error>
#include <vector>

namespace edgefirst::sync {

namespace {

auto strip_quotes(std::string value) -> std::string {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// "bytes 0-0/12345" -> 12345
auto parse_content_range_total(const std::string& header) -> std::optional<uint64_t> {
    auto slash = header.rfind('/');
    if (slash == std::string::npos || slash + 1 >= header.size()) {
        return std::nullopt;
    }
    uint64_t total = 0;
    const char* begin = header.data() + slash + 1;
    const char* end = header.data() + header.size();
    auto [ptr, ec] = std::from_chars(begin, end, total);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return total;
}

auto temp_path_for(const std::filesystem::path& dest) -> std::filesystem::path {
    auto temp = dest;
    temp += ".part";
    return temp;
}

/**
 * @brief Pick the error that represents a failed transfer
 *
 * Real failures win over parts that were skipped because of cancellation;
 * among real failures the lowest part index wins.
 */
auto aggregate_failure(const std::vector<std::optional<error>>& failures)
    -> std::optional<error> {
    std::optional<error> cancelled;
    for (const auto& failure : failures) {
        if (!failure) continue;
        if (failure->code != error_code::transfer_cancelled) {
            return failure;
        }
        if (!cancelled) cancelled = failure;
    }
    return cancelled;
}

/// Result of one part, with an exception from the worker turned into internal_error
template <typename T>
auto collect_part(std::future<result<T>>& pending, std::size_t slot) -> result<T> {
    try {
        return pending.get();
    } catch (const std::exception& e) {
        EDGEFIRST_LOG_ERROR(log_category::transfer,
            "part " + std::to_string(slot + 1) + " worker threw: " + e.what());
        return unexpected{error{error_code::internal_error,
            std::string("part worker threw: ") + e.what()}.with_part(slot)};
    }
}

}  // namespace

struct transfer_session::part_job_state {
    std::shared_ptr<file_handle> file;
    std::atomic<bool> stop{false};
};

auto make_upload_task(const std::filesystem::path& local_path,
                      std::string remote_key,
                      uint64_t part_size) -> transfer_task {
    transfer_task task;
    task.direction = transfer_direction::upload;
    task.local_path = local_path;
    task.remote_key = std::move(remote_key);
    task.part_size = part_size;
    return task;
}

auto make_download_task(std::string remote_key,
                        const std::filesystem::path& local_path,
                        uint64_t part_size) -> transfer_task {
    transfer_task task;
    task.direction = transfer_direction::download;
    task.local_path = local_path;
    task.remote_key = std::move(remote_key);
    task.part_size = part_size;
    return task;
}

transfer_session::transfer_session(session_dependencies deps,
                                   transfer_task task,
                                   std::shared_ptr<progress_channel> progress,
                                   cancellation_token token)
    : deps_(std::move(deps)),
      progress_(std::move(progress)),
      token_(std::move(token)),
      task_(std::move(task)) {}

transfer_session::~transfer_session() = default;

void transfer_session::cancel() {
    EDGEFIRST_LOG_INFO(log_category::session, "Cancelling transfer of " + task_.remote_key);
    token_.cancel();
}

auto transfer_session::state() const -> session_state {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

auto transfer_session::task() const -> transfer_task {
    std::lock_guard<std::mutex> lock(mutex_);
    return task_;
}

auto transfer_session::progress() const -> transfer_progress {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfer_progress{task_.bytes_done(), task_.total_size, task_.parts_done(),
                             static_cast<uint64_t>(task_.parts.size())};
}

void transfer_session::set_state(session_state next) {
    std::lock_guard<std::mutex> lock(mutex_);
    EDGEFIRST_LOG_DEBUG(log_category::session,
        task_.remote_key + ": " + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

void transfer_session::mark_part(std::size_t slot, part_status status, uint32_t attempts,
                                 std::optional<std::string> token) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& p = task_.parts[slot];
    p.status = status;
    if (attempts > 0) {
        p.attempts = attempts;
    }
    if (token) {
        p.completion_token = std::move(token);
    }
}

void transfer_session::publish_progress() {
    if (!progress_) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    progress_->push(transfer_progress{task_.bytes_done(), task_.total_size, task_.parts_done(),
                                      static_cast<uint64_t>(task_.parts.size())});
}

auto transfer_session::stop_requested(const part_job_state& shared) const -> bool {
    return shared.stop.load() || token_.is_cancelled();
}

auto transfer_session::fail(error err) -> result<void> {
    transfer_log_context ctx;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task_.status = transfer_status::failed;
        task_.failure = err;
        state_ = session_state::failed;
        ctx.remote_key = task_.remote_key;
        ctx.local_path = task_.local_path.string();
        ctx.part_index = err.part_index;
        ctx.total_parts = task_.parts.size();
    }
    ctx.http_status = err.http_status;
    if (err.attempts > 0) ctx.attempt = err.attempts;
    ctx.error_message = err.message;
    EDGEFIRST_LOG_ERROR_CTX(log_category::session, "Transfer failed: " + err.describe(), ctx);
    return unexpected{std::move(err)};
}

auto transfer_session::run() -> result<void> {
    if (started_.exchange(true)) {
        return unexpected{error{error_code::session_already_run,
            "a transfer session can only be run once"}};
    }
    if (!deps_.http || !deps_.endpoint || !deps_.pool) {
        return fail(error{error_code::invalid_configuration,
            "session requires an HTTP client, an endpoint and a worker pool"});
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        task_.status = transfer_status::in_progress;
    }

    auto started_at = std::chrono::steady_clock::now();
    auto outcome = task_.direction == transfer_direction::upload ? run_upload() : run_download();
    if (!outcome) {
        return outcome;
    }

    transfer_log_context ctx;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task_.status = transfer_status::completed;
        state_ = session_state::completed;
        ctx.remote_key = task_.remote_key;
        ctx.local_path = task_.local_path.string();
        ctx.total_bytes = task_.total_size;
        ctx.total_parts = task_.parts.size();
    }
    ctx.duration_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at).count());
    EDGEFIRST_LOG_INFO_CTX(log_category::session,
        std::string(to_string(task_.direction)) + " completed", ctx);
    return {};
}

// ============================================================================
// Upload
// ============================================================================

auto transfer_session::upload_part(part_job_state& shared, std::size_t slot,
                                   const std::string& url) -> result<std::string> {
    part p;
    std::string key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        p = task_.parts[slot];
        key = task_.remote_key;
    }

    if (stop_requested(shared)) {
        return unexpected{error{error_code::transfer_cancelled, "part not started"}.with_part(p.index)};
    }
    mark_part(slot, part_status::in_flight, 0);

    auto data = shared.file->read_at(p.offset, p.length);
    if (!data) {
        auto err = data.error();
        err.with_part(p.index);
        mark_part(slot, part_status::failed, 0);
        shared.stop = true;
        return unexpected{err};
    }

    const header_map headers{{"Content-Length", std::to_string(p.length)}};
    retry_executor executor(retry_policy::for_url(url, deps_.config), token_);
    executor.with_description(key + " part " + std::to_string(p.index + 1));

    auto response = executor.execute([&]() -> result<http_response> {
        auto put = deps_.http->put(url, data.value(), headers);
        if (put && put.value().is_success()) {
            auto etag = put.value().get_header("ETag");
            if (!etag || strip_quotes(*etag).empty()) {
                return unexpected{error{error_code::invalid_etag,
                    "object storage response has no ETag header"}
                    .with_status(put.value().status_code)};
            }
        }
        return put;
    });

    if (!response) {
        auto err = response.error();
        err.with_part(p.index).with_attempts(executor.attempts());
        mark_part(slot, part_status::failed, executor.attempts());
        shared.stop = true;
        return unexpected{err};
    }

    auto etag = strip_quotes(*response.value().get_header("ETag"));
    mark_part(slot, part_status::done, executor.attempts(), etag);
    publish_progress();

    EDGEFIRST_LOG_TRACE(log_category::transfer,
        key + ": uploaded part " + std::to_string(p.index + 1) + " (" +
        std::to_string(p.length) + " bytes)");
    return etag;
}

auto transfer_session::run_upload() -> result<void> {
    transfer_task snapshot = task();

    auto file = file_handle::open_read(snapshot.local_path);
    if (!file) {
        return fail(file.error());
    }
    auto size = file.value().size();
    if (!size) {
        return fail(size.error());
    }
    auto parts = plan(size.value(), snapshot.part_size);
    if (!parts) {
        return fail(parts.error());
    }
    const auto part_count = parts.value().size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task_.total_size = size.value();
        task_.parts = std::move(parts.value());
    }
    publish_progress();

    if (token_.is_cancelled()) {
        return fail(error{error_code::transfer_cancelled, "upload cancelled before start"});
    }

    auto upload = deps_.endpoint->create_multipart_upload(snapshot.remote_key, size.value(),
                                                          part_count);
    if (!upload) {
        return fail(upload.error());
    }

    auto abort_upload = [this, &upload]() {
        auto aborted = deps_.endpoint->abort_multipart_upload(upload.value());
        if (!aborted) {
            EDGEFIRST_LOG_WARN(log_category::session,
                "Could not abort multipart upload " + upload.value().upload_id + ": " +
                aborted.error().describe());
        }
    };

    if (upload.value().urls.size() < part_count) {
        abort_upload();
        return fail(error{error_code::invalid_response,
            "server issued " + std::to_string(upload.value().urls.size()) +
            " upload URLs for " + std::to_string(part_count) + " parts"});
    }

    set_state(session_state::transferring);

    part_job_state shared;
    shared.file = std::make_shared<file_handle>(std::move(file.value()));

    std::vector<std::future<result<std::string>>> pending;
    pending.reserve(part_count);
    for (std::size_t slot = 0; slot < part_count; ++slot) {
        const auto& url = upload.value().urls[slot];
        pending.push_back(deps_.pool->submit<std::string>(
            [this, &shared, slot, url]() { return upload_part(shared, slot, url); }));
    }

    std::vector<std::optional<error>> failures(part_count);
    std::vector<completed_part> completed;
    completed.reserve(part_count);
    for (std::size_t slot = 0; slot < part_count; ++slot) {
        auto outcome = collect_part(pending[slot], slot);
        if (outcome) {
            completed.push_back(completed_part{static_cast<uint64_t>(slot), std::move(outcome.value())});
        } else {
            if (outcome.error().code == error_code::internal_error) {
                shared.stop = true;
                mark_part(slot, part_status::failed, 0);
            }
            failures[slot] = outcome.error();
        }
    }

    if (auto failure = aggregate_failure(failures)) {
        abort_upload();
        return fail(std::move(*failure));
    }

    set_state(session_state::finalizing);

    std::sort(completed.begin(), completed.end(),
              [](const completed_part& a, const completed_part& b) { return a.index < b.index; });

    auto closed = deps_.endpoint->complete_multipart_upload(upload.value(), completed);
    if (!closed) {
        abort_upload();
        return fail(closed.error());
    }
    return {};
}

// ============================================================================
// Download
// ============================================================================

auto transfer_session::probe_size(const std::string& url) -> result<uint64_t> {
    retry_executor executor(retry_policy::for_url(url, deps_.config), token_);
    executor.with_description(task_.remote_key + " size probe")
        .with_acceptor([](const http_response& response) {
            return response.status_code == 200 || response.status_code == 206 ||
                   response.status_code == 416;
        });

    const header_map headers{{"Range", "bytes=0-0"}};
    auto response = executor.execute([&] { return deps_.http->get(url, headers); });
    if (!response) {
        return unexpected{response.error()};
    }

    const auto& value = response.value();
    if (value.status_code == 416) {
        return uint64_t{0};
    }
    if (value.status_code == 200) {
        return static_cast<uint64_t>(value.body.size());
    }

    auto range = value.get_header("Content-Range");
    if (!range) {
        return unexpected{error{error_code::invalid_response,
            "206 response without Content-Range"}.with_status(206)};
    }
    auto total = parse_content_range_total(*range);
    if (!total) {
        return unexpected{error{error_code::invalid_response,
            "cannot read object size from Content-Range '" + *range + "'"}.with_status(206)};
    }
    return *total;
}

auto transfer_session::download_part(part_job_state& shared, std::size_t slot,
                                     const std::string& url) -> result<void> {
    part p;
    std::string key;
    uint64_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        p = task_.parts[slot];
        key = task_.remote_key;
        total = task_.total_size;
    }

    if (stop_requested(shared)) {
        return unexpected{error{error_code::transfer_cancelled, "part not started"}.with_part(p.index)};
    }
    mark_part(slot, part_status::in_flight, 0);

    const bool whole_object = p.offset == 0 && p.length == total;
    const header_map headers{
        {"Range", "bytes=" + std::to_string(p.offset) + "-" + std::to_string(p.last_byte())}};

    retry_executor executor(retry_policy::for_url(url, deps_.config), token_);
    executor.with_description(key + " part " + std::to_string(p.index + 1))
        .with_acceptor([whole_object](const http_response& response) {
            return response.status_code == 206 || (whole_object && response.status_code == 200);
        });

    auto response = executor.execute([&]() -> result<http_response> {
        auto get = deps_.http->get(url, headers);
        if (get && (get.value().status_code == 206 || get.value().status_code == 200) &&
            get.value().body.size() != p.length) {
            return unexpected{error{error_code::connection_failed,
                "received " + std::to_string(get.value().body.size()) + " of " +
                std::to_string(p.length) + " bytes"}};
        }
        return get;
    });

    if (!response) {
        auto err = response.error();
        err.with_part(p.index).with_attempts(executor.attempts());
        mark_part(slot, part_status::failed, executor.attempts());
        shared.stop = true;
        return unexpected{err};
    }

    auto written = shared.file->write_at(p.offset, response.value().body);
    if (!written) {
        auto err = written.error();
        err.with_part(p.index).with_attempts(executor.attempts());
        mark_part(slot, part_status::failed, executor.attempts());
        shared.stop = true;
        return unexpected{err};
    }

    mark_part(slot, part_status::done, executor.attempts());
    publish_progress();
    return {};
}

auto transfer_session::run_download() -> result<void> {
    transfer_task snapshot = task();

    auto urls = deps_.endpoint->create_download_urls();
    if (!urls) {
        return fail(urls.error());
    }
    auto found = urls.value().find(snapshot.remote_key);
    if (found == urls.value().end()) {
        return fail(error{error_code::remote_object_not_found,
            "no download URL for " + snapshot.remote_key});
    }
    const auto url = found->second;

    auto size = probe_size(url);
    if (!size) {
        return fail(size.error());
    }
    auto parts = plan(size.value(), snapshot.part_size);
    if (!parts) {
        return fail(parts.error());
    }
    const auto part_count = parts.value().size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task_.total_size = size.value();
        task_.parts = std::move(parts.value());
    }
    publish_progress();

    if (token_.is_cancelled()) {
        return fail(error{error_code::transfer_cancelled, "download cancelled before start"});
    }

    const auto dest = snapshot.local_path;
    const auto temp = temp_path_for(dest);
    if (dest.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(dest.parent_path(), ec);
        if (ec) {
            return fail(error{error_code::file_write_error,
                "cannot create " + dest.parent_path().string() + ": " + ec.message()});
        }
    }

    auto file = file_handle::create(temp, size.value());
    if (!file) {
        return fail(file.error());
    }

    set_state(session_state::transferring);

    part_job_state shared;
    shared.file = std::make_shared<file_handle>(std::move(file.value()));

    auto discard = [&shared, &temp]() {
        shared.file->close();
        std::error_code ec;
        std::filesystem::remove(temp, ec);
    };

    std::vector<std::optional<error>> failures(part_count);
    if (size.value() == 0) {
        mark_part(0, part_status::done, 0);
        publish_progress();
    } else {
        std::vector<std::future<result<void>>> pending;
        pending.reserve(part_count);
        for (std::size_t slot = 0; slot < part_count; ++slot) {
            pending.push_back(deps_.pool->submit<void>(
                [this, &shared, slot, &url]() { return download_part(shared, slot, url); }));
        }
        for (std::size_t slot = 0; slot < part_count; ++slot) {
            auto outcome = collect_part(pending[slot], slot);
            if (!outcome) {
                if (outcome.error().code == error_code::internal_error) {
                    shared.stop = true;
                    mark_part(slot, part_status::failed, 0);
                }
                failures[slot] = outcome.error();
            }
        }
    }

    if (auto failure = aggregate_failure(failures)) {
        discard();
        return fail(std::move(*failure));
    }

    set_state(session_state::finalizing);

    if (auto synced = shared.file->sync(); !synced) {
        discard();
        return fail(synced.error());
    }
    shared.file->close();

    std::error_code ec;
    std::filesystem::rename(temp, dest, ec);
    if (ec) {
        discard();
        return fail(error{error_code::file_write_error,
            "cannot move " + temp.string() + " to " + dest.string() + ": " + ec.message()});
    }
    return {};
}

}  // namespace edgefirst::sync
