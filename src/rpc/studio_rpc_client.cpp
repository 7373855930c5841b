/**
 * @file studio_rpc_client.cpp
 * @brief JSON-RPC 2.0 client for the platform snapshot API
 */

#include "edgefirst/sync/rpc/studio_rpc_client.h"

#include "edgefirst/sync/core/logging.h"
#include "edgefirst/sync/retry/retry_executor.h"
#include "edgefirst/sync/rpc/json_utils.h"

#include <sstream>

namespace edgefirst::sync {

namespace {

auto invalid_response(std::string_view method, std::string_view what) -> unexpected {
    return unexpected{error{error_code::invalid_response,
        std::string(method) + ": " + std::string(what)}};
}

auto parse_upload_entry(std::string_view raw, std::string_view method)
    -> result<multipart_upload> {
    multipart_upload upload;

    auto key = json::find_member(raw, "key");
    auto upload_id = json::find_member(raw, "upload_id");
    auto urls = json::find_member(raw, "urls");
    if (!key || !upload_id || !urls) {
        return invalid_response(method, "upload entry is missing key, upload_id or urls");
    }

    auto key_value = json::parse_string(*key);
    auto id_value = json::parse_string(*upload_id);
    auto url_values = json::parse_string_array(*urls);
    if (!key_value || !id_value || !url_values) {
        return invalid_response(method, "upload entry has malformed fields");
    }

    upload.key = std::move(*key_value);
    upload.upload_id = std::move(*id_value);
    upload.urls = std::move(*url_values);
    return upload;
}

}  // namespace

auto static_token(std::string token) -> token_provider {
    return [token = std::move(token)]() -> result<std::string> { return token; };
}

studio_rpc_client::studio_rpc_client(std::shared_ptr<http_client_interface> http,
                                     sync_config config,
                                     token_provider tokens)
    : http_(std::move(http)), config_(std::move(config)), tokens_(std::move(tokens)) {
    if (!tokens_) {
        tokens_ = static_token(config_.token);
    }
}

void studio_rpc_client::set_snapshot_name(std::string name) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_name_ = std::move(name);
}

void studio_rpc_client::set_snapshot_id(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_id_ = id;
}

auto studio_rpc_client::snapshot_id() const -> std::optional<int64_t> {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_id_;
}

void studio_rpc_client::set_cancellation_token(cancellation_token token) {
    cancel_ = std::move(token);
}

auto studio_rpc_client::call(std::string_view method, const std::string& params_json)
    -> result<std::string> {
    if (!http_) {
        return unexpected{error{error_code::invalid_configuration, "no HTTP client configured"}};
    }

    auto token = tokens_();
    if (!token) {
        return unexpected{token.error()};
    }

    std::ostringstream body;
    body << "{\"id\":0,\"jsonrpc\":\"2.0\",\"method\":" << json::quote(method)
         << ",\"params\":" << (params_json.empty() ? "null" : params_json) << "}";
    const auto payload = body.str();

    header_map headers{
        {"Accept", "application/json"},
        {"Content-Type", "application/json"},
        {"User-Agent", "EdgeFirst Client"},
    };
    if (!token.value().empty()) {
        headers["Authorization"] = "Bearer " + token.value();
    }

    const auto url = config_.rpc_url();
    retry_executor executor(retry_policy::for_url(url, config_), cancel_);
    executor.with_description(std::string(method));

    EDGEFIRST_LOG_DEBUG(log_category::rpc, "RPC call " + std::string(method));

    auto response = executor.execute([&] { return http_->post(url, payload, headers); });
    if (!response) {
        auto err = response.error();
        EDGEFIRST_LOG_ERROR(log_category::rpc,
            "RPC call " + std::string(method) + " failed: " + err.describe());
        return unexpected{err};
    }

    const auto text = response.value().get_body_string();
    if (auto rpc_error = json::find_member(text, "error"); rpc_error && !json::is_null(*rpc_error)) {
        auto code = json::find_member(*rpc_error, "code");
        auto message = json::find_member(*rpc_error, "message");
        std::string description = std::string(method) + " returned error";
        if (code) {
            description += " " + std::string(json::trim(*code));
        }
        if (message) {
            if (auto decoded = json::parse_string(*message)) {
                description += ": " + *decoded;
            }
        }
        EDGEFIRST_LOG_ERROR(log_category::rpc, description);
        return unexpected{error{error_code::rpc_error, description}};
    }

    auto result_value = json::find_member(text, "result");
    if (!result_value) {
        return invalid_response(method, "response has neither result nor error");
    }
    return std::string(*result_value);
}

auto studio_rpc_client::create_multipart_upload(const std::string& key,
                                                uint64_t size,
                                                uint64_t part_count)
    -> result<multipart_upload> {
    constexpr std::string_view method = "snapshots.create_upload_url_multipart";

    std::string snapshot_name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_name = snapshot_name_;
    }

    std::ostringstream params;
    params << "{\"snapshot_name\":" << json::quote(snapshot_name)
           << ",\"keys\":[" << json::quote(key) << "]"
           << ",\"file_sizes\":[" << size << "]}";

    auto raw = call(method, params.str());
    if (!raw) {
        return unexpected{raw.error()};
    }

    auto members = json::object_members(raw.value());
    if (!members) {
        return invalid_response(method, "result is not an object");
    }

    std::optional<multipart_upload> upload;
    for (const auto& [name, value] : *members) {
        if (name == "snapshot_id") {
            if (auto id = json::parse_int(value)) {
                set_snapshot_id(*id);
            }
        } else if (name == key) {
            auto entry = parse_upload_entry(value, method);
            if (!entry) {
                return unexpected{entry.error()};
            }
            upload = std::move(entry.value());
        }
    }

    if (!upload) {
        return invalid_response(method, "result has no entry for key " + key);
    }
    if (upload->key.empty()) {
        upload->key = key;
    }

    EDGEFIRST_LOG_DEBUG(log_category::rpc,
        "Opened multipart upload for " + key + " with " +
        std::to_string(upload->urls.size()) + " URLs (planned " +
        std::to_string(part_count) + " parts)");
    return std::move(*upload);
}

auto studio_rpc_client::complete_multipart_upload(const multipart_upload& upload,
                                                  const std::vector<completed_part>& parts)
    -> result<void> {
    std::ostringstream params;
    params << "{\"key\":" << json::quote(upload.key)
           << ",\"upload_id\":" << json::quote(upload.upload_id)
           << ",\"etag_list\":[";
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) params << ",";
        params << "{\"ETag\":" << json::quote(parts[i].etag)
               << ",\"PartNumber\":" << (parts[i].index + 1) << "}";
    }
    params << "]}";

    auto raw = call("snapshots.complete_multipart_upload", params.str());
    if (!raw) {
        return unexpected{raw.error()};
    }
    return {};
}

auto studio_rpc_client::abort_multipart_upload(const multipart_upload& upload)
    -> result<void> {
    std::ostringstream params;
    params << "{\"key\":" << json::quote(upload.key)
           << ",\"upload_id\":" << json::quote(upload.upload_id) << "}";

    auto raw = call("snapshots.abort_multipart_upload", params.str());
    if (!raw) {
        auto err = raw.error();
        return unexpected{error{error_code::multipart_abort_failed,
            "abort of " + upload.key + " failed: " + err.describe()}};
    }
    return {};
}

auto studio_rpc_client::create_download_urls()
    -> result<std::map<std::string, std::string>> {
    constexpr std::string_view method = "snapshots.create_download_url";

    auto id = snapshot_id();
    if (!id) {
        return unexpected{error{error_code::invalid_argument,
            "no snapshot id set for download"}};
    }

    auto raw = call(method, "{\"snapshot_id\":" + std::to_string(*id) + "}");
    if (!raw) {
        return unexpected{raw.error()};
    }

    auto members = json::object_members(raw.value());
    if (!members) {
        return invalid_response(method, "result is not an object");
    }

    std::map<std::string, std::string> urls;
    for (const auto& [name, value] : *members) {
        auto url = json::parse_string(value);
        if (!url) {
            return invalid_response(method, "URL for " + name + " is not a string");
        }
        urls.emplace(name, std::move(*url));
    }
    return urls;
}

}  // namespace edgefirst::sync
