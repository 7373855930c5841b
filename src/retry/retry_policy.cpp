/**
 * @file retry_policy.cpp
 * @brief Request classification and backoff scheduling
 */

#include "edgefirst/sync/retry/retry_policy.h"

#include <algorithm>
#include <cctype>
#include <random>
#include <string>

namespace edgefirst::sync {

namespace {

constexpr std::string_view platform_domain = "edgefirst.studio";

auto to_lower(std::string_view input) -> std::string {
    std::string out(input);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

struct url_parts {
    std::string scheme;
    std::string host;
    std::string path;
};

// scheme "://" [userinfo "@"] host [":" port] [path] ["?" query] ["#" fragment]
auto split_url(std::string_view url) -> std::optional<url_parts> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }

    url_parts parts;
    parts.scheme = to_lower(url.substr(0, scheme_end));

    auto rest = url.substr(scheme_end + 3);
    auto authority_end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authority_end);
    auto tail = authority_end == std::string_view::npos
                    ? std::string_view{}
                    : rest.substr(authority_end);

    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }
    if (auto colon = authority.rfind(':'); colon != std::string_view::npos &&
                                           authority.find(']') == std::string_view::npos) {
        authority = authority.substr(0, colon);
    }
    if (authority.empty()) {
        return std::nullopt;
    }
    parts.host = to_lower(authority);
    if (!parts.host.empty() && parts.host.back() == '.') {
        parts.host.pop_back();
    }

    auto path_end = tail.find_first_of("?#");
    parts.path = std::string(tail.substr(0, path_end));
    if (parts.path.empty()) {
        parts.path = "/";
    }
    return parts;
}

auto is_platform_host(const std::string& host) -> bool {
    if (host == platform_domain) {
        return true;
    }
    return host.size() > platform_domain.size() + 1 &&
           host.compare(host.size() - platform_domain.size(), platform_domain.size(),
                        platform_domain) == 0 &&
           host[host.size() - platform_domain.size() - 1] == '.';
}

auto is_api_path(const std::string& path) -> bool {
    return path == "/api" || path.rfind("/api/", 0) == 0;
}

}  // namespace

auto classify(std::string_view url) -> request_class {
    auto parts = split_url(url);
    if (!parts) {
        return request_class::object_storage;
    }
    if (parts->scheme != "http" && parts->scheme != "https") {
        return request_class::object_storage;
    }
    if (is_platform_host(parts->host) && is_api_path(parts->path)) {
        return request_class::remote_api;
    }
    return request_class::object_storage;
}

auto is_retryable_status(request_class cls, int status) -> bool {
    if (status >= 500 && status < 600) {
        return true;
    }
    switch (cls) {
        case request_class::remote_api:
            return status == 408 || status == 429;
        case request_class::object_storage:
            return status == 408 || status == 409 || status == 423 || status == 429;
    }
    return false;
}

auto retry_policy::for_class(request_class cls, const sync_config& config) -> retry_policy {
    retry_policy policy;
    policy.cls = cls;
    policy.max_retries = cls == request_class::remote_api
                             ? config.max_retries
                             : config.object_storage_max_retries;
    policy.timeout = config.request_timeout;
    policy.initial_delay = config.initial_backoff;
    policy.max_delay = config.max_backoff;
    policy.backoff_multiplier = config.backoff_multiplier;
    return policy;
}

auto retry_policy::for_url(std::string_view url, const sync_config& config) -> retry_policy {
    return for_class(classify(url), config);
}

auto should_retry(const retry_policy& policy, const attempt_outcome& outcome,
                  uint32_t attempt) -> bool {
    if (attempt > policy.max_retries) {
        return false;
    }
    if (outcome.is_transport_error()) {
        return true;
    }
    int status = *outcome.status;
    if (policy.cls == request_class::remote_api && (status == 401 || status == 403)) {
        return false;
    }
    return is_retryable_status(policy.cls, status);
}

auto next_delay(const retry_policy& policy, uint32_t attempt, double jitter_factor)
    -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());

    for (uint32_t i = 1; i < attempt; ++i) {
        delay *= policy.backoff_multiplier;
        if (delay >= static_cast<double>(policy.max_delay.count())) {
            break;
        }
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));
    delay *= std::clamp(jitter_factor, 0.5, 1.5);
    delay = std::min(delay, static_cast<double>(policy.timeout.count()));

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto next_delay(const retry_policy& policy, uint32_t attempt) -> std::chrono::milliseconds {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(0.5, 1.5);
    return next_delay(policy, attempt, dis(gen));
}

}  // namespace edgefirst::sync
