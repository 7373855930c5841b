/**
 * @file http_client.cpp
 * @brief network_system backed HTTP client
 */

#include "edgefirst/sync/transport/http_client.h"

#include "edgefirst/sync/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace edgefirst::sync {

namespace {

[[maybe_unused]] auto backend_missing() -> result<http_response> {
    return unexpected{error{error_code::not_supported,
        "HTTP client not available (built without network_system)"}};
}

}  // namespace

struct studio_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    template <typename Response>
    static auto convert(const Response& resp) -> http_response {
        http_response out;
        out.status_code = resp.status_code;
        out.headers = header_map(resp.headers.begin(), resp.headers.end());
        out.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return out;
    }

    template <typename NetworkResult>
    static auto finish(NetworkResult&& response, const char* verb,
                       const std::string& url) -> result<http_response> {
        if (response.is_err()) {
            return unexpected{error{error_code::connection_failed,
                std::string("HTTP ") + verb + " request failed: " + url}};
        }
        return convert(response.value());
    }
#endif
};

studio_http_client::studio_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

studio_http_client::~studio_http_client() = default;

studio_http_client::studio_http_client(studio_http_client&&) noexcept = default;
auto studio_http_client::operator=(studio_http_client&&) noexcept
    -> studio_http_client& = default;

auto studio_http_client::get(const std::string& url, const header_map& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->get(url, {}, headers), "GET", url);
#else
    (void)url;
    (void)headers;
    return backend_missing();
#endif
}

auto studio_http_client::post(const std::string& url, const std::string& body,
                              const header_map& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->post(url, body, headers), "POST", url);
#else
    (void)url;
    (void)body;
    (void)headers;
    return backend_missing();
#endif
}

auto studio_http_client::put(const std::string& url, const std::vector<uint8_t>& body,
                             const header_map& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    std::string payload(body.begin(), body.end());
    return impl::finish(impl_->client->put(url, payload, headers), "PUT", url);
#else
    (void)url;
    (void)body;
    (void)headers;
    return backend_missing();
#endif
}

auto studio_http_client::head(const std::string& url, const header_map& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl::finish(impl_->client->head(url, headers), "HEAD", url);
#else
    (void)url;
    (void)headers;
    return backend_missing();
#endif
}

auto studio_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

auto make_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_client_interface> {
    return std::make_shared<studio_http_client>(timeout);
}

}  // namespace edgefirst::sync
