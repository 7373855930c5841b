/**
 * @file http_client.h
 * @brief HTTP client abstraction used by the RPC client and transfer workers
 *
 * The production implementation wraps the network_system HTTP client. Tests
 * and embedders substitute their own implementation of
 * http_client_interface.
 */

#ifndef EDGEFIRST_SYNC_TRANSPORT_HTTP_CLIENT_H
#define EDGEFIRST_SYNC_TRANSPORT_HTTP_CLIENT_H

#include "edgefirst/sync/core/types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace edgefirst::sync {

using header_map = std::map<std::string, std::string>;

/**
 * @brief HTTP response
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    header_map headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        };
        const auto wanted = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == wanted) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Interface for the HTTP operations the engine needs
 *
 * Implementations report transport failures (no HTTP status received) as
 * error_code::connection_failed or error_code::request_timeout. Any response
 * with a status code, including 4xx and 5xx, is a successful result.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    virtual auto get(const std::string& url,
                     const header_map& headers) -> result<http_response> = 0;

    virtual auto post(const std::string& url,
                      const std::string& body,
                      const header_map& headers) -> result<http_response> = 0;

    virtual auto put(const std::string& url,
                     const std::vector<uint8_t>& body,
                     const header_map& headers) -> result<http_response> = 0;

    virtual auto head(const std::string& url,
                      const header_map& headers) -> result<http_response> = 0;
};

/**
 * @brief HTTP client backed by network_system
 *
 * Without network_system every request fails with error_code::not_supported.
 *
 * @note Thread-safe for concurrent requests.
 */
class studio_http_client : public http_client_interface {
public:
    explicit studio_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~studio_http_client() override;

    studio_http_client(const studio_http_client&) = delete;
    auto operator=(const studio_http_client&) -> studio_http_client& = delete;
    studio_http_client(studio_http_client&&) noexcept;
    auto operator=(studio_http_client&&) noexcept -> studio_http_client&;

    [[nodiscard]] auto get(const std::string& url,
                           const header_map& headers) -> result<http_response> override;

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const header_map& headers) -> result<http_response> override;

    [[nodiscard]] auto put(const std::string& url,
                           const std::vector<uint8_t>& body,
                           const header_map& headers) -> result<http_response> override;

    [[nodiscard]] auto head(const std::string& url,
                            const header_map& headers) -> result<http_response> override;

    /**
     * @brief Whether a network backend was compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

[[nodiscard]] auto make_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_client_interface>;

}  // namespace edgefirst::sync

#endif  // EDGEFIRST_SYNC_TRANSPORT_HTTP_CLIENT_H
