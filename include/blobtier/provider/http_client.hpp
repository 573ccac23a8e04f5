/**
 * @file http_client.hpp
 * @brief HTTP transport seam for the Azure Blob provider
 *
 * network_http_client is the production implementation on network_system.
 * Tests inject mock_http_client to script responses and inspect requests.
 */

#pragma once

#include <blobtier/core/result.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace kcenon::network::core {
class http_client;
}  // namespace kcenon::network::core

namespace blobtier::provider {

/**
 * @brief HTTP response returned by http_client_interface
 */
struct http_response {
    int status_code{0};
    std::map<std::string, std::string> headers;
    std::string body;

    /**
     * @brief Case-insensitive header lookup
     * @return Header value, or an empty string when absent
     */
    [[nodiscard]] auto header(const std::string& name) const -> std::string;
};

/**
 * @brief Minimal HTTP client interface
 *
 * A transport-level failure (no connection, timeout) is an error result.
 * Any HTTP status, including 4xx and 5xx, is a successful result.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    [[nodiscard]] virtual auto get(const std::string& url,
                                   const std::map<std::string, std::string>& headers)
        -> Result<http_response> = 0;

    [[nodiscard]] virtual auto put(const std::string& url,
                                   const std::string& body,
                                   const std::map<std::string, std::string>& headers)
        -> Result<http_response> = 0;
};

/**
 * @brief The URL without its query string
 *
 * Query strings can carry a SAS token, so messages and logs only ever show
 * the stripped form.
 */
[[nodiscard]] auto strip_query(const std::string& url) -> std::string;

/**
 * @brief Replace every "sig=<value>" in free text with "sig=<redacted>"
 */
[[nodiscard]] auto redact_signature(const std::string& text) -> std::string;

/**
 * @brief http_client_interface backed by kcenon::network::core::http_client
 */
class network_http_client final : public http_client_interface {
public:
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));
    ~network_http_client() override;

    [[nodiscard]] auto get(const std::string& url,
                           const std::map<std::string, std::string>& headers)
        -> Result<http_response> override;

    [[nodiscard]] auto put(const std::string& url,
                           const std::string& body,
                           const std::map<std::string, std::string>& headers)
        -> Result<http_response> override;

private:
    std::shared_ptr<kcenon::network::core::http_client> client_;
};

}  // namespace blobtier::provider
