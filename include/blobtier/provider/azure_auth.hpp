/**
 * @file azure_auth.hpp
 * @brief Azure Storage credentials and SharedKey request signing
 *
 * Signing follows the "Authorize with Shared Key" rules of the Blob
 * service: the canonicalized x-ms-* headers and resource are signed with
 * HMAC-SHA256 using the base64-decoded account key.
 */

#pragma once

#include <blobtier/core/result.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace blobtier::provider {

/**
 * @brief Credentials and endpoint of a storage account
 *
 * Exactly one of account_key or sas_token is used. When both are set the
 * account key wins.
 */
struct azure_credentials {
    std::string account_name;

    /// Base64 account key for SharedKey authorization
    std::string account_key;

    /// SAS token without the leading '?'
    std::string sas_token;

    /// Blob endpoint override, e.g. "http://127.0.0.1:10000/devstoreaccount1"
    std::string blob_endpoint;

    /// DNS suffix used when no endpoint override is given
    std::string endpoint_suffix{"core.windows.net"};

    /// "https" unless the connection string says otherwise
    std::string protocol{"https"};

    [[nodiscard]] auto has_shared_key() const noexcept -> bool {
        return !account_key.empty();
    }

    [[nodiscard]] auto has_sas() const noexcept -> bool { return !sas_token.empty(); }

    /**
     * @brief Resolve the blob service endpoint without a trailing slash
     */
    [[nodiscard]] auto resolve_blob_endpoint() const -> std::string;
};

/**
 * @brief Parse a storage connection string
 *
 * Recognised keys: DefaultEndpointsProtocol, AccountName, AccountKey,
 * EndpointSuffix, BlobEndpoint, SharedAccessSignature.
 *
 * @return Credentials, or invalid_configuration when the account name or
 *         both secrets are missing
 */
[[nodiscard]] auto parse_connection_string(std::string_view connection_string)
    -> Result<azure_credentials>;

// =============================================================================
// Encoding Helpers
// =============================================================================

[[nodiscard]] auto base64_encode(const std::vector<std::uint8_t>& data) -> std::string;

[[nodiscard]] auto base64_decode(std::string_view encoded)
    -> Result<std::vector<std::uint8_t>>;

[[nodiscard]] auto hmac_sha256(const std::vector<std::uint8_t>& key,
                               std::string_view data)
    -> Result<std::vector<std::uint8_t>>;

/**
 * @brief Percent-encode a URL component
 * @param keep_slash Leave '/' unencoded (used for blob paths)
 */
[[nodiscard]] auto url_encode(std::string_view value, bool keep_slash = false)
    -> std::string;

// =============================================================================
// SharedKey Signing
// =============================================================================

/**
 * @brief Description of a request to sign
 */
struct signing_request {
    std::string method;

    /// URL path as sent, already percent-encoded, starting with '/'
    std::string path;

    /// Decoded query parameters
    std::map<std::string, std::string> query;

    /// Request headers (x-ms-date and x-ms-version must be present)
    std::map<std::string, std::string> headers;

    /// Empty when the body is empty
    std::string content_length;
};

/**
 * @brief Build the SharedKey string-to-sign for a request
 */
[[nodiscard]] auto build_string_to_sign(const std::string& account_name,
                                        const signing_request& request)
    -> std::string;

/**
 * @brief Compute the Authorization header value
 * @return "SharedKey <account>:<signature>", or provider_auth_error when the
 *         key cannot be decoded or signing fails
 */
[[nodiscard]] auto sign_shared_key(const azure_credentials& credentials,
                                   const signing_request& request)
    -> Result<std::string>;

}  // namespace blobtier::provider
