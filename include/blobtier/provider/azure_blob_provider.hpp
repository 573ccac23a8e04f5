/**
 * @file azure_blob_provider.hpp
 * @brief blob_provider implementation over the Azure Blob REST API
 *
 * Uses List Blobs (paged through NextMarker) for enumeration and Set Blob
 * Tier for tier changes. Requests are authorized with SharedKey or a SAS
 * token.
 */

#pragma once

#include <blobtier/di/ilogger.hpp>
#include <blobtier/provider/azure_auth.hpp>
#include <blobtier/provider/blob_provider.hpp>
#include <blobtier/provider/http_client.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blobtier::provider {

/**
 * @brief Configuration of azure_blob_provider
 */
struct azure_blob_provider_config {
    azure_credentials credentials;

    /// Value of x-ms-version
    std::string api_version{"2021-12-02"};

    /// maxresults per List Blobs page
    std::size_t page_size{5000};

    /// List previous blob versions too. Off means current versions only.
    bool include_versions{false};
};

/**
 * @brief Parse a tier predicate of the form "AccessTier eq '<Tier>'"
 *
 * @return The tier, nullopt for an empty expression, or
 *         invalid_filter_expression when the text is not a tier predicate
 */
[[nodiscard]] auto parse_tier_predicate(std::string_view filter_expr)
    -> Result<std::optional<access_tier>>;

/**
 * @brief Parse one List Blobs response page
 *
 * Entity and character references are decoded, and names the service
 * returns as <Name Encoded="true"> are percent-decoded.
 *
 * @param xml Response body
 * @param next_marker Receives the NextMarker value (empty on the last page)
 * @return The page entries, or provider_response_error for a body that is
 *         not a List Blobs document
 */
[[nodiscard]] auto parse_list_blobs_page(const std::string& xml, std::string& next_marker)
    -> Result<std::vector<raw_object_metadata>>;

/**
 * @class azure_blob_provider
 * @brief Azure Blob REST implementation of blob_provider
 *
 * Thread Safety: set_tier() is safe to call concurrently as long as the
 * injected http_client_interface is.
 *
 * @example
 * @code
 * azure_blob_provider_config config;
 * config.credentials = parse_connection_string(conn).value();
 *
 * auto provider = std::make_shared<azure_blob_provider>(
 *     config, std::make_shared<network_http_client>());
 * auto blobs = provider->list_objects("archive-data", "AccessTier eq 'Archive'");
 * @endcode
 */
class azure_blob_provider final : public blob_provider {
public:
    azure_blob_provider(azure_blob_provider_config config,
                        std::shared_ptr<http_client_interface> http_client,
                        std::shared_ptr<di::ILogger> logger = nullptr);

    ~azure_blob_provider() override = default;

    azure_blob_provider(const azure_blob_provider&) = delete;
    azure_blob_provider& operator=(const azure_blob_provider&) = delete;

    [[nodiscard]] auto list_objects(const std::string& container,
                                    const std::string& filter_expr)
        -> Result<std::vector<raw_object_metadata>> override;

    [[nodiscard]] auto set_tier(const std::string& container,
                                const std::string& name,
                                const std::optional<std::string>& version_id,
                                access_tier tier,
                                std::optional<rehydrate_priority> priority)
        -> VoidResult override;

    /**
     * @brief Blob service endpoint requests are sent to
     */
    [[nodiscard]] auto endpoint() const -> const std::string& { return endpoint_; }

private:
    /**
     * @brief Build the URL, sign it and fill in the common headers
     */
    [[nodiscard]] auto prepare_request(const std::string& method,
                                       const std::string& resource_path,
                                       const std::map<std::string, std::string>& query,
                                       std::map<std::string, std::string>& headers)
        -> Result<std::string>;

    azure_blob_provider_config config_;
    std::shared_ptr<http_client_interface> http_client_;
    std::shared_ptr<di::ILogger> logger_;

    /// Resolved endpoint, e.g. "https://acct.blob.core.windows.net"
    std::string endpoint_;

    /// Path component of the endpoint ("" or "/devstoreaccount1")
    std::string base_path_;
};

}  // namespace blobtier::provider
