/**
 * @file blob_provider.hpp
 * @brief Abstract object-listing and tier-change capability of a blob store
 *
 * The orchestrator only talks to the blob store through this interface.
 * azure_blob_provider implements it over the Azure Blob REST API and tests
 * inject mock_blob_provider.
 */

#pragma once

#include <blobtier/core/blob_types.hpp>
#include <blobtier/core/result.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace blobtier::provider {

/**
 * @brief Object metadata exactly as reported by the provider
 *
 * Values are kept as provider text; the blob enumerator parses them into a
 * blob_record.
 */
struct raw_object_metadata {
    std::string name;
    std::optional<std::string> version_id;

    /// e.g. "Archive", "Hot"
    std::string access_tier;

    /// RFC 1123 text, e.g. "Wed, 10 Apr 2024 10:15:30 GMT"
    std::string last_modified;

    /// Empty unless last-access tracking is enabled on the account
    std::string last_access_time;

    std::string content_length;

    /// e.g. "rehydrate-pending-to-hot"; empty when no rehydration is running
    std::string archive_status;

    /// Priority of the last rehydration, if the provider still reports one
    std::string rehydrate_priority;

    std::string etag;
    std::map<std::string, std::string> tags;

    /// Reported only when previous versions are listed
    std::optional<bool> is_current_version;
};

/**
 * @brief Blob store capability used by the enumerator and the executor
 *
 * Thread Safety: set_tier() may be called concurrently when the executor
 * runs with bounded fan-out. Implementations must allow that.
 */
class blob_provider {
public:
    virtual ~blob_provider() = default;

    /**
     * @brief List every object in a container
     *
     * @param container Container name
     * @param filter_expr Server-side predicate such as "AccessTier eq 'Archive'".
     *                    Empty lists every object.
     * @return Fully materialized listing, or a provider error
     */
    [[nodiscard]] virtual auto list_objects(const std::string& container,
                                            const std::string& filter_expr)
        -> Result<std::vector<raw_object_metadata>> = 0;

    /**
     * @brief Request a tier change for one object
     *
     * @param container Container name
     * @param name Object name
     * @param version_id Version to change; nullopt targets the current version
     * @param tier Destination tier
     * @param priority Rehydration priority; only meaningful when leaving Archive
     */
    [[nodiscard]] virtual auto set_tier(const std::string& container,
                                        const std::string& name,
                                        const std::optional<std::string>& version_id,
                                        access_tier tier,
                                        std::optional<rehydrate_priority> priority)
        -> VoidResult = 0;

protected:
    blob_provider() = default;
    blob_provider(const blob_provider&) = default;
    blob_provider& operator=(const blob_provider&) = default;
};

}  // namespace blobtier::provider
