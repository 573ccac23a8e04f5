/**
 * @file blob_enumerator.hpp
 * @brief Lists the objects of a container as blob_record snapshots
 */

#pragma once

#include <blobtier/core/blob_types.hpp>
#include <blobtier/core/result.hpp>
#include <blobtier/di/ilogger.hpp>
#include <blobtier/provider/blob_provider.hpp>

#include <memory>
#include <string>
#include <vector>

namespace blobtier::orchestrator {

/**
 * @brief Build the provider-side predicate selecting one tier
 * @return e.g. "AccessTier eq 'Archive'"
 */
[[nodiscard]] auto make_tier_predicate(access_tier tier) -> std::string;

/**
 * @brief Convert provider metadata into a blob_record
 *
 * Unparseable values do not fail the conversion: a bad Last-Modified leaves
 * last_modified empty (the raw text is kept), an unknown tier becomes
 * access_tier::unknown and a bad Content-Length becomes zero.
 */
[[nodiscard]] auto make_blob_record(const std::string& container,
                                    const provider::raw_object_metadata& raw)
    -> blob_record;

/**
 * @class blob_enumerator
 * @brief Fully materialized listing of one container
 */
class blob_enumerator {
public:
    explicit blob_enumerator(std::shared_ptr<provider::blob_provider> provider,
                             std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief List the objects of @p container currently in @p tier
     *
     * The tier predicate is passed to the provider to reduce transfer; the
     * Tier Filter still applies the authoritative match.
     *
     * @return Every record, or enumeration_error. A partial listing is never
     *         returned.
     */
    [[nodiscard]] auto list_blobs(const std::string& container, access_tier tier)
        -> Result<std::vector<blob_record>>;

private:
    std::shared_ptr<provider::blob_provider> provider_;
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace blobtier::orchestrator
