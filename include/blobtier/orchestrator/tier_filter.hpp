/**
 * @file tier_filter.hpp
 * @brief Narrows enumerated records to the migration candidate set
 */

#pragma once

#include <blobtier/core/blob_types.hpp>
#include <blobtier/di/ilogger.hpp>

#include <memory>
#include <vector>

namespace blobtier::orchestrator {

/**
 * @class tier_filter
 * @brief Tier and modification-time window selection
 *
 * Every operation is a pure function of its inputs (the logger only
 * observes). Output order always equals input order.
 */
class tier_filter {
public:
    explicit tier_filter(std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Keep records with start_time <= last_modified <= end_time
     *
     * Both ends are inclusive. Records without a parseable last_modified
     * are excluded and logged as malformed; they never abort the batch.
     */
    [[nodiscard]] auto filter_by_window(const std::vector<blob_record>& records,
                                        const tier_filter_criteria& criteria) const
        -> std::vector<blob_record>;

    /**
     * @brief Keep records whose tier equals @p tier
     */
    [[nodiscard]] auto filter_by_tier(const std::vector<blob_record>& records,
                                      access_tier tier) const
        -> std::vector<blob_record>;

    /**
     * @brief Tier match, then window match
     */
    [[nodiscard]] auto apply(const std::vector<blob_record>& records,
                             const tier_filter_criteria& criteria) const
        -> std::vector<blob_record>;

private:
    std::shared_ptr<di::ILogger> logger_;
};

}  // namespace blobtier::orchestrator
