/**
 * @file tier_filter.cpp
 * @brief Implementation of the tier filter
 */

#include <blobtier/orchestrator/tier_filter.hpp>

#include <blobtier/core/result.hpp>
#include <blobtier/core/timestamp.hpp>

namespace blobtier::orchestrator {

tier_filter::tier_filter(std::shared_ptr<di::ILogger> logger)
    : logger_(logger ? std::move(logger) : di::null_logger()) {}

auto tier_filter::filter_by_window(const std::vector<blob_record>& records,
                                   const tier_filter_criteria& criteria) const
    -> std::vector<blob_record> {
    std::vector<blob_record> selected;
    std::size_t malformed = 0;

    for (const auto& record : records) {
        if (!record.last_modified) {
            ++malformed;
            logger_->warn_fmt(
                "[{}] Skipping malformed record {}: unparseable last_modified '{}'",
                error_codes::malformed_record, record.display_name(),
                record.last_modified_raw);
            continue;
        }
        if (*record.last_modified < criteria.start_time ||
            *record.last_modified > criteria.end_time) {
            continue;
        }
        selected.push_back(record);
    }

    logger_->info_fmt("Window [{} .. {}] selected {} of {} objects ({} malformed)",
                      format_iso8601(criteria.start_time),
                      format_iso8601(criteria.end_time), selected.size(),
                      records.size(), malformed);
    return selected;
}

auto tier_filter::filter_by_tier(const std::vector<blob_record>& records,
                                 access_tier tier) const -> std::vector<blob_record> {
    std::vector<blob_record> selected;
    for (const auto& record : records) {
        if (record.tier == tier) {
            selected.push_back(record);
        } else {
            logger_->debug_fmt("Skipping {}: tier {} is not {}", record.display_name(),
                               to_string(record.tier), to_string(tier));
        }
    }
    return selected;
}

auto tier_filter::apply(const std::vector<blob_record>& records,
                        const tier_filter_criteria& criteria) const
    -> std::vector<blob_record> {
    return filter_by_window(filter_by_tier(records, criteria.tier), criteria);
}

}  // namespace blobtier::orchestrator
