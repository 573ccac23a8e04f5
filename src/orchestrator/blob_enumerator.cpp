/**
 * @file blob_enumerator.cpp
 * @brief Implementation of the blob enumerator
 */

#include <blobtier/orchestrator/blob_enumerator.hpp>

#include <blobtier/core/timestamp.hpp>

#include <charconv>

namespace blobtier::orchestrator {

namespace {

constexpr const char* kModule = "blob_enumerator";

auto parse_rehydration(const provider::raw_object_metadata& raw, access_tier tier)
    -> rehydration_status {
    if (raw.archive_status.starts_with("rehydrate-pending")) {
        return rehydration_status::pending;
    }
    // The provider keeps reporting the priority after a rehydration finished
    if (!raw.rehydrate_priority.empty() && tier != access_tier::archive) {
        return rehydration_status::complete;
    }
    return rehydration_status::none;
}

}  // namespace

auto make_tier_predicate(access_tier tier) -> std::string {
    return "AccessTier eq '" + std::string{to_string(tier)} + "'";
}

auto make_blob_record(const std::string& container,
                      const provider::raw_object_metadata& raw) -> blob_record {
    blob_record record;
    record.container = container;
    record.name = raw.name;
    if (raw.version_id && !raw.version_id->empty()) {
        record.version_id = raw.version_id;
    }
    record.tier = access_tier_from_string(raw.access_tier).value_or(access_tier::unknown);
    record.last_modified_raw = raw.last_modified;
    record.last_modified = parse_timestamp(raw.last_modified);
    if (!raw.last_access_time.empty()) {
        record.last_accessed = parse_timestamp(raw.last_access_time);
    }

    std::uint64_t length = 0;
    const auto* first = raw.content_length.data();
    const auto* last = first + raw.content_length.size();
    auto [ptr, ec] = std::from_chars(first, last, length);
    record.content_length = (ec == std::errc{} && ptr == last) ? length : 0;

    record.rehydration = parse_rehydration(raw, record.tier);
    record.etag = raw.etag;
    record.tags = raw.tags;
    return record;
}

blob_enumerator::blob_enumerator(std::shared_ptr<provider::blob_provider> provider,
                                 std::shared_ptr<di::ILogger> logger)
    : provider_(std::move(provider)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

auto blob_enumerator::list_blobs(const std::string& container, access_tier tier)
    -> Result<std::vector<blob_record>> {
    const auto predicate = make_tier_predicate(tier);
    logger_->info_fmt("Enumerating container '{}' ({})", container, predicate);

    auto listing = provider_->list_objects(container, predicate);
    if (listing.is_err()) {
        return blobtier_error<std::vector<blob_record>>(
            error_codes::enumeration_error,
            "Listing container '" + container + "' failed: " + listing.error().message,
            kModule);
    }

    std::vector<blob_record> records;
    records.reserve(listing.value().size());
    for (const auto& raw : listing.value()) {
        auto record = make_blob_record(container, raw);
        logger_->debug_fmt("Discovered {} tier={} last_modified='{}' length={}",
                           record.display_name(), to_string(record.tier),
                           record.last_modified_raw, record.content_length);
        records.push_back(std::move(record));
    }

    logger_->info_fmt("Discovered {} objects in '{}'", records.size(), container);
    return records;
}

}  // namespace blobtier::orchestrator
