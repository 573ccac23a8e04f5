/**
 * @file blob_types.hpp
 * @brief Core types for blob tier migration
 *
 * This file defines the access tiers, rehydration state, the immutable
 * blob_record snapshot produced by enumeration, and the filter and migration
 * request types consumed by the orchestrator.
 */

#pragma once

#include <blobtier/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blobtier {

/**
 * @brief Blob access tier
 *
 * Mirrors the storage provider's access tiers. Each tier trades access
 * latency against storage cost:
 * - Hot: frequently accessed, highest storage cost
 * - Cool: infrequently accessed, stored for at least 30 days
 * - Cold: rarely accessed, stored for at least 90 days
 * - Archive: offline, requires rehydration before reading
 */
enum class access_tier {
    hot,
    cool,
    cold,
    archive,

    /// Tier reported by the provider but not recognised
    unknown
};

/**
 * @brief Convert access_tier to its provider spelling
 * @param tier The access tier
 * @return "Hot", "Cool", "Cold", "Archive" or "Unknown"
 */
[[nodiscard]] constexpr auto to_string(access_tier tier) noexcept
    -> std::string_view {
    switch (tier) {
        case access_tier::hot:
            return "Hot";
        case access_tier::cool:
            return "Cool";
        case access_tier::cold:
            return "Cold";
        case access_tier::archive:
            return "Archive";
        case access_tier::unknown:
            return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Parse access_tier from string (case-insensitive)
 * @param str Tier name such as "Archive" or "hot"
 * @return Parsed tier, or std::nullopt if the name is not a known tier
 */
[[nodiscard]] auto access_tier_from_string(std::string_view str)
    -> std::optional<access_tier>;

/**
 * @brief Provider-side rehydration state of an object
 */
enum class rehydration_status {
    none,
    pending,
    complete
};

[[nodiscard]] constexpr auto to_string(rehydration_status status) noexcept
    -> std::string_view {
    switch (status) {
        case rehydration_status::none:
            return "None";
        case rehydration_status::pending:
            return "Pending";
        case rehydration_status::complete:
            return "Complete";
    }
    return "None";
}

/**
 * @brief Requested urgency of a rehydration out of the Archive tier
 */
enum class rehydrate_priority {
    standard,
    high
};

[[nodiscard]] constexpr auto to_string(rehydrate_priority priority) noexcept
    -> std::string_view {
    switch (priority) {
        case rehydrate_priority::standard:
            return "Standard";
        case rehydrate_priority::high:
            return "High";
    }
    return "Standard";
}

/**
 * @brief Parse rehydrate_priority from string (case-insensitive)
 */
[[nodiscard]] auto rehydrate_priority_from_string(std::string_view str)
    -> std::optional<rehydrate_priority>;

/**
 * @brief Immutable snapshot of one object captured at enumeration time
 *
 * Instances are created only by the blob enumerator from provider
 * responses. The snapshot does not follow live provider state.
 */
struct blob_record {
    /// Container that holds the object
    std::string container;

    /// Object name (path within the container)
    std::string name;

    /// Version identifier when versioning is enabled on the account
    std::optional<std::string> version_id;

    /// Access tier reported by the provider
    access_tier tier{access_tier::unknown};

    /// Last modification time, authoritative for window filtering.
    /// nullopt when the provider value was missing or unparseable.
    std::optional<std::chrono::system_clock::time_point> last_modified;

    /// Provider text of the last modification time, kept for the audit trail
    std::string last_modified_raw;

    /// Last access time (only when access tracking is enabled)
    std::optional<std::chrono::system_clock::time_point> last_accessed;

    /// Object size in bytes
    std::uint64_t content_length{0};

    /// Rehydration state (pending while an Archive object is being moved)
    rehydration_status rehydration{rehydration_status::none};

    /// Opaque concurrency token
    std::string etag;

    /// Free-form index tags
    std::map<std::string, std::string> tags;

    /**
     * @brief Identity string used in logs and progress output
     * @return "container/name" with "@version" appended when versioned
     */
    [[nodiscard]] auto display_name() const -> std::string;
};

/**
 * @brief Criteria that select the candidate set
 *
 * The window is inclusive at both ends. start_time <= end_time is enforced
 * when the run context is built.
 */
struct tier_filter_criteria {
    /// Tier the objects must currently be in
    access_tier tier{access_tier::archive};

    /// Earliest accepted last_modified (inclusive)
    std::chrono::system_clock::time_point start_time;

    /// Latest accepted last_modified (inclusive)
    std::chrono::system_clock::time_point end_time;
};

/**
 * @brief Requested tier transition
 */
struct migration_request {
    /// Tier to move the objects into
    access_tier target_tier{access_tier::hot};

    /// Rehydration priority; only sent for objects leaving Archive
    rehydrate_priority priority{rehydrate_priority::standard};
};

/**
 * @brief A record whose tier change failed, with the provider error
 */
struct failed_migration {
    blob_record record;
    error_info error;
};

/**
 * @brief Result of executing a migration batch
 *
 * All sequences preserve enumeration order.
 */
struct migration_outcome {
    /// Objects whose tier change was accepted by the provider
    std::vector<blob_record> succeeded;

    /// Objects whose tier change failed
    std::vector<failed_migration> failed;

    /// Objects skipped because the run was cancelled
    std::vector<blob_record> not_attempted;

    /// Number of tier-change requests issued
    std::size_t attempted{0};

    [[nodiscard]] auto has_failures() const noexcept -> bool {
        return !failed.empty();
    }

    [[nodiscard]] auto was_cancelled() const noexcept -> bool {
        return !not_attempted.empty();
    }
};

}  // namespace blobtier
