/**
 * @file run_context.hpp
 * @brief Immutable per-run configuration
 *
 * A run_context is built once before the session guard runs and is passed
 * by const reference to every component. Nothing mutates it afterwards and
 * it is never persisted.
 */

#pragma once

#include <blobtier/core/blob_types.hpp>
#include <blobtier/core/result.hpp>

#include <filesystem>
#include <string>

namespace blobtier {

/**
 * @brief Everything a run needs to know about its target and intent
 */
struct run_context {
    /// Storage account name
    std::string account;

    /// Directory (tenant) the session must be scoped to
    std::string tenant;

    /// Subscription the session must be scoped to
    std::string subscription;

    /// Container to migrate objects in
    std::string container;

    /// Tier and modification-time window that select the candidates
    tier_filter_criteria criteria;

    /// Requested transition for every candidate
    migration_request request;

    /// Directory that receives the audit artifacts
    std::filesystem::path audit_directory{"audit"};

    /// File name prefix of the audit artifacts
    std::string audit_prefix{"blobtier"};
};

/**
 * @brief Validate inputs and build a run_context
 *
 * Validation rules:
 * - account, tenant, subscription and container are non-empty
 * - criteria.start_time <= criteria.end_time
 * - neither the source nor the target tier is unknown
 * - the source tier differs from the target tier
 *
 * @return The validated context, or an invalid_configuration error
 */
[[nodiscard]] auto make_run_context(run_context draft) -> Result<run_context>;

}  // namespace blobtier
