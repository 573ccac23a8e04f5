/**
 * @file run_journal.hpp
 * @brief SQLite journal of migration runs and per-object outcomes
 *
 * The journal complements the CSV audit artifacts with a queryable history:
 * one row per run (context, counts, final status, artifact paths) and one
 * row per attempted or skipped object.
 *
 * Schema (version 1):
 * - runs(run_id, started_at, finished_at, account, tenant, subscription,
 *        container, source_tier, target_tier, window_start, window_end,
 *        status, fatal_kind, phase, discovered, candidates, migrated, failed,
 *        not_attempted, discovered_artifact, migrated_artifact,
 *        failed_artifact, error_message)
 * - object_outcomes(id, run_id, container, name, version_id, from_tier,
 *        to_tier, outcome, error_code, error_message, recorded_at)
 */

#pragma once

#include <blobtier/core/blob_types.hpp>
#include <blobtier/core/result.hpp>
#include <blobtier/core/run_context.hpp>
#include <blobtier/core/run_outcome.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;

namespace blobtier::storage {

/**
 * @brief One row of the runs table
 */
struct journal_run {
    std::int64_t run_id{0};
    std::string started_at;
    std::string finished_at;
    std::string account;
    std::string container;
    std::string source_tier;
    std::string target_tier;

    /// Empty while the run is in progress
    std::string status;
    std::string fatal_kind;
    std::string phase;

    std::size_t discovered{0};
    std::size_t candidates{0};
    std::size_t migrated{0};
    std::size_t failed{0};
    std::size_t not_attempted{0};

    std::string discovered_artifact;
    std::string migrated_artifact;
    std::string failed_artifact;
    std::string error_message;
};

/**
 * @class run_journal
 * @brief SQLite-backed run history
 *
 * Thread Safety: NOT thread-safe. The runner uses it from one thread.
 *
 * @example
 * @code
 * auto journal = run_journal::open("blobtier.db");
 * if (journal.is_ok()) {
 *     auto run_id = journal.value()->begin_run(context);
 * }
 * @endcode
 */
class run_journal {
public:
    /// Schema version written to PRAGMA user_version
    static constexpr int schema_version = 1;

    /**
     * @brief Open or create a journal
     * @param db_path Database file, or ":memory:"
     * @return The journal, or journal_open_error
     */
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::unique_ptr<run_journal>>;

    ~run_journal();

    run_journal(const run_journal&) = delete;
    auto operator=(const run_journal&) -> run_journal& = delete;
    run_journal(run_journal&&) = delete;
    auto operator=(run_journal&&) -> run_journal& = delete;

    /**
     * @brief Insert a run row for @p context
     * @return The new run id
     */
    [[nodiscard]] auto begin_run(const run_context& context) -> Result<std::int64_t>;

    /**
     * @brief Record every object of @p outcome in one transaction
     */
    [[nodiscard]] auto record_outcomes(std::int64_t run_id,
                                       const migration_outcome& outcome,
                                       access_tier target_tier) -> VoidResult;

    /**
     * @brief Store the final status, counts and artifact paths
     */
    [[nodiscard]] auto finish_run(std::int64_t run_id, const run_outcome& outcome)
        -> VoidResult;

    [[nodiscard]] auto find_run(std::int64_t run_id) const
        -> Result<std::optional<journal_run>>;

    /**
     * @brief Number of object rows of a run with the given outcome
     * @param outcome "succeeded", "failed" or "not_attempted"
     */
    [[nodiscard]] auto count_outcomes(std::int64_t run_id, std::string_view outcome) const
        -> Result<std::size_t>;

    [[nodiscard]] auto path() const noexcept -> const std::string& { return path_; }

private:
    run_journal(sqlite3* db, std::string path);

    [[nodiscard]] auto apply_schema() -> VoidResult;

    [[nodiscard]] auto exec(const char* sql) -> VoidResult;

    sqlite3* db_{nullptr};
    std::string path_;
};

}  // namespace blobtier::storage
