/**
 * @file run_outcome.hpp
 * @brief Terminal state of a migration run
 *
 * Callers branch on run_status instead of catching exceptions. "No
 * candidates" and "operator declined" are normal terminal states; only
 * fatal carries a fatal_kind.
 */

#pragma once

#include <blobtier/core/result.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace blobtier {

/**
 * @brief How a run ended
 */
enum class run_status {
    /// Every candidate was migrated
    completed,

    /// The filter produced an empty candidate set
    no_work,

    /// The operator did not confirm; nothing was mutated
    declined,

    /// All candidates were attempted, at least one failed
    completed_with_errors,

    /// Cancellation stopped the batch before every candidate was attempted
    interrupted,

    /// An error compromised the validity of the whole run
    fatal
};

/**
 * @brief Kind of run-level failure
 */
enum class fatal_kind {
    session_scope,
    enumeration,
    audit_write
};

/**
 * @brief Pipeline stage a run was in when it ended
 */
enum class run_phase {
    session,
    enumeration,
    filtering,
    discovery_audit,
    confirmation,
    migration,
    migration_audit,
    finished
};

[[nodiscard]] constexpr auto to_string(run_status status) noexcept
    -> std::string_view {
    switch (status) {
        case run_status::completed:
            return "completed";
        case run_status::no_work:
            return "no_work";
        case run_status::declined:
            return "declined";
        case run_status::completed_with_errors:
            return "completed_with_errors";
        case run_status::interrupted:
            return "interrupted";
        case run_status::fatal:
            return "fatal";
    }
    return "fatal";
}

[[nodiscard]] constexpr auto to_string(fatal_kind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case fatal_kind::session_scope:
            return "SessionScopeError";
        case fatal_kind::enumeration:
            return "EnumerationError";
        case fatal_kind::audit_write:
            return "AuditWriteError";
    }
    return "UnknownError";
}

[[nodiscard]] constexpr auto to_string(run_phase phase) noexcept
    -> std::string_view {
    switch (phase) {
        case run_phase::session:
            return "session";
        case run_phase::enumeration:
            return "enumeration";
        case run_phase::filtering:
            return "filtering";
        case run_phase::discovery_audit:
            return "discovery_audit";
        case run_phase::confirmation:
            return "confirmation";
        case run_phase::migration:
            return "migration";
        case run_phase::migration_audit:
            return "migration_audit";
        case run_phase::finished:
            return "finished";
    }
    return "finished";
}

/**
 * @brief Process exit codes
 */
namespace exit_codes {
    constexpr int success = 0;
    constexpr int fatal = 1;
    constexpr int usage_error = 2;
    constexpr int completed_with_errors = 3;
    constexpr int interrupted = 4;
}  // namespace exit_codes

/**
 * @brief Summary of a finished run
 */
struct run_outcome {
    run_status status{run_status::completed};

    /// Set only when status == fatal
    std::optional<fatal_kind> kind;

    /// Error that caused a fatal outcome
    std::optional<error_info> error;

    /// Stage the run ended in
    run_phase phase{run_phase::finished};

    std::size_t discovered_count{0};
    std::size_t candidate_count{0};
    std::size_t migrated_count{0};
    std::size_t failed_count{0};
    std::size_t not_attempted_count{0};

    /// Audit artifacts written during the run
    std::optional<std::filesystem::path> discovered_artifact;
    std::optional<std::filesystem::path> migrated_artifact;
    std::optional<std::filesystem::path> failed_artifact;

    /**
     * @brief Map the status to a process exit code
     */
    [[nodiscard]] auto exit_code() const noexcept -> int {
        switch (status) {
            case run_status::completed:
            case run_status::no_work:
            case run_status::declined:
                return exit_codes::success;
            case run_status::completed_with_errors:
                return exit_codes::completed_with_errors;
            case run_status::interrupted:
                return exit_codes::interrupted;
            case run_status::fatal:
                return exit_codes::fatal;
        }
        return exit_codes::fatal;
    }
};

}  // namespace blobtier
