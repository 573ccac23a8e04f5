/**
 * @file tier_migration_runner.hpp
 * @brief Drives one tier migration run from session check to final audit
 *
 * Pipeline:
 *   session_guard -> blob_enumerator -> tier_filter -> audit (discovered)
 *   -> confirmation_gate -> migration_executor -> audit (migrated, failed)
 *
 * Every terminal state is reported as a run_outcome value.
 */

#pragma once

#include <blobtier/core/run_context.hpp>
#include <blobtier/core/run_outcome.hpp>
#include <blobtier/di/ilogger.hpp>
#include <blobtier/orchestrator/audit_recorder.hpp>
#include <blobtier/orchestrator/blob_enumerator.hpp>
#include <blobtier/orchestrator/confirmation_gate.hpp>
#include <blobtier/orchestrator/migration_executor.hpp>
#include <blobtier/orchestrator/session_guard.hpp>
#include <blobtier/orchestrator/tier_filter.hpp>
#include <blobtier/storage/run_journal.hpp>

#include <kcenon/thread/core/cancellation_token.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace blobtier::orchestrator {

/**
 * @brief Collaborators of a run
 *
 * Every member except journal is required.
 */
struct runner_components {
    std::shared_ptr<session_guard> guard;
    std::shared_ptr<blob_enumerator> enumerator;
    std::shared_ptr<tier_filter> filter;
    std::shared_ptr<audit_recorder> recorder;
    std::shared_ptr<confirmation_gate> gate;
    std::shared_ptr<migration_executor> executor;

    /// Optional run history; failures are logged and never change the outcome
    std::shared_ptr<storage::run_journal> journal;
};

/**
 * @class tier_migration_runner
 * @brief Orchestrates a single run
 *
 * Policies:
 * - an empty candidate set ends with no_work before any prompt
 * - the discovered artifact is best effort (bounded retry, then continue)
 * - the migrated and failed artifacts are mandatory once a mutation happened
 * - a declined confirmation ends with declined and no mutation
 * - a cancelled token before migration ends with interrupted
 *
 * @example
 * @code
 * tier_migration_runner runner(components, logger);
 * auto token = kcenon::thread::cancellation_token::create();
 * auto outcome = runner.run(context, token);
 * return outcome.exit_code();
 * @endcode
 */
class tier_migration_runner {
public:
    /// Attempts per audit artifact before giving up
    static constexpr std::size_t audit_attempts = 3;

    explicit tier_migration_runner(runner_components components,
                                   std::shared_ptr<di::ILogger> logger = nullptr);

    [[nodiscard]] auto run(const run_context& context,
                           const kcenon::thread::cancellation_token& token)
        -> run_outcome;

private:
    [[nodiscard]] auto fatal(run_outcome outcome, fatal_kind kind,
                             run_phase phase, const error_info& error) -> run_outcome;

    [[nodiscard]] auto finish(run_outcome outcome, run_status status,
                              run_phase phase) -> run_outcome;

    /**
     * @brief Write an artifact, retrying up to audit_attempts times
     */
    template <typename Writer>
    [[nodiscard]] auto write_with_retry(audit_phase phase, Writer&& writer)
        -> Result<audit_batch>;

    void journal_begin(const run_context& context);

    void journal_finish(const run_outcome& outcome);

    void trail_migration(const migration_outcome& outcome, access_tier target);

    runner_components components_;
    std::shared_ptr<di::ILogger> logger_;
    std::optional<std::int64_t> journal_run_id_;
};

}  // namespace blobtier::orchestrator
