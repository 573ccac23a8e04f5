/**
 * @file tier_migration_runner.cpp
 * @brief Implementation of the tier migration runner
 */

#include <blobtier/orchestrator/tier_migration_runner.hpp>

#include <blobtier/integration/logger_adapter.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace blobtier::orchestrator {

using integration::logger_adapter;

tier_migration_runner::tier_migration_runner(runner_components components,
                                             std::shared_ptr<di::ILogger> logger)
    : components_(std::move(components)),
      logger_(logger ? std::move(logger) : di::null_logger()) {
    if (!components_.guard || !components_.enumerator || !components_.filter ||
        !components_.recorder || !components_.gate || !components_.executor) {
        throw std::invalid_argument("tier_migration_runner requires every pipeline component");
    }
}

// =============================================================================
// Run
// =============================================================================

auto tier_migration_runner::run(const run_context& context,
                                const kcenon::thread::cancellation_token& token)
    -> run_outcome {
    run_outcome outcome;
    journal_run_id_.reset();

    const std::string source_tier{to_string(context.criteria.tier)};
    const std::string target_tier{to_string(context.request.target_tier)};

    logger_->info_fmt("Starting run: {}/{} {} -> {}", context.account, context.container,
                      source_tier, target_tier);
    logger_adapter::log_run_started(context.account, context.container, source_tier,
                                    target_tier);
    journal_begin(context);

    // Session
    auto session = components_.guard->ensure_session(context.tenant, context.subscription);
    if (session.is_err()) {
        return fatal(std::move(outcome), fatal_kind::session_scope, run_phase::session,
                     session.error());
    }

    // Enumeration
    auto listed = components_.enumerator->list_blobs(context.container, context.criteria.tier);
    if (listed.is_err()) {
        return fatal(std::move(outcome), fatal_kind::enumeration, run_phase::enumeration,
                     listed.error());
    }
    const auto& discovered = listed.value();
    outcome.discovered_count = discovered.size();

    // Filtering
    auto candidates = components_.filter->apply(discovered, context.criteria);
    outcome.candidate_count = candidates.size();
    logger_->info_fmt("{} of {} objects are candidates", candidates.size(), discovered.size());

    if (candidates.empty()) {
        logger_->info("No objects match the tier and window; nothing to do");
        return finish(std::move(outcome), run_status::no_work, run_phase::filtering);
    }

    // Discovery audit (best effort)
    auto discovered_batch = write_with_retry(audit_phase::discovered, [&]() {
        return components_.recorder->record(audit_phase::discovered, candidates);
    });
    if (discovered_batch.is_ok()) {
        outcome.discovered_artifact = discovered_batch.value().path;
    } else {
        logger_->warn_fmt("Continuing without a discovered artifact: {}",
                          discovered_batch.error().message);
    }

    // Confirmation
    if (token.is_cancelled()) {
        logger_->warn("Run cancelled before confirmation");
        outcome.not_attempted_count = candidates.size();
        return finish(std::move(outcome), run_status::interrupted, run_phase::confirmation);
    }

    const bool approved = components_.gate->require_confirmation(
        candidates, context, outcome.discovered_artifact, token);
    logger_adapter::log_confirmation(approved, candidates.size());

    if (token.is_cancelled()) {
        outcome.not_attempted_count = candidates.size();
        return finish(std::move(outcome), run_status::interrupted, run_phase::confirmation);
    }
    if (!approved) {
        logger_->info("Operator declined; no tier changes issued");
        return finish(std::move(outcome), run_status::declined, run_phase::confirmation);
    }

    // Migration
    auto migrated = components_.executor->migrate(candidates, context.request, token);
    outcome.migrated_count = migrated.succeeded.size();
    outcome.failed_count = migrated.failed.size();
    outcome.not_attempted_count = migrated.not_attempted.size();

    trail_migration(migrated, context.request.target_tier);

    if (components_.journal && journal_run_id_) {
        auto recorded = components_.journal->record_outcomes(*journal_run_id_, migrated,
                                                             context.request.target_tier);
        if (recorded.is_err()) {
            logger_->warn_fmt("Run journal: {}", recorded.error().message);
        }
    }

    // Migration audit (mandatory)
    auto migrated_batch = write_with_retry(audit_phase::migrated, [&]() {
        return components_.recorder->record(audit_phase::migrated, migrated.succeeded);
    });
    if (migrated_batch.is_err()) {
        return fatal(std::move(outcome), fatal_kind::audit_write, run_phase::migration_audit,
                     migrated_batch.error());
    }
    outcome.migrated_artifact = migrated_batch.value().path;

    if (migrated.has_failures()) {
        auto failed_batch = write_with_retry(audit_phase::failed, [&]() {
            return components_.recorder->record_failures(migrated.failed);
        });
        if (failed_batch.is_err()) {
            return fatal(std::move(outcome), fatal_kind::audit_write,
                         run_phase::migration_audit, failed_batch.error());
        }
        outcome.failed_artifact = failed_batch.value().path;
    }

    if (migrated.was_cancelled()) {
        return finish(std::move(outcome), run_status::interrupted, run_phase::migration);
    }
    if (migrated.has_failures()) {
        return finish(std::move(outcome), run_status::completed_with_errors,
                      run_phase::finished);
    }
    return finish(std::move(outcome), run_status::completed, run_phase::finished);
}

// =============================================================================
// Terminal states
// =============================================================================

auto tier_migration_runner::fatal(run_outcome outcome, fatal_kind kind,
                                  run_phase phase, const error_info& error) -> run_outcome {
    outcome.kind = kind;
    outcome.error = error;

    logger_->error_fmt("Run aborted: {} during {}: {}", to_string(kind), to_string(phase),
                       error.message);
    if (kind == fatal_kind::audit_write && outcome.migrated_count + outcome.failed_count > 0) {
        logger_->error_fmt("{} objects changed tier without a complete audit artifact in {}",
                           outcome.migrated_count, components_.recorder->config().directory.string());
    }
    return finish(std::move(outcome), run_status::fatal, phase);
}

auto tier_migration_runner::finish(run_outcome outcome, run_status status,
                                   run_phase phase) -> run_outcome {
    outcome.status = status;
    outcome.phase = phase;

    logger_->info_fmt("Run finished: {} (candidates {}, migrated {}, failed {}, "
                      "not attempted {})",
                      to_string(status), outcome.candidate_count, outcome.migrated_count,
                      outcome.failed_count, outcome.not_attempted_count);
    logger_adapter::log_run_finished(std::string{to_string(status)}, outcome.migrated_count,
                                     outcome.failed_count);
    journal_finish(outcome);
    return outcome;
}

// =============================================================================
// Helpers
// =============================================================================

template <typename Writer>
auto tier_migration_runner::write_with_retry(audit_phase phase, Writer&& writer)
    -> Result<audit_batch> {
    std::optional<error_info> last_error;
    for (std::size_t attempt = 1; attempt <= audit_attempts; ++attempt) {
        auto batch = writer();
        if (batch.is_ok()) {
            const auto& written = batch.value();
            logger_adapter::log_batch_recorded(std::string{to_string(phase)},
                                               written.record_count,
                                               written.path.string());
            return batch;
        }
        last_error = batch.error();
        logger_->warn_fmt("Writing {} artifact failed (attempt {}/{}): {}", to_string(phase),
                          attempt, audit_attempts, last_error->message);
    }
    return blobtier_error<audit_batch>(last_error->code, last_error->message,
                                       last_error->module);
}

void tier_migration_runner::journal_begin(const run_context& context) {
    if (!components_.journal) {
        return;
    }
    auto begun = components_.journal->begin_run(context);
    if (begun.is_err()) {
        logger_->warn_fmt("Run journal: {}", begun.error().message);
        return;
    }
    journal_run_id_ = begun.value();
    logger_->debug_fmt("Run journal entry {}", *journal_run_id_);
}

void tier_migration_runner::journal_finish(const run_outcome& outcome) {
    if (!components_.journal || !journal_run_id_) {
        return;
    }
    auto finished = components_.journal->finish_run(*journal_run_id_, outcome);
    if (finished.is_err()) {
        logger_->warn_fmt("Run journal: {}", finished.error().message);
    }
}

void tier_migration_runner::trail_migration(const migration_outcome& outcome,
                                            access_tier target) {
    const std::string to_tier{to_string(target)};
    for (const auto& record : outcome.succeeded) {
        logger_adapter::log_tier_changed(record.container, record.display_name(),
                                         std::string{to_string(record.tier)}, to_tier);
    }
    for (const auto& failure : outcome.failed) {
        logger_adapter::log_tier_change_failed(failure.record.container,
                                               failure.record.display_name(), to_tier,
                                               failure.error.message);
    }
}

}  // namespace blobtier::orchestrator
