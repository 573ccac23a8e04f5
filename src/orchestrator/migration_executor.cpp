/**
 * @file migration_executor.cpp
 * @brief Implementation of the tier migration executor
 */

#include <blobtier/orchestrator/migration_executor.hpp>

#include <algorithm>
#include <exception>
#include <future>
#include <optional>
#include <utility>

namespace blobtier::orchestrator {

namespace {

constexpr const char* kModule = "migration_executor";

auto object_error(const std::string& message) -> VoidResult {
    return blobtier_void_error(error_codes::per_object_migration_error, message, kModule);
}

}  // namespace

migration_executor::migration_executor(std::shared_ptr<provider::blob_provider> provider,
                                       std::shared_ptr<di::ILogger> logger)
    : provider_(std::move(provider)),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

migration_executor::migration_executor(
    std::shared_ptr<provider::blob_provider> provider,
    std::shared_ptr<di::ILogger> logger,
    std::shared_ptr<integration::thread_pool_interface> pool,
    std::size_t max_parallel)
    : provider_(std::move(provider)),
      logger_(logger ? std::move(logger) : di::null_logger()),
      pool_(std::move(pool)),
      max_parallel_(std::max<std::size_t>(max_parallel, 1)) {}

void migration_executor::set_progress_callback(progress_callback callback) {
    progress_ = std::move(callback);
}

auto migration_executor::migrate(const std::vector<blob_record>& records,
                                 const migration_request& request,
                                 const kcenon::thread::cancellation_token& token)
    -> migration_outcome {
    migration_outcome outcome;
    total_ = records.size();

    logger_->info_fmt("Migrating {} objects to {}", records.size(),
                      to_string(request.target_tier));

    if (pool_ && max_parallel_ > 1) {
        migrate_parallel(records, request, token, outcome);
    } else {
        migrate_sequential(records, request, token, outcome);
    }

    if (outcome.was_cancelled()) {
        logger_->warn_fmt("Migration cancelled: {} objects not attempted",
                          outcome.not_attempted.size());
    }
    logger_->info_fmt("Migration finished: {} succeeded, {} failed, {} not attempted",
                      outcome.succeeded.size(), outcome.failed.size(),
                      outcome.not_attempted.size());
    return outcome;
}

auto migration_executor::migrate_one(const blob_record& record,
                                     const migration_request& request) -> VoidResult {
    std::optional<rehydrate_priority> priority;
    if (record.tier == access_tier::archive) {
        priority = request.priority;
    }

    auto result = provider_->set_tier(record.container, record.name, record.version_id,
                                      request.target_tier, priority);
    if (result.is_err()) {
        return object_error(result.error().message + " (provider code " +
                            std::to_string(result.error().code) + ")");
    }
    return ok();
}

void migration_executor::record_result(const blob_record& record,
                                       const VoidResult& result,
                                       migration_outcome& outcome) {
    ++outcome.attempted;
    const bool succeeded = result.is_ok();

    if (succeeded) {
        outcome.succeeded.push_back(record);
        logger_->debug_fmt("Tier change of {} (from {}) accepted", record.display_name(),
                           to_string(record.tier));
    } else {
        outcome.failed.push_back(failed_migration{record, result.error()});
        logger_->error_fmt("Tier change of {} failed: {}", record.display_name(),
                           result.error().message);
    }

    logger_->info_fmt("Progress {} / {}", outcome.attempted, total_);
    if (progress_) {
        progress_(migration_progress{outcome.attempted, total_, &record, succeeded});
    }
}

void migration_executor::migrate_sequential(const std::vector<blob_record>& records,
                                            const migration_request& request,
                                            const kcenon::thread::cancellation_token& token,
                                            migration_outcome& outcome) {
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (token.is_cancelled()) {
            outcome.not_attempted.assign(records.begin() + static_cast<std::ptrdiff_t>(i),
                                         records.end());
            return;
        }
        record_result(records[i], migrate_one(records[i], request), outcome);
    }
}

void migration_executor::migrate_parallel(const std::vector<blob_record>& records,
                                          const migration_request& request,
                                          const kcenon::thread::cancellation_token& token,
                                          migration_outcome& outcome) {
    std::size_t next = 0;
    while (next < records.size()) {
        const std::size_t window_end = std::min(next + max_parallel_, records.size());

        // Slots are sized once so workers can write without reallocation
        std::vector<std::optional<VoidResult>> results(window_end - next);
        std::vector<std::pair<std::size_t, std::future<void>>> in_flight;

        std::size_t dispatched_end = next;
        bool cancelled = false;
        for (; dispatched_end < window_end; ++dispatched_end) {
            if (token.is_cancelled()) {
                cancelled = true;
                break;
            }

            const std::size_t index = dispatched_end;
            auto& slot = results[index - next];
            try {
                in_flight.emplace_back(index, pool_->submit([this, &records, &request,
                                                             &slot, index]() {
                    slot = migrate_one(records[index], request);
                }));
            } catch (const std::exception& ex) {
                slot = object_error(std::string("Cannot dispatch tier change: ") + ex.what());
            }
        }

        for (auto& [index, future] : in_flight) {
            try {
                future.get();
            } catch (const std::exception& ex) {
                results[index - next] =
                    object_error(std::string("Tier change raised: ") + ex.what());
            }
        }

        for (std::size_t i = next; i < dispatched_end; ++i) {
            const auto& slot = results[i - next];
            record_result(records[i],
                          slot ? *slot : object_error("Tier change produced no result"),
                          outcome);
        }

        if (cancelled) {
            outcome.not_attempted.assign(
                records.begin() + static_cast<std::ptrdiff_t>(dispatched_end),
                records.end());
            return;
        }
        next = window_end;
    }
}

}  // namespace blobtier::orchestrator
