/**
 * @file migration_executor.hpp
 * @brief Per-object tier transitions with partial-failure tolerance
 */

#pragma once

#include <blobtier/core/blob_types.hpp>
#include <blobtier/core/result.hpp>
#include <blobtier/di/ilogger.hpp>
#include <blobtier/integration/thread_pool_interface.hpp>
#include <blobtier/provider/blob_provider.hpp>

#include <kcenon/thread/core/cancellation_token.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace blobtier::orchestrator {

/**
 * @brief Progress report issued after each object
 */
struct migration_progress {
    /// Objects finished so far (1-based)
    std::size_t completed{0};

    /// Size of the candidate set
    std::size_t total{0};

    /// Object just finished
    const blob_record* record{nullptr};

    bool succeeded{false};
};

using progress_callback = std::function<void(const migration_progress&)>;

/**
 * @class migration_executor
 * @brief Issues one set_tier per candidate and tracks the outcome
 *
 * One object's failure never stops the batch. The cancellation token is
 * checked before each object; once it is cancelled the remaining objects
 * are reported as not attempted.
 *
 * With a thread pool and max_parallel > 1, objects are dispatched in
 * windows of max_parallel and the results are reassembled in enumeration
 * order, so the outcome is indistinguishable from a sequential run.
 *
 * @example
 * @code
 * migration_executor executor(provider, logger);
 * executor.set_progress_callback([](const migration_progress& p) {
 *     std::cout << p.completed << " / " << p.total << "\n";
 * });
 * auto outcome = executor.migrate(candidates, request, token);
 * @endcode
 */
class migration_executor {
public:
    /**
     * @brief Sequential executor
     */
    explicit migration_executor(std::shared_ptr<provider::blob_provider> provider,
                                std::shared_ptr<di::ILogger> logger = nullptr);

    /**
     * @brief Executor with bounded fan-out
     *
     * @param pool Pool the tier changes are submitted to
     * @param max_parallel Objects in flight at once (1 means sequential)
     */
    migration_executor(std::shared_ptr<provider::blob_provider> provider,
                       std::shared_ptr<di::ILogger> logger,
                       std::shared_ptr<integration::thread_pool_interface> pool,
                       std::size_t max_parallel);

    void set_progress_callback(progress_callback callback);

    /**
     * @brief Migrate every record to request.target_tier
     *
     * The rehydration priority is sent only for records leaving Archive.
     */
    [[nodiscard]] auto migrate(const std::vector<blob_record>& records,
                               const migration_request& request,
                               const kcenon::thread::cancellation_token& token)
        -> migration_outcome;

private:
    [[nodiscard]] auto migrate_one(const blob_record& record,
                                   const migration_request& request) -> VoidResult;

    void record_result(const blob_record& record,
                       const VoidResult& result,
                       migration_outcome& outcome);

    void migrate_sequential(const std::vector<blob_record>& records,
                            const migration_request& request,
                            const kcenon::thread::cancellation_token& token,
                            migration_outcome& outcome);

    void migrate_parallel(const std::vector<blob_record>& records,
                          const migration_request& request,
                          const kcenon::thread::cancellation_token& token,
                          migration_outcome& outcome);

    std::shared_ptr<provider::blob_provider> provider_;
    std::shared_ptr<di::ILogger> logger_;
    std::shared_ptr<integration::thread_pool_interface> pool_;
    std::size_t max_parallel_{1};
    progress_callback progress_;
    std::size_t total_{0};
};

}  // namespace blobtier::orchestrator
