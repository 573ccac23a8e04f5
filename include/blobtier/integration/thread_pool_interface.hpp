/**
 * @file thread_pool_interface.hpp
 * @brief Abstract interface for thread pool operations
 *
 * The migration executor receives a thread_pool_interface when bounded
 * fan-out is enabled. Tests inject a synchronous mock instead of a real
 * pool.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>

namespace blobtier::integration {

/**
 * @brief Abstract interface for thread pool operations
 *
 * Thread Safety:
 * - All methods must be thread-safe in concrete implementations
 * - Concurrent task submission is allowed
 *
 * @example
 * @code
 * auto pool = std::make_shared<thread_pool_adapter>(config);
 * migration_executor executor(provider, logger, pool, 8);
 *
 * // In tests
 * auto mock_pool = std::make_shared<mock_thread_pool>();
 * migration_executor executor(provider, logger, mock_pool, 4);
 * @endcode
 */
class thread_pool_interface {
public:
    virtual ~thread_pool_interface() = default;

    // =========================================================================
    // Lifecycle Management
    // =========================================================================

    /**
     * @brief Start the thread pool
     *
     * Safe to call multiple times; subsequent calls are no-ops if running.
     *
     * @return true if started successfully or already running
     */
    [[nodiscard]] virtual auto start() -> bool = 0;

    [[nodiscard]] virtual auto is_running() const noexcept -> bool = 0;

    /**
     * @brief Stop accepting tasks
     * @param wait_for_completion If true, waits for all pending tasks
     */
    virtual void shutdown(bool wait_for_completion = true) = 0;

    // =========================================================================
    // Task Submission
    // =========================================================================

    /**
     * @brief Submit a task for execution
     *
     * @param task The task to execute
     * @return Future that completes when the task finishes. An exception
     *         thrown by the task is rethrown from future::get().
     *
     * @throws std::runtime_error if the pool cannot be started
     */
    [[nodiscard]] virtual auto submit(std::function<void()> task)
        -> std::future<void> = 0;

    // =========================================================================
    // Statistics
    // =========================================================================

    [[nodiscard]] virtual auto get_thread_count() const -> std::size_t = 0;

    [[nodiscard]] virtual auto get_pending_task_count() const -> std::size_t = 0;

protected:
    thread_pool_interface() = default;

    thread_pool_interface(const thread_pool_interface&) = delete;
    thread_pool_interface& operator=(const thread_pool_interface&) = delete;

    thread_pool_interface(thread_pool_interface&&) = default;
    thread_pool_interface& operator=(thread_pool_interface&&) = default;
};

}  // namespace blobtier::integration
