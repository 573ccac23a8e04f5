/**
 * @file thread_pool_adapter.hpp
 * @brief Concrete implementation of thread_pool_interface using kcenon::thread
 */

#pragma once

#include <blobtier/integration/thread_pool_interface.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace blobtier::integration {

/**
 * @struct thread_pool_config
 * @brief Configuration options for the migration worker pool
 */
struct thread_pool_config {
    /// Number of worker threads started with the pool
    std::size_t worker_count = 4;

    /// Thread pool name for logging
    std::string pool_name = "blobtier_migration_pool";
};

/**
 * @class thread_pool_adapter
 * @brief Adapts kcenon::thread::thread_pool to thread_pool_interface
 *
 * Thread Safety: All public methods are thread-safe.
 *
 * @example
 * @code
 * thread_pool_config config;
 * config.worker_count = 8;
 *
 * auto pool = std::make_shared<thread_pool_adapter>(config);
 * pool->start();
 * @endcode
 */
class thread_pool_adapter final : public thread_pool_interface {
public:
    /**
     * @brief Construct adapter with configuration
     *
     * The pool is not started until start() is called.
     */
    explicit thread_pool_adapter(const thread_pool_config& config);

    /**
     * @brief Destructor
     *
     * Shuts down the thread pool if it's still running.
     */
    ~thread_pool_adapter() override;

    thread_pool_adapter(const thread_pool_adapter&) = delete;
    thread_pool_adapter& operator=(const thread_pool_adapter&) = delete;
    thread_pool_adapter(thread_pool_adapter&&) = delete;
    thread_pool_adapter& operator=(thread_pool_adapter&&) = delete;

    // =========================================================================
    // Lifecycle Management (from thread_pool_interface)
    // =========================================================================

    [[nodiscard]] auto start() -> bool override;
    [[nodiscard]] auto is_running() const noexcept -> bool override;
    void shutdown(bool wait_for_completion = true) override;

    // =========================================================================
    // Task Submission (from thread_pool_interface)
    // =========================================================================

    [[nodiscard]] auto submit(std::function<void()> task)
        -> std::future<void> override;

    // =========================================================================
    // Statistics (from thread_pool_interface)
    // =========================================================================

    [[nodiscard]] auto get_thread_count() const -> std::size_t override;
    [[nodiscard]] auto get_pending_task_count() const -> std::size_t override;

    [[nodiscard]] auto get_config() const noexcept -> const thread_pool_config&;

private:
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    thread_pool_config config_;
    mutable std::mutex mutex_;
    bool initialized_{false};
};

}  // namespace blobtier::integration
