/**
 * @file thread_pool_adapter.cpp
 * @brief Implementation of thread_pool_adapter
 */

#include <blobtier/integration/thread_pool_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/interfaces/thread_context.h>

#include <stdexcept>
#include <vector>

namespace blobtier::integration {

// =============================================================================
// Constructors & Destructor
// =============================================================================

thread_pool_adapter::thread_pool_adapter(const thread_pool_config& config)
    : config_(config) {
    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }

    kcenon::thread::thread_context context;
    pool_ = std::make_shared<kcenon::thread::thread_pool>(config_.pool_name, context);
}

thread_pool_adapter::~thread_pool_adapter() {
    shutdown(true);
}

// =============================================================================
// Lifecycle Management
// =============================================================================

auto thread_pool_adapter::start() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_ && pool_ && pool_->is_running()) {
        return true;
    }

    if (!pool_) {
        kcenon::thread::thread_context context;
        pool_ = std::make_shared<kcenon::thread::thread_pool>(config_.pool_name, context);
    }

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(config_.worker_count);

    kcenon::thread::thread_context context;
    for (std::size_t i = 0; i < config_.worker_count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>(false, context));
    }

    auto enqueue_result = pool_->enqueue_batch(std::move(workers));
    if (enqueue_result.is_err()) {
        return false;
    }

    auto start_result = pool_->start();
    if (start_result.is_err()) {
        return false;
    }

    initialized_ = true;
    return true;
}

auto thread_pool_adapter::is_running() const noexcept -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ && pool_->is_running();
}

void thread_pool_adapter::shutdown(bool wait_for_completion) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (pool_ && initialized_) {
        pool_->stop(!wait_for_completion);
    }

    initialized_ = false;
}

// =============================================================================
// Task Submission
// =============================================================================

auto thread_pool_adapter::submit(std::function<void()> task)
    -> std::future<void> {
    if (!is_running()) {
        if (!start()) {
            throw std::runtime_error("Failed to start migration thread pool");
        }
    }

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    const bool submitted = pool_->submit_task(
        [task = std::move(task), promise]() mutable {
            try {
                task();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
    if (!submitted) {
        throw std::runtime_error("Failed to submit task to migration thread pool");
    }

    return future;
}

// =============================================================================
// Statistics
// =============================================================================

auto thread_pool_adapter::get_thread_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_ ? config_.worker_count : 0;
}

auto thread_pool_adapter::get_pending_task_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ ? pool_->get_pending_task_count() : 0;
}

auto thread_pool_adapter::get_config() const noexcept -> const thread_pool_config& {
    return config_;
}

}  // namespace blobtier::integration
