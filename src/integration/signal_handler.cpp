/**
 * @file signal_handler.cpp
 * @brief Implementation of the cancellation signal handler
 */

#include <blobtier/integration/signal_handler.hpp>

#include <utility>

namespace blobtier::integration {

// ============================================================================
// Static Member Definitions
// ============================================================================

std::atomic<bool> signal_handler::signal_pending_{false};
std::atomic<bool> signal_handler::cancel_requested_{false};
std::atomic<int> signal_handler::last_signal_{0};
std::atomic<bool> signal_handler::callback_invoked_{false};
signal_handler::cancel_callback signal_handler::callback_;
std::mutex signal_handler::mutex_;
std::jthread signal_handler::watcher_;

static_assert(std::atomic<bool>::is_always_lock_free,
              "signal handler state must be lock-free");
static_assert(std::atomic<int>::is_always_lock_free,
              "signal handler state must be lock-free");

// ============================================================================
// Signal Handler Implementation
// ============================================================================

void signal_handler::install(cancel_callback callback) {
    stop_watcher();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }
    signal_pending_.store(false, std::memory_order_release);
    cancel_requested_.store(false, std::memory_order_release);
    callback_invoked_.store(false, std::memory_order_release);
    last_signal_.store(0, std::memory_order_release);

    std::signal(SIGINT, handler);
    std::signal(SIGTERM, handler);

    watcher_ = std::jthread([](std::stop_token stop) {
        while (!stop.stop_requested()) {
            dispatch_pending();
            std::this_thread::sleep_for(watch_interval);
        }
    });
}

auto signal_handler::cancel_requested() noexcept -> bool {
    return cancel_requested_.load(std::memory_order_acquire) ||
           signal_pending_.load(std::memory_order_acquire);
}

auto signal_handler::last_signal() noexcept -> int {
    return last_signal_.load(std::memory_order_acquire);
}

auto signal_handler::dispatch_pending() -> bool {
    if (!signal_pending_.exchange(false, std::memory_order_acq_rel)) {
        return false;
    }
    request_cancel();
    return true;
}

void signal_handler::request_cancel() {
    bool expected = false;
    if (!cancel_requested_.compare_exchange_strong(expected, true,
            std::memory_order_acq_rel, std::memory_order_relaxed)) {
        return;
    }

    cancel_callback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = callback_;
    }
    // Invoke callback only once
    if (callback && !callback_invoked_.exchange(true, std::memory_order_acq_rel)) {
        callback();
    }
}

void signal_handler::reset() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);

    stop_watcher();

    std::lock_guard<std::mutex> lock(mutex_);
    signal_pending_.store(false, std::memory_order_release);
    cancel_requested_.store(false, std::memory_order_release);
    callback_invoked_.store(false, std::memory_order_release);
    last_signal_.store(0, std::memory_order_release);
    callback_ = nullptr;
}

void signal_handler::stop_watcher() {
    if (watcher_.joinable()) {
        watcher_.request_stop();
        watcher_.join();
    }
}

void signal_handler::handler(int signal) {
    // Async-signal context: lock-free atomic stores and std::signal only.
    // A second signal terminates the process.
    std::signal(signal, SIG_DFL);
    int expected = 0;
    last_signal_.compare_exchange_strong(expected, signal, std::memory_order_acq_rel);
    signal_pending_.store(true, std::memory_order_release);
}

// ============================================================================
// Scoped Signal Handler Implementation
// ============================================================================

scoped_signal_handler::scoped_signal_handler(signal_handler::cancel_callback callback) {
    signal_handler::install(std::move(callback));
}

scoped_signal_handler::~scoped_signal_handler() {
    signal_handler::reset();
}

auto scoped_signal_handler::cancel_requested() const noexcept -> bool {
    return signal_handler::cancel_requested();
}

}  // namespace blobtier::integration
