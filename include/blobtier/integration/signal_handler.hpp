/**
 * @file signal_handler.hpp
 * @brief SIGINT/SIGTERM handling that cancels a running migration
 *
 * The first signal requests cancellation: the executor stops before the
 * next object and the run ends as interrupted. The default disposition is
 * restored at the same time, so a second signal terminates the process.
 *
 * The signal handler itself only stores lock-free atomics. The cancel
 * callback runs later on a watcher thread started by install(), never in
 * signal context.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <mutex>
#include <thread>

namespace blobtier::integration {

/**
 * @brief Process-wide cancellation signal handler
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * auto token = kcenon::thread::cancellation_token::create();
 * signal_handler::install([token]() mutable { token.cancel(); });
 * @endcode
 */
class signal_handler {
public:
    /// Invoked once, on the first cancellation request
    using cancel_callback = std::function<void()>;

    /// How often the watcher thread looks for a delivered signal
    static constexpr std::chrono::milliseconds watch_interval{50};

    /**
     * @brief Install handlers for SIGINT and SIGTERM and start the watcher
     */
    static void install(cancel_callback callback = nullptr);

    /**
     * @brief True once a signal arrived or request_cancel() was called
     *
     * Becomes true as soon as the signal is delivered, before the callback
     * has been dispatched.
     */
    [[nodiscard]] static auto cancel_requested() noexcept -> bool;

    /**
     * @brief Run the callback for a delivered signal, if one is pending
     *
     * Called by the watcher thread. Safe to call from any thread.
     *
     * @return true if a pending signal was dispatched by this call
     */
    static auto dispatch_pending() -> bool;

    /**
     * @brief Request cancellation as if a signal had arrived
     */
    static void request_cancel();

    /**
     * @brief Restore default dispositions, stop the watcher and clear the state
     */
    static void reset();

    /// Signal number of the first request, 0 when requested programmatically
    [[nodiscard]] static auto last_signal() noexcept -> int;

private:
    static void handler(int signal);
    static void stop_watcher();

    static std::atomic<bool> signal_pending_;
    static std::atomic<bool> cancel_requested_;
    static std::atomic<int> last_signal_;
    static std::atomic<bool> callback_invoked_;
    static cancel_callback callback_;
    static std::mutex mutex_;
    static std::jthread watcher_;
};

/**
 * @brief Installs the handler for the lifetime of a scope
 */
class scoped_signal_handler {
public:
    explicit scoped_signal_handler(signal_handler::cancel_callback callback = nullptr);

    ~scoped_signal_handler();

    scoped_signal_handler(const scoped_signal_handler&) = delete;
    auto operator=(const scoped_signal_handler&) -> scoped_signal_handler& = delete;
    scoped_signal_handler(scoped_signal_handler&&) = delete;
    auto operator=(scoped_signal_handler&&) -> scoped_signal_handler& = delete;

    [[nodiscard]] auto cancel_requested() const noexcept -> bool;
};

}  // namespace blobtier::integration
