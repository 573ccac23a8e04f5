/**
 * @file signal_handler_test.cpp
 * @brief Unit tests for the cancellation signal handler
 */

#include <blobtier/integration/signal_handler.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <thread>

using namespace blobtier::integration;

namespace {

/**
 * @brief Restores default signal dispositions after each test
 */
struct signal_handler_guard {
    ~signal_handler_guard() { signal_handler::reset(); }
};

auto wait_until(const std::function<bool()>& condition) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!condition()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

}  // namespace

TEST_CASE("request_cancel invokes the callback once", "[signal_handler]") {
    signal_handler_guard guard;
    int calls = 0;
    signal_handler::install([&calls] { ++calls; });

    CHECK_FALSE(signal_handler::cancel_requested());

    signal_handler::request_cancel();
    signal_handler::request_cancel();

    CHECK(signal_handler::cancel_requested());
    CHECK(calls == 1);
    CHECK(signal_handler::last_signal() == 0);
}

TEST_CASE("reset clears the cancellation state", "[signal_handler]") {
    int calls = 0;
    signal_handler::install([&calls] { ++calls; });
    signal_handler::request_cancel();
    REQUIRE(signal_handler::cancel_requested());

    signal_handler::reset();
    CHECK_FALSE(signal_handler::cancel_requested());
    CHECK(signal_handler::last_signal() == 0);

    signal_handler::request_cancel();
    CHECK(calls == 1);
    signal_handler::reset();
}

TEST_CASE("install rearms after a previous cancel", "[signal_handler]") {
    signal_handler_guard guard;
    int first = 0;
    int second = 0;

    signal_handler::install([&first] { ++first; });
    signal_handler::request_cancel();

    signal_handler::install([&second] { ++second; });
    CHECK_FALSE(signal_handler::cancel_requested());
    signal_handler::request_cancel();

    CHECK(first == 1);
    CHECK(second == 1);
}

TEST_CASE("a delivered signal requests cancellation", "[signal_handler]") {
    signal_handler_guard guard;
    std::atomic<int> calls{0};
    std::atomic<std::thread::id> callback_thread{};
    signal_handler::install([&calls, &callback_thread] {
        callback_thread.store(std::this_thread::get_id());
        ++calls;
    });

    REQUIRE(std::raise(SIGTERM) == 0);

    // Visible at once, before any callback has run
    CHECK(signal_handler::cancel_requested());
    CHECK(signal_handler::last_signal() == SIGTERM);

    REQUIRE(wait_until([&calls] { return calls.load() == 1; }));
    CHECK(callback_thread.load() != std::this_thread::get_id());

    CHECK_FALSE(signal_handler::dispatch_pending());
    CHECK(calls.load() == 1);
}

TEST_CASE("dispatch_pending without a signal does nothing", "[signal_handler]") {
    signal_handler_guard guard;
    std::atomic<int> calls{0};
    signal_handler::install([&calls] { ++calls; });

    CHECK_FALSE(signal_handler::dispatch_pending());
    CHECK_FALSE(signal_handler::cancel_requested());
    CHECK(calls.load() == 0);
}

TEST_CASE("scoped_signal_handler restores defaults on exit", "[signal_handler]") {
    int calls = 0;
    {
        scoped_signal_handler scoped([&calls] { ++calls; });
        CHECK_FALSE(scoped.cancel_requested());

        signal_handler::request_cancel();
        CHECK(scoped.cancel_requested());
    }

    CHECK_FALSE(signal_handler::cancel_requested());
    CHECK(calls == 1);
}
