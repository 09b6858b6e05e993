#include <catch2/catch_test_macros.hpp>

#include <relcheck/validation/failure_monitor.h>

using relcheck::validation::FailureMonitor;
using namespace std::chrono_literals;

TEST_CASE("FailureMonitor trips on consecutive failures", "[validation][monitor]") {
    FailureMonitor monitor(FailureMonitor::Config{3, 30s});
    const auto t0 = FailureMonitor::Clock::now();

    CHECK_FALSE(monitor.recordFailure(t0));
    CHECK_FALSE(monitor.recordFailure(t0 + 1s));
    CHECK(monitor.streak() == 2);
    CHECK(monitor.recordFailure(t0 + 2s));
    CHECK(monitor.tripped());

    // Already tripped: no second signal
    CHECK_FALSE(monitor.recordFailure(t0 + 3s));
}

TEST_CASE("FailureMonitor resets on success", "[validation][monitor]") {
    FailureMonitor monitor(FailureMonitor::Config{3, 30s});
    const auto t0 = FailureMonitor::Clock::now();

    monitor.recordFailure(t0);
    monitor.recordFailure(t0);
    monitor.recordSuccess();
    CHECK(monitor.streak() == 0);
    CHECK_FALSE(monitor.recordFailure(t0));
    CHECK(monitor.getState() == FailureMonitor::State::Healthy);
}

TEST_CASE("FailureMonitor forgets failures outside the window", "[validation][monitor]") {
    FailureMonitor monitor(FailureMonitor::Config{3, 10s});
    const auto t0 = FailureMonitor::Clock::now();

    monitor.recordFailure(t0);
    monitor.recordFailure(t0 + 1s);
    CHECK_FALSE(monitor.recordFailure(t0 + 20s));
    CHECK(monitor.streak() == 1);
}

TEST_CASE("FailureMonitor with threshold 0 never trips", "[validation][monitor]") {
    FailureMonitor monitor(FailureMonitor::Config{0, 30s});
    for (int i = 0; i < 100; ++i)
        CHECK_FALSE(monitor.recordFailure());
    CHECK_FALSE(monitor.tripped());
}
