#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace relcheck::validation {

/**
 * @brief Escalates sustained backend/provider failures into a run abort.
 *
 * Works like a circuit breaker that never closes again: consecutive case-scoped
 * failures are counted, failures older than the window are forgotten, and once
 * the threshold is reached the monitor trips for the rest of the run. Any success
 * clears the streak. Thread-safe.
 */
class FailureMonitor {
public:
    using Clock = std::chrono::steady_clock;

    enum class State {
        Healthy, // Normal operation
        Tripped  // Threshold reached, run must stop
    };

    struct Config {
        std::size_t failureThreshold; // 0 disables escalation
        std::chrono::seconds window;

        Config() : failureThreshold(10), window(30) {}
        Config(std::size_t threshold, std::chrono::seconds w)
            : failureThreshold(threshold), window(w) {}
    };

    explicit FailureMonitor(const Config& config = Config{});

    void recordSuccess();

    /// @return true when this failure tripped the monitor.
    bool recordFailure(Clock::time_point now = Clock::now());

    State getState() const;
    bool tripped() const { return getState() == State::Tripped; }

    /// Failures currently counted towards the threshold.
    std::size_t streak() const;

    std::string describe() const;

private:
    Config config_;
    mutable std::mutex mutex_;
    State state_ = State::Healthy;
    std::deque<Clock::time_point> failures_;
};

} // namespace relcheck::validation
