#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace relcheck {

/**
 * @brief Cooperative cancellation signal shared between a run and its workers.
 *
 * A token is cancelled either explicitly (cancel()) or implicitly once its deadline
 * passes. Child tokens created with withDeadline() observe their parent, so a case
 * token trips when the case deadline or the run deadline elapses, whichever is first.
 * Copies share state; the token is safe to use from any thread.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    enum class State { Active, Cancelled, DeadlineExceeded };

    /// A fresh token with no deadline.
    CancellationToken();

    /// Child token bounded by @p deadline and by every ancestor.
    CancellationToken withDeadline(Clock::time_point deadline) const;
    CancellationToken withTimeout(std::chrono::milliseconds timeout) const;

    void cancel(std::string reason = "cancelled");

    bool isCancelled() const { return state() != State::Active; }

    /// State of this token, falling back to the nearest tripped ancestor.
    State state() const;

    /// True when this token's own deadline (not an ancestor's) is the one that tripped.
    bool ownDeadlineExceeded() const;

    std::string reason() const;

    std::optional<Clock::time_point> deadline() const;

    /// Time left before the effective deadline; nullopt when unbounded.
    std::optional<std::chrono::milliseconds> remaining() const;

    /**
     * @brief Sleep for up to @p duration, waking early on cancellation.
     * @return false when the token tripped before the full duration elapsed.
     */
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    struct SharedState;
    explicit CancellationToken(std::shared_ptr<SharedState> state);

    std::shared_ptr<SharedState> state_;
};

} // namespace relcheck
