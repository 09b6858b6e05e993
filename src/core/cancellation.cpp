#include <relcheck/core/cancellation.h>

#include <algorithm>
#include <atomic>

namespace relcheck {

namespace {
// Upper bound on a single wait slice so ancestor cancellation is noticed promptly.
constexpr auto kWaitSlice = std::chrono::milliseconds(20);
} // namespace

struct CancellationToken::SharedState {
    std::shared_ptr<SharedState> parent;
    std::optional<Clock::time_point> deadline;
    std::atomic<bool> cancelled{false};
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::string reason;

    State ownState() const {
        if (cancelled.load(std::memory_order_acquire))
            return State::Cancelled;
        if (deadline && Clock::now() >= *deadline)
            return State::DeadlineExceeded;
        return State::Active;
    }
};

CancellationToken::CancellationToken() : state_(std::make_shared<SharedState>()) {}

CancellationToken::CancellationToken(std::shared_ptr<SharedState> state)
    : state_(std::move(state)) {}

CancellationToken CancellationToken::withDeadline(Clock::time_point deadline) const {
    auto s = std::make_shared<SharedState>();
    s->parent = state_;
    s->deadline = deadline;
    return CancellationToken(std::move(s));
}

CancellationToken CancellationToken::withTimeout(std::chrono::milliseconds timeout) const {
    return withDeadline(Clock::now() + timeout);
}

void CancellationToken::cancel(std::string reason) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.load(std::memory_order_relaxed))
            return;
        state_->reason = std::move(reason);
        state_->cancelled.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
}

CancellationToken::State CancellationToken::state() const {
    for (auto* s = state_.get(); s != nullptr; s = s->parent.get()) {
        auto st = s->ownState();
        if (st != State::Active)
            return st;
    }
    return State::Active;
}

bool CancellationToken::ownDeadlineExceeded() const {
    return state_->ownState() == State::DeadlineExceeded;
}

std::string CancellationToken::reason() const {
    for (auto* s = state_.get(); s != nullptr; s = s->parent.get()) {
        switch (s->ownState()) {
            case State::Cancelled: {
                std::lock_guard<std::mutex> lock(s->mutex);
                return s->reason;
            }
            case State::DeadlineExceeded:
                return "deadline exceeded";
            case State::Active:
                break;
        }
    }
    return {};
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const {
    std::optional<Clock::time_point> earliest;
    for (auto* s = state_.get(); s != nullptr; s = s->parent.get()) {
        if (s->deadline && (!earliest || *s->deadline < *earliest))
            earliest = s->deadline;
    }
    return earliest;
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const {
    auto d = deadline();
    if (!d)
        return std::nullopt;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*d - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    const auto until = Clock::now() + duration;
    std::unique_lock<std::mutex> lock(state_->mutex);
    while (true) {
        if (isCancelled())
            return false;
        auto now = Clock::now();
        if (now >= until)
            return true;
        auto slice = std::min<Clock::duration>(until - now, kWaitSlice);
        state_->cv.wait_for(lock, slice);
    }
}

} // namespace relcheck
