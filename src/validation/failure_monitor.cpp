#include <relcheck/validation/failure_monitor.h>

#include <spdlog/spdlog.h>

namespace relcheck::validation {

FailureMonitor::FailureMonitor(const Config& config) : config_(config) {}

void FailureMonitor::recordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.clear();
}

bool FailureMonitor::recordFailure(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.failureThreshold == 0 || state_ == State::Tripped) {
        return false;
    }

    failures_.push_back(now);
    while (!failures_.empty() && now - failures_.front() > config_.window) {
        failures_.pop_front();
    }

    if (failures_.size() >= config_.failureThreshold) {
        state_ = State::Tripped;
        spdlog::error("{} consecutive failures within {}s, aborting run", failures_.size(),
                      config_.window.count());
        return true;
    }
    return false;
}

FailureMonitor::State FailureMonitor::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::size_t FailureMonitor::streak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_.size();
}

std::string FailureMonitor::describe() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::to_string(config_.failureThreshold) + " consecutive backend failures within " +
           std::to_string(config_.window.count()) + "s";
}

} // namespace relcheck::validation
