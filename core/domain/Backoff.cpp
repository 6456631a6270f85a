#include "Backoff.hpp"
#include <string>

namespace datalogger::domain {

BackoffState::BackoffState(const ports::RetryPolicy& policy) : policy_(policy) {}

std::chrono::milliseconds BackoffState::recordFailure(std::chrono::steady_clock::time_point now) {
    ++attempts_;
    if (!policy_.shouldRetry(attempts_)) {
        exhausted_ = true;
        lastDelay_ = std::chrono::milliseconds(0);
        return lastDelay_;
    }

    lastDelay_ = policy_.getBackoffDelay(attempts_);
    nextAttemptAt_ = now + lastDelay_;
    return lastDelay_;
}

void BackoffState::reset() {
    attempts_ = 0;
    exhausted_ = false;
    lastDelay_ = std::chrono::milliseconds(0);
    nextAttemptAt_ = {};
}

BackoffState::Phase BackoffState::phase(std::chrono::steady_clock::time_point now) const {
    if (exhausted_) {
        return Phase::Exhausted;
    }
    if (attempts_ > 0 && now < nextAttemptAt_) {
        return Phase::Waiting;
    }
    return Phase::Ready;
}

std::string phaseToString(BackoffState::Phase phase) {
    switch (phase) {
        case BackoffState::Phase::Ready: return "Ready";
        case BackoffState::Phase::Waiting: return "Waiting";
        case BackoffState::Phase::Exhausted: return "Exhausted";
        default: return "Unknown";
    }
}

} // namespace datalogger::domain
