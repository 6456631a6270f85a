#pragma once

#include "../ports/IPolicyEngine.hpp"
#include <chrono>
#include <string>

namespace datalogger::domain {

/**
 * Attempt-counting retry state machine.
 *
 *   Ready --recordFailure--> Waiting --(now >= nextAttemptAt)--> Ready
 *   Waiting/Ready --recordFailure (policy refuses)--> Exhausted
 *   any --reset--> Ready
 *
 * Time is always supplied by the caller so the machine can be driven by a
 * simulated clock.
 */
class BackoffState {
public:
    enum class Phase {
        Ready,
        Waiting,
        Exhausted
    };

    explicit BackoffState(const ports::RetryPolicy& policy);

    /// Register a failed attempt; returns the delay before the next one
    std::chrono::milliseconds recordFailure(std::chrono::steady_clock::time_point now);

    void reset();

    Phase phase(std::chrono::steady_clock::time_point now) const;
    bool readyAt(std::chrono::steady_clock::time_point now) const { return phase(now) == Phase::Ready; }

    int attempts() const { return attempts_; }
    std::chrono::milliseconds lastDelay() const { return lastDelay_; }
    std::chrono::steady_clock::time_point nextAttemptAt() const { return nextAttemptAt_; }

private:
    const ports::RetryPolicy& policy_;
    int attempts_ = 0;
    bool exhausted_ = false;
    std::chrono::milliseconds lastDelay_{0};
    std::chrono::steady_clock::time_point nextAttemptAt_{};
};

std::string phaseToString(BackoffState::Phase phase);

} // namespace datalogger::domain
