#pragma once

#include "../ports/IPolicyEngine.hpp"
#include "../IRng.hpp"
#include <algorithm>
#include <cmath>
#include <memory>

namespace datalogger::adapters {

/**
 * Exponential backoff with "full jitter": the delay for attempt n is drawn
 * uniformly from [0, min(cap, base * multiplier^(n-1))].
 * maxAttempts <= 0 means retry forever.
 */
class ExponentialBackoffRetryPolicy : public ports::RetryPolicy {
public:
    ExponentialBackoffRetryPolicy(std::shared_ptr<IRng> rng,
                                std::chrono::milliseconds baseDelay = std::chrono::milliseconds(1000),
                                double multiplier = 2.0,
                                std::chrono::milliseconds maxDelay = std::chrono::seconds(60),
                                int maxAttempts = 0)
        : rng_(std::move(rng)), baseDelay_(baseDelay), multiplier_(multiplier),
          maxDelay_(maxDelay), maxAttempts_(maxAttempts) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        auto ceiling = getDelayCeiling(attemptCount);
        if (!rng_ || ceiling.count() == 0) {
            return ceiling;
        }
        return std::chrono::milliseconds(rng_->uniformInt(0, ceiling.count()));
    }

    /// Upper bound of the jittered delay for the given attempt
    std::chrono::milliseconds getDelayCeiling(int attemptCount) const {
        int exponent = std::max(attemptCount - 1, 0);
        double raw = static_cast<double>(baseDelay_.count()) * std::pow(multiplier_, exponent);
        if (raw >= static_cast<double>(maxDelay_.count())) {
            return maxDelay_;
        }
        return std::chrono::milliseconds(static_cast<long long>(raw));
    }

    bool shouldRetry(int attemptCount) const override {
        return maxAttempts_ <= 0 || attemptCount < maxAttempts_;
    }

private:
    std::shared_ptr<IRng> rng_;
    std::chrono::milliseconds baseDelay_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
};

class DefaultPolicyEngine : public ports::IPolicyEngine {
public:
    DefaultPolicyEngine(std::shared_ptr<IRng> rng,
                        std::chrono::milliseconds forwardBase = std::chrono::milliseconds(1000),
                        std::chrono::milliseconds forwardCap = std::chrono::seconds(60),
                        std::chrono::milliseconds reconnectBase = std::chrono::milliseconds(1000),
                        std::chrono::milliseconds reconnectCap = std::chrono::seconds(60))
        : forwardPolicy_(rng, forwardBase, 2.0, forwardCap),
          reconnectPolicy_(rng, reconnectBase, 2.0, reconnectCap) {}

    const ports::RetryPolicy& getForwardRetryPolicy() const override {
        return forwardPolicy_;
    }

    const ports::RetryPolicy& getReconnectPolicy() const override {
        return reconnectPolicy_;
    }

private:
    ExponentialBackoffRetryPolicy forwardPolicy_;
    ExponentialBackoffRetryPolicy reconnectPolicy_;
};

} // namespace datalogger::adapters
