#pragma once

#include <chrono>

namespace datalogger::ports {

struct RetryPolicy {
    virtual ~RetryPolicy() = default;
    /// Delay to wait after the attemptCount-th consecutive failure (1-based)
    virtual std::chrono::milliseconds getBackoffDelay(int attemptCount) const = 0;
    virtual bool shouldRetry(int attemptCount) const = 0;
};

class IPolicyEngine {
public:
    virtual ~IPolicyEngine() = default;

    /// Backoff between forward attempts after a transient collector failure
    virtual const RetryPolicy& getForwardRetryPolicy() const = 0;

    /// Backoff between broker reconnect attempts
    virtual const RetryPolicy& getReconnectPolicy() const = 0;
};

} // namespace datalogger::ports
