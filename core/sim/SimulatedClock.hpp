#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>

namespace datalogger::sim {

/**
 * Manually driven clock. Steady and wall time only move on advance(), so
 * backoff schedules can be tested without sleeping.
 */
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(std::chrono::system_clock::time_point wallStart = fromEpochMillis(1700000000000));
    ~SimulatedClock() override = default;

    // IClock interface
    std::chrono::steady_clock::time_point now() const override;
    std::chrono::system_clock::time_point wallNow() const override;

    // Simulation controls
    void advance(std::chrono::milliseconds duration);
    void setWallTime(std::chrono::system_clock::time_point time);

private:
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point simulatedTime_;
    std::chrono::system_clock::time_point wallTime_;
};

} // namespace datalogger::sim
