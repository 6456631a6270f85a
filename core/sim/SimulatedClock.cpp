#include "SimulatedClock.hpp"

namespace datalogger::sim {

SimulatedClock::SimulatedClock(std::chrono::system_clock::time_point wallStart)
    : simulatedTime_(std::chrono::steady_clock::time_point(std::chrono::hours(1))),
      wallTime_(wallStart) {
}

std::chrono::steady_clock::time_point SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return simulatedTime_;
}

std::chrono::system_clock::time_point SimulatedClock::wallNow() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return wallTime_;
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ += duration;
    wallTime_ += duration;
}

void SimulatedClock::setWallTime(std::chrono::system_clock::time_point time) {
    std::lock_guard<std::mutex> lock(mutex_);
    wallTime_ = time;
}

} // namespace datalogger::sim
