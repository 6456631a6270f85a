#pragma once

#include "../IRng.hpp"
#include <algorithm>

namespace datalogger::sim {

/**
 * Deterministic IRng. Returns the same fraction of every requested range,
 * 1.0 by default (the top of the range, so jittered backoff equals its ceiling).
 */
class FixedRng : public IRng {
public:
    explicit FixedRng(double fraction = 1.0) : fraction_(std::clamp(fraction, 0.0, 1.0)) {}

    std::int64_t uniformInt(std::int64_t min, std::int64_t max) override {
        return min + static_cast<std::int64_t>(static_cast<double>(max - min) * fraction_);
    }

    void setFraction(double fraction) { fraction_ = std::clamp(fraction, 0.0, 1.0); }

private:
    double fraction_;
};

} // namespace datalogger::sim
