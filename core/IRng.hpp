#pragma once

#include <cstdint>
#include <mutex>
#include <random>

namespace datalogger {

class IRng {
public:
    virtual ~IRng() = default;

    virtual std::int64_t uniformInt(std::int64_t min, std::int64_t max) = 0;
};

class StandardRng : public IRng {
private:
    std::random_device rd_;
    std::mt19937_64 gen_;
    std::mutex mutex_;  ///< Shared by reconnect and forward workers

public:
    StandardRng() : gen_(rd_()) {}

    std::int64_t uniformInt(std::int64_t min, std::int64_t max) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<std::int64_t> dist(min, max);
        return dist(gen_);
    }
};

} // namespace datalogger
