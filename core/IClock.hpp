#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace datalogger {

class IClock {
public:
    virtual ~IClock() = default;

    /// Monotonic time used for scheduling retries and reconnects
    virtual std::chrono::steady_clock::time_point now() const = 0;

    /// Wall-clock time used for timestamps
    virtual std::chrono::system_clock::time_point wallNow() const = 0;

    uint64_t epochSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            wallNow().time_since_epoch()).count();
    }

    std::string iso8601() const;
};

class SystemClock : public IClock {
public:
    std::chrono::steady_clock::time_point now() const override {
        return std::chrono::steady_clock::now();
    }

    std::chrono::system_clock::time_point wallNow() const override {
        return std::chrono::system_clock::now();
    }
};

/// Format as "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string formatIso8601(std::chrono::system_clock::time_point time);

/// Parse "YYYY-MM-DDTHH:MM:SS[.fff][Z]" (also accepts a space separator), UTC
std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& text);

/// Milliseconds since the Unix epoch
std::int64_t toEpochMillis(std::chrono::system_clock::time_point time);
std::chrono::system_clock::time_point fromEpochMillis(std::int64_t millis);

} // namespace datalogger
