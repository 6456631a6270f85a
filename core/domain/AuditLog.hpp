#pragma once

#include "../IClock.hpp"
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace datalogger::domain {

enum class AuditEvent {
    DecodeError,
    Delivered,
    DeadLetter,
    Retry
};

/**
 * Append-only CSV trail: Timestamp,Event,Topic,Sequence,Detail
 * The header is written only when the file is new or empty.
 */
class AuditLog {
public:
    /// @throws std::runtime_error if the file cannot be opened for appending
    AuditLog(const std::string& path, std::shared_ptr<IClock> clock);

    void record(AuditEvent event, const std::string& topic, std::uint64_t sequence, const std::string& detail);

    const std::string& path() const { return path_; }

    static std::string escapeField(const std::string& field);

private:
    std::string path_;
    std::shared_ptr<IClock> clock_;
    std::mutex mutex_;
    std::ofstream out_;
};

std::string auditEventToString(AuditEvent event);

} // namespace datalogger::domain
