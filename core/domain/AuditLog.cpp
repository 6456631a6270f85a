#include "AuditLog.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace datalogger::domain {

AuditLog::AuditLog(const std::string& path, std::shared_ptr<IClock> clock)
    : path_(path), clock_(std::move(clock)) {
    std::error_code ec;
    bool needsHeader = !std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0;

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        throw std::runtime_error("cannot open audit log " + path_);
    }

    if (needsHeader) {
        out_ << "Timestamp,Event,Topic,Sequence,Detail\n";
        out_.flush();
    }
    std::cout << "[Audit] Writing to " << path_ << std::endl;
}

void AuditLog::record(AuditEvent event, const std::string& topic, std::uint64_t sequence, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);

    out_ << clock_->iso8601() << ','
         << auditEventToString(event) << ','
         << escapeField(topic) << ','
         << (sequence == 0 ? std::string() : std::to_string(sequence)) << ','
         << escapeField(detail) << '\n';
    out_.flush();

    if (!out_) {
        std::cerr << "[Audit] Write to " << path_ << " failed" << std::endl;
        out_.clear();
    }
}

std::string AuditLog::escapeField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') {
            quoted += "\"\"";
        } else {
            quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

std::string auditEventToString(AuditEvent event) {
    switch (event) {
        case AuditEvent::DecodeError: return "decode_error";
        case AuditEvent::Delivered: return "delivered";
        case AuditEvent::DeadLetter: return "dead_letter";
        case AuditEvent::Retry: return "retry";
        default: return "unknown";
    }
}

} // namespace datalogger::domain
