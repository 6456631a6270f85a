#pragma once

#include <stdexcept>
#include <string>

namespace datalogger {

/// Broker unreachable or authentication refused; always retried, never fatal
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Durable queue could not read or persist a record
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace datalogger
