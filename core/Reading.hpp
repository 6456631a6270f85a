/**
 * @file Reading.hpp
 * @brief Sensor reading data model shared by every pipeline stage
 *
 * A Reading is produced once by the Decoder and never modified afterwards.
 * The Durable Queue wraps it in a QueuedRecord that carries the delivery
 * bookkeeping, and the Forwarder sees records grouped into a Batch.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace datalogger {

/// Opaque per-message handle issued by the MQTT adapter (0 means "no token")
using AckToken = std::uint64_t;

/**
 * @brief One decoded sensor measurement
 *
 * @note Immutable once decoded - pass by const reference
 * @note ackToken is session-scoped and never persisted
 */
struct Reading {
    std::string topic;                                ///< MQTT topic the reading arrived on
    std::string deviceId;                             ///< Reporting device
    std::chrono::system_clock::time_point timestamp;  ///< Measurement instant (UTC)
    nlohmann::json payload;                           ///< Parsed measurement value
    AckToken ackToken = 0;                            ///< Broker acknowledgement handle
};

enum class DeliveryState {
    Pending,
    InFlight,
    Delivered,
    Failed
};

/**
 * @brief Reading plus the queue's delivery bookkeeping
 */
struct QueuedRecord {
    std::uint64_t sequenceNumber = 0;             ///< Durable ordering key, assigned at enqueue
    Reading reading;
    DeliveryState state = DeliveryState::Pending;
    std::string failureReason;                    ///< Last failure, empty when none
    std::uint32_t attemptCount = 0;               ///< Forward attempts that failed so far
};

/**
 * @brief Records selected for one forwarding attempt
 *
 * The queue stays authoritative for every record; the batch only carries a
 * read-only snapshot in ascending sequence order.
 */
struct Batch {
    std::vector<QueuedRecord> records;
    std::vector<std::uint64_t> corrupted;   ///< Dead-lettered while selecting, stored form unreadable

    bool empty() const { return records.empty(); }
    std::size_t size() const { return records.size(); }
    std::vector<std::uint64_t> sequenceNumbers() const;
};

std::string deliveryStateToString(DeliveryState state);
DeliveryState stringToDeliveryState(const std::string& str);

} // namespace datalogger
