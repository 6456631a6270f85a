/**
 * @file DurableQueue.hpp
 * @brief SQLite-backed store of readings awaiting delivery
 *
 * Records are owned by the queue from enqueue until they are Delivered
 * (deleted) or dead-lettered (moved to the dead_letter table). Sequence
 * numbers come from a counter persisted with the records, so they keep
 * increasing across restarts.
 *
 * Tables:
 * - records(seq, reading, state, attempts, reason)
 * - dead_letter(seq, reading, attempts, reason, failed_ms)
 * - meta(key, value) holding next_seq
 *
 * @note Every operation serializes on one mutex; no record is ever handed
 *       out in two batches at once
 * @note Records left InFlight by a crash are Pending again after reopen
 */

#pragma once

#include "../Reading.hpp"
#include "../../storage/sqlite/SqliteDb.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace datalogger::domain {

enum class FailureKind {
    Transient,   ///< Retry until max_attempts, then dead-letter
    Permanent    ///< Dead-letter now
};

struct FailOutcome {
    enum class Action {
        Retrying,
        DeadLettered,
        NotFound
    };

    Action action = Action::NotFound;
    std::uint32_t attemptCount = 0;
};

struct DeadLetter {
    std::uint64_t sequenceNumber = 0;
    Reading reading;
    std::uint32_t attemptCount = 0;
    std::string reason;
    std::chrono::system_clock::time_point failedAt;
};

class DurableQueue {
public:
    /**
     * @brief Open (or create) the queue database
     * @param path SQLite file; ":memory:" gives a non-durable queue for tests
     * @param maxRecords Capacity; enqueue throws StorageError beyond it
     * @param maxAttempts Transient failures before a record is dead-lettered
     * @throws StorageError if the database cannot be opened or migrated
     */
    DurableQueue(const std::string& path, std::size_t maxRecords, std::uint32_t maxAttempts);
    ~DurableQueue() = default;

    DurableQueue(const DurableQueue&) = delete;
    DurableQueue& operator=(const DurableQueue&) = delete;

    /**
     * @brief Persist a reading as a new Pending record
     * @return Assigned sequence number
     * @throws StorageError when full or when the write fails; nothing is stored then
     */
    std::uint64_t enqueue(const Reading& reading);

    /**
     * @brief Take up to maxSize Pending records in ascending sequence order
     * @return Snapshot of the records, now InFlight; empty if none are Pending
     * @note A stored record that no longer parses is moved to the dead-letter
     *       store with reason "corrupt" and skipped
     */
    Batch peekBatch(std::size_t maxSize);

    /**
     * @brief Batching policy: wait until maxSize records are Pending, or
     *        maxWait has passed with at least one Pending record
     * @return Empty batch if nothing became Pending or waits were interrupted
     */
    Batch waitForBatch(std::size_t maxSize, std::chrono::milliseconds maxWait);

    /// Remove delivered records
    void markDelivered(const std::vector<std::uint64_t>& sequenceNumbers);

    /**
     * @brief Return InFlight records to Pending without counting an attempt
     * @return Number of records released
     */
    std::size_t release(const std::vector<std::uint64_t>& sequenceNumbers);

    /**
     * @brief Record a failed forward attempt
     * @param reason Stored with the record and in the dead-letter store
     * @param kind Transient failures count against max_attempts
     */
    FailOutcome markFailed(std::uint64_t sequenceNumber, const std::string& reason,
                           FailureKind kind = FailureKind::Transient);

    /**
     * @brief Block until the queue is below capacity
     * @return true if there is room, false on timeout or interruption
     */
    bool waitForSpace(std::chrono::milliseconds timeout);

    /// Release every thread blocked in waitForBatch()/waitForSpace()
    void interruptWaits();
    void resumeWaits();

    std::size_t size() const;
    std::size_t pendingCount() const;
    std::size_t inFlightCount() const;
    std::size_t deadLetterCount() const;
    std::vector<DeadLetter> deadLetters() const;
    std::optional<QueuedRecord> find(std::uint64_t sequenceNumber) const;

    std::size_t maxRecords() const { return maxRecords_; }
    std::uint32_t maxAttempts() const { return maxAttempts_; }
    std::uint64_t nextSequenceNumber() const;

private:
    std::unique_ptr<storage::SqliteDb> db_;
    const std::size_t maxRecords_;
    const std::uint32_t maxAttempts_;

    mutable std::mutex mutex_;
    std::condition_variable batchCv_;
    std::condition_variable spaceCv_;
    bool interrupted_ = false;

    std::uint64_t nextSeq_ = 1;
    std::size_t count_ = 0;
    std::size_t pending_ = 0;

    void migrate();
    void recover();
    Batch peekLocked(std::size_t maxSize);
    void deadLetterCorruptLocked(std::uint64_t seq, const std::string& stored, const std::string& reason);
    std::uint64_t queryScalar(const std::string& sql) const;
};

} // namespace datalogger::domain
