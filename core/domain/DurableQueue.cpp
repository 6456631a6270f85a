#include "DurableQueue.hpp"
#include "../Errors.hpp"
#include "../IClock.hpp"
#include "../JsonCodec.hpp"
#include <algorithm>
#include <iostream>

namespace datalogger::domain {

namespace {

const char* const kStatePending = "pending";
const char* const kStateInFlight = "inflight";

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

Reading decodeStoredReading(std::uint64_t seq, const std::string& json) {
    try {
        return JsonCodec::deserialize(json);
    } catch (const nlohmann::json::exception& e) {
        throw StorageError("record " + std::to_string(seq) + " is corrupt: " + e.what());
    }
}

} // namespace

DurableQueue::DurableQueue(const std::string& path, std::size_t maxRecords, std::uint32_t maxAttempts)
    : db_(std::make_unique<storage::SqliteDb>(path)),
      maxRecords_(maxRecords),
      maxAttempts_(maxAttempts == 0 ? 1 : maxAttempts) {
    migrate();
    recover();

    std::cout << "[Queue] Opened " << path << ": " << count_ << " undelivered, "
              << deadLetterCount() << " dead-lettered, next sequence " << nextSeq_ << std::endl;
}

void DurableQueue::migrate() {
    db_->exec(
        "CREATE TABLE IF NOT EXISTS records ("
        "  seq INTEGER PRIMARY KEY,"
        "  reading TEXT NOT NULL,"
        "  state TEXT NOT NULL,"
        "  attempts INTEGER NOT NULL DEFAULT 0,"
        "  reason TEXT NOT NULL DEFAULT ''"
        ");"
        "CREATE TABLE IF NOT EXISTS dead_letter ("
        "  seq INTEGER PRIMARY KEY,"
        "  reading TEXT NOT NULL,"
        "  attempts INTEGER NOT NULL,"
        "  reason TEXT NOT NULL,"
        "  failed_ms INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS meta ("
        "  key TEXT PRIMARY KEY,"
        "  value INTEGER NOT NULL"
        ");");
}

void DurableQueue::recover() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Batches that were on the wire when the process died go out again
    auto reset = db_->prepare("UPDATE records SET state = ? WHERE state = ?;");
    bindText(reset.get(), 1, kStatePending);
    bindText(reset.get(), 2, kStateInFlight);
    db_->stepDone(reset.get(), "reset in-flight records");
    if (db_->changes() > 0) {
        std::cout << "[Queue] Returned " << db_->changes() << " in-flight records to pending" << std::endl;
    }

    std::uint64_t metaNext = queryScalar("SELECT COALESCE(MAX(value), 0) FROM meta WHERE key = 'next_seq';");
    std::uint64_t recordsNext = queryScalar("SELECT COALESCE(MAX(seq), 0) FROM records;") + 1;
    std::uint64_t deadNext = queryScalar("SELECT COALESCE(MAX(seq), 0) FROM dead_letter;") + 1;
    nextSeq_ = std::max({metaNext, recordsNext, deadNext, static_cast<std::uint64_t>(1)});

    count_ = static_cast<std::size_t>(queryScalar("SELECT COUNT(*) FROM records;"));
    pending_ = count_;
}

std::uint64_t DurableQueue::enqueue(const Reading& reading) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (count_ >= maxRecords_) {
        throw StorageError("queue full (" + std::to_string(maxRecords_) + " records)");
    }

    std::uint64_t seq = nextSeq_;
    std::string json = JsonCodec::serialize(reading);

    storage::Transaction tx(*db_);

    auto insert = db_->prepare("INSERT INTO records (seq, reading, state, attempts, reason) VALUES (?, ?, ?, 0, '');");
    sqlite3_bind_int64(insert.get(), 1, static_cast<sqlite3_int64>(seq));
    bindText(insert.get(), 2, json);
    bindText(insert.get(), 3, kStatePending);
    db_->stepDone(insert.get(), "insert record");

    auto counter = db_->prepare(
        "INSERT INTO meta (key, value) VALUES ('next_seq', ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value;");
    sqlite3_bind_int64(counter.get(), 1, static_cast<sqlite3_int64>(seq + 1));
    db_->stepDone(counter.get(), "persist sequence counter");

    tx.commit();

    nextSeq_ = seq + 1;
    count_++;
    pending_++;

    lock.unlock();
    batchCv_.notify_all();
    return seq;
}

Batch DurableQueue::peekBatch(std::size_t maxSize) {
    std::lock_guard<std::mutex> lock(mutex_);
    return peekLocked(maxSize);
}

Batch DurableQueue::waitForBatch(std::size_t maxSize, std::chrono::milliseconds maxWait) {
    std::unique_lock<std::mutex> lock(mutex_);
    batchCv_.wait_for(lock, maxWait, [&] { return interrupted_ || pending_ >= maxSize; });

    if (interrupted_) {
        return Batch{};
    }
    return peekLocked(maxSize);
}

Batch DurableQueue::peekLocked(std::size_t maxSize) {
    Batch batch;
    if (maxSize == 0 || pending_ == 0) {
        return batch;
    }

    auto select = db_->prepare(
        "SELECT seq, reading, attempts, reason FROM records WHERE state = ? ORDER BY seq ASC LIMIT ?;");
    bindText(select.get(), 1, kStatePending);
    sqlite3_bind_int64(select.get(), 2, static_cast<sqlite3_int64>(maxSize));

    struct Corrupt {
        std::uint64_t seq;
        std::string stored;
        std::string reason;
    };
    std::vector<Corrupt> corrupt;

    while (db_->stepRow(select.get(), "select batch")) {
        QueuedRecord record;
        record.sequenceNumber = static_cast<std::uint64_t>(sqlite3_column_int64(select.get(), 0));
        std::string stored = columnText(select.get(), 1);
        try {
            record.reading = decodeStoredReading(record.sequenceNumber, stored);
        } catch (const StorageError& e) {
            corrupt.push_back({record.sequenceNumber, stored, e.what()});
            continue;
        }
        record.attemptCount = static_cast<std::uint32_t>(sqlite3_column_int64(select.get(), 2));
        record.failureReason = columnText(select.get(), 3);
        record.state = DeliveryState::InFlight;
        batch.records.push_back(std::move(record));
    }
    select.reset();

    if (!corrupt.empty()) {
        storage::Transaction tx(*db_);
        for (const auto& entry : corrupt) {
            deadLetterCorruptLocked(entry.seq, entry.stored, entry.reason);
        }
        tx.commit();

        for (const auto& entry : corrupt) {
            batch.corrupted.push_back(entry.seq);
        }

        count_ -= std::min(count_, corrupt.size());
        pending_ -= std::min(pending_, corrupt.size());
        spaceCv_.notify_all();
    }

    if (batch.empty()) {
        return batch;
    }

    storage::Transaction tx(*db_);
    auto update = db_->prepare("UPDATE records SET state = ? WHERE seq = ?;");
    for (const auto& record : batch.records) {
        sqlite3_reset(update.get());
        bindText(update.get(), 1, kStateInFlight);
        sqlite3_bind_int64(update.get(), 2, static_cast<sqlite3_int64>(record.sequenceNumber));
        db_->stepDone(update.get(), "mark in-flight");
    }
    tx.commit();

    pending_ -= std::min(pending_, batch.size());
    return batch;
}

void DurableQueue::markDelivered(const std::vector<std::uint64_t>& sequenceNumbers) {
    if (sequenceNumbers.empty()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);

        storage::Transaction tx(*db_);
        auto remove = db_->prepare("DELETE FROM records WHERE seq = ? RETURNING state;");
        std::size_t removed = 0;
        std::size_t removedPending = 0;
        for (auto seq : sequenceNumbers) {
            sqlite3_reset(remove.get());
            sqlite3_bind_int64(remove.get(), 1, static_cast<sqlite3_int64>(seq));
            while (db_->stepRow(remove.get(), "delete delivered record")) {
                removed++;
                if (columnText(remove.get(), 0) == kStatePending) {
                    removedPending++;
                }
            }
        }
        tx.commit();

        count_ -= std::min(count_, removed);
        pending_ -= std::min(pending_, removedPending);
    }
    spaceCv_.notify_all();
}

void DurableQueue::deadLetterCorruptLocked(std::uint64_t seq, const std::string& stored, const std::string& reason) {
    std::cerr << "[Queue] Dead-lettering " << reason << std::endl;

    auto insert = db_->prepare(
        "INSERT OR REPLACE INTO dead_letter (seq, reading, attempts, reason, failed_ms) "
        "SELECT seq, ?, attempts, ?, ? FROM records WHERE seq = ?;");
    bindText(insert.get(), 1, stored);
    bindText(insert.get(), 2, reason);
    sqlite3_bind_int64(insert.get(), 3, toEpochMillis(std::chrono::system_clock::now()));
    sqlite3_bind_int64(insert.get(), 4, static_cast<sqlite3_int64>(seq));
    db_->stepDone(insert.get(), "dead-letter corrupt record");

    auto remove = db_->prepare("DELETE FROM records WHERE seq = ?;");
    sqlite3_bind_int64(remove.get(), 1, static_cast<sqlite3_int64>(seq));
    db_->stepDone(remove.get(), "delete corrupt record");
}

std::size_t DurableQueue::release(const std::vector<std::uint64_t>& sequenceNumbers) {
    if (sequenceNumbers.empty()) {
        return 0;
    }

    std::size_t released = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        storage::Transaction tx(*db_);
        auto update = db_->prepare("UPDATE records SET state = ? WHERE seq = ? AND state = ?;");
        for (auto seq : sequenceNumbers) {
            sqlite3_reset(update.get());
            bindText(update.get(), 1, kStatePending);
            sqlite3_bind_int64(update.get(), 2, static_cast<sqlite3_int64>(seq));
            bindText(update.get(), 3, kStateInFlight);
            db_->stepDone(update.get(), "release record");
            released += static_cast<std::size_t>(db_->changes());
        }
        tx.commit();

        pending_ = std::min(count_, pending_ + released);
    }
    if (released > 0) {
        batchCv_.notify_all();
    }
    return released;
}

FailOutcome DurableQueue::markFailed(std::uint64_t sequenceNumber, const std::string& reason, FailureKind kind) {
    FailOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto select = db_->prepare("SELECT reading, attempts, state FROM records WHERE seq = ?;");
        sqlite3_bind_int64(select.get(), 1, static_cast<sqlite3_int64>(sequenceNumber));
        if (!db_->stepRow(select.get(), "select failed record")) {
            return outcome;
        }
        std::string reading = columnText(select.get(), 0);
        auto attempts = static_cast<std::uint32_t>(sqlite3_column_int64(select.get(), 1)) + 1;
        bool wasPending = columnText(select.get(), 2) == kStatePending;
        select.reset();

        outcome.attemptCount = attempts;

        if (kind == FailureKind::Permanent || attempts >= maxAttempts_) {
            storage::Transaction tx(*db_);

            auto insert = db_->prepare(
                "INSERT OR REPLACE INTO dead_letter (seq, reading, attempts, reason, failed_ms) VALUES (?, ?, ?, ?, ?);");
            sqlite3_bind_int64(insert.get(), 1, static_cast<sqlite3_int64>(sequenceNumber));
            bindText(insert.get(), 2, reading);
            sqlite3_bind_int64(insert.get(), 3, attempts);
            bindText(insert.get(), 4, reason);
            sqlite3_bind_int64(insert.get(), 5, toEpochMillis(std::chrono::system_clock::now()));
            db_->stepDone(insert.get(), "insert dead letter");

            auto remove = db_->prepare("DELETE FROM records WHERE seq = ?;");
            sqlite3_bind_int64(remove.get(), 1, static_cast<sqlite3_int64>(sequenceNumber));
            db_->stepDone(remove.get(), "delete dead-lettered record");

            tx.commit();

            count_ -= std::min<std::size_t>(count_, 1);
            if (wasPending) {
                pending_ -= std::min<std::size_t>(pending_, 1);
            }
            outcome.action = FailOutcome::Action::DeadLettered;
        } else {
            auto update = db_->prepare("UPDATE records SET state = ?, attempts = ?, reason = ? WHERE seq = ?;");
            bindText(update.get(), 1, kStatePending);
            sqlite3_bind_int64(update.get(), 2, attempts);
            bindText(update.get(), 3, reason);
            sqlite3_bind_int64(update.get(), 4, static_cast<sqlite3_int64>(sequenceNumber));
            db_->stepDone(update.get(), "return record to pending");

            if (!wasPending) {
                pending_++;
            }
            outcome.action = FailOutcome::Action::Retrying;
        }
    }

    if (outcome.action == FailOutcome::Action::DeadLettered) {
        spaceCv_.notify_all();
    } else {
        batchCv_.notify_all();
    }
    return outcome;
}

bool DurableQueue::waitForSpace(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    spaceCv_.wait_for(lock, timeout, [&] { return interrupted_ || count_ < maxRecords_; });
    return count_ < maxRecords_;
}

void DurableQueue::interruptWaits() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
    }
    batchCv_.notify_all();
    spaceCv_.notify_all();
}

void DurableQueue::resumeWaits() {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = false;
}

std::size_t DurableQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

std::size_t DurableQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

std::size_t DurableQueue::inFlightCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_ - pending_;
}

std::size_t DurableQueue::deadLetterCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(queryScalar("SELECT COUNT(*) FROM dead_letter;"));
}

std::vector<DeadLetter> DurableQueue::deadLetters() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<DeadLetter> letters;
    auto select = db_->prepare("SELECT seq, reading, attempts, reason, failed_ms FROM dead_letter ORDER BY seq ASC;");
    while (db_->stepRow(select.get(), "select dead letters")) {
        DeadLetter letter;
        letter.sequenceNumber = static_cast<std::uint64_t>(sqlite3_column_int64(select.get(), 0));
        try {
            letter.reading = decodeStoredReading(letter.sequenceNumber, columnText(select.get(), 1));
        } catch (const StorageError&) {
            // Kept as stored; the reason column says why it was dead-lettered
            letter.reading.payload = columnText(select.get(), 1);
        }
        letter.attemptCount = static_cast<std::uint32_t>(sqlite3_column_int64(select.get(), 2));
        letter.reason = columnText(select.get(), 3);
        letter.failedAt = fromEpochMillis(sqlite3_column_int64(select.get(), 4));
        letters.push_back(std::move(letter));
    }
    return letters;
}

std::optional<QueuedRecord> DurableQueue::find(std::uint64_t sequenceNumber) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto select = db_->prepare("SELECT reading, state, attempts, reason FROM records WHERE seq = ?;");
    sqlite3_bind_int64(select.get(), 1, static_cast<sqlite3_int64>(sequenceNumber));
    if (!db_->stepRow(select.get(), "find record")) {
        return std::nullopt;
    }

    QueuedRecord record;
    record.sequenceNumber = sequenceNumber;
    record.reading = decodeStoredReading(sequenceNumber, columnText(select.get(), 0));
    record.state = stringToDeliveryState(columnText(select.get(), 1));
    record.attemptCount = static_cast<std::uint32_t>(sqlite3_column_int64(select.get(), 2));
    record.failureReason = columnText(select.get(), 3);
    return record;
}

std::uint64_t DurableQueue::nextSequenceNumber() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextSeq_;
}

std::uint64_t DurableQueue::queryScalar(const std::string& sql) const {
    auto stmt = db_->prepare(sql);
    if (!db_->stepRow(stmt.get(), "scalar query")) {
        return 0;
    }
    return static_cast<std::uint64_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace datalogger::domain
