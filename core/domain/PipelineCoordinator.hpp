/**
 * @file PipelineCoordinator.hpp
 * @brief Control loop wiring broker, decoder, durable queue and forwarder
 *
 * Inbound path (ingest worker):
 *   Idle -> Decoding -> Queuing -> Idle
 * Forward path (one per forward worker):
 *   Idle -> Batching -> Forwarding -> Acking -> Idle
 *   Forwarding --transient failure--> Batching (records stay Pending)
 *
 * Acknowledgement timing follows AckMode. With OnEnqueue a message is
 * acknowledged as soon as its record is durably queued. With OnDelivery it
 * is only acknowledged once the record is Delivered or dead-lettered; that
 * needs a client whose PUBACK waits for acknowledge(), and against any other
 * client the coordinator runs OnEnqueue instead. Messages that fail to
 * decode are acknowledged at once; messages that cannot be queued are
 * rejected.
 *
 * The step functions pumpInbound() and forwardOnce() run one unit of work
 * on the calling thread. start() runs them on background workers.
 */

#pragma once

#include "AuditLog.hpp"
#include "Backoff.hpp"
#include "DurableQueue.hpp"
#include "Forwarder.hpp"
#include "../BoundedChannel.hpp"
#include "../ConnectionManager.hpp"
#include "../DataloggerConfig.hpp"
#include "../Decoder.hpp"
#include "../IClock.hpp"
#include "../ports/IPolicyEngine.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace datalogger::domain {

enum class PipelineStage {
    Idle,
    Decoding,
    Queuing,
    Batching,
    Forwarding,
    Acking
};

enum class CycleOutcome {
    Idle,           ///< Nothing was Pending
    Deferred,       ///< Retry gate still closed after a transient failure
    Delivered,      ///< Collector accepted the batch
    Retrying,       ///< Transient failure; records are Pending again
    DeadLettered    ///< Permanent failure or retries exhausted
};

/// What one forwardOnce() call did
struct CycleReport {
    CycleOutcome outcome = CycleOutcome::Idle;
    std::uint64_t batchId = 0;
    std::size_t records = 0;
    std::size_t acknowledged = 0;
    std::size_t deadLettered = 0;
    int httpStatus = 0;
    std::chrono::milliseconds retryDelay{0};   ///< Wait before the next attempt when Retrying/Deferred
};

struct PipelineOptions {
    AckMode ackMode = AckMode::OnEnqueue;
    std::size_t channelCapacity = 256;
    std::size_t batchSize = 50;
    std::chrono::milliseconds batchWait{1000};
    std::size_t concurrency = 1;
    std::chrono::milliseconds enqueueWait{5000};   ///< Longest wait for queue space before rejecting
    std::chrono::milliseconds pollInterval{100};   ///< Ingest loop tick for reconnect handling

    static PipelineOptions fromConfig(const DataloggerConfig& config);
};

struct PipelineStats {
    std::uint64_t received = 0;
    std::uint64_t decodeErrors = 0;
    std::uint64_t enqueued = 0;
    std::uint64_t enqueueFailures = 0;
    std::uint64_t batchesDelivered = 0;
    std::uint64_t recordsDelivered = 0;
    std::uint64_t recordsDeadLettered = 0;
    std::uint64_t transientFailures = 0;
};

class PipelineCoordinator {
public:
    /// Reports every stage entered, from whichever worker entered it
    using StageObserver = std::function<void(PipelineStage stage)>;

    PipelineCoordinator(std::shared_ptr<ConnectionManager> connection,
                        std::shared_ptr<Decoder> decoder,
                        std::shared_ptr<DurableQueue> queue,
                        std::shared_ptr<Forwarder> forwarder,
                        std::shared_ptr<IClock> clock,
                        std::shared_ptr<ports::IPolicyEngine> policyEngine,
                        PipelineOptions options,
                        std::shared_ptr<AuditLog> audit = nullptr);

    ~PipelineCoordinator();

    PipelineCoordinator(const PipelineCoordinator&) = delete;
    PipelineCoordinator& operator=(const PipelineCoordinator&) = delete;

    /**
     * @brief Decode and queue up to maxMessages buffered publishes
     * @return Number of messages taken from the inbound channel
     */
    std::size_t pumpInbound(std::size_t maxMessages = SIZE_MAX);

    /**
     * @brief Run one Batching -> Forwarding -> Acking cycle
     * @param maxWait Longest wait for a full batch
     * @throws StorageError if the queue fails; the batch is back to Pending then
     */
    CycleReport forwardOnce(std::chrono::milliseconds maxWait);

    /// Start the ingest worker and the forward workers
    void start();

    /**
     * @brief Stop intake, let in-flight forward attempts finish, reject every
     *        unsettled message so the broker redelivers it
     * @note Undelivered records stay Pending in the durable queue
     */
    void stop();

    bool isRunning() const { return running_; }

    void setStageObserver(StageObserver observer);

    PipelineStats stats() const;
    std::size_t unsettledCount() const;
    std::size_t bufferedCount() const { return inbound_.size(); }
    const PipelineOptions& options() const { return options_; }

private:
    std::shared_ptr<ConnectionManager> connection_;
    std::shared_ptr<Decoder> decoder_;
    std::shared_ptr<DurableQueue> queue_;
    std::shared_ptr<Forwarder> forwarder_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::shared_ptr<AuditLog> audit_;
    PipelineOptions options_;

    BoundedChannel<MqttMessage> inbound_;

    // Sequence number -> broker ack token, OnDelivery mode only
    mutable std::mutex acksMutex_;
    std::map<std::uint64_t, AckToken> unsettled_;

    // Shared by every forward worker so retries never overtake each other
    std::mutex retryMutex_;
    BackoffState retryBackoff_;
    std::chrono::steady_clock::time_point retryGate_{};

    StageObserver observer_;

    std::atomic<bool> running_{false};
    std::mutex runMutex_;
    std::condition_variable runCv_;
    std::thread ingestThread_;
    std::vector<std::thread> forwardThreads_;

    mutable std::mutex statsMutex_;
    PipelineStats stats_;

    CycleReport forwardBatch(const Batch& batch, CycleReport report);

    void onInbound(const MqttMessage& message);
    void handleInbound(const MqttMessage& message);
    std::size_t settle(const std::vector<std::uint64_t>& sequenceNumbers);
    void enterStage(PipelineStage stage);

    void ingestLoop();
    void forwardLoop();
    void pauseFor(std::chrono::milliseconds delay);

    void audit(AuditEvent event, const std::string& topic, std::uint64_t sequence, const std::string& detail);
};

std::string pipelineStageToString(PipelineStage stage);
std::string cycleOutcomeToString(CycleOutcome outcome);

} // namespace datalogger::domain
