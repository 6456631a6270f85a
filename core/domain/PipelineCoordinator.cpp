#include "PipelineCoordinator.hpp"
#include "../Errors.hpp"
#include <algorithm>
#include <iostream>

namespace datalogger::domain {

PipelineOptions PipelineOptions::fromConfig(const DataloggerConfig& config) {
    PipelineOptions options;
    options.ackMode = config.pipeline.ackMode;
    options.channelCapacity = config.pipeline.channelCapacity;
    options.batchSize = config.forwarder.batchSize;
    options.batchWait = config.forwarder.batchWait;
    options.concurrency = config.forwarder.concurrency;
    return options;
}

PipelineCoordinator::PipelineCoordinator(std::shared_ptr<ConnectionManager> connection,
                                         std::shared_ptr<Decoder> decoder,
                                         std::shared_ptr<DurableQueue> queue,
                                         std::shared_ptr<Forwarder> forwarder,
                                         std::shared_ptr<IClock> clock,
                                         std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                         PipelineOptions options,
                                         std::shared_ptr<AuditLog> audit)
    : connection_(std::move(connection)),
      decoder_(std::move(decoder)),
      queue_(std::move(queue)),
      forwarder_(std::move(forwarder)),
      clock_(std::move(clock)),
      policyEngine_(std::move(policyEngine)),
      audit_(std::move(audit)),
      options_(options),
      inbound_(options.channelCapacity),
      retryBackoff_(policyEngine_->getForwardRetryPolicy()) {
    if (options_.ackMode == AckMode::OnDelivery && !connection_->defersAcknowledgement()) {
        std::cerr << "[Pipeline] MQTT client acknowledges on receipt; acking on enqueue instead of on delivery"
                  << std::endl;
        options_.ackMode = AckMode::OnEnqueue;
    }

    connection_->onMessage([this](const MqttMessage& message) {
        onInbound(message);
    });
}

PipelineCoordinator::~PipelineCoordinator() {
    stop();
    connection_->onMessage(nullptr);
}

void PipelineCoordinator::setStageObserver(StageObserver observer) {
    observer_ = std::move(observer);
}

void PipelineCoordinator::onInbound(const MqttMessage& message) {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.received++;
    }

    // Blocks while the channel is full, holding the client's callback thread
    if (!inbound_.push(message)) {
        connection_->reject(message.ackToken);
    }
}

std::size_t PipelineCoordinator::pumpInbound(std::size_t maxMessages) {
    std::size_t handled = 0;
    while (handled < maxMessages) {
        auto message = inbound_.tryPop();
        if (!message) {
            break;
        }
        handleInbound(*message);
        handled++;
    }
    return handled;
}

void PipelineCoordinator::handleInbound(const MqttMessage& message) {
    enterStage(PipelineStage::Decoding);

    auto result = decoder_->decode(message.topic, message.payload, clock_->wallNow());
    if (!result.success) {
        std::cerr << "[Decoder] Dropped message on " << message.topic << ": "
                  << decodeErrorKindToString(result.error.kind) << " (" << result.error.message << ")" << std::endl;
        audit(AuditEvent::DecodeError, message.topic, 0,
              decodeErrorKindToString(result.error.kind) + ": " + result.error.message);
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.decodeErrors++;
        }
        connection_->acknowledge(message.ackToken);
        enterStage(PipelineStage::Idle);
        return;
    }

    Reading reading = std::move(result.reading);
    reading.ackToken = message.ackToken;

    enterStage(PipelineStage::Queuing);

    if (!queue_->waitForSpace(options_.enqueueWait)) {
        std::cerr << "[Pipeline] Queue full, holding back " << message.topic << std::endl;
    }

    try {
        if (options_.ackMode == AckMode::OnDelivery) {
            // Registered under the same lock so a fast forward worker cannot miss the token
            std::lock_guard<std::mutex> lock(acksMutex_);
            auto seq = queue_->enqueue(reading);
            unsettled_[seq] = message.ackToken;
        } else {
            queue_->enqueue(reading);
            connection_->acknowledge(message.ackToken);
        }

        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.enqueued++;
    } catch (const StorageError& e) {
        std::cerr << "[Pipeline] Enqueue failed for " << message.topic << ": " << e.what()
                  << "; message left for redelivery" << std::endl;
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.enqueueFailures++;
        }
        connection_->reject(message.ackToken);
    }

    enterStage(PipelineStage::Idle);
}

CycleReport PipelineCoordinator::forwardOnce(std::chrono::milliseconds maxWait) {
    CycleReport report;

    {
        std::lock_guard<std::mutex> lock(retryMutex_);
        auto now = clock_->now();
        if (now < retryGate_) {
            report.outcome = CycleOutcome::Deferred;
            report.retryDelay = std::chrono::duration_cast<std::chrono::milliseconds>(retryGate_ - now);
            return report;
        }
    }

    enterStage(PipelineStage::Batching);
    Batch batch = queue_->waitForBatch(options_.batchSize, maxWait);
    if (!batch.corrupted.empty()) {
        // Nothing left to deliver for these; release them like any other dead letter
        report.deadLettered = batch.corrupted.size();
        report.acknowledged = settle(batch.corrupted);
        for (auto seq : batch.corrupted) {
            audit(AuditEvent::DeadLetter, "", seq, "corrupt stored record");
        }
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.recordsDeadLettered += batch.corrupted.size();
    }
    if (batch.empty()) {
        enterStage(PipelineStage::Idle);
        return report;
    }

    try {
        return forwardBatch(batch, report);
    } catch (const StorageError& e) {
        // The queue could not record the outcome; hand the batch out again
        std::cerr << "[Pipeline] Queue error after batch was taken: " << e.what() << std::endl;
        try {
            auto released = queue_->release(batch.sequenceNumbers());
            std::cerr << "[Pipeline] " << released << " records back to pending" << std::endl;
        } catch (const StorageError& releaseError) {
            std::cerr << "[Pipeline] Could not release batch, records return on restart: "
                      << releaseError.what() << std::endl;
        }
        enterStage(PipelineStage::Idle);
        throw;
    }
}

CycleReport PipelineCoordinator::forwardBatch(const Batch& batch, CycleReport report) {
    report.records = batch.size();

    enterStage(PipelineStage::Forwarding);
    ForwardResult result = forwarder_->send(batch);
    auto seqs = batch.sequenceNumbers();

    if (result.success) {
        queue_->markDelivered(seqs);
        {
            std::lock_guard<std::mutex> lock(retryMutex_);
            retryBackoff_.reset();
            retryGate_ = {};
        }

        enterStage(PipelineStage::Acking);
        report.acknowledged += settle(seqs);
        report.outcome = CycleOutcome::Delivered;
        report.batchId = result.report.batchId;
        report.httpStatus = result.report.httpStatus;

        audit(AuditEvent::Delivered, batch.records.front().reading.topic, seqs.front(),
              "batch " + std::to_string(result.report.batchId) + ": " + std::to_string(seqs.size()) +
              " records, HTTP " + std::to_string(result.report.httpStatus));
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.batchesDelivered++;
            stats_.recordsDelivered += seqs.size();
        }
        enterStage(PipelineStage::Idle);
        return report;
    }

    report.batchId = result.error.batchId;
    report.httpStatus = result.error.httpStatus;

    FailureKind kind = result.error.kind == ForwardErrorKind::Permanent ? FailureKind::Permanent
                                                                          : FailureKind::Transient;
    std::vector<std::uint64_t> terminal;
    try {
        for (const auto& record : batch.records) {
            auto outcome = queue_->markFailed(record.sequenceNumber, result.error.message, kind);
            if (outcome.action == FailOutcome::Action::DeadLettered) {
                terminal.push_back(record.sequenceNumber);
                std::cerr << "[Pipeline] Record " << record.sequenceNumber << " dead-lettered after "
                          << outcome.attemptCount << " attempt(s): " << result.error.message << std::endl;
                audit(AuditEvent::DeadLetter, record.reading.topic, record.sequenceNumber, result.error.message);
            }
        }
    } catch (const StorageError&) {
        // Records already dead-lettered are gone from the queue; settle them before giving up
        settle(terminal);
        throw;
    }
    report.deadLettered += terminal.size();

    if (kind == FailureKind::Transient) {
        std::lock_guard<std::mutex> lock(retryMutex_);
        report.retryDelay = retryBackoff_.recordFailure(clock_->now());
        retryGate_ = retryBackoff_.nextAttemptAt();
    }

    if (!terminal.empty()) {
        // Dead-lettering is terminal, so those messages are done with the broker
        enterStage(PipelineStage::Acking);
        report.acknowledged += settle(terminal);
    }

    if (terminal.size() == batch.size()) {
        report.outcome = CycleOutcome::DeadLettered;
    } else {
        report.outcome = CycleOutcome::Retrying;
        std::cerr << "[Pipeline] " << (batch.size() - terminal.size()) << " records back to pending, next attempt in "
                  << report.retryDelay.count() << " ms" << std::endl;
        audit(AuditEvent::Retry, batch.records.front().reading.topic, seqs.front(),
              result.error.message + "; retry in " + std::to_string(report.retryDelay.count()) + " ms");
        enterStage(PipelineStage::Batching);
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.recordsDeadLettered += terminal.size();
        if (kind == FailureKind::Transient) {
            stats_.transientFailures++;
        }
    }

    enterStage(PipelineStage::Idle);
    return report;
}

std::size_t PipelineCoordinator::settle(const std::vector<std::uint64_t>& sequenceNumbers) {
    std::vector<AckToken> tokens;
    {
        std::lock_guard<std::mutex> lock(acksMutex_);
        for (auto seq : sequenceNumbers) {
            auto it = unsettled_.find(seq);
            if (it != unsettled_.end()) {
                tokens.push_back(it->second);
                unsettled_.erase(it);
            }
        }
    }

    std::size_t acknowledged = 0;
    for (auto token : tokens) {
        if (connection_->acknowledge(token)) {
            acknowledged++;
        }
    }
    return acknowledged;
}

void PipelineCoordinator::start() {
    if (running_.exchange(true)) {
        return;
    }

    inbound_.reopen();
    queue_->resumeWaits();

    std::cout << "[Pipeline] Starting: ack on " << ackModeToString(options_.ackMode)
              << ", batch " << options_.batchSize << " / " << options_.batchWait.count() << " ms, "
              << options_.concurrency << " forward worker(s)" << std::endl;

    ingestThread_ = std::thread([this] { ingestLoop(); });
    for (std::size_t i = 0; i < std::max<std::size_t>(options_.concurrency, 1); ++i) {
        forwardThreads_.emplace_back([this] { forwardLoop(); });
    }
}

void PipelineCoordinator::stop() {
    bool wasRunning = running_.exchange(false);
    if (wasRunning) {
        std::cout << "[Pipeline] Stopping" << std::endl;
    }

    inbound_.close();
    queue_->interruptWaits();
    {
        std::lock_guard<std::mutex> lock(runMutex_);
    }
    runCv_.notify_all();

    if (ingestThread_.joinable()) {
        ingestThread_.join();
    }
    for (auto& worker : forwardThreads_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    forwardThreads_.clear();

    // Messages never decoded or never delivered go back to the broker
    std::size_t rejected = 0;
    for (const auto& message : inbound_.drain()) {
        if (connection_->reject(message.ackToken)) {
            rejected++;
        }
    }

    std::map<std::uint64_t, AckToken> unsettled;
    {
        std::lock_guard<std::mutex> lock(acksMutex_);
        unsettled.swap(unsettled_);
    }
    for (const auto& entry : unsettled) {
        if (connection_->reject(entry.second)) {
            rejected++;
        }
    }

    if (wasRunning || rejected > 0) {
        std::cout << "[Pipeline] Stopped: " << queue_->size() << " records left pending, "
                  << rejected << " messages returned to the broker" << std::endl;
    }
}

void PipelineCoordinator::ingestLoop() {
    while (running_) {
        connection_->processEvents();

        auto message = inbound_.pop(options_.pollInterval);
        if (message) {
            handleInbound(*message);
        }
    }
}

void PipelineCoordinator::forwardLoop() {
    while (running_) {
        try {
            auto report = forwardOnce(options_.batchWait);
            if (report.outcome == CycleOutcome::Deferred || report.outcome == CycleOutcome::Retrying) {
                pauseFor(std::min(report.retryDelay, options_.pollInterval));
            }
        } catch (const StorageError& e) {
            std::cerr << "[Pipeline] Queue error while forwarding: " << e.what() << std::endl;
            pauseFor(std::chrono::milliseconds(1000));
        }
    }
}

void PipelineCoordinator::pauseFor(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(runMutex_);
    runCv_.wait_for(lock, delay, [this] { return !running_; });
}

PipelineStats PipelineCoordinator::stats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

std::size_t PipelineCoordinator::unsettledCount() const {
    std::lock_guard<std::mutex> lock(acksMutex_);
    return unsettled_.size();
}

void PipelineCoordinator::enterStage(PipelineStage stage) {
    if (observer_) {
        observer_(stage);
    }
}

void PipelineCoordinator::audit(AuditEvent event, const std::string& topic, std::uint64_t sequence,
                                const std::string& detail) {
    if (audit_) {
        audit_->record(event, topic, sequence, detail);
    }
}

std::string pipelineStageToString(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Idle: return "Idle";
        case PipelineStage::Decoding: return "Decoding";
        case PipelineStage::Queuing: return "Queuing";
        case PipelineStage::Batching: return "Batching";
        case PipelineStage::Forwarding: return "Forwarding";
        case PipelineStage::Acking: return "Acking";
        default: return "Unknown";
    }
}

std::string cycleOutcomeToString(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::Idle: return "idle";
        case CycleOutcome::Deferred: return "deferred";
        case CycleOutcome::Delivered: return "delivered";
        case CycleOutcome::Retrying: return "retrying";
        case CycleOutcome::DeadLettered: return "dead_lettered";
        default: return "unknown";
    }
}

} // namespace datalogger::domain
