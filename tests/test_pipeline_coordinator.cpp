#include <gtest/gtest.h>
#include "../core/domain/PipelineCoordinator.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/sim/FixedRng.hpp"
#include "../core/sim/MockHttpClient.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "../core/Errors.hpp"
#include "../storage/sqlite/SqliteDb.hpp"
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <set>
#include <thread>

using namespace datalogger;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

class PipelineCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("datalogger_pipeline_" + std::to_string(rd()));
        fs::create_directories(dir_);
        queuePath_ = (dir_ / "queue.db").string();

        clock_ = std::make_shared<sim::SimulatedClock>();
        rng_ = std::make_shared<sim::FixedRng>(1.0);
        policyEngine_ = std::make_shared<adapters::DefaultPolicyEngine>(rng_);
        mqtt_ = std::make_shared<sim::MockMqttClient>();
        http_ = std::make_shared<sim::MockHttpClient>();

        connection_ = std::make_shared<ConnectionManager>(mqtt_, clock_, policyEngine_);
        decoder_ = std::make_shared<Decoder>(DecoderConfig{});

        CollectorConfig collector;
        collector.url = "http://collector.local/ingest";
        forwarder_ = std::make_shared<domain::Forwarder>(http_, collector, clock_);

        options_.ackMode = AckMode::OnDelivery;
        options_.batchSize = 50;
        options_.batchWait = 0ms;
        options_.enqueueWait = 10ms;
        options_.pollInterval = 10ms;

        BrokerAddress address;
        address.host = "broker.local";
        Credentials credentials;
        credentials.clientId = "datalogger-test";
        connection_->connect(address, credentials, {"sensors/#"});
    }

    void TearDown() override {
        coordinator_.reset();
        queue_.reset();
        connection_.reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void build(std::size_t maxRecords = 1000, std::uint32_t maxAttempts = 5,
               std::shared_ptr<domain::AuditLog> audit = nullptr) {
        coordinator_.reset();
        queue_.reset();
        queue_ = std::make_shared<domain::DurableQueue>(queuePath_, maxRecords, maxAttempts);
        coordinator_ = std::make_unique<domain::PipelineCoordinator>(
            connection_, decoder_, queue_, forwarder_, clock_, policyEngine_, options_, audit);
    }

    std::vector<AckToken> publish(std::size_t count, const std::string& topic = "sensors/temp") {
        std::vector<AckToken> tokens;
        for (std::size_t i = 0; i < count; ++i) {
            tokens.push_back(mqtt_->injectMessage(topic, R"({"value":)" + std::to_string(i) + "}"));
        }
        return tokens;
    }

    void execOnQueueFile(const std::string& sql) {
        storage::SqliteDb db(queuePath_);
        db.exec(sql);
    }

    fs::path dir_;
    std::string queuePath_;

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::FixedRng> rng_;
    std::shared_ptr<adapters::DefaultPolicyEngine> policyEngine_;
    std::shared_ptr<sim::MockMqttClient> mqtt_;
    std::shared_ptr<sim::MockHttpClient> http_;
    std::shared_ptr<ConnectionManager> connection_;
    std::shared_ptr<Decoder> decoder_;
    std::shared_ptr<domain::Forwarder> forwarder_;
    std::shared_ptr<domain::DurableQueue> queue_;
    domain::PipelineOptions options_;
    std::unique_ptr<domain::PipelineCoordinator> coordinator_;
};

TEST_F(PipelineCoordinatorTest, HundredMessagesDelivered) {
    build();
    auto tokens = publish(100);

    EXPECT_EQ(coordinator_->pumpInbound(), 100u);
    EXPECT_EQ(queue_->size(), 100u);
    // Nothing is acknowledged before the collector has the records
    EXPECT_TRUE(mqtt_->acknowledged().empty());

    auto first = coordinator_->forwardOnce(0ms);
    auto second = coordinator_->forwardOnce(0ms);

    EXPECT_EQ(first.outcome, domain::CycleOutcome::Delivered);
    EXPECT_EQ(first.acknowledged, 50u);
    EXPECT_EQ(second.outcome, domain::CycleOutcome::Delivered);
    EXPECT_EQ(second.acknowledged, 50u);

    EXPECT_EQ(queue_->size(), 0u);
    EXPECT_EQ(mqtt_->acknowledged().size(), 100u);
    EXPECT_EQ(mqtt_->unsettledCount(), 0u);
    EXPECT_EQ(http_->requestCount(), 2u);

    auto stats = coordinator_->stats();
    EXPECT_EQ(stats.received, 100u);
    EXPECT_EQ(stats.recordsDelivered, 100u);
    EXPECT_EQ(coordinator_->forwardOnce(0ms).outcome, domain::CycleOutcome::Idle);
}

TEST_F(PipelineCoordinatorTest, DeliveryOrderMatchesPublishOrder) {
    options_.batchSize = 4;
    build();
    publish(10);
    coordinator_->pumpInbound();

    std::vector<int> values;
    while (coordinator_->forwardOnce(0ms).outcome == domain::CycleOutcome::Delivered) {
    }
    for (const auto& request : http_->requests()) {
        auto body = nlohmann::json::parse(request.body);
        std::uint64_t lastSeq = 0;
        for (const auto& reading : body["readings"]) {
            EXPECT_GT(reading["seq"].get<std::uint64_t>(), lastSeq);
            lastSeq = reading["seq"].get<std::uint64_t>();
            values.push_back(reading["payload"].get<int>());
        }
    }

    ASSERT_EQ(values.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(values[i], i);
    }
}

TEST_F(PipelineCoordinatorTest, TransientFailuresRetryWithGrowingBackoff) {
    build();
    auto tokens = publish(3);
    coordinator_->pumpInbound();

    http_->queueStatus(503);
    http_->queueStatus(503);
    http_->queueStatus(200);

    auto first = coordinator_->forwardOnce(0ms);
    EXPECT_EQ(first.outcome, domain::CycleOutcome::Retrying);
    EXPECT_EQ(first.retryDelay, 1000ms);
    EXPECT_EQ(queue_->pendingCount(), 3u);
    EXPECT_TRUE(mqtt_->acknowledged().empty());

    // Gate stays closed until the backoff has elapsed
    auto early = coordinator_->forwardOnce(0ms);
    EXPECT_EQ(early.outcome, domain::CycleOutcome::Deferred);
    EXPECT_EQ(http_->requestCount(), 1u);

    clock_->advance(1000ms);
    auto second = coordinator_->forwardOnce(0ms);
    EXPECT_EQ(second.outcome, domain::CycleOutcome::Retrying);
    EXPECT_EQ(second.retryDelay, 2000ms);
    EXPECT_GT(second.retryDelay, first.retryDelay);

    clock_->advance(2000ms);
    auto third = coordinator_->forwardOnce(0ms);
    EXPECT_EQ(third.outcome, domain::CycleOutcome::Delivered);
    EXPECT_EQ(third.acknowledged, 3u);

    EXPECT_EQ(http_->requestCount(), 3u);
    EXPECT_EQ(queue_->size(), 0u);
    EXPECT_EQ(queue_->deadLetterCount(), 0u);

    // Exactly one acknowledgement per record
    auto acked = mqtt_->acknowledged();
    EXPECT_EQ(acked.size(), 3u);
    EXPECT_EQ(std::set<AckToken>(acked.begin(), acked.end()), std::set<AckToken>(tokens.begin(), tokens.end()));
    EXPECT_TRUE(mqtt_->rejected().empty());
}

TEST_F(PipelineCoordinatorTest, ClientErrorDeadLettersWithoutRetry) {
    build();
    auto tokens = publish(3);
    coordinator_->pumpInbound();
    http_->queueStatus(400, "schema mismatch");

    auto report = coordinator_->forwardOnce(0ms);

    EXPECT_EQ(report.outcome, domain::CycleOutcome::DeadLettered);
    EXPECT_EQ(report.deadLettered, 3u);
    EXPECT_EQ(report.acknowledged, 3u);
    EXPECT_EQ(report.httpStatus, 400);
    EXPECT_EQ(queue_->size(), 0u);
    EXPECT_EQ(queue_->deadLetterCount(), 3u);
    EXPECT_EQ(mqtt_->acknowledged().size(), 3u);

    EXPECT_EQ(coordinator_->forwardOnce(0ms).outcome, domain::CycleOutcome::Idle);
    EXPECT_EQ(http_->requestCount(), 1u);
}

TEST_F(PipelineCoordinatorTest, RetriesExhaustedDeadLetter) {
    build(1000, 2);
    publish(1);
    coordinator_->pumpInbound();
    http_->setDefaultStatus(502);

    EXPECT_EQ(coordinator_->forwardOnce(0ms).outcome, domain::CycleOutcome::Retrying);
    clock_->advance(60s);
    auto report = coordinator_->forwardOnce(0ms);

    EXPECT_EQ(report.outcome, domain::CycleOutcome::DeadLettered);
    EXPECT_EQ(queue_->deadLetterCount(), 1u);
    EXPECT_EQ(mqtt_->acknowledged().size(), 1u);
}

TEST_F(PipelineCoordinatorTest, MalformedPayloadDroppedAndAcked) {
    build();
    auto bad = mqtt_->injectMessage("sensors/temp", "{broken");
    auto good = mqtt_->injectMessage("sensors/temp", R"({"value":1})");

    coordinator_->pumpInbound();

    EXPECT_TRUE(mqtt_->isSettled(bad));
    EXPECT_EQ(mqtt_->acknowledged(), (std::vector<AckToken>{bad}));
    EXPECT_EQ(queue_->size(), 1u);
    EXPECT_EQ(coordinator_->stats().decodeErrors, 1u);

    auto report = coordinator_->forwardOnce(0ms);
    EXPECT_EQ(report.outcome, domain::CycleOutcome::Delivered);
    EXPECT_TRUE(mqtt_->isSettled(good));
}

TEST_F(PipelineCoordinatorTest, QueuedRecordsSurviveRestart) {
    build();
    publish(2);
    coordinator_->pumpInbound();

    // Crash mid-forward: the batch was taken but never confirmed
    queue_->peekBatch(10);
    coordinator_.reset();

    build();
    auto report = coordinator_->forwardOnce(0ms);

    EXPECT_EQ(report.outcome, domain::CycleOutcome::Delivered);
    EXPECT_EQ(report.records, 2u);
    auto body = nlohmann::json::parse(http_->lastRequest().body);
    EXPECT_EQ(body["readings"][0]["seq"], 1);
    EXPECT_EQ(body["readings"][0]["payload"], 0);
    EXPECT_EQ(body["readings"][1]["payload"], 1);

    // New publishes continue the numbering
    publish(1);
    coordinator_->pumpInbound();
    auto next = queue_->peekBatch(1);
    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next.records[0].sequenceNumber, 3u);
}

TEST_F(PipelineCoordinatorTest, StopReturnsUnsettledMessages) {
    build();
    auto tokens = publish(2);
    coordinator_->pumpInbound();
    EXPECT_EQ(coordinator_->unsettledCount(), 2u);

    coordinator_->stop();

    EXPECT_EQ(coordinator_->unsettledCount(), 0u);
    EXPECT_EQ(mqtt_->rejected().size(), 2u);
    EXPECT_TRUE(mqtt_->acknowledged().empty());
    // Records stay queued for the next run
    EXPECT_EQ(queue_->size(), 2u);
}

TEST_F(PipelineCoordinatorTest, AckOnEnqueueMode) {
    options_.ackMode = AckMode::OnEnqueue;
    build();
    auto tokens = publish(2);

    coordinator_->pumpInbound();
    EXPECT_EQ(mqtt_->acknowledged().size(), 2u);
    EXPECT_EQ(coordinator_->unsettledCount(), 0u);

    auto report = coordinator_->forwardOnce(0ms);
    EXPECT_EQ(report.outcome, domain::CycleOutcome::Delivered);
    EXPECT_EQ(report.acknowledged, 0u);
}

TEST_F(PipelineCoordinatorTest, FullQueueRejectsMessage) {
    build(2, 5);
    auto tokens = publish(3);

    coordinator_->pumpInbound();

    EXPECT_EQ(queue_->size(), 2u);
    EXPECT_EQ(mqtt_->rejected(), (std::vector<AckToken>{tokens[2]}));
    EXPECT_EQ(coordinator_->stats().enqueueFailures, 1u);
}

TEST_F(PipelineCoordinatorTest, StagesReported) {
    build();
    std::vector<domain::PipelineStage> stages;
    coordinator_->setStageObserver([&](domain::PipelineStage stage) { stages.push_back(stage); });

    publish(1);
    coordinator_->pumpInbound();
    coordinator_->forwardOnce(0ms);

    std::vector<domain::PipelineStage> expected = {
        domain::PipelineStage::Decoding, domain::PipelineStage::Queuing, domain::PipelineStage::Idle,
        domain::PipelineStage::Batching, domain::PipelineStage::Forwarding, domain::PipelineStage::Acking,
        domain::PipelineStage::Idle};
    EXPECT_EQ(stages, expected);
}

TEST_F(PipelineCoordinatorTest, AuditTrailRecordsOutcomes) {
    auto auditPath = (dir_ / "audit.csv").string();
    build(1000, 5, std::make_shared<domain::AuditLog>(auditPath, clock_));

    mqtt_->injectMessage("sensors/temp", "");
    publish(1);
    coordinator_->pumpInbound();
    http_->queueStatus(400);
    coordinator_->forwardOnce(0ms);

    std::ifstream in(auditPath);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("decode_error,sensors/temp,,empty_payload"), std::string::npos);
    EXPECT_NE(content.find("dead_letter,sensors/temp,1,HTTP 400"), std::string::npos);
}

TEST_F(PipelineCoordinatorTest, BackgroundWorkersDeliver) {
    options_.batchSize = 5;
    options_.batchWait = 20ms;
    options_.concurrency = 2;
    build();
    coordinator_->start();
    EXPECT_TRUE(coordinator_->isRunning());

    publish(20);

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (mqtt_->acknowledged().size() < 20 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    coordinator_->stop();

    EXPECT_EQ(mqtt_->acknowledged().size(), 20u);
    EXPECT_EQ(queue_->size(), 0u);
    EXPECT_FALSE(coordinator_->isRunning());
}

TEST_F(PipelineCoordinatorTest, ConcurrentWorkersPostEachRecordOnce) {
    options_.batchSize = 3;
    options_.batchWait = 5ms;
    options_.concurrency = 4;
    build();
    coordinator_->start();

    publish(40);

    auto deadline = std::chrono::steady_clock::now() + 10s;
    while (mqtt_->acknowledged().size() < 40 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    coordinator_->stop();

    std::map<std::uint64_t, int> posted;
    for (const auto& request : http_->requests()) {
        auto body = nlohmann::json::parse(request.body);
        EXPECT_LE(body["readings"].size(), 3u);
        for (const auto& reading : body["readings"]) {
            posted[reading["seq"].get<std::uint64_t>()]++;
        }
    }

    ASSERT_EQ(posted.size(), 40u);
    EXPECT_EQ(posted.begin()->first, 1u);
    EXPECT_EQ(posted.rbegin()->first, 40u);
    for (const auto& entry : posted) {
        EXPECT_EQ(entry.second, 1) << "seq " << entry.first;
    }
    EXPECT_EQ(mqtt_->acknowledged().size(), 40u);
    EXPECT_EQ(queue_->size(), 0u);
}

TEST_F(PipelineCoordinatorTest, StorageFailureOnEnqueueRejectsMessage) {
    build();
    execOnQueueFile("CREATE TRIGGER fail_insert BEFORE INSERT ON records BEGIN SELECT RAISE(ABORT, 'disk I/O error'); END;");

    auto tokens = publish(1);
    coordinator_->pumpInbound();

    EXPECT_EQ(mqtt_->rejected(), tokens);
    EXPECT_TRUE(mqtt_->acknowledged().empty());
    EXPECT_EQ(coordinator_->stats().enqueueFailures, 1u);
    EXPECT_EQ(coordinator_->unsettledCount(), 0u);
    EXPECT_EQ(queue_->size(), 0u);
}

TEST_F(PipelineCoordinatorTest, QueueErrorAfterSendReleasesBatch) {
    build();
    auto tokens = publish(2);
    coordinator_->pumpInbound();
    execOnQueueFile("CREATE TRIGGER fail_delete BEFORE DELETE ON records BEGIN SELECT RAISE(ABORT, 'disk I/O error'); END;");

    EXPECT_THROW(coordinator_->forwardOnce(0ms), StorageError);

    EXPECT_EQ(queue_->pendingCount(), 2u);
    EXPECT_EQ(queue_->inFlightCount(), 0u);
    EXPECT_TRUE(mqtt_->acknowledged().empty());
    EXPECT_EQ(coordinator_->unsettledCount(), 2u);

    execOnQueueFile("DROP TRIGGER fail_delete;");
    auto report = coordinator_->forwardOnce(0ms);

    EXPECT_EQ(report.outcome, domain::CycleOutcome::Delivered);
    EXPECT_EQ(report.acknowledged, 2u);
    EXPECT_EQ(queue_->size(), 0u);
    EXPECT_EQ(http_->requestCount(), 2u);
}

TEST_F(PipelineCoordinatorTest, CorruptRecordDoesNotBlockLaterRecords) {
    build();
    auto tokens = publish(3);
    coordinator_->pumpInbound();
    execOnQueueFile("UPDATE records SET reading = '{not json' WHERE seq = 1;");

    auto report = coordinator_->forwardOnce(0ms);

    EXPECT_EQ(report.outcome, domain::CycleOutcome::Delivered);
    EXPECT_EQ(report.records, 2u);
    EXPECT_EQ(report.deadLettered, 1u);
    EXPECT_EQ(report.acknowledged, 3u);
    EXPECT_EQ(queue_->size(), 0u);
    EXPECT_EQ(queue_->deadLetterCount(), 1u);
    EXPECT_TRUE(mqtt_->isSettled(tokens[0]));
    EXPECT_EQ(coordinator_->stats().recordsDeadLettered, 1u);
}

TEST_F(PipelineCoordinatorTest, DeliveryAckFallsBackWhenClientAcksOnReceipt) {
    mqtt_->setDefersAcknowledgement(false);
    build();

    EXPECT_EQ(coordinator_->options().ackMode, AckMode::OnEnqueue);

    publish(2);
    coordinator_->pumpInbound();
    EXPECT_EQ(mqtt_->acknowledged().size(), 2u);
    EXPECT_EQ(coordinator_->unsettledCount(), 0u);
}

TEST_F(PipelineCoordinatorTest, DefaultOptionsAckOnEnqueue) {
    EXPECT_EQ(domain::PipelineOptions{}.ackMode, AckMode::OnEnqueue);
    EXPECT_EQ(domain::PipelineOptions::fromConfig(DataloggerConfig{}).ackMode, AckMode::OnEnqueue);
}
