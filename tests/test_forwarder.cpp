#include <gtest/gtest.h>
#include "../core/domain/Forwarder.hpp"
#include "../core/JsonCodec.hpp"
#include "../core/sim/MockHttpClient.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include "../crypto/RequestSigner.hpp"
#include <memory>

using namespace datalogger;

class ForwarderTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        http_ = std::make_shared<sim::MockHttpClient>();

        config_.url = "https://collector.example.com/ingest";
        config_.authToken = "secret-token";
        forwarder_ = std::make_unique<domain::Forwarder>(http_, config_, clock_);
    }

    static Batch makeBatch(std::size_t count) {
        Batch batch;
        for (std::size_t i = 0; i < count; ++i) {
            QueuedRecord record;
            record.sequenceNumber = 10 + i;
            record.reading.topic = "sensors/temp";
            record.reading.deviceId = "dev-" + std::to_string(i);
            record.reading.timestamp = fromEpochMillis(1700000000000 + static_cast<std::int64_t>(i));
            record.reading.payload = {{"temp", 20 + static_cast<int>(i)}};
            batch.records.push_back(record);
        }
        return batch;
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::MockHttpClient> http_;
    CollectorConfig config_;
    std::unique_ptr<domain::Forwarder> forwarder_;
};

TEST_F(ForwarderTest, PostsVersionedBatch) {
    auto result = forwarder_->send(makeBatch(3));

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.report.batchId, 1u);
    EXPECT_EQ(result.report.httpStatus, 200);
    EXPECT_EQ(result.report.sequenceNumbers, (std::vector<std::uint64_t>{10, 11, 12}));

    ASSERT_EQ(http_->requestCount(), 1u);
    auto request = http_->lastRequest();
    EXPECT_EQ(request.url, config_.url);
    EXPECT_EQ(request.headers["Content-Type"], "application/json");
    EXPECT_EQ(request.headers["Authorization"], "Bearer secret-token");
    EXPECT_EQ(request.headers["X-Datalogger-Schema"], "datalogger.batch.v1");
    EXPECT_EQ(request.headers["X-Datalogger-Batch"], "1");
    EXPECT_EQ(request.headers.count(RequestSigner::kHeaderName), 0u);

    auto body = nlohmann::json::parse(request.body);
    EXPECT_EQ(body["schema"], "datalogger.batch.v1");
    EXPECT_EQ(body["batch_id"], 1);
    EXPECT_EQ(body["count"], 3);
    EXPECT_EQ(body["sent_at"], "2023-11-14T22:13:20.000Z");
    ASSERT_EQ(body["readings"].size(), 3u);
    EXPECT_EQ(body["readings"][0]["seq"], 10);
    EXPECT_EQ(body["readings"][0]["device_id"], "dev-0");
    EXPECT_EQ(body["readings"][0]["ts"], "2023-11-14T22:13:20.000Z");
    EXPECT_EQ(body["readings"][0]["ts_ms"], 1700000000000);
    EXPECT_EQ(body["readings"][2]["payload"]["temp"], 22);
}

TEST_F(ForwarderTest, EmptyBatchSendsNothing) {
    auto result = forwarder_->send(Batch{});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(http_->requestCount(), 0u);
    EXPECT_EQ(forwarder_->batchesSent(), 0u);
}

TEST_F(ForwarderTest, BatchIdsIncrease) {
    forwarder_->send(makeBatch(1));
    auto second = forwarder_->send(makeBatch(1));

    EXPECT_EQ(second.report.batchId, 2u);
    EXPECT_EQ(forwarder_->batchesSent(), 2u);
}

TEST_F(ForwarderTest, ServerErrorIsTransient) {
    http_->queueStatus(503, "overloaded");

    auto result = forwarder_->send(makeBatch(2));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, domain::ForwardErrorKind::Transient);
    EXPECT_EQ(result.error.httpStatus, 503);
    EXPECT_NE(result.error.message.find("503"), std::string::npos);
    EXPECT_EQ(http_->requestCount(), 1u);
}

TEST_F(ForwarderTest, ClientErrorIsPermanent) {
    http_->queueStatus(400, "bad reading");

    auto result = forwarder_->send(makeBatch(1));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, domain::ForwardErrorKind::Permanent);
    EXPECT_EQ(result.error.httpStatus, 400);
}

TEST_F(ForwarderTest, TransportFailuresAreTransient) {
    http_->queueTransportFailure("Connection refused");
    http_->queueTimeout();

    auto refused = forwarder_->send(makeBatch(1));
    auto timedOut = forwarder_->send(makeBatch(1));

    EXPECT_EQ(refused.error.kind, domain::ForwardErrorKind::Transient);
    EXPECT_EQ(refused.error.httpStatus, 0);
    EXPECT_FALSE(refused.error.timedOut);
    EXPECT_EQ(timedOut.error.kind, domain::ForwardErrorKind::Transient);
    EXPECT_TRUE(timedOut.error.timedOut);
}

TEST_F(ForwarderTest, StatusClassification) {
    EXPECT_TRUE(domain::Forwarder::isSuccessStatus(200));
    EXPECT_TRUE(domain::Forwarder::isSuccessStatus(204));
    EXPECT_FALSE(domain::Forwarder::isSuccessStatus(302));

    EXPECT_EQ(domain::Forwarder::classifyStatus(404), domain::ForwardErrorKind::Permanent);
    EXPECT_EQ(domain::Forwarder::classifyStatus(429), domain::ForwardErrorKind::Permanent);
    EXPECT_EQ(domain::Forwarder::classifyStatus(500), domain::ForwardErrorKind::Transient);
    EXPECT_EQ(domain::Forwarder::classifyStatus(302), domain::ForwardErrorKind::Transient);
}

TEST_F(ForwarderTest, SignsBodyWhenKeyConfigured) {
    config_.signingKeyBase64 = "dGVzdGtleQ==";
    domain::Forwarder signing(http_, config_, clock_);

    signing.send(makeBatch(2));

    auto request = http_->lastRequest();
    RequestSigner signer("dGVzdGtleQ==");
    EXPECT_EQ(request.headers[RequestSigner::kHeaderName], signer.sign(request.body, 1700000000));
    EXPECT_EQ(request.headers[RequestSigner::kHeaderName].rfind("t=1700000000,sig=", 0), 0u);
}

TEST_F(ForwarderTest, NoAuthorizationWithoutToken) {
    config_.authToken.clear();
    domain::Forwarder anonymous(http_, config_, clock_);

    anonymous.send(makeBatch(1));

    EXPECT_EQ(http_->lastRequest().headers.count("Authorization"), 0u);
}

TEST_F(ForwarderTest, StaticTokenUnauthorizedIsPermanent) {
    http_->queueStatus(401);

    auto result = forwarder_->send(makeBatch(1));

    EXPECT_EQ(result.error.kind, domain::ForwardErrorKind::Permanent);
    EXPECT_EQ(result.error.httpStatus, 401);
    EXPECT_EQ(http_->requestCount(), 1u);
}

TEST_F(ForwarderTest, LogsInBeforeFirstBatch) {
    config_.authToken.clear();
    config_.loginUrl = "https://collector.example.com/login";
    config_.loginEmail = "logger@example.com";
    config_.loginPassword = "p&ss word";
    domain::Forwarder withLogin(http_, config_, clock_);

    http_->queueStatus(200, R"({"token":"fresh-1"})");
    auto result = withLogin.send(makeBatch(2));

    ASSERT_TRUE(result.success);
    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].url, "https://collector.example.com/login");
    EXPECT_EQ(requests[0].headers["Content-Type"], "application/x-www-form-urlencoded");
    EXPECT_EQ(requests[0].body, "email=logger%40example.com&password=p%26ss+word");
    EXPECT_EQ(requests[1].url, config_.url);
    EXPECT_EQ(requests[1].headers["Authorization"], "Bearer fresh-1");
    EXPECT_EQ(withLogin.logins(), 1u);
}

TEST_F(ForwarderTest, ExpiredTokenRenewedAndBatchResent) {
    config_.authToken = "expired";
    config_.loginUrl = "https://collector.example.com/login";
    config_.loginEmail = "logger@example.com";
    domain::Forwarder withLogin(http_, config_, clock_);

    http_->queueStatus(401, "token expired");
    http_->queueStatus(200, R"({"token":"renewed"})");
    http_->queueStatus(200);

    auto result = withLogin.send(makeBatch(3));

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.report.httpStatus, 200);
    auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].headers["Authorization"], "Bearer expired");
    EXPECT_EQ(requests[1].url, "https://collector.example.com/login");
    EXPECT_EQ(requests[2].headers["Authorization"], "Bearer renewed");
    // Same batch goes out again
    EXPECT_EQ(requests[2].headers["X-Datalogger-Batch"], requests[0].headers["X-Datalogger-Batch"]);
    EXPECT_EQ(requests[2].body, requests[0].body);
}

TEST_F(ForwarderTest, FailedLoginIsTransient) {
    config_.authToken = "expired";
    config_.loginUrl = "https://collector.example.com/login";
    config_.loginEmail = "logger@example.com";
    domain::Forwarder withLogin(http_, config_, clock_);

    http_->queueStatus(401);
    http_->queueStatus(200, R"({"message":"no token here"})");

    auto result = withLogin.send(makeBatch(1));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, domain::ForwardErrorKind::Transient);
    EXPECT_NE(result.error.message.find("token missing"), std::string::npos);
    EXPECT_EQ(http_->requestCount(), 2u);

    // Next batch logs in first, with no token left to send
    http_->queueTransportFailure("Connection refused");
    auto next = withLogin.send(makeBatch(1));
    EXPECT_EQ(next.error.kind, domain::ForwardErrorKind::Transient);
    EXPECT_EQ(http_->lastRequest().url, "https://collector.example.com/login");
}

TEST_F(ForwarderTest, SecondUnauthorizedAfterLoginIsPermanent) {
    config_.loginUrl = "https://collector.example.com/login";
    config_.loginEmail = "logger@example.com";
    domain::Forwarder withLogin(http_, config_, clock_);

    http_->queueStatus(401);
    http_->queueStatus(200, R"({"token":"renewed"})");
    http_->queueStatus(401);

    auto result = withLogin.send(makeBatch(1));

    EXPECT_EQ(result.error.kind, domain::ForwardErrorKind::Permanent);
    EXPECT_EQ(result.error.httpStatus, 401);
    EXPECT_EQ(http_->requestCount(), 3u);
}
