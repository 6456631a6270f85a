#include <gtest/gtest.h>
#include "../core/ConnectionManager.hpp"
#include "../core/Errors.hpp"
#include "../core/adapters/DefaultPolicies.hpp"
#include "../core/sim/FixedRng.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace datalogger;
using namespace std::chrono_literals;

class ConnectionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        rng_ = std::make_shared<sim::FixedRng>(1.0);
        policyEngine_ = std::make_shared<adapters::DefaultPolicyEngine>(rng_);
        client_ = std::make_shared<sim::MockMqttClient>();

        SessionOptions options;
        options.connectTimeout = 1s;
        manager_ = std::make_unique<ConnectionManager>(client_, clock_, policyEngine_, options);

        address_.host = "broker.local";
        address_.port = 1883;
        credentials_.clientId = "datalogger-test";
        credentials_.username = "logger";
        credentials_.password = "pw";
        filters_ = {"sensors/#", "plant/+/status"};
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::FixedRng> rng_;
    std::shared_ptr<adapters::DefaultPolicyEngine> policyEngine_;
    std::shared_ptr<sim::MockMqttClient> client_;
    std::unique_ptr<ConnectionManager> manager_;

    BrokerAddress address_;
    Credentials credentials_;
    std::vector<std::string> filters_;
};

TEST_F(ConnectionManagerTest, ConnectSubscribesAllFilters) {
    auto session = manager_->connect(address_, credentials_, filters_);

    EXPECT_EQ(session.state, SessionState::Connected);
    EXPECT_EQ(session.host, "broker.local");
    EXPECT_EQ(session.clientId, "datalogger-test");
    EXPECT_EQ(client_->subscriptions(), filters_);

    auto options = client_->lastConnectOptions();
    EXPECT_EQ(options.host, "broker.local");
    EXPECT_EQ(options.username, "logger");
    EXPECT_FALSE(options.cleanSession);
}

TEST_F(ConnectionManagerTest, RefusedConnectThrowsAndKeepsRetrying) {
    client_->setFailConnect(true);

    EXPECT_THROW(manager_->connect(address_, credentials_, filters_), ConnectionError);
    EXPECT_EQ(manager_->state(), SessionState::Reconnecting);
    EXPECT_NE(manager_->session().lastError.find("not authorized"), std::string::npos);
    EXPECT_EQ(client_->connectAttempts(), 1);

    // Backoff not elapsed yet
    manager_->processEvents();
    EXPECT_EQ(client_->connectAttempts(), 1);

    client_->setFailConnect(false);
    clock_->advance(1000ms);
    manager_->processEvents();

    EXPECT_EQ(client_->connectAttempts(), 2);
    EXPECT_TRUE(manager_->isConnected());
    EXPECT_EQ(client_->subscriptions(), filters_);
    EXPECT_EQ(manager_->session().reconnects, 1u);
}

TEST_F(ConnectionManagerTest, ReconnectDelayGrowsWithFailures) {
    manager_->connect(address_, credentials_, filters_);
    client_->setFailConnect(true);
    auto start = clock_->now();

    client_->simulateConnectionLoss("keepalive timeout");
    EXPECT_EQ(manager_->state(), SessionState::Reconnecting);
    EXPECT_EQ(manager_->nextReconnectAt(), start + 1000ms);

    clock_->advance(1000ms);
    manager_->processEvents();
    EXPECT_EQ(client_->connectAttempts(), 2);
    EXPECT_EQ(manager_->nextReconnectAt(), clock_->now() + 2000ms);

    clock_->advance(1999ms);
    manager_->processEvents();
    EXPECT_EQ(client_->connectAttempts(), 2);

    clock_->advance(1ms);
    manager_->processEvents();
    EXPECT_EQ(client_->connectAttempts(), 3);
    EXPECT_EQ(manager_->session().reconnectAttempts, 2);
}

TEST_F(ConnectionManagerTest, ResubscribesAfterConnectionLoss) {
    manager_->connect(address_, credentials_, filters_);
    client_->simulateConnectionLoss("network down");
    EXPECT_TRUE(client_->subscriptions().empty());

    clock_->advance(1000ms);
    manager_->processEvents();

    EXPECT_TRUE(manager_->isConnected());
    EXPECT_EQ(client_->subscriptions(), filters_);
}

TEST_F(ConnectionManagerTest, ConnackTimeoutSchedulesReconnect) {
    client_->setSilentConnect(true);

    EXPECT_THROW(manager_->connect(address_, credentials_, filters_), ConnectionError);
    EXPECT_EQ(manager_->state(), SessionState::Reconnecting);
}

TEST_F(ConnectionManagerTest, DeliversMessagesAndSettlesTokens) {
    std::vector<MqttMessage> received;
    manager_->onMessage([&](const MqttMessage& message) { received.push_back(message); });
    manager_->connect(address_, credentials_, filters_);

    auto first = client_->injectMessage("sensors/a", "1");
    auto second = client_->injectMessage("sensors/b", "2");

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0].topic, "sensors/a");
    EXPECT_EQ(received[1].payload, "2");
    EXPECT_EQ(client_->unsettledCount(), 2u);

    EXPECT_TRUE(manager_->acknowledge(first));
    EXPECT_TRUE(manager_->reject(second));
    EXPECT_FALSE(manager_->acknowledge(first));

    EXPECT_EQ(client_->acknowledged(), (std::vector<AckToken>{first}));
    EXPECT_EQ(client_->rejected(), (std::vector<AckToken>{second}));
    EXPECT_EQ(manager_->messagesReceived(), 2u);
    EXPECT_EQ(manager_->messagesAcknowledged(), 1u);
    EXPECT_EQ(manager_->messagesRejected(), 1u);
}

TEST_F(ConnectionManagerTest, MessageWithoutConsumerIsRejected) {
    manager_->connect(address_, credentials_, filters_);

    auto token = client_->injectMessage("sensors/a", "1");

    EXPECT_TRUE(client_->isSettled(token));
    EXPECT_EQ(client_->rejected(), (std::vector<AckToken>{token}));
}

TEST_F(ConnectionManagerTest, CloseStopsReconnects) {
    manager_->connect(address_, credentials_, filters_);
    manager_->close();

    EXPECT_EQ(manager_->state(), SessionState::Closed);
    EXPECT_FALSE(client_->isConnected());

    clock_->advance(120s);
    manager_->processEvents();
    EXPECT_EQ(client_->connectAttempts(), 1);

    EXPECT_THROW(manager_->connect(address_, credentials_, filters_), ConnectionError);
    EXPECT_NO_THROW(manager_->close());
}

TEST_F(ConnectionManagerTest, SecondConnectWhileConnectedThrows) {
    manager_->connect(address_, credentials_, filters_);
    EXPECT_THROW(manager_->connect(address_, credentials_, filters_), ConnectionError);
}
