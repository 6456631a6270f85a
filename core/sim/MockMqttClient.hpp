#pragma once

#include "../IMqttClient.hpp"
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace datalogger::sim {

/**
 * In-memory IMqttClient. connect() reports its outcome synchronously through
 * the connection callback; messages are handed to the callback by
 * injectMessage() on the caller's thread.
 */
class MockMqttClient : public IMqttClient {
public:
    MockMqttClient();
    ~MockMqttClient() override = default;

    // IMqttClient interface
    bool connect(const ConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;

    bool subscribe(const std::string& topic, int qos = 1) override;
    bool unsubscribe(const std::string& topic) override;

    bool acknowledge(AckToken token) override;
    bool reject(AckToken token) override;

    bool defersAcknowledgement() const override { return defersAck_; }

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

    // Mock-specific methods for testing
    AckToken injectMessage(const std::string& topic, const std::string& payload, int qos = 1);
    void simulateConnectionLoss(const std::string& reason = "Connection lost");

    /// Next connect() attempts are refused with the given reason
    void setFailConnect(bool fail, const std::string& reason = "CONNACK return code 5 (not authorized)");

    /// connect() returns true but never reports an outcome
    void setSilentConnect(bool silent) { silentConnect_ = silent; }

    /// false behaves like a client that sends PUBACK on receipt
    void setDefersAcknowledgement(bool defers) { defersAck_ = defers; }

    int connectAttempts() const;
    ConnectOptions lastConnectOptions() const;
    std::vector<std::string> subscriptions() const;
    int subscribeCalls() const;

    std::vector<AckToken> acknowledged() const;
    std::vector<AckToken> rejected() const;
    std::size_t unsettledCount() const;
    bool isSettled(AckToken token) const;

private:
    mutable std::mutex mutex_;
    bool connected_ = false;
    bool failConnect_ = false;
    bool silentConnect_ = false;
    bool defersAck_ = true;
    std::string failReason_;

    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;

    int connectAttempts_ = 0;
    int subscribeCalls_ = 0;
    ConnectOptions lastOptions_;
    std::vector<std::string> subscriptions_;

    AckToken nextToken_ = 1;
    std::set<AckToken> unsettled_;
    std::vector<AckToken> acknowledged_;
    std::vector<AckToken> rejected_;
};

} // namespace datalogger::sim
