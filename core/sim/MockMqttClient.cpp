#include "MockMqttClient.hpp"
#include <algorithm>

namespace datalogger::sim {

MockMqttClient::MockMqttClient() = default;

bool MockMqttClient::connect(const ConnectOptions& options) {
    ConnectionCallback callback;
    bool accepted = false;
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastOptions_ = options;
        connectAttempts_++;
        if (silentConnect_) {
            return true;
        }
        accepted = !failConnect_;
        connected_ = accepted;
        reason = accepted ? "Mock connection established" : failReason_;
        callback = connectionCallback_;
    }

    if (callback) {
        callback(accepted, reason);
    }
    return true;
}

void MockMqttClient::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = false;
}

bool MockMqttClient::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

bool MockMqttClient::subscribe(const std::string& topic, int qos) {
    (void)qos;
    std::lock_guard<std::mutex> lock(mutex_);
    subscribeCalls_++;
    if (!connected_) return false;

    if (std::find(subscriptions_.begin(), subscriptions_.end(), topic) == subscriptions_.end()) {
        subscriptions_.push_back(topic);
    }
    return true;
}

bool MockMqttClient::unsubscribe(const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) return false;

    subscriptions_.erase(std::remove(subscriptions_.begin(), subscriptions_.end(), topic),
                         subscriptions_.end());
    return true;
}

bool MockMqttClient::acknowledge(AckToken token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unsettled_.erase(token) == 0) {
        return false;
    }
    acknowledged_.push_back(token);
    return true;
}

bool MockMqttClient::reject(AckToken token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (unsettled_.erase(token) == 0) {
        return false;
    }
    rejected_.push_back(token);
    return true;
}

void MockMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageCallback_ = std::move(callback);
}

void MockMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    connectionCallback_ = std::move(callback);
}

AckToken MockMqttClient::injectMessage(const std::string& topic, const std::string& payload, int qos) {
    MqttMessage msg;
    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        msg.topic = topic;
        msg.payload = payload;
        msg.qos = qos;
        msg.ackToken = nextToken_++;
        unsettled_.insert(msg.ackToken);
        callback = messageCallback_;
    }

    if (callback) {
        callback(msg);
    }
    return msg.ackToken;
}

void MockMqttClient::simulateConnectionLoss(const std::string& reason) {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) return;
        connected_ = false;
        subscriptions_.clear();
        callback = connectionCallback_;
    }

    if (callback) {
        callback(false, reason);
    }
}

void MockMqttClient::setFailConnect(bool fail, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    failConnect_ = fail;
    failReason_ = reason;
}

int MockMqttClient::connectAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectAttempts_;
}

ConnectOptions MockMqttClient::lastConnectOptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastOptions_;
}

std::vector<std::string> MockMqttClient::subscriptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_;
}

int MockMqttClient::subscribeCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribeCalls_;
}

std::vector<AckToken> MockMqttClient::acknowledged() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acknowledged_;
}

std::vector<AckToken> MockMqttClient::rejected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

std::size_t MockMqttClient::unsettledCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unsettled_.size();
}

bool MockMqttClient::isSettled(AckToken token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return unsettled_.count(token) == 0;
}

} // namespace datalogger::sim
