/**
 * @file ConnectionManager.hpp
 * @brief Broker session lifecycle for the telemetry subscriber
 *
 * Owns one logical MQTT session: initial connect, subscription to every
 * configured topic filter, reconnect with exponential backoff and full
 * jitter after an unexpected disconnect, and resubscription once the
 * broker accepts the new connection.
 *
 * Session states:
 *   Disconnected --connect()--> Connecting --CONNACK--> Connected
 *   Connecting --refused/timeout--> Reconnecting --backoff elapsed--> Connecting
 *   Connected --connection lost--> Reconnecting
 *   any --close()--> Closed
 *
 * @note processEvents() drives reconnects and must be called regularly
 * @note The IMqttClient is never called while the internal mutex is held
 */

#pragma once

#include "IClock.hpp"
#include "IMqttClient.hpp"
#include "DataloggerConfig.hpp"
#include "domain/Backoff.hpp"
#include "ports/IPolicyEngine.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace datalogger {

/**
 * @brief Where the broker lives and how to reach it
 */
struct BrokerAddress {
    std::string host;
    std::uint16_t port = 1883;
    bool useTls = false;
    TlsConfig tls;
};

/**
 * @brief Client identity presented to the broker
 * @note password is never logged
 */
struct Credentials {
    std::string clientId;
    std::string username;
    std::string password;
};

/**
 * @brief Per-session tuning independent of the broker address
 */
struct SessionOptions {
    int qos = 1;                                   ///< Subscription QoS
    int keepAliveSeconds = 60;
    std::chrono::seconds connectTimeout{30};       ///< Longest wait for CONNACK
};

enum class SessionState {
    Disconnected,   ///< connect() not called yet
    Connecting,     ///< Waiting for the broker to accept the connection
    Connected,      ///< Subscribed and receiving
    Reconnecting,   ///< Waiting out the backoff before the next attempt
    Closed          ///< close() called; no further reconnects
};

/**
 * @brief Snapshot of the broker session
 */
struct Session {
    SessionState state = SessionState::Disconnected;
    std::string host;
    std::uint16_t port = 0;
    std::string clientId;
    std::vector<std::string> topicFilters;
    int reconnectAttempts = 0;                 ///< Attempts since the last successful connect
    std::uint64_t reconnects = 0;              ///< Successful reconnects over the session lifetime
    std::string lastError;
};

/**
 * @brief Owns the MQTT session and hands inbound publishes to one consumer
 *
 * Inbound messages carry an ack token. The consumer settles each token
 * exactly once with acknowledge() (after the message is safe) or reject()
 * (the broker redelivers it).
 */
class ConnectionManager {
public:
    /// Callback for inbound publishes: raw topic, payload and ack token
    using MessageCallback = std::function<void(const MqttMessage&)>;

    /**
     * @brief Construct connection manager
     * @param client MQTT client adapter (Paho in production, mock in tests)
     * @param clock Time source for the reconnect schedule
     * @param policyEngine Supplies the reconnect backoff policy
     * @param options QoS, keep-alive and CONNACK timeout
     */
    ConnectionManager(std::shared_ptr<IMqttClient> client,
                      std::shared_ptr<IClock> clock,
                      std::shared_ptr<ports::IPolicyEngine> policyEngine,
                      SessionOptions options = SessionOptions{});

    /// Destructor - closes the session
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Open the session and subscribe to every topic filter
     * @param address Broker host, port and TLS settings
     * @param credentials Client id, username and password
     * @param topicFilters MQTT filters to subscribe to (and resubscribe after reconnects)
     * @return Session snapshot in the Connected state
     * @throws ConnectionError on refused authentication, network failure or
     *         CONNACK timeout; the session is then Reconnecting and
     *         processEvents() keeps trying
     */
    Session connect(const BrokerAddress& address,
                    const Credentials& credentials,
                    const std::vector<std::string>& topicFilters);

    /**
     * @brief Set the consumer of inbound publishes
     * @note Invoked on the MQTT client's thread, once per publish
     */
    void onMessage(MessageCallback callback);

    /**
     * @brief Release the broker acknowledgement for a message
     * @return false if the token was unknown or already settled
     */
    bool acknowledge(AckToken token);

    /**
     * @brief Settle a message without acknowledging it; the broker redelivers
     * @return false if the token was unknown or already settled
     */
    bool reject(AckToken token);

    /**
     * @brief Drive reconnects and pending resubscriptions
     * @note Non-blocking; reconnect attempts are gated by the injected clock
     */
    void processEvents();

    /**
     * @brief End the session; no further reconnect attempts
     * @note Safe to call multiple times
     */
    void close();

    bool isConnected() const;

    /// See IMqttClient::defersAcknowledgement()
    bool defersAcknowledgement() const { return client_->defersAcknowledgement(); }
    SessionState state() const;
    Session session() const;

    /// Next reconnect attempt time, meaningful while Reconnecting
    std::chrono::steady_clock::time_point nextReconnectAt() const;

    std::uint64_t messagesReceived() const { return messagesReceived_; }
    std::uint64_t messagesAcknowledged() const { return messagesAcknowledged_; }
    std::uint64_t messagesRejected() const { return messagesRejected_; }

private:
    /// Result of the connect attempt connect() is waiting on
    enum class ConnectOutcome {
        None,
        Accepted,
        Refused
    };

    std::shared_ptr<IMqttClient> client_;              ///< MQTT adapter
    std::shared_ptr<IClock> clock_;                    ///< Scheduling time source
    std::shared_ptr<ports::IPolicyEngine> policyEngine_; ///< Owner of the reconnect policy
    SessionOptions options_;

    mutable std::mutex mutex_;                         ///< Protects everything below
    std::condition_variable outcomeCv_;                ///< Signals connect() waiters
    ConnectOutcome outcome_ = ConnectOutcome::None;
    Session session_;
    ConnectOptions connectOptions_;
    domain::BackoffState backoff_;
    bool needsSubscribe_ = false;
    std::chrono::steady_clock::time_point connectDeadline_{};
    MessageCallback messageCallback_;

    std::atomic<std::uint64_t> messagesReceived_{0};
    std::atomic<std::uint64_t> messagesAcknowledged_{0};
    std::atomic<std::uint64_t> messagesRejected_{0};

    /**
     * @brief Handle connection state changes reported by the client
     * @param connected Whether the broker accepted the connection
     * @param reason Status description from the client
     */
    void onConnectionEvent(bool connected, const std::string& reason);

    /// Route an inbound publish to the consumer
    void onClientMessage(const MqttMessage& message);

    /// Move to Reconnecting and schedule the next attempt; caller holds mutex_
    void scheduleReconnectLocked(const std::string& reason);

    /// Subscribe every filter; returns false if any request was not sent
    bool subscribeAll(const std::vector<std::string>& filters);
};

std::string sessionStateToString(SessionState state);

BrokerAddress brokerAddressFromConfig(const BrokerConfig& config);
Credentials credentialsFromConfig(const BrokerConfig& config);
SessionOptions sessionOptionsFromConfig(const BrokerConfig& config);

} // namespace datalogger
