/**
 * @file PahoMqttClient.hpp
 * @brief Paho MQTT C library implementation of the subscriber port
 *
 * Provides the IMqttClient implementation used by the datalogger daemon,
 * built on the Eclipse Paho MQTT C asynchronous API (MQTTAsync). Supports
 * plain TCP and TLS broker connections with username/password and optional
 * client certificates.
 *
 * Acknowledgement model: Paho's receive thread sends the PUBACK for a QoS 1
 * message as soon as it has queued the message for the application, before
 * the message-arrived callback runs. The broker therefore never redelivers a
 * message this client has received, and defersAcknowledgement() is false.
 *
 * Ack tokens only govern the hand-off to the pipeline. The callback is held
 * until the token is settled; an acknowledged message is released, a
 * rejected one is kept and handed to the callback again by Paho after a
 * short pause. Paho keeps that copy in memory only (no client persistence),
 * so messages received but not yet in the durable queue are lost if the
 * process dies: at most the one held in the callback plus whatever Paho has
 * read from the socket behind it.
 *
 * @note Holding the callback stops the application from taking further
 *       messages, it does not slow the broker down
 * @note Thread-safe: acknowledge()/reject() may be called from any thread
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace datalogger {

/**
 * @brief Paho MQTT C library implementation of IMqttClient
 *
 * Features:
 * - Ack tokens with redelivery of rejected messages from Paho's in-memory copy
 * - Persistent sessions (cleansession = 0) so subscriptions and messages
 *   queued by the broker while offline survive reconnects
 * - TLS with optional server verification and client certificates
 */
class PahoMqttClient : public IMqttClient {
public:
    /**
     * @brief Construct new Paho MQTT client instance
     * @note Client is not connected after construction - call connect() method
     */
    PahoMqttClient();

    /**
     * @brief Destructor - releases unsettled messages and destroys the Paho handle
     */
    ~PahoMqttClient() override;

    // Disable copy and assignment to prevent resource management issues
    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

    bool connect(const ConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;

    bool subscribe(const std::string& topic, int qos = 1) override;
    bool unsubscribe(const std::string& topic) override;

    bool acknowledge(AckToken token) override;
    bool reject(AckToken token) override;

    /// Paho acknowledges QoS 1 publishes on receipt
    bool defersAcknowledgement() const override { return false; }

    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

private:
    /// Settlement state of one inbound message
    enum class Settlement {
        Pending,
        Acknowledged,
        Rejected
    };

    /// Pause before Paho redelivers a rejected message to the callback
    static constexpr int kRedeliveryPauseMs = 500;

    /// Timeout for the DISCONNECT handshake
    static constexpr int kDisconnectTimeoutMs = 2000;

    MQTTAsync client_ = nullptr;          ///< Paho MQTT client handle
    std::string serverUri_;               ///< URI the handle was created for
    ConnectOptions options_;              ///< Kept alive for the duration of the connect call
    std::atomic<bool> connected_{false};  ///< Current connection state
    std::atomic<bool> closing_{false};    ///< Set by disconnect() to release held callbacks

    MessageCallback messageCallback_;     ///< User callback for incoming messages, guarded by settleMutex_
    ConnectionCallback connectionCallback_; ///< User callback for connection events

    std::mutex settleMutex_;              ///< Protects messageCallback_, settlements_ and nextToken_
    std::condition_variable settleCv_;    ///< Wakes the callback thread on settlement
    std::unordered_map<AckToken, Settlement> settlements_;
    AckToken nextToken_ = 1;

    /**
     * @brief Static callback for incoming MQTT messages
     * @param context Pointer to PahoMqttClient instance
     * @param topicName MQTT topic name
     * @param topicLen Topic length, 0 when topicName is null-terminated
     * @param message Paho message structure with payload and metadata
     * @return 1 once the message token was acknowledged, 0 to have Paho call back again with it
     */
    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);

    /**
     * @brief Static callback for successful MQTT connection
     * @param context Pointer to PahoMqttClient instance
     * @param response Success response data (may contain session info)
     */
    static void onConnected(void* context, MQTTAsync_successData* response);

    /**
     * @brief Static callback for failed MQTT connection
     * @param context Pointer to PahoMqttClient instance
     * @param response Failure response with error code and message
     */
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);

    /**
     * @brief Static callback for lost MQTT connection
     * @param context Pointer to PahoMqttClient instance
     * @param cause Reason for connection loss (may be null)
     */
    static void connectionLost(void* context, char* cause);

    /**
     * @brief Static callback for failed subscription
     * @param context Pointer to PahoMqttClient instance
     * @param response Failure response with error code
     */
    static void onSubscribeFailure(void* context, MQTTAsync_failureData* response);

    /**
     * @brief Block the Paho callback thread until the token is settled
     * @return Final settlement, Rejected when the client is closing
     */
    Settlement waitForSettlement(AckToken token);

    bool settle(AckToken token, Settlement settlement);

    /**
     * @brief Validate certificate files exist and are readable
     * @param tlsConfig TLS configuration with certificate paths
     * @return true if all configured certificate files are accessible
     */
    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;
};

} // namespace datalogger
