/**
 * @file IMqttClient.hpp
 * @brief MQTT client port for the telemetry subscriber
 *
 * Platform-independent MQTT client abstraction used by the Connection Manager.
 * Inbound publishes carry an acknowledgement token that the pipeline settles
 * with acknowledge() or reject(). What settling means for the broker depends
 * on the client: see defersAcknowledgement().
 *
 * @note Implementations: PahoMqttClient (desktop/server), sim::MockMqttClient (tests)
 * @note Callbacks are invoked from the client's own thread - ensure thread safety
 */

#pragma once

#include "Reading.hpp"
#include <string>
#include <functional>
#include <memory>
#include <cstdint>

namespace datalogger {

/**
 * @brief Inbound MQTT message
 *
 * @note payload is raw bytes; it is not required to be valid UTF-8
 * @note ackToken is unique per delivery within one client instance
 */
struct MqttMessage {
    std::string topic;              ///< Topic the message was published on
    std::string payload;            ///< Raw payload bytes
    int qos = 0;                    ///< Delivery QoS (0, 1 or 2)
    bool retained = false;          ///< Retain flag as reported by the broker
    bool duplicate = false;         ///< DUP flag - broker redelivery of an unacknowledged message
    AckToken ackToken = 0;          ///< Settle with acknowledge() or reject()
};

/**
 * @brief TLS configuration for broker connections
 *
 * @note Certificate files must be in PEM format
 * @note certPath/keyPath are optional - only needed for client certificate auth
 */
struct TlsConfig {
    std::string caPath;            ///< Path to trusted CA certificate file (.pem)
    std::string certPath;          ///< Path to client certificate file (.pem)
    std::string keyPath;           ///< Path to private key file (.pem)
    bool verifyServer = true;      ///< Enable server certificate validation
};

/**
 * @brief Everything needed to open one broker session
 */
struct ConnectOptions {
    std::string host;
    std::uint16_t port = 1883;
    std::string clientId;
    std::string username;
    std::string password;
    bool useTls = false;
    TlsConfig tls;
    int keepAliveSeconds = 60;
    int connectTimeoutSeconds = 30;
    bool cleanSession = false;      ///< false keeps unacknowledged QoS 1 messages across reconnects
};

/**
 * @brief Platform-independent MQTT client interface
 *
 * @note connect() only initiates the connection - the outcome arrives through
 *       the connection callback
 */
class IMqttClient {
public:
    /// Virtual destructor for proper cleanup in derived classes
    virtual ~IMqttClient() = default;

    /// Callback function type for incoming MQTT messages
    using MessageCallback = std::function<void(const MqttMessage&)>;

    /// Callback function type for connection state changes
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /**
     * @brief Initiate a broker connection
     * @param options Address, credentials and session settings
     * @return true if connection initiated successfully, false otherwise
     * @note Asynchronous - the connection callback reports success or failure
     */
    virtual bool connect(const ConnectOptions& options) = 0;

    /**
     * @brief Disconnect from MQTT broker
     * @note Unsettled inbound messages are released unacknowledged
     */
    virtual void disconnect() = 0;

    /**
     * @brief Check if currently connected to MQTT broker
     * @return true if connected, false otherwise
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Subscribe to MQTT topic filter
     * @param topic MQTT topic filter (supports + and # wildcards)
     * @param qos Maximum Quality of Service level for received messages
     * @return true if the subscription request was sent, false otherwise
     */
    virtual bool subscribe(const std::string& topic, int qos = 1) = 0;

    /**
     * @brief Unsubscribe from MQTT topic filter
     * @param topic MQTT topic filter to unsubscribe from
     * @return true if unsubscription request was sent, false otherwise
     */
    virtual bool unsubscribe(const std::string& topic) = 0;

    /**
     * @brief Release the broker acknowledgement for a received message
     * @param token Token from MqttMessage::ackToken
     * @return false if the token is unknown or already settled
     */
    virtual bool acknowledge(AckToken token) = 0;

    /**
     * @brief Settle a received message without acknowledging it
     * @param token Token from MqttMessage::ackToken
     * @return false if the token is unknown or already settled
     * @note The broker redelivers the message later
     */
    virtual bool reject(AckToken token) = 0;

    /**
     * @brief Whether the broker PUBACK waits for acknowledge()
     * @return true if an unacknowledged message is redelivered by the broker,
     *         false if the client acknowledges on receipt and tokens only
     *         govern in-process handling
     */
    virtual bool defersAcknowledgement() const = 0;

    /**
     * @brief Set callback for incoming MQTT messages
     * @param callback Function to call when message is received
     * @note Callback is called from MQTT thread - ensure thread safety
     */
    virtual void setMessageCallback(MessageCallback callback) = 0;

    /**
     * @brief Set callback for connection state changes
     * @param callback Function to call when connection state changes
     * @note Callback is called from MQTT thread - ensure thread safety
     */
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

protected:
    // Protected constructors to prevent direct instantiation
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace datalogger
