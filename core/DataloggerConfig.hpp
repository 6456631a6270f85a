/**
 * @file DataloggerConfig.hpp
 * @brief Configuration object for the MQTT-to-HTTP relay pipeline
 *
 * Groups every named option the pipeline needs: broker address and
 * credentials, topic filters, collector endpoint, durable queue limits,
 * batching and retry tuning, acknowledgement timing and the audit trail.
 * Populated by TomlConfig (file + environment) or directly by tests.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace datalogger {

/**
 * @brief Broker address, credentials and session options
 */
struct BrokerConfig {
    std::string host = "localhost";          ///< Broker hostname or IP
    std::uint16_t port = 1883;               ///< 1883 plain, 8883 TLS by convention
    std::string clientId = "datalogger";     ///< Stable id so the broker keeps our session
    std::string username;                    ///< Empty for anonymous brokers
    std::string password;                    ///< Never logged
    bool useTls = false;                     ///< Connect with ssl:// instead of tcp://
    std::string caPath;                      ///< Trusted CA bundle (.pem)
    std::string certPath;                    ///< Optional client certificate (.pem)
    std::string keyPath;                     ///< Optional client private key (.pem)
    bool verifyServerCert = true;            ///< Enable server certificate validation
    int keepAliveSeconds = 60;
    int qos = 1;                             ///< Subscription QoS, at least 1 for redelivery
    int connectTimeoutSeconds = 30;
};

struct TopicConfig {
    std::vector<std::string> filters{"sensors/#"};  ///< MQTT subscription filters
    int deviceIdLevel = 1;                           ///< Topic level used when the payload has no device id
};

struct CollectorConfig {
    std::string url;                          ///< http(s)://host[:port]/path
    std::string authToken;                    ///< Sent as "Authorization: Bearer ..." when set
    std::string loginUrl;                     ///< Token endpoint; when set the bearer token comes from a login
    std::string loginEmail;
    std::string loginPassword;
    std::string signingKeyBase64;             ///< HMAC-SHA256 request signing key when set
    std::chrono::milliseconds timeout{10000};
    bool verifyTls = true;
};

struct QueueConfig {
    std::string path = "datalogger.db";      ///< SQLite file holding undelivered records
    std::size_t maxRecords = 100000;          ///< Capacity before producers are held back
    std::uint32_t maxAttempts = 5;            ///< Transient failures before dead-lettering
};

struct ForwarderConfig {
    std::size_t batchSize = 50;                       ///< N: records per request
    std::chrono::milliseconds batchWait{1000};        ///< T: longest wait to fill a batch
    std::size_t concurrency = 1;                      ///< Parallel forward workers
    std::chrono::milliseconds backoffBase{1000};
    std::chrono::milliseconds backoffCap{60000};
};

struct ReconnectConfig {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{60000};
};

/// When the broker acknowledgement for a message is issued
enum class AckMode {
    OnDelivery,   ///< After the collector accepted (or dead-lettered) the record; needs a client that defers PUBACK
    OnEnqueue     ///< As soon as the record is durably queued
};

struct PipelineConfig {
    AckMode ackMode = AckMode::OnEnqueue;
    std::size_t channelCapacity = 256;        ///< Bounded hand-off from the MQTT thread
};

struct AuditConfig {
    bool enabled = false;
    std::string path = "datalogger_audit.csv";
};

struct DataloggerConfig {
    BrokerConfig broker;
    TopicConfig topics;
    CollectorConfig collector;
    QueueConfig queue;
    ForwarderConfig forwarder;
    ReconnectConfig reconnect;
    PipelineConfig pipeline;
    AuditConfig audit;

    /**
     * @brief Check the configuration for values the pipeline cannot run with
     * @return Human readable problems, empty when the configuration is usable
     */
    std::vector<std::string> validate() const;
};

std::string ackModeToString(AckMode mode);
bool parseAckMode(const std::string& text, AckMode& mode);

} // namespace datalogger
