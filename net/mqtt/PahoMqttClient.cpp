#include "PahoMqttClient.hpp"
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <thread>

namespace datalogger {

PahoMqttClient::PahoMqttClient() = default;

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    if (client_) {
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::connect(const ConnectOptions& options) {
    if (options.useTls && !validateCertificateFiles(options.tls)) {
        return false;
    }

    std::string serverURI = (options.useTls ? "ssl://" : "tcp://") +
                            options.host + ":" + std::to_string(options.port);

    // A handle is bound to one URI and client id; reuse it across reconnects
    if (client_ && (serverURI != serverUri_ || options.clientId != options_.clientId)) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }

    options_ = options;
    closing_ = false;

    if (!client_) {
        int rc = MQTTAsync_create(&client_, serverURI.c_str(), options_.clientId.c_str(),
                                  MQTTCLIENT_PERSISTENCE_NONE, nullptr);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
            client_ = nullptr;
            return false;
        }
        serverUri_ = serverURI;

        rc = MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Failed to register callbacks, error code: " << rc << std::endl;
            return false;
        }
    }

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;

    conn_opts.keepAliveInterval = options_.keepAliveSeconds;
    conn_opts.cleansession = options_.cleanSession ? 1 : 0;
    conn_opts.connectTimeout = options_.connectTimeoutSeconds;
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    conn_opts.username = options_.username.empty() ? nullptr : options_.username.c_str();
    conn_opts.password = options_.password.empty() ? nullptr : options_.password.c_str();

    if (options_.useTls) {
        ssl_opts.trustStore = options_.tls.caPath.empty() ? nullptr : options_.tls.caPath.c_str();
        ssl_opts.keyStore = options_.tls.certPath.empty() ? nullptr : options_.tls.certPath.c_str();
        ssl_opts.privateKey = options_.tls.keyPath.empty() ? nullptr : options_.tls.keyPath.c_str();
        ssl_opts.enableServerCertAuth = options_.tls.verifyServer ? 1 : 0;
        ssl_opts.verify = options_.tls.verifyServer ? 1 : 0;
        ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
        conn_opts.ssl = &ssl_opts;
    }

    std::cout << "[MQTT] Connecting to " << serverURI << " as " << options_.clientId << std::endl;

    int rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    closing_ = true;
    settleCv_.notify_all();

    if (client_ && MQTTAsync_isConnected(client_)) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.timeout = kDisconnectTimeoutMs;

        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect failed, error code: " << rc << std::endl;
        }
    }
    connected_ = false;
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    if (!connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.onFailure = onSubscribeFailure;
    opts.context = this;

    int rc = MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    if (!connected_) {
        return false;
    }

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    int rc = MQTTAsync_unsubscribe(client_, topic.c_str(), &opts);
    return rc == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::acknowledge(AckToken token) {
    return settle(token, Settlement::Acknowledged);
}

bool PahoMqttClient::reject(AckToken token) {
    return settle(token, Settlement::Rejected);
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(settleMutex_);
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

bool PahoMqttClient::settle(AckToken token, Settlement settlement) {
    {
        std::lock_guard<std::mutex> lock(settleMutex_);
        auto it = settlements_.find(token);
        if (it == settlements_.end() || it->second != Settlement::Pending) {
            return false;
        }
        it->second = settlement;
    }
    settleCv_.notify_all();
    return true;
}

PahoMqttClient::Settlement PahoMqttClient::waitForSettlement(AckToken token) {
    std::unique_lock<std::mutex> lock(settleMutex_);
    settleCv_.wait(lock, [&] {
        return closing_ || settlements_[token] != Settlement::Pending;
    });

    Settlement result = settlements_[token];
    settlements_.erase(token);
    return result == Settlement::Pending ? Settlement::Rejected : result;
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);

    MqttMessage msg;
    msg.topic = topicLen > 0 ? std::string(topicName, static_cast<std::size_t>(topicLen))
                             : std::string(topicName);
    msg.payload = std::string(static_cast<char*>(message->payload),
                              static_cast<std::size_t>(message->payloadlen));
    msg.qos = message->qos;
    msg.retained = message->retained != 0;
    msg.duplicate = message->dup != 0;

    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(client->settleMutex_);
        if (!client->closing_ && client->messageCallback_) {
            callback = client->messageCallback_;
            msg.ackToken = client->nextToken_++;
            client->settlements_[msg.ackToken] = Settlement::Pending;
        }
    }

    // Nobody to take it: Paho keeps the message and calls back again
    if (!callback) {
        std::this_thread::sleep_for(std::chrono::milliseconds(kRedeliveryPauseMs));
        return 0;
    }

    callback(msg);

    if (client->waitForSettlement(msg.ackToken) != Settlement::Acknowledged) {
        std::this_thread::sleep_for(std::chrono::milliseconds(kRedeliveryPauseMs));
        return 0;
    }

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;

    if (client->connectionCallback_) {
        client->connectionCallback_(true, "Connected successfully");
    }
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    if (client->connectionCallback_) {
        std::string reason = "Connection failed";
        if (response) {
            reason = "CONNACK return code " + std::to_string(response->code);
            if (response->message) {
                reason += " (" + std::string(response->message) + ")";
            }
        }
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    if (client->connectionCallback_) {
        std::string reason = cause ? std::string(cause) : "Connection lost";
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::onSubscribeFailure(void* context, MQTTAsync_failureData* response) {
    (void)context;
    std::cerr << "[MQTT] Subscribe failed, code: " << (response ? response->code : -1) << std::endl;
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    auto readable = [](const std::string& path, const char* what) {
        if (path.empty()) {
            return true;
        }
        std::ifstream file(path);
        if (!file.good()) {
            std::cerr << "[MQTT] ERROR: " << what << " not found: " << path << std::endl;
            return false;
        }
        return true;
    };

    return readable(tlsConfig.caPath, "CA file") &&
           readable(tlsConfig.certPath, "Certificate file") &&
           readable(tlsConfig.keyPath, "Private key file");
}

} // namespace datalogger
