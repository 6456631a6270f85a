#include "ConnectionManager.hpp"
#include "Errors.hpp"
#include <iostream>

namespace datalogger {

ConnectionManager::ConnectionManager(std::shared_ptr<IMqttClient> client,
                                     std::shared_ptr<IClock> clock,
                                     std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                     SessionOptions options)
    : client_(std::move(client)),
      clock_(std::move(clock)),
      policyEngine_(std::move(policyEngine)),
      options_(options),
      backoff_(policyEngine_->getReconnectPolicy()) {
    client_->setConnectionCallback([this](bool connected, const std::string& reason) {
        onConnectionEvent(connected, reason);
    });
    client_->setMessageCallback([this](const MqttMessage& message) {
        onClientMessage(message);
    });
}

ConnectionManager::~ConnectionManager() {
    close();
    client_->setConnectionCallback(nullptr);
    client_->setMessageCallback(nullptr);
}

Session ConnectionManager::connect(const BrokerAddress& address,
                                   const Credentials& credentials,
                                   const std::vector<std::string>& topicFilters) {
    ConnectOptions opts;
    opts.host = address.host;
    opts.port = address.port;
    opts.useTls = address.useTls;
    opts.tls = address.tls;
    opts.clientId = credentials.clientId;
    opts.username = credentials.username;
    opts.password = credentials.password;
    opts.keepAliveSeconds = options_.keepAliveSeconds;
    opts.connectTimeoutSeconds = static_cast<int>(options_.connectTimeout.count());
    opts.cleanSession = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state == SessionState::Closed) {
            throw ConnectionError("session is closed");
        }
        if (session_.state == SessionState::Connected || session_.state == SessionState::Connecting) {
            throw ConnectionError("session already " + sessionStateToString(session_.state));
        }

        connectOptions_ = opts;
        session_.host = address.host;
        session_.port = address.port;
        session_.clientId = credentials.clientId;
        session_.topicFilters = topicFilters;
        session_.state = SessionState::Connecting;
        outcome_ = ConnectOutcome::None;
        connectDeadline_ = clock_->now() + options_.connectTimeout;
    }

    std::cout << "[Connection] Connecting to " << address.host << ":" << address.port
              << (address.useTls ? " (TLS)" : "") << " as " << credentials.clientId << std::endl;

    if (!client_->connect(opts)) {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduleReconnectLocked("could not initiate connection");
        throw ConnectionError("could not initiate connection to " + address.host);
    }

    ConnectOutcome outcome;
    std::string lastError;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        // Real-time wait: the CONNACK arrives on the client's own thread
        outcomeCv_.wait_for(lock, options_.connectTimeout, [this] {
            return outcome_ != ConnectOutcome::None;
        });
        outcome = outcome_;
        if (outcome == ConnectOutcome::None && session_.state == SessionState::Connecting) {
            scheduleReconnectLocked("timed out waiting for CONNACK");
        }
        lastError = session_.lastError;
    }

    if (outcome == ConnectOutcome::Refused) {
        throw ConnectionError("broker refused connection: " + lastError);
    }
    if (outcome == ConnectOutcome::None) {
        throw ConnectionError("timed out connecting to " + address.host);
    }

    processEvents();
    return session();
}

void ConnectionManager::onMessage(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    messageCallback_ = std::move(callback);
}

bool ConnectionManager::acknowledge(AckToken token) {
    bool settled = client_->acknowledge(token);
    if (settled) {
        messagesAcknowledged_++;
    }
    return settled;
}

bool ConnectionManager::reject(AckToken token) {
    bool settled = client_->reject(token);
    if (settled) {
        messagesRejected_++;
    }
    return settled;
}

void ConnectionManager::processEvents() {
    bool reconnect = false;
    ConnectOptions opts;
    int attempt = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock_->now();

        if (session_.state == SessionState::Connecting && now >= connectDeadline_) {
            scheduleReconnectLocked("timed out waiting for CONNACK");
        } else if (session_.state == SessionState::Reconnecting && backoff_.readyAt(now)) {
            session_.state = SessionState::Connecting;
            session_.reconnectAttempts++;
            connectDeadline_ = now + options_.connectTimeout;
            opts = connectOptions_;
            attempt = session_.reconnectAttempts;
            reconnect = true;
        }
    }

    if (reconnect) {
        std::cout << "[Connection] Reconnect attempt " << attempt << " to "
                  << opts.host << ":" << opts.port << std::endl;
        if (!client_->connect(opts)) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (session_.state == SessionState::Connecting) {
                scheduleReconnectLocked("could not initiate connection");
            }
        }
    }

    // The broker may have accepted the connection on the client's thread since
    std::vector<std::string> filters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state != SessionState::Connected || !needsSubscribe_) {
            return;
        }
        needsSubscribe_ = false;
        filters = session_.topicFilters;
    }

    if (!subscribeAll(filters)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state == SessionState::Connected) {
            needsSubscribe_ = true;
        }
    }
}

void ConnectionManager::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state == SessionState::Closed) {
            return;
        }
        session_.state = SessionState::Closed;
        needsSubscribe_ = false;
    }
    outcomeCv_.notify_all();

    client_->disconnect();
    std::cout << "[Connection] Session closed" << std::endl;
}

bool ConnectionManager::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state == SessionState::Connected;
}

SessionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state;
}

Session ConnectionManager::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

std::chrono::steady_clock::time_point ConnectionManager::nextReconnectAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backoff_.nextAttemptAt();
}

void ConnectionManager::onConnectionEvent(bool connected, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state == SessionState::Closed) {
            return;
        }

        if (connected) {
            bool wasReconnect = session_.reconnectAttempts > 0;
            session_.state = SessionState::Connected;
            session_.reconnectAttempts = 0;
            session_.lastError.clear();
            if (wasReconnect) {
                session_.reconnects++;
            }
            backoff_.reset();
            needsSubscribe_ = true;
            outcome_ = ConnectOutcome::Accepted;
            std::cout << "[Connection] Connected to " << session_.host << ":" << session_.port << std::endl;
        } else if (session_.state == SessionState::Connected) {
            std::cerr << "[Connection] Connection lost: " << reason << std::endl;
            scheduleReconnectLocked(reason);
        } else if (session_.state == SessionState::Connecting) {
            scheduleReconnectLocked(reason);
            outcome_ = ConnectOutcome::Refused;
        }
    }
    outcomeCv_.notify_all();
}

void ConnectionManager::onClientMessage(const MqttMessage& message) {
    messagesReceived_++;

    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = messageCallback_;
    }

    if (callback) {
        callback(message);
    } else {
        // Nobody to take ownership; let the broker hold on to it
        reject(message.ackToken);
    }
}

void ConnectionManager::scheduleReconnectLocked(const std::string& reason) {
    session_.state = SessionState::Reconnecting;
    session_.lastError = reason;
    auto delay = backoff_.recordFailure(clock_->now());
    std::cerr << "[Connection] " << reason << "; next attempt in " << delay.count() << " ms" << std::endl;
}

bool ConnectionManager::subscribeAll(const std::vector<std::string>& filters) {
    bool allSent = true;
    for (const auto& filter : filters) {
        if (client_->subscribe(filter, options_.qos)) {
            std::cout << "[Connection] Subscribed to " << filter << " (QoS " << options_.qos << ")" << std::endl;
        } else {
            std::cerr << "[Connection] Subscribe to " << filter << " failed" << std::endl;
            allSent = false;
        }
    }
    return allSent;
}

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting: return "connecting";
        case SessionState::Connected: return "connected";
        case SessionState::Reconnecting: return "reconnecting";
        case SessionState::Closed: return "closed";
        default: return "unknown";
    }
}

BrokerAddress brokerAddressFromConfig(const BrokerConfig& config) {
    BrokerAddress address;
    address.host = config.host;
    address.port = config.port;
    address.useTls = config.useTls;
    address.tls.caPath = config.caPath;
    address.tls.certPath = config.certPath;
    address.tls.keyPath = config.keyPath;
    address.tls.verifyServer = config.verifyServerCert;
    return address;
}

Credentials credentialsFromConfig(const BrokerConfig& config) {
    Credentials credentials;
    credentials.clientId = config.clientId;
    credentials.username = config.username;
    credentials.password = config.password;
    return credentials;
}

SessionOptions sessionOptionsFromConfig(const BrokerConfig& config) {
    SessionOptions options;
    options.qos = config.qos;
    options.keepAliveSeconds = config.keepAliveSeconds;
    options.connectTimeout = std::chrono::seconds(config.connectTimeoutSeconds);
    return options;
}

} // namespace datalogger
