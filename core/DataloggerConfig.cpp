#include "DataloggerConfig.hpp"

namespace datalogger {

std::vector<std::string> DataloggerConfig::validate() const {
    std::vector<std::string> problems;

    if (broker.host.empty()) {
        problems.push_back("broker.host is required");
    }
    if (broker.port == 0) {
        problems.push_back("broker.port must be non-zero");
    }
    if (broker.clientId.empty()) {
        problems.push_back("broker.client_id is required");
    }
    if (broker.qos < 1 || broker.qos > 2) {
        problems.push_back("broker.qos must be 1 or 2 for broker redelivery");
    }
    if (!broker.certPath.empty() && broker.keyPath.empty()) {
        problems.push_back("broker.key_path is required with broker.cert_path");
    }

    if (topics.filters.empty()) {
        problems.push_back("topics.filters must name at least one filter");
    }
    for (const auto& filter : topics.filters) {
        if (filter.empty()) {
            problems.push_back("topics.filters contains an empty filter");
        }
    }
    if (topics.deviceIdLevel < 0) {
        problems.push_back("topics.device_id_level must be >= 0");
    }

    if (collector.url.rfind("http://", 0) != 0 && collector.url.rfind("https://", 0) != 0) {
        problems.push_back("collector.url must start with http:// or https://");
    }
    if (collector.timeout.count() <= 0) {
        problems.push_back("collector.timeout_ms must be positive");
    }
    if (!collector.loginUrl.empty()) {
        if (collector.loginUrl.rfind("http://", 0) != 0 && collector.loginUrl.rfind("https://", 0) != 0) {
            problems.push_back("collector.login_url must start with http:// or https://");
        }
        if (collector.loginEmail.empty()) {
            problems.push_back("collector.login_email is required with collector.login_url");
        }
    }

    if (queue.path.empty()) {
        problems.push_back("queue.path is required");
    }
    if (queue.maxRecords == 0) {
        problems.push_back("queue.max_records must be positive");
    }
    if (queue.maxAttempts == 0) {
        problems.push_back("queue.max_attempts must be positive");
    }

    if (forwarder.batchSize == 0) {
        problems.push_back("forwarder.batch_size must be positive");
    }
    if (forwarder.concurrency == 0) {
        problems.push_back("forwarder.concurrency must be positive");
    }
    if (forwarder.backoffCap < forwarder.backoffBase) {
        problems.push_back("forwarder.backoff_cap_ms must be >= backoff_base_ms");
    }
    if (reconnect.cap < reconnect.base) {
        problems.push_back("reconnect.cap_ms must be >= base_ms");
    }

    if (pipeline.channelCapacity == 0) {
        problems.push_back("pipeline.channel_capacity must be positive");
    }
    if (audit.enabled && audit.path.empty()) {
        problems.push_back("audit.path is required when audit is enabled");
    }

    return problems;
}

std::string ackModeToString(AckMode mode) {
    switch (mode) {
        case AckMode::OnDelivery: return "delivery";
        case AckMode::OnEnqueue: return "enqueue";
        default: return "unknown";
    }
}

bool parseAckMode(const std::string& text, AckMode& mode) {
    if (text == "delivery") {
        mode = AckMode::OnDelivery;
        return true;
    }
    if (text == "enqueue") {
        mode = AckMode::OnEnqueue;
        return true;
    }
    return false;
}

} // namespace datalogger
