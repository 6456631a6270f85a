/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the datalogger daemon
 *
 * Reads the subset of TOML the datalogger needs into a DataloggerConfig:
 * section headers, key = value pairs, quoted strings, string arrays and
 * # comments. Environment variables can override the settings most often
 * injected by a deployment (broker address and credentials, collector URL
 * and token, queue location).
 *
 * Supported Sections:
 * - [broker]: MQTT broker address, credentials and TLS material
 * - [topics]: Subscription filters and device id topic level
 * - [collector]: HTTP collector endpoint, token and signing key
 * - [queue]: Durable queue file and limits
 * - [forwarder]: Batching and retry tuning
 * - [reconnect]: Broker reconnect backoff
 * - [pipeline]: Acknowledgement mode and channel capacity
 * - [audit]: CSV audit trail
 *
 * @note Unknown keys are reported and ignored
 * @note Bad numbers and unknown enum values throw std::runtime_error naming the key
 */

#pragma once

#include "DataloggerConfig.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace datalogger {

class TomlConfig {
public:
    /**
     * @brief Load and parse a TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Configuration with file values over the built-in defaults
     * @throws std::runtime_error if the file cannot be read or a value cannot be parsed
     * @note Environment overrides are applied separately by applyEnvironment()
     */
    static DataloggerConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open config file: " + filename);
        }

        std::cout << "[Config] Loading " << filename << std::endl;
        return parse(file);
    }

    /**
     * @brief Parse configuration text from a stream
     * @param input TOML text
     * @return Parsed configuration
     * @throws std::runtime_error on a malformed value
     */
    static DataloggerConfig parse(std::istream& input) {
        DataloggerConfig config;

        std::string currentSection;
        std::string line;
        int lineNumber = 0;
        while (std::getline(input, line)) {
            lineNumber++;
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            if (line[0] == '[') {
                if (line.back() != ']') {
                    throw std::runtime_error("Malformed section header on line " + std::to_string(lineNumber));
                }
                currentSection = line.substr(1, line.length() - 2);
                trim(currentSection);
                continue;
            }

            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                throw std::runtime_error("Expected key = value on line " + std::to_string(lineNumber));
            }

            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);

            if (!applyValue(config, currentSection, key, value)) {
                std::cerr << "[Config] Warning: ignoring unknown key " << qualified(currentSection, key)
                          << " on line " << lineNumber << std::endl;
            }
        }

        return config;
    }

    /**
     * @brief Override settings from DATALOGGER_* environment variables
     * @param config Configuration to update in place
     * @throws std::runtime_error if DATALOGGER_BROKER_PORT is not a valid port
     */
    static void applyEnvironment(DataloggerConfig& config) {
        std::string value;

        if (safeGetEnv("DATALOGGER_BROKER_HOST", value)) {
            config.broker.host = value;
        }
        if (safeGetEnv("DATALOGGER_BROKER_PORT", value)) {
            config.broker.port = toPort("DATALOGGER_BROKER_PORT", value);
        }
        if (safeGetEnv("DATALOGGER_BROKER_USERNAME", value)) {
            config.broker.username = value;
        }
        if (safeGetEnv("DATALOGGER_BROKER_PASSWORD", value)) {
            config.broker.password = value;
        }
        if (safeGetEnv("DATALOGGER_COLLECTOR_URL", value)) {
            config.collector.url = value;
        }
        if (safeGetEnv("DATALOGGER_COLLECTOR_TOKEN", value)) {
            config.collector.authToken = value;
        }
        if (safeGetEnv("DATALOGGER_COLLECTOR_PASSWORD", value)) {
            config.collector.loginPassword = value;
        }
        if (safeGetEnv("DATALOGGER_QUEUE_PATH", value)) {
            config.queue.path = value;
        }
    }

    /**
     * @brief Report TLS material referenced by the configuration that does not exist
     * @param config Configuration to check
     */
    static void warnMissingFiles(const DataloggerConfig& config) {
        namespace fs = std::filesystem;

        if (!config.broker.useTls) {
            return;
        }
        if (!config.broker.caPath.empty() && !fs::exists(config.broker.caPath)) {
            std::cerr << "[Config] Warning: CA bundle not found: " << config.broker.caPath << std::endl;
        }
        if (!config.broker.certPath.empty() && !fs::exists(config.broker.certPath)) {
            std::cerr << "[Config] Warning: client certificate not found: " << config.broker.certPath << std::endl;
        }
        if (!config.broker.keyPath.empty() && !fs::exists(config.broker.keyPath)) {
            std::cerr << "[Config] Warning: client private key not found: " << config.broker.keyPath << std::endl;
        }
    }

private:
    static bool applyValue(DataloggerConfig& config, const std::string& section,
                           const std::string& key, const std::string& raw) {
        const std::string name = qualified(section, key);

        if (section == "broker") {
            auto& b = config.broker;
            if (key == "host") b.host = toString(name, raw);
            else if (key == "port") b.port = toPort(name, raw);
            else if (key == "client_id") b.clientId = toString(name, raw);
            else if (key == "username") b.username = toString(name, raw);
            else if (key == "password") b.password = toString(name, raw);
            else if (key == "use_tls") b.useTls = toBool(name, raw);
            else if (key == "ca_path") b.caPath = toString(name, raw);
            else if (key == "cert_path") b.certPath = toString(name, raw);
            else if (key == "key_path") b.keyPath = toString(name, raw);
            else if (key == "verify_server_cert") b.verifyServerCert = toBool(name, raw);
            else if (key == "keep_alive_seconds") b.keepAliveSeconds = static_cast<int>(toInteger(name, raw));
            else if (key == "qos") b.qos = static_cast<int>(toInteger(name, raw));
            else if (key == "connect_timeout_seconds") b.connectTimeoutSeconds = static_cast<int>(toInteger(name, raw));
            else return false;
        } else if (section == "topics") {
            if (key == "filters") config.topics.filters = toStringArray(name, raw);
            else if (key == "device_id_level") config.topics.deviceIdLevel = static_cast<int>(toInteger(name, raw));
            else return false;
        } else if (section == "collector") {
            auto& c = config.collector;
            if (key == "url") c.url = toString(name, raw);
            else if (key == "auth_token") c.authToken = toString(name, raw);
            else if (key == "login_url") c.loginUrl = toString(name, raw);
            else if (key == "login_email") c.loginEmail = toString(name, raw);
            else if (key == "login_password") c.loginPassword = toString(name, raw);
            else if (key == "signing_key_base64") c.signingKeyBase64 = toString(name, raw);
            else if (key == "timeout_ms") c.timeout = std::chrono::milliseconds(toInteger(name, raw));
            else if (key == "verify_tls") c.verifyTls = toBool(name, raw);
            else return false;
        } else if (section == "queue") {
            if (key == "path") config.queue.path = toString(name, raw);
            else if (key == "max_records") config.queue.maxRecords = toUnsigned(name, raw);
            else if (key == "max_attempts") config.queue.maxAttempts = static_cast<std::uint32_t>(toUnsigned(name, raw));
            else return false;
        } else if (section == "forwarder") {
            auto& f = config.forwarder;
            if (key == "batch_size") f.batchSize = toUnsigned(name, raw);
            else if (key == "batch_wait_ms") f.batchWait = std::chrono::milliseconds(toInteger(name, raw));
            else if (key == "concurrency") f.concurrency = toUnsigned(name, raw);
            else if (key == "backoff_base_ms") f.backoffBase = std::chrono::milliseconds(toInteger(name, raw));
            else if (key == "backoff_cap_ms") f.backoffCap = std::chrono::milliseconds(toInteger(name, raw));
            else return false;
        } else if (section == "reconnect") {
            if (key == "base_ms") config.reconnect.base = std::chrono::milliseconds(toInteger(name, raw));
            else if (key == "cap_ms") config.reconnect.cap = std::chrono::milliseconds(toInteger(name, raw));
            else return false;
        } else if (section == "pipeline") {
            if (key == "ack_mode") {
                std::string text = toString(name, raw);
                if (!parseAckMode(text, config.pipeline.ackMode)) {
                    throw std::runtime_error("Invalid value for " + name + ": " + text +
                                             " (expected delivery or enqueue)");
                }
            } else if (key == "channel_capacity") {
                config.pipeline.channelCapacity = toUnsigned(name, raw);
            } else {
                return false;
            }
        } else if (section == "audit") {
            if (key == "enabled") config.audit.enabled = toBool(name, raw);
            else if (key == "path") config.audit.path = toString(name, raw);
            else return false;
        } else {
            return false;
        }
        return true;
    }

    static std::string qualified(const std::string& section, const std::string& key) {
        return section.empty() ? key : section + "." + key;
    }

    static std::string toString(const std::string& name, const std::string& raw) {
        std::string value = raw;
        if (!value.empty() && value.front() == '"') {
            if (value.size() < 2 || value.back() != '"') {
                throw std::runtime_error("Unterminated string for " + name);
            }
            return unescape(value.substr(1, value.size() - 2));
        }
        return value;
    }

    static bool toBool(const std::string& name, const std::string& raw) {
        if (raw == "true" || raw == "1") {
            return true;
        }
        if (raw == "false" || raw == "0") {
            return false;
        }
        throw std::runtime_error("Invalid boolean for " + name + ": " + raw);
    }

    static long long toInteger(const std::string& name, const std::string& raw) {
        try {
            size_t consumed = 0;
            long long value = std::stoll(raw, &consumed);
            if (consumed != raw.size()) {
                throw std::invalid_argument(raw);
            }
            return value;
        } catch (const std::logic_error&) {
            throw std::runtime_error("Invalid number for " + name + ": " + raw);
        }
    }

    static std::size_t toUnsigned(const std::string& name, const std::string& raw) {
        long long value = toInteger(name, raw);
        if (value < 0) {
            throw std::runtime_error("Negative value for " + name + ": " + raw);
        }
        return static_cast<std::size_t>(value);
    }

    static std::uint16_t toPort(const std::string& name, const std::string& raw) {
        long long value = toInteger(name, raw);
        if (value < 0 || value > 65535) {
            throw std::runtime_error("Port out of range for " + name + ": " + raw);
        }
        return static_cast<std::uint16_t>(value);
    }

    /// ["a", "b"] on a single line
    static std::vector<std::string> toStringArray(const std::string& name, const std::string& raw) {
        if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
            throw std::runtime_error("Expected a string array for " + name);
        }

        std::vector<std::string> items;
        std::string inner = raw.substr(1, raw.size() - 2);
        std::string current;
        bool inString = false;
        bool escaped = false;
        for (char c : inner) {
            if (inString) {
                current += c;
                if (escaped) {
                    escaped = false;
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == '"') {
                    inString = false;
                }
            } else if (c == '"') {
                inString = true;
                current += c;
            } else if (c == ',') {
                trim(current);
                if (!current.empty()) {
                    items.push_back(toString(name, current));
                }
                current.clear();
            } else {
                current += c;
            }
        }
        if (inString) {
            throw std::runtime_error("Unterminated string in array for " + name);
        }
        trim(current);
        if (!current.empty()) {
            items.push_back(toString(name, current));
        }
        return items;
    }

    static std::string unescape(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            if (value[i] == '\\' && i + 1 < value.size()) {
                char next = value[++i];
                switch (next) {
                    case 'n': out += '\n'; break;
                    case 't': out += '\t'; break;
                    case '"': out += '"'; break;
                    case '\\': out += '\\'; break;
                    default: out += '\\'; out += next; break;
                }
            } else {
                out += value[i];
            }
        }
        return out;
    }

    /// Drop a # comment that is not inside a quoted string
    static void stripComment(std::string& line) {
        bool inString = false;
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (c == '\\' && inString) {
                ++i;
            } else if (c == '"') {
                inString = !inString;
            } else if (c == '#' && !inString) {
                line.erase(i);
                return;
            }
        }
    }

    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    static bool safeGetEnv(const char* name, std::string& value) {
        const char* env = std::getenv(name);
        if (env == nullptr || *env == '\0') {
            return false;
        }
        value = env;
        return true;
    }
};

} // namespace datalogger
