/**
 * @file main_cli.cpp
 * @brief Command-line entry point for the datalogger daemon
 *
 * Loads the TOML configuration (plus environment overrides), wires the
 * Paho MQTT client, durable queue and Beast HTTP client into a
 * PipelineCoordinator and runs until SIGINT or SIGTERM.
 *
 * A broker that cannot be reached at startup is not fatal: the connection
 * manager keeps retrying with backoff while queued records continue to be
 * forwarded to the collector.
 */

#include "PahoMqttClient.hpp"
#include "BeastHttpClient.hpp"
#include "ConnectionManager.hpp"
#include "DataloggerConfig.hpp"
#include "Decoder.hpp"
#include "Errors.hpp"
#include "IClock.hpp"
#include "IRng.hpp"
#include "TomlConfig.hpp"
#include "adapters/DefaultPolicies.hpp"
#include "domain/AuditLog.hpp"
#include "domain/DurableQueue.hpp"
#include "domain/Forwarder.hpp"
#include "domain/PipelineCoordinator.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace datalogger;

/// Global flag for graceful shutdown coordination
static std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config [file]    Configuration file (default: datalogger.toml)\n"
              << "  --help             Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [broker]\n"
              << "  host = \"broker.local\"\n"
              << "  port = 1883\n"
              << "  [topics]\n"
              << "  filters = [\"sensors/#\"]\n"
              << "  [collector]\n"
              << "  url = \"https://collector.example.com/ingest\"\n"
              << "\nEnvironment overrides:\n"
              << "  DATALOGGER_BROKER_HOST, DATALOGGER_BROKER_PORT, DATALOGGER_BROKER_USERNAME,\n"
              << "  DATALOGGER_BROKER_PASSWORD, DATALOGGER_COLLECTOR_URL, DATALOGGER_COLLECTOR_TOKEN,\n"
              << "  DATALOGGER_QUEUE_PATH\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string configFile = "datalogger.toml";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "--config requires a file name" << std::endl;
                return 1;
            }
            configFile = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    DataloggerConfig config;
    try {
        config = TomlConfig::loadFromFile(configFile);
        TomlConfig::applyEnvironment(config);
    } catch (const std::runtime_error& e) {
        std::cerr << "[Config] " << e.what() << std::endl;
        return 1;
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        std::cerr << "Error: invalid configuration in " << configFile << std::endl;
        for (const auto& problem : problems) {
            std::cerr << "  - " << problem << std::endl;
        }
        return 1;
    }
    TomlConfig::warnMissingFiles(config);

    std::cout << "Starting datalogger" << std::endl;
    std::cout << "Broker: " << config.broker.host << ":" << config.broker.port
              << (config.broker.useTls ? " (TLS)" : "") << std::endl;
    std::cout << "Collector: " << config.collector.url << std::endl;
    std::cout << "Queue: " << config.queue.path << std::endl;
    std::cout << "Ack mode: " << ackModeToString(config.pipeline.ackMode) << std::endl;

    auto clock = std::make_shared<SystemClock>();
    auto rng = std::make_shared<StandardRng>();
    auto policies = std::make_shared<adapters::DefaultPolicyEngine>(
        rng, config.forwarder.backoffBase, config.forwarder.backoffCap,
        config.reconnect.base, config.reconnect.cap);

    std::shared_ptr<domain::DurableQueue> queue;
    std::shared_ptr<domain::AuditLog> audit;
    std::shared_ptr<domain::Forwarder> forwarder;
    try {
        queue = std::make_shared<domain::DurableQueue>(config.queue.path, config.queue.maxRecords,
                                                       config.queue.maxAttempts);
        if (config.audit.enabled) {
            audit = std::make_shared<domain::AuditLog>(config.audit.path, clock);
        }
        forwarder = std::make_shared<domain::Forwarder>(std::make_shared<BeastHttpClient>(),
                                                        config.collector, clock);
    } catch (const StorageError& e) {
        std::cerr << "[Queue] " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Config] collector.signing_key_base64: " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "[Audit] " << e.what() << std::endl;
        return 1;
    }

    DecoderConfig decoderConfig;
    decoderConfig.topicFilters = config.topics.filters;
    decoderConfig.deviceIdLevel = config.topics.deviceIdLevel;
    auto decoder = std::make_shared<Decoder>(decoderConfig);

    auto mqttClient = std::make_shared<PahoMqttClient>();
    auto connection = std::make_shared<ConnectionManager>(mqttClient, clock, policies,
                                                          sessionOptionsFromConfig(config.broker));

    auto pipeline = std::make_unique<domain::PipelineCoordinator>(
        connection, decoder, queue, forwarder, clock, policies,
        domain::PipelineOptions::fromConfig(config), audit);

    // Forwarding of records left from a previous run starts before the broker is up
    pipeline->start();

    try {
        connection->connect(brokerAddressFromConfig(config.broker),
                            credentialsFromConfig(config.broker),
                            config.topics.filters);
    } catch (const ConnectionError& e) {
        std::cerr << "[Connection] Initial connect failed: " << e.what()
                  << "; retrying in the background" << std::endl;
    }

    std::cout << "Running. Press Ctrl+C to stop." << std::endl;
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutting down..." << std::endl;
    pipeline->stop();
    connection->close();

    auto stats = pipeline->stats();
    std::cout << "Received " << stats.received << ", delivered " << stats.recordsDelivered
              << ", dead-lettered " << stats.recordsDeadLettered << ", decode errors " << stats.decodeErrors
              << ", " << queue->size() << " records still queued" << std::endl;

    pipeline.reset();
    std::cout << "Datalogger stopped." << std::endl;
    return 0;
}
