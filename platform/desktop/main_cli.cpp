/**
 * @file main_cli.cpp
 * @brief Command-line server for the tracking and spatial alert engine
 *
 * Loads the configuration, seeds the zone registry and the entity directory,
 * connects to the fleet broker and runs the maintenance loop until SIGINT or
 * SIGTERM. Without --headless, single-letter operator commands are read from
 * stdin.
 */

#include "IClock.hpp"
#include "PahoMqttClient.hpp"
#include "TomlConfig.hpp"
#include "adapters/DefaultPolicies.hpp"
#include "adapters/MqttIngestGateway.hpp"
#include "adapters/MqttEventRelay.hpp"
#include "adapters/MqttTransportAdapter.hpp"
#include "domain/AlertLog.hpp"
#include "domain/EntityDirectory.hpp"
#include "domain/IngestionCoordinator.hpp"
#include "domain/PositionStore.hpp"
#include "domain/SubscriptionBus.hpp"
#include "domain/ZoneRegistry.hpp"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <set>
#include <signal.h>
#include <thread>
#include <vector>

using namespace rtsae;

/// Global flag for graceful shutdown coordination
static std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n"
              << "Options:\n"
              << "  --config [file]    Configuration file (default: rtsae.toml)\n"
              << "  --headless         Run without operator commands\n"
              << "  --help             Show this help message\n"
              << "\nEnvironment overrides:\n"
              << "  RTSAE_MQTT_HOST, RTSAE_MQTT_PORT, RTSAE_WORKERS\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [mqtt]\n"
              << "  host = \"broker.local\"\n"
              << "  port = 1883\n"
              << "\n"
              << "  [[vehicle]]\n"
              << "  tenant_id = \"acme\"\n"
              << "  vehicle_id = \"truck-1\"\n"
              << std::endl;
}

/**
 * @brief Safe environment variable getter for Windows
 * @return Environment variable value or empty string if not found
 */
std::string safeGetEnv(const char* name) {
#ifdef _WIN32
    char* buffer = nullptr;
    size_t size = 0;
    if (_dupenv_s(&buffer, &size, name) == 0 && buffer != nullptr) {
        std::string result(buffer);
        free(buffer);
        return result;
    }
    return "";
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : "";
#endif
}

void printCounters(const domain::IngestionCoordinator& coordinator, const domain::AlertLog& alertLog) {
    auto c = coordinator.counters();
    std::cout << "[Server] accepted=" << c.accepted
              << " stale=" << c.staleIgnored
              << " rejected=" << c.rejected
              << " dropped=" << c.queueDropped
              << " historyFailures=" << c.historyFailures
              << " logFailures=" << c.logFailures
              << " logRetries=" << c.logRetries
              << " logGaveUp=" << c.logGaveUp
              << " zoneErrors=" << c.zoneErrors
              << " staleRegistry=" << c.staleRegistrySkips
              << " telemetry=" << c.telemetryAccepted
              << " alarms=" << c.alarmsRaised
              << " pendingRetries=" << coordinator.pendingRetries()
              << " activeAlerts=" << alertLog.activeCount() << std::endl;
}

void printZones(const domain::ZoneRegistry& registry, const std::set<std::string>& tenants) {
    for (const auto& tenantId : tenants) {
        for (const auto& zone : registry.listZones(tenantId)) {
            std::cout << "[Server] " << tenantId << " geofence " << zone.zoneId << " \"" << zone.name << "\""
                      << (zone.active ? "" : " (inactive)") << std::endl;
        }
    }
    for (const auto& zone : registry.listAccidentZones()) {
        std::cout << "[Server] accident zone " << zone.zoneId << " " << severityToString(zone.severity)
                  << " r=" << zone.radiusM << "m count=" << zone.accidentCount << std::endl;
    }
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    bool headless = false;
    bool explicitConfig = false;
    std::string configFile = "rtsae.toml";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
                explicitConfig = true;
            }
        } else if (arg == "--headless") {
            headless = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    EngineConfig config;
    try {
        config = TomlConfig::loadFromFile(configFile);
    } catch (const std::runtime_error& e) {
        if (explicitConfig) {
            std::cerr << "[Config] " << e.what() << std::endl;
            return 1;
        }
        std::cout << "[Config] " << configFile << " not found, using defaults" << std::endl;
    }
    TomlConfig::applyEnvironment(config, safeGetEnv);

    std::cout << "Starting RTSAE server" << std::endl;

    auto clock = std::make_shared<SystemClock>();

    auto directory = std::make_shared<domain::InMemoryEntityDirectory>();
    std::set<std::string> tenants;
    for (const auto& vehicle : config.vehicles) {
        if (vehicle.tenantId.empty() || vehicle.vehicleId.empty()) {
            std::cerr << "[Config] Warning: [[vehicle]] entry without tenant_id/vehicle_id skipped" << std::endl;
            continue;
        }
        directory->registerVehicle(vehicle.tenantId, vehicle.vehicleId);
        tenants.insert(vehicle.tenantId);
    }
    auto cachedDirectory = std::make_shared<domain::CachedEntityDirectory>(
        directory, clock, config.ingestion.entityCacheTtl, config.ingestion.entityCacheMaxEntries);

    auto store = std::make_shared<domain::PositionStore>(clock, config.store);
    auto registry = std::make_shared<domain::ZoneRegistry>(clock, config.registry, config.accident);

    auto loaded = registry->replaceAccidentZones(config.accidentZones);
    if (!loaded.success) {
        std::cerr << "[Server] Accident zones rejected: " << loaded.error << std::endl;
        return 1;
    }
    for (const auto& zone : config.geofences) {
        auto result = registry->upsertZone(zone);
        if (!result.success) {
            std::cerr << "[Server] Geofence \"" << zone.name << "\" rejected: " << result.error << std::endl;
        }
        tenants.insert(zone.tenantId);
    }

    auto bus = std::make_shared<domain::SubscriptionBus>(config.bus);
    auto alertLog = std::make_shared<domain::AlertLog>(clock, config.alertLog);
    auto policies = std::make_shared<adapters::DefaultPolicyEngine>(config.ingestion);

    auto coordinator = std::make_shared<domain::IngestionCoordinator>(
        cachedDirectory, store, registry, bus, alertLog, policies, clock, config);

    std::cout << "Workers: " << config.ingestion.workerThreads
              << ", vehicles: " << config.vehicles.size()
              << ", geofences: " << config.geofences.size()
              << ", accident zones: " << config.accidentZones.size() << std::endl;

    std::shared_ptr<ports::ITransport> transport;
    std::unique_ptr<adapters::MqttIngestGateway> gateway;
    std::unique_ptr<adapters::MqttEventRelay> relay;

    if (config.mqtt.enabled()) {
        auto mqttClient = std::make_shared<PahoMqttClient>();
        transport = std::make_shared<adapters::MqttTransportAdapter>(mqttClient);

        gateway = std::make_unique<adapters::MqttIngestGateway>(transport, coordinator, config.mqtt);
        gateway->start();

        std::vector<std::string> relayed;
        for (const auto& tenantId : tenants) {
            relayed.push_back(ports::topics::tenant(tenantId));
        }
        for (const auto& zone : registry->listAccidentZones()) {
            relayed.push_back(ports::topics::accidentZone(zone.zoneId));
        }
        relay = std::make_unique<adapters::MqttEventRelay>(
            bus, transport, config.mqtt.eventsRoot, config.bus.subscriberBuffer, config.mqtt.qos);
        relay->start(std::move(relayed));

        ports::Credentials credentials;
        credentials.host = config.mqtt.host;
        credentials.port = config.mqtt.port;
        credentials.clientId = config.mqtt.clientId;
        credentials.username = config.mqtt.username;
        credentials.password = config.mqtt.password;
        credentials.useTls = config.mqtt.useTls;
        credentials.caPath = config.mqtt.caPath;
        credentials.certPath = config.mqtt.certPath;
        credentials.keyPath = config.mqtt.keyPath;
        credentials.verifyServer = config.mqtt.verifyServer;

        std::cout << "Broker: " << config.mqtt.host << ":" << config.mqtt.port
                  << (config.mqtt.useTls ? " (TLS)" : "") << std::endl;
        if (!transport->connect(credentials)) {
            std::cerr << "[Server] Could not start broker connection" << std::endl;
            return 1;
        }
    } else {
        std::cout << "No [mqtt] host configured, broker ingestion disabled" << std::endl;
    }

    auto maintain = [&]() {
        auto lastPurge = std::chrono::steady_clock::now();
        while (g_running) {
            if (gateway) {
                gateway->processEvents(std::chrono::milliseconds(200));
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            if (relay) {
                relay->pump();
            }
            coordinator->processRetries();

            auto now = std::chrono::steady_clock::now();
            if (now - lastPurge >= std::chrono::minutes(1)) {
                store->purgeExpired();
                cachedDirectory->purgeExpired();
                alertLog->purgeExpired();
                alertLog->purgeResolvedOlderThan(config.alertLog.resolvedRetention);
                lastPurge = now;
            }
        }
    };

    if (headless) {
        std::cout << "Running in headless mode. Press Ctrl+C to stop." << std::endl;
        maintain();
    } else {
        std::cout << "\nInteractive mode. Commands:" << std::endl;
        std::cout << "  c - Show counters" << std::endl;
        std::cout << "  z - List zones" << std::endl;
        std::cout << "  p - Purge expired positions and alerts" << std::endl;
        std::cout << "  q - Quit" << std::endl;

        std::thread maintenanceThread(maintain);

        char cmd;
        while (g_running && std::cin >> cmd) {
            switch (cmd) {
                case 'c':
                    printCounters(*coordinator, *alertLog);
                    break;

                case 'z':
                    printZones(*registry, tenants);
                    break;

                case 'p': {
                    auto positions = store->purgeExpired();
                    auto alerts = alertLog->purgeExpired();
                    auto resolved = alertLog->purgeResolvedOlderThan(config.alertLog.resolvedRetention);
                    std::cout << "Purged " << positions << " positions, "
                              << alerts + resolved << " alerts" << std::endl;
                    break;
                }

                case 'q':
                    g_running = false;
                    break;

                default:
                    std::cout << "Unknown command" << std::endl;
                    break;
            }
        }
        g_running = false;
        maintenanceThread.join();
    }

    std::cout << "Stopping server..." << std::endl;
    if (gateway) {
        gateway->stop();
        gateway->processEvents(std::chrono::milliseconds(500));
    }
    coordinator->shutdown();
    if (relay) {
        if (relay->restarts() > 0) {
            std::cout << "Event relay restarted " << relay->restarts() << " times" << std::endl;
        }
        relay->stop();
    }
    if (transport) {
        transport->disconnect();
    }

    printCounters(*coordinator, *alertLog);
    std::cout << "Server stopped." << std::endl;
    return 0;
}
