#pragma once

#include "Model.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rtsae {

struct IngestionConfig {
    std::chrono::seconds maxFutureSkew{30};
    std::chrono::seconds maxAge{86400};
    std::size_t laneCapacity = 64;
    std::size_t workerThreads = 4;
    std::chrono::seconds entityCacheTtl{60};
    std::size_t entityCacheMaxEntries = 10000;
    std::chrono::seconds telemetryCacheTtl{300};

    std::chrono::milliseconds storeWriteDeadline{200};
    std::chrono::milliseconds logWriteDeadline{500};

    std::chrono::milliseconds retryBaseDelay{1000};
    double retryMultiplier = 2.0;
    std::chrono::milliseconds retryMaxDelay{std::chrono::minutes(5)};
    int retryMaxAttempts = 5;
};

struct StoreConfig {
    std::chrono::seconds hotTtl{300};
    std::chrono::hours historyRetention{24};
    std::size_t shardCount = 16;
    std::size_t defaultQueryLimit = 100;
    std::size_t shipmentQueryLimit = 500;
    std::size_t maxQueryLimit = 1000;
};

struct RegistryConfig {
    double cellSizeDeg = 1.0;
    std::size_t maxCellsPerZone = 4096;
};

struct GeofenceConfig {
    double accuracyCeilingM = 150.0;
};

struct AccidentConfig {
    std::chrono::seconds exitHold{60};
    std::chrono::seconds activeMax{900};
    // 0 disables the staleness check
    std::chrono::seconds maxSnapshotAge{0};
    double tieToleranceM = 1.0;

    double radiusLowM = 300.0;
    double radiusMediumM = 500.0;
    double radiusHighM = 1000.0;

    double nearbyRadiusM = 5000.0;

    double radiusFor(Severity severity) const {
        switch (severity) {
            case Severity::High: return radiusHighM;
            case Severity::Medium: return radiusMediumM;
            case Severity::Low: return radiusLowM;
        }
        return radiusLowM;
    }
};

struct TelemetryThresholds {
    double lowFuelPct = 15.0;
    double overheatC = 100.0;
    double lowBatteryV = 11.5;
    std::optional<double> lowOilPressure;
    std::optional<double> lowTirePressure;
};

struct EtaConfig {
    double defaultSpeedKph = 50.0;
    std::chrono::seconds sampleWindow{60};
    std::size_t minSamples = 3;
    double smoothingAlpha = 0.3;
    double minSpeedKph = 5.0;
    double maxSpeedKph = 150.0;
    std::chrono::seconds highConfidenceAge{60};
    std::chrono::seconds mediumConfidenceAge{300};
};

struct BusConfig {
    std::size_t subscriberBuffer = 256;
    std::chrono::milliseconds publishDeadline{100};
};

struct AlertLogConfig {
    std::chrono::hours retention{24 * 90};
    // Resolved alerts are cleared earlier than the general retention.
    std::chrono::hours resolvedRetention{24 * 7};
    std::size_t defaultPageSize = 20;
    std::size_t maxPageSize = 100;
    std::size_t topZones = 5;
};

struct MqttConfig {
    std::string host;
    std::uint16_t port = 1883;
    std::string clientId = "rtsae-server";
    std::string username;
    std::string password;

    bool useTls = false;
    std::string caPath;
    std::string certPath;
    std::string keyPath;
    bool verifyServer = true;

    int qos = 1;
    std::string topicRoot = "fleet";
    std::string eventsRoot = "rtsae/events";

    bool enabled() const { return !host.empty(); }
};

struct VehicleSeed {
    std::string tenantId;
    std::string vehicleId;
};

struct EngineConfig {
    IngestionConfig ingestion;
    StoreConfig store;
    RegistryConfig registry;
    GeofenceConfig geofence;
    AccidentConfig accident;
    TelemetryThresholds telemetry;
    EtaConfig eta;
    BusConfig bus;
    AlertLogConfig alertLog;
    MqttConfig mqtt;

    std::vector<AccidentZone> accidentZones;
    std::vector<Geofence> geofences;
    std::vector<VehicleSeed> vehicles;
};

} // namespace rtsae
