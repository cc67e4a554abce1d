/**
 * @file TomlConfig.hpp
 * @brief TOML configuration file parser for the engine server
 *
 * Line-oriented parser for the subset of TOML the server configuration uses:
 * tables, arrays of tables, strings, numbers, booleans, string lists and
 * lists of [lat, lon] pairs.
 *
 * Supported Sections:
 * - [ingestion], [store], [registry], [geofence], [accident], [telemetry],
 *   [eta], [bus], [alert_log]: engine tuning, see EngineConfig.hpp
 * - [mqtt]: broker connection and topic roots
 * - [[accident_zone]]: accident zones loaded at start-up
 * - [[geofence]]: tenant geofences loaded at start-up
 * - [[vehicle]]: tenant/vehicle pairs known to the entity directory
 *
 * @note Unknown keys are ignored; unparsable values keep their default and log a warning
 */

#pragma once

#include "EngineConfig.hpp"
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace rtsae {

class TomlConfig {
public:
    using EnvLookup = std::function<std::string(const char*)>;

    /**
     * @brief Load and parse TOML configuration file
     * @param filename Path to TOML configuration file
     * @return Engine configuration, defaults where the file is silent
     * @throws std::runtime_error if the file cannot be opened
     */
    static EngineConfig loadFromFile(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Could not open config file: " + filename);
        }
        return parse(file);
    }

    static EngineConfig loadFromString(const std::string& text) {
        std::istringstream stream(text);
        return parse(stream);
    }

    /**
     * @brief Apply RTSAE_MQTT_HOST, RTSAE_MQTT_PORT and RTSAE_WORKERS overrides
     * @param lookup Returns the variable's value or an empty string
     */
    static void applyEnvironment(EngineConfig& config, const EnvLookup& lookup) {
        std::string host = lookup("RTSAE_MQTT_HOST");
        std::string port = lookup("RTSAE_MQTT_PORT");
        std::string workers = lookup("RTSAE_WORKERS");

        if (!host.empty()) config.mqtt.host = host;
        if (!port.empty()) assignUnsigned(config.mqtt.port, port, "RTSAE_MQTT_PORT");
        if (!workers.empty()) assignUnsigned(config.ingestion.workerThreads, workers, "RTSAE_WORKERS");
    }

    static EngineConfig parse(std::istream& input) {
        EngineConfig config;
        std::vector<GeofenceDraft> geofences;

        std::string currentSection;
        std::string line;
        while (std::getline(input, line)) {
            stripComment(line);
            trim(line);

            if (line.empty()) {
                continue;
            }

            // Array of tables: every header starts a new element
            if (line.rfind("[[", 0) == 0) {
                if (line.size() > 4 && line.compare(line.size() - 2, 2, "]]") == 0) {
                    std::string table = line.substr(2, line.length() - 4);
                    trim(table);
                    // Kept apart from plain tables: [geofence] and [[geofence]] both exist
                    currentSection = "[[" + table + "]]";
                    if (table == "accident_zone") {
                        config.accidentZones.emplace_back();
                    } else if (table == "geofence") {
                        geofences.emplace_back();
                    } else if (table == "vehicle") {
                        config.vehicles.emplace_back();
                    } else {
                        std::cerr << "[Config] Warning: unknown table " << currentSection << std::endl;
                    }
                }
                continue;
            }

            if (line[0] == '[') {
                if (line.back() == ']') {
                    currentSection = line.substr(1, line.length() - 2);
                    trim(currentSection);
                }
                continue;
            }

            // Parse key = value
            size_t equalPos = line.find('=');
            if (equalPos == std::string::npos) {
                continue;
            }
            std::string key = line.substr(0, equalPos);
            std::string value = line.substr(equalPos + 1);
            trim(key);
            trim(value);

            const std::string context = currentSection + "." + key;

            if (currentSection == "ingestion") {
                applyIngestion(config.ingestion, key, value, context);
            } else if (currentSection == "store") {
                applyStore(config.store, key, value, context);
            } else if (currentSection == "registry") {
                if (key == "cell_size_deg") assignDouble(config.registry.cellSizeDeg, value, context);
                else if (key == "max_cells_per_zone") assignUnsigned(config.registry.maxCellsPerZone, value, context);
            } else if (currentSection == "geofence") {
                if (key == "accuracy_ceiling_m") assignDouble(config.geofence.accuracyCeilingM, value, context);
            } else if (currentSection == "accident") {
                applyAccident(config.accident, key, value, context);
            } else if (currentSection == "telemetry") {
                applyTelemetry(config.telemetry, key, value, context);
            } else if (currentSection == "eta") {
                applyEta(config.eta, key, value, context);
            } else if (currentSection == "bus") {
                if (key == "subscriber_buffer") assignUnsigned(config.bus.subscriberBuffer, value, context);
                else if (key == "publish_deadline_ms") assignDuration(config.bus.publishDeadline, value, context);
            } else if (currentSection == "alert_log") {
                if (key == "retention_days") {
                    std::size_t days = 0;
                    if (assignUnsigned(days, value, context)) {
                        config.alertLog.retention = std::chrono::hours(24 * static_cast<long>(days));
                    }
                }
                else if (key == "resolved_retention_days") {
                    std::size_t days = 0;
                    if (assignUnsigned(days, value, context)) {
                        config.alertLog.resolvedRetention = std::chrono::hours(24 * static_cast<long>(days));
                    }
                }
                else if (key == "default_page_size") assignUnsigned(config.alertLog.defaultPageSize, value, context);
                else if (key == "max_page_size") assignUnsigned(config.alertLog.maxPageSize, value, context);
                else if (key == "top_zones") assignUnsigned(config.alertLog.topZones, value, context);
            } else if (currentSection == "mqtt") {
                applyMqtt(config.mqtt, key, value, context);
            } else if (currentSection == "[[accident_zone]]" && !config.accidentZones.empty()) {
                applyAccidentZone(config.accidentZones.back(), key, value, context);
            } else if (currentSection == "[[geofence]]" && !geofences.empty()) {
                applyGeofence(geofences.back(), key, value, context);
            } else if (currentSection == "[[vehicle]]" && !config.vehicles.empty()) {
                if (key == "tenant_id") config.vehicles.back().tenantId = unquoted(value);
                else if (key == "vehicle_id") config.vehicles.back().vehicleId = unquoted(value);
            }
        }

        for (auto& draft : geofences) {
            if (auto zone = finish(draft)) {
                config.geofences.push_back(std::move(*zone));
            }
        }
        return config;
    }

private:
    struct GeofenceDraft {
        Geofence zone;
        std::string type = "circle";
        GeoPoint center;
        double radiusM = 0.0;
        std::vector<GeoPoint> ring;
        std::optional<double> innerRadiusM;
        std::optional<double> outerRadiusM;
    };

    static void applyIngestion(IngestionConfig& c, const std::string& key, const std::string& value,
                               const std::string& context) {
        if (key == "max_future_skew_s") assignDuration(c.maxFutureSkew, value, context);
        else if (key == "max_age_s") assignDuration(c.maxAge, value, context);
        else if (key == "lane_capacity") assignUnsigned(c.laneCapacity, value, context);
        else if (key == "worker_threads") assignUnsigned(c.workerThreads, value, context);
        else if (key == "entity_cache_ttl_s") assignDuration(c.entityCacheTtl, value, context);
        else if (key == "entity_cache_max_entries") assignUnsigned(c.entityCacheMaxEntries, value, context);
        else if (key == "telemetry_cache_ttl_s") assignDuration(c.telemetryCacheTtl, value, context);
        else if (key == "store_write_deadline_ms") assignDuration(c.storeWriteDeadline, value, context);
        else if (key == "log_write_deadline_ms") assignDuration(c.logWriteDeadline, value, context);
        else if (key == "retry_base_delay_ms") assignDuration(c.retryBaseDelay, value, context);
        else if (key == "retry_multiplier") assignDouble(c.retryMultiplier, value, context);
        else if (key == "retry_max_delay_ms") assignDuration(c.retryMaxDelay, value, context);
        else if (key == "retry_max_attempts") assignInt(c.retryMaxAttempts, value, context);
    }

    static void applyStore(StoreConfig& c, const std::string& key, const std::string& value,
                           const std::string& context) {
        if (key == "hot_ttl_s") assignDuration(c.hotTtl, value, context);
        else if (key == "history_retention_h") assignDuration(c.historyRetention, value, context);
        else if (key == "shard_count") assignUnsigned(c.shardCount, value, context);
        else if (key == "default_query_limit") assignUnsigned(c.defaultQueryLimit, value, context);
        else if (key == "shipment_query_limit") assignUnsigned(c.shipmentQueryLimit, value, context);
        else if (key == "max_query_limit") assignUnsigned(c.maxQueryLimit, value, context);
    }

    static void applyAccident(AccidentConfig& c, const std::string& key, const std::string& value,
                              const std::string& context) {
        if (key == "exit_hold_s") assignDuration(c.exitHold, value, context);
        else if (key == "active_max_s") assignDuration(c.activeMax, value, context);
        else if (key == "max_snapshot_age_s") assignDuration(c.maxSnapshotAge, value, context);
        else if (key == "tie_tolerance_m") assignDouble(c.tieToleranceM, value, context);
        else if (key == "radius_low_m") assignDouble(c.radiusLowM, value, context);
        else if (key == "radius_medium_m") assignDouble(c.radiusMediumM, value, context);
        else if (key == "radius_high_m") assignDouble(c.radiusHighM, value, context);
        else if (key == "nearby_radius_m") assignDouble(c.nearbyRadiusM, value, context);
    }

    static void applyTelemetry(TelemetryThresholds& c, const std::string& key, const std::string& value,
                               const std::string& context) {
        if (key == "low_fuel_pct") assignDouble(c.lowFuelPct, value, context);
        else if (key == "overheat_c") assignDouble(c.overheatC, value, context);
        else if (key == "low_battery_v") assignDouble(c.lowBatteryV, value, context);
        else if (key == "low_oil_pressure") {
            double threshold = 0.0;
            if (assignDouble(threshold, value, context)) c.lowOilPressure = threshold;
        } else if (key == "low_tire_pressure") {
            double threshold = 0.0;
            if (assignDouble(threshold, value, context)) c.lowTirePressure = threshold;
        }
    }

    static void applyEta(EtaConfig& c, const std::string& key, const std::string& value,
                         const std::string& context) {
        if (key == "default_speed_kph") assignDouble(c.defaultSpeedKph, value, context);
        else if (key == "sample_window_s") assignDuration(c.sampleWindow, value, context);
        else if (key == "min_samples") assignUnsigned(c.minSamples, value, context);
        else if (key == "smoothing_alpha") assignDouble(c.smoothingAlpha, value, context);
        else if (key == "min_speed_kph") assignDouble(c.minSpeedKph, value, context);
        else if (key == "max_speed_kph") assignDouble(c.maxSpeedKph, value, context);
        else if (key == "high_confidence_age_s") assignDuration(c.highConfidenceAge, value, context);
        else if (key == "medium_confidence_age_s") assignDuration(c.mediumConfidenceAge, value, context);
    }

    static void applyMqtt(MqttConfig& c, const std::string& key, const std::string& value,
                          const std::string& context) {
        if (key == "host") c.host = unquoted(value);
        else if (key == "port") assignUnsigned(c.port, value, context);
        else if (key == "client_id") c.clientId = unquoted(value);
        else if (key == "username") c.username = unquoted(value);
        else if (key == "password") c.password = unquoted(value);
        else if (key == "use_tls") assignBool(c.useTls, value, context);
        else if (key == "ca_path") c.caPath = unquoted(value);
        else if (key == "cert_path") c.certPath = unquoted(value);
        else if (key == "key_path") c.keyPath = unquoted(value);
        else if (key == "verify_server") assignBool(c.verifyServer, value, context);
        else if (key == "qos") assignInt(c.qos, value, context);
        else if (key == "topic_root") c.topicRoot = unquoted(value);
        else if (key == "events_root") c.eventsRoot = unquoted(value);
    }

    static void applyAccidentZone(AccidentZone& zone, const std::string& key, const std::string& value,
                                  const std::string& context) {
        if (key == "id") zone.zoneId = unquoted(value);
        else if (key == "lat") assignDouble(zone.center.lat, value, context);
        else if (key == "lon") assignDouble(zone.center.lon, value, context);
        else if (key == "radius_m") assignDouble(zone.radiusM, value, context);
        else if (key == "accident_count") assignInt(zone.accidentCount, value, context);
        else if (key == "severity") {
            auto severity = stringToSeverity(unquoted(value));
            if (severity) {
                zone.severity = *severity;
            } else {
                warn(context, value);
            }
        } else if (key.rfind("meta_", 0) == 0) {
            zone.metadata[key.substr(5)] = unquoted(value);
        }
    }

    static void applyGeofence(GeofenceDraft& draft, const std::string& key, const std::string& value,
                              const std::string& context) {
        auto& zone = draft.zone;
        if (key == "id") zone.zoneId = unquoted(value);
        else if (key == "tenant_id") zone.tenantId = unquoted(value);
        else if (key == "name") zone.name = unquoted(value);
        else if (key == "type") draft.type = unquoted(value);
        else if (key == "lat") assignDouble(draft.center.lat, value, context);
        else if (key == "lon") assignDouble(draft.center.lon, value, context);
        else if (key == "radius_m") assignDouble(draft.radiusM, value, context);
        else if (key == "polygon") {
            auto ring = parsePointList(value);
            if (ring) draft.ring = std::move(*ring);
            else warn(context, value);
        } else if (key == "vehicle_ids") {
            auto ids = parseStringList(value);
            if (ids) zone.vehicleIds.insert(ids->begin(), ids->end());
            else warn(context, value);
        } else if (key == "shipment_ids") {
            auto ids = parseStringList(value);
            if (ids) zone.shipmentIds.insert(ids->begin(), ids->end());
            else warn(context, value);
        }
        else if (key == "on_entry") assignBool(zone.onEntry, value, context);
        else if (key == "on_exit") assignBool(zone.onExit, value, context);
        else if (key == "active") assignBool(zone.active, value, context);
        else if (key == "inner_radius_m") {
            double radius = 0.0;
            if (assignDouble(radius, value, context)) draft.innerRadiusM = radius;
        } else if (key == "outer_radius_m") {
            double radius = 0.0;
            if (assignDouble(radius, value, context)) draft.outerRadiusM = radius;
        } else if (key.rfind("meta_", 0) == 0) {
            zone.metadata[key.substr(5)] = unquoted(value);
        }
    }

    static std::optional<Geofence> finish(GeofenceDraft& draft) {
        Geofence zone = std::move(draft.zone);
        if (draft.type == "polygon") {
            zone.shape = Polygon{draft.ring};
        } else if (draft.type == "circle") {
            zone.shape = Circle{draft.center, draft.radiusM};
        } else {
            std::cerr << "[Config] Warning: geofence '" << zone.name << "' has unknown type "
                      << draft.type << ", skipped" << std::endl;
            return std::nullopt;
        }

        if (draft.innerRadiusM || draft.outerRadiusM) {
            Hysteresis hysteresis;
            hysteresis.innerRadiusM = draft.innerRadiusM.value_or(draft.radiusM);
            hysteresis.outerRadiusM = draft.outerRadiusM.value_or(draft.radiusM);
            zone.hysteresis = hysteresis;
        }
        return zone;
    }

    static void warn(const std::string& context, const std::string& value) {
        std::cerr << "[Config] Warning: invalid value for " << context << ": " << value << std::endl;
    }

    static bool assignDouble(double& target, const std::string& value, const std::string& context) {
        try {
            size_t used = 0;
            double parsed = std::stod(value, &used);
            if (used != value.size()) {
                warn(context, value);
                return false;
            }
            target = parsed;
            return true;
        } catch (const std::exception&) {
            warn(context, value);
            return false;
        }
    }

    static bool assignInt(int& target, const std::string& value, const std::string& context) {
        try {
            size_t used = 0;
            int parsed = std::stoi(value, &used);
            if (used != value.size()) {
                warn(context, value);
                return false;
            }
            target = parsed;
            return true;
        } catch (const std::exception&) {
            warn(context, value);
            return false;
        }
    }

    template <typename Unsigned>
    static bool assignUnsigned(Unsigned& target, const std::string& value, const std::string& context) {
        try {
            size_t used = 0;
            long long parsed = std::stoll(value, &used);
            if (used != value.size() || parsed < 0 ||
                static_cast<unsigned long long>(parsed) > static_cast<unsigned long long>(std::numeric_limits<Unsigned>::max())) {
                warn(context, value);
                return false;
            }
            target = static_cast<Unsigned>(parsed);
            return true;
        } catch (const std::exception&) {
            warn(context, value);
            return false;
        }
    }

    template <typename Rep, typename Period>
    static bool assignDuration(std::chrono::duration<Rep, Period>& target, const std::string& value,
                               const std::string& context) {
        try {
            size_t used = 0;
            long long parsed = std::stoll(value, &used);
            if (used != value.size() || parsed < 0) {
                warn(context, value);
                return false;
            }
            target = std::chrono::duration<Rep, Period>(static_cast<Rep>(parsed));
            return true;
        } catch (const std::exception&) {
            warn(context, value);
            return false;
        }
    }

    static bool assignBool(bool& target, const std::string& value, const std::string& context) {
        if (value == "true" || value == "1") {
            target = true;
            return true;
        }
        if (value == "false" || value == "0") {
            target = false;
            return true;
        }
        warn(context, value);
        return false;
    }

    // ["a", "b"]
    static std::optional<std::vector<std::string>> parseStringList(const std::string& value) {
        if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
            return std::nullopt;
        }
        std::vector<std::string> items;
        std::istringstream ss(value.substr(1, value.size() - 2));
        std::string item;
        while (std::getline(ss, item, ',')) {
            trim(item);
            if (item.empty()) continue;
            if (item.size() < 2 || item.front() != '"' || item.back() != '"') {
                return std::nullopt;
            }
            items.push_back(unquoted(item));
        }
        return items;
    }

    // [[lat, lon], [lat, lon], ...]
    static std::optional<std::vector<GeoPoint>> parsePointList(const std::string& value) {
        if (value.size() < 2 || value.front() != '[' || value.back() != ']') {
            return std::nullopt;
        }
        std::vector<GeoPoint> points;
        std::string inner = value.substr(1, value.size() - 2);
        size_t pos = 0;
        while (true) {
            size_t open = inner.find('[', pos);
            if (open == std::string::npos) break;
            size_t close = inner.find(']', open);
            if (close == std::string::npos) return std::nullopt;

            std::string pair = inner.substr(open + 1, close - open - 1);
            size_t comma = pair.find(',');
            if (comma == std::string::npos) return std::nullopt;

            std::string lat = pair.substr(0, comma);
            std::string lon = pair.substr(comma + 1);
            trim(lat);
            trim(lon);

            GeoPoint point;
            if (!assignDouble(point.lat, lat, "polygon") || !assignDouble(point.lon, lon, "polygon")) {
                return std::nullopt;
            }
            points.push_back(point);
            pos = close + 1;
        }
        return points;
    }

    /**
     * @brief Remove a trailing comment, ignoring '#' inside quoted strings
     */
    static void stripComment(std::string& line) {
        bool quoted = false;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                quoted = !quoted;
            } else if (line[i] == '#' && !quoted) {
                line.erase(i);
                return;
            }
        }
    }

    /**
     * @brief Trim whitespace from both ends of string
     * @param str String to trim (modified in place)
     */
    static void trim(std::string& str) {
        str.erase(0, str.find_first_not_of(" \t\r"));
        str.erase(str.find_last_not_of(" \t\r") + 1);
    }

    static std::string unquoted(const std::string& value) {
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            return value.substr(1, value.size() - 2);
        }
        return value;
    }
};

} // namespace rtsae
