#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace rtsae {

using Timestamp = std::chrono::system_clock::time_point;

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

struct Fix {
    std::string tenantId;
    std::string vehicleId;
    std::optional<std::string> shipmentId;
    std::optional<std::string> driverId;

    double lat = 0.0;
    double lon = 0.0;
    std::optional<double> speedKph;
    std::optional<double> heading;
    std::optional<double> accuracyM;
    std::optional<double> altitudeM;

    Timestamp ts{};

    GeoPoint point() const { return GeoPoint{lat, lon}; }
};

struct Telemetry {
    std::string tenantId;
    std::string vehicleId;
    Timestamp ts{};

    std::optional<double> engineRpm;
    std::optional<double> engineTemperatureC;
    std::optional<double> fuelPct;
    std::optional<double> batteryV;
    std::optional<double> tirePressure;
    std::optional<double> oilPressure;
    std::optional<double> odometer;

    std::set<std::string> diagnosticCodes;
};

struct Circle {
    GeoPoint center;
    double radiusM = 0.0;
};

struct Polygon {
    std::vector<GeoPoint> ring;
};

using ZoneShape = std::variant<Circle, Polygon>;

// Entry is tested against innerRadiusM, exit against outerRadiusM.
struct Hysteresis {
    double innerRadiusM = 0.0;
    double outerRadiusM = 0.0;
};

struct Geofence {
    std::string zoneId;
    std::string tenantId;
    std::string name;
    ZoneShape shape = Circle{};

    std::set<std::string> vehicleIds;
    std::set<std::string> shipmentIds;

    bool onEntry = true;
    bool onExit = true;
    bool active = true;

    std::optional<Hysteresis> hysteresis;
    std::map<std::string, std::string> metadata;
};

enum class Severity {
    Low,
    Medium,
    High
};

struct AccidentZone {
    std::string zoneId;
    GeoPoint center;
    Severity severity = Severity::Low;
    int accidentCount = 0;
    double radiusM = 0.0;
    std::map<std::string, std::string> metadata;
};

enum class EdgeKind {
    Entry,
    Exit
};

struct GeofenceEdge {
    std::string zoneId;
    std::string zoneName;
    EdgeKind kind = EdgeKind::Entry;
};

enum class AlarmLevel {
    Info,
    Warning
};

struct Alarm {
    std::string kind;
    AlarmLevel level = AlarmLevel::Info;
    std::string detail;
};

enum class AlertKind {
    Geofence,
    AccidentProximity
};

enum class AlertStatus {
    Active,
    Acknowledged,
    Resolved
};

struct AlertRecord {
    std::string alertId;
    AlertKind kind = AlertKind::Geofence;

    std::string tenantId;
    std::string vehicleId;
    std::optional<std::string> shipmentId;
    std::optional<std::string> driverId;

    std::string zoneId;

    // geofence_alert
    std::string zoneName;
    std::optional<EdgeKind> edge;

    // accident_proximity_alert
    std::optional<Severity> severity;
    int accidentCount = 0;
    double distanceM = 0.0;
    GeoPoint zoneCenter;

    GeoPoint vehicleLocation;
    Timestamp ts{};
    Timestamp emittedAt{};

    AlertStatus status = AlertStatus::Active;
    std::optional<Timestamp> acknowledgedAt;
    std::optional<std::string> acknowledgedBy;
    std::optional<Timestamp> resolvedAt;

    std::map<std::string, std::string> metadata;
};

std::string severityToString(Severity severity);
std::optional<Severity> stringToSeverity(const std::string& str);
int severityRank(Severity severity);

std::string edgeKindToString(EdgeKind kind);
std::optional<EdgeKind> stringToEdgeKind(const std::string& str);

std::string alarmLevelToString(AlarmLevel level);

std::string alertKindToString(AlertKind kind);
std::optional<AlertKind> stringToAlertKind(const std::string& str);

std::string alertStatusToString(AlertStatus status);
std::optional<AlertStatus> stringToAlertStatus(const std::string& str);

} // namespace rtsae
