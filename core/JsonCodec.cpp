#include "JsonCodec.hpp"
#include "IClock.hpp"
#include <stdexcept>

namespace rtsae {

Fix JsonCodec::deserializeFix(const std::string& json) {
    return jsonToFix(nlohmann::json::parse(json));
}

Telemetry JsonCodec::deserializeTelemetry(const std::string& json) {
    return jsonToTelemetry(nlohmann::json::parse(json));
}

nlohmann::json JsonCodec::fixToJson(const Fix& fix) {
    nlohmann::json j;

    j["tenantId"] = fix.tenantId;
    j["vehicleId"] = fix.vehicleId;
    if (fix.shipmentId) j["shipmentId"] = *fix.shipmentId;
    if (fix.driverId) j["driverId"] = *fix.driverId;

    j["lat"] = fix.lat;
    j["lon"] = fix.lon;
    if (fix.speedKph) j["speed"] = *fix.speedKph;
    if (fix.heading) j["heading"] = *fix.heading;
    if (fix.accuracyM) j["accuracy"] = *fix.accuracyM;
    if (fix.altitudeM) j["altitude"] = *fix.altitudeM;

    j["ts"] = timestampToJson(fix.ts);
    return j;
}

Fix JsonCodec::jsonToFix(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("fix payload must be a JSON object");
    }

    Fix fix;
    fix.tenantId = json.value("tenantId", "");
    fix.vehicleId = json.value("vehicleId", "");
    fix.shipmentId = optionalString(json, "shipmentId");
    fix.driverId = optionalString(json, "driverId");

    if (!json.contains("lat") || !json.contains("lon")) {
        throw std::invalid_argument("fix requires lat and lon");
    }
    fix.lat = json.at("lat").get<double>();
    fix.lon = json.at("lon").get<double>();

    fix.speedKph = optionalNumber(json, "speed");
    fix.heading = optionalNumber(json, "heading");
    fix.accuracyM = optionalNumber(json, "accuracy");
    fix.altitudeM = optionalNumber(json, "altitude");

    if (!json.contains("ts")) {
        throw std::invalid_argument("fix requires ts");
    }
    fix.ts = jsonToTimestamp(json.at("ts"));
    return fix;
}

nlohmann::json JsonCodec::telemetryToJson(const Telemetry& telemetry) {
    nlohmann::json j;
    j["tenantId"] = telemetry.tenantId;
    j["vehicleId"] = telemetry.vehicleId;
    j["ts"] = timestampToJson(telemetry.ts);

    if (telemetry.engineRpm) j["engineRpm"] = *telemetry.engineRpm;
    if (telemetry.engineTemperatureC) j["engineTemperatureC"] = *telemetry.engineTemperatureC;
    if (telemetry.fuelPct) j["fuelPct"] = *telemetry.fuelPct;
    if (telemetry.batteryV) j["batteryV"] = *telemetry.batteryV;
    if (telemetry.tirePressure) j["tirePressure"] = *telemetry.tirePressure;
    if (telemetry.oilPressure) j["oilPressure"] = *telemetry.oilPressure;
    if (telemetry.odometer) j["odometer"] = *telemetry.odometer;

    j["diagnosticCodes"] = telemetry.diagnosticCodes;
    return j;
}

Telemetry JsonCodec::jsonToTelemetry(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("telemetry payload must be a JSON object");
    }

    Telemetry telemetry;
    telemetry.tenantId = json.value("tenantId", "");
    telemetry.vehicleId = json.value("vehicleId", "");
    if (!json.contains("ts")) {
        throw std::invalid_argument("telemetry requires ts");
    }
    telemetry.ts = jsonToTimestamp(json.at("ts"));

    telemetry.engineRpm = optionalNumber(json, "engineRpm");
    telemetry.engineTemperatureC = optionalNumber(json, "engineTemperatureC");
    telemetry.fuelPct = optionalNumber(json, "fuelPct");
    telemetry.batteryV = optionalNumber(json, "batteryV");
    telemetry.tirePressure = optionalNumber(json, "tirePressure");
    telemetry.oilPressure = optionalNumber(json, "oilPressure");
    telemetry.odometer = optionalNumber(json, "odometer");

    if (json.contains("diagnosticCodes") && json["diagnosticCodes"].is_array()) {
        for (const auto& code : json["diagnosticCodes"]) {
            telemetry.diagnosticCodes.insert(code.get<std::string>());
        }
    }
    return telemetry;
}

nlohmann::json JsonCodec::geofenceToJson(const Geofence& zone) {
    nlohmann::json j;
    j["zoneId"] = zone.zoneId;
    j["tenantId"] = zone.tenantId;
    j["name"] = zone.name;

    nlohmann::json shape;
    if (const auto* circle = std::get_if<Circle>(&zone.shape)) {
        shape["type"] = "circle";
        shape["center"] = pointToJson(circle->center);
        shape["radiusM"] = circle->radiusM;
    } else {
        shape["type"] = "polygon";
        shape["ring"] = nlohmann::json::array();
        for (const auto& vertex : std::get<Polygon>(zone.shape).ring) {
            shape["ring"].push_back(pointToJson(vertex));
        }
    }
    j["shape"] = shape;

    j["scope"] = {
        {"vehicleIds", zone.vehicleIds},
        {"shipmentIds", zone.shipmentIds}
    };
    j["triggers"] = {
        {"onEntry", zone.onEntry},
        {"onExit", zone.onExit}
    };
    j["active"] = zone.active;

    if (zone.hysteresis) {
        j["hysteresis"] = {
            {"innerRadiusM", zone.hysteresis->innerRadiusM},
            {"outerRadiusM", zone.hysteresis->outerRadiusM}
        };
    }
    if (!zone.metadata.empty()) {
        j["metadata"] = zone.metadata;
    }
    return j;
}

Geofence JsonCodec::jsonToGeofence(const nlohmann::json& json) {
    Geofence zone;
    zone.zoneId = json.value("zoneId", "");
    zone.tenantId = json.value("tenantId", "");
    zone.name = json.value("name", "");

    if (!json.contains("shape") || !json["shape"].is_object()) {
        throw std::invalid_argument("geofence requires a shape");
    }
    const auto& shape = json["shape"];
    std::string type = shape.value("type", "circle");
    if (type == "circle") {
        Circle circle;
        circle.center = jsonToPoint(shape.at("center"));
        circle.radiusM = shape.at("radiusM").get<double>();
        zone.shape = circle;
    } else if (type == "polygon") {
        Polygon polygon;
        for (const auto& vertex : shape.at("ring")) {
            polygon.ring.push_back(jsonToPoint(vertex));
        }
        zone.shape = polygon;
    } else {
        throw std::invalid_argument("unknown shape type: " + type);
    }

    if (json.contains("scope") && json["scope"].is_object()) {
        const auto& scope = json["scope"];
        if (scope.contains("vehicleIds")) {
            zone.vehicleIds = scope["vehicleIds"].get<std::set<std::string>>();
        }
        if (scope.contains("shipmentIds")) {
            zone.shipmentIds = scope["shipmentIds"].get<std::set<std::string>>();
        }
    }

    // Missing triggers default to both edges.
    if (json.contains("triggers") && json["triggers"].is_object()) {
        zone.onEntry = json["triggers"].value("onEntry", true);
        zone.onExit = json["triggers"].value("onExit", true);
    }
    zone.active = json.value("active", true);

    if (json.contains("hysteresis") && json["hysteresis"].is_object()) {
        Hysteresis hysteresis;
        hysteresis.innerRadiusM = json["hysteresis"].at("innerRadiusM").get<double>();
        hysteresis.outerRadiusM = json["hysteresis"].at("outerRadiusM").get<double>();
        zone.hysteresis = hysteresis;
    }

    if (json.contains("metadata") && json["metadata"].is_object()) {
        for (const auto& [key, value] : json["metadata"].items()) {
            zone.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return zone;
}

nlohmann::json JsonCodec::accidentZoneToJson(const AccidentZone& zone) {
    nlohmann::json j;
    j["zoneId"] = zone.zoneId;
    j["center"] = pointToJson(zone.center);
    j["severity"] = severityToString(zone.severity);
    j["accidentCount"] = zone.accidentCount;
    j["radiusM"] = zone.radiusM;
    if (!zone.metadata.empty()) {
        j["metadata"] = zone.metadata;
    }
    return j;
}

AccidentZone JsonCodec::jsonToAccidentZone(const nlohmann::json& json) {
    AccidentZone zone;
    zone.zoneId = json.value("zoneId", "");
    zone.center = jsonToPoint(json.at("center"));

    std::string severity = json.value("severity", "low");
    auto parsed = stringToSeverity(severity);
    if (!parsed) {
        throw std::invalid_argument("unknown severity: " + severity);
    }
    zone.severity = *parsed;
    zone.accidentCount = json.value("accidentCount", 0);
    // 0 means derive from severity
    zone.radiusM = json.value("radiusM", 0.0);

    if (json.contains("metadata") && json["metadata"].is_object()) {
        for (const auto& [key, value] : json["metadata"].items()) {
            zone.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return zone;
}

nlohmann::json JsonCodec::pointToJson(const GeoPoint& point) {
    nlohmann::json j;
    j["lat"] = point.lat;
    j["lon"] = point.lon;
    return j;
}

GeoPoint JsonCodec::jsonToPoint(const nlohmann::json& json) {
    GeoPoint point;
    point.lat = json.at("lat").get<double>();
    point.lon = json.at("lon").get<double>();
    return point;
}

nlohmann::json JsonCodec::timestampToJson(Timestamp ts) {
    return IClock::formatIso8601(ts);
}

Timestamp JsonCodec::jsonToTimestamp(const nlohmann::json& json) {
    if (json.is_number()) {
        return IClock::fromEpochMillis(json.get<int64_t>());
    }
    if (json.is_string()) {
        auto parsed = IClock::parseIso8601(json.get<std::string>());
        if (parsed) {
            return *parsed;
        }
        throw std::invalid_argument("invalid timestamp: " + json.get<std::string>());
    }
    throw std::invalid_argument("timestamp must be an ISO-8601 string or epoch milliseconds");
}

nlohmann::json JsonCodec::locationUpdateToJson(const Fix& fix, Timestamp serverTs) {
    nlohmann::json j;
    j["type"] = "location_update";
    j["tenantId"] = fix.tenantId;
    j["vehicleId"] = fix.vehicleId;
    if (fix.shipmentId) j["shipmentId"] = *fix.shipmentId;
    j["lat"] = fix.lat;
    j["lon"] = fix.lon;
    if (fix.speedKph) j["speed"] = *fix.speedKph;
    if (fix.heading) j["heading"] = *fix.heading;
    j["ts"] = timestampToJson(fix.ts);
    j["serverTs"] = timestampToJson(serverTs);
    return j;
}

nlohmann::json JsonCodec::alertEventToJson(const AlertRecord& record, Timestamp serverTs) {
    nlohmann::json j;
    j["type"] = alertKindToString(record.kind);
    j["alertId"] = record.alertId;
    j["tenantId"] = record.tenantId;
    j["vehicleId"] = record.vehicleId;
    if (record.shipmentId) j["shipmentId"] = *record.shipmentId;

    if (record.kind == AlertKind::Geofence) {
        j["zoneId"] = record.zoneId;
        j["zoneName"] = record.zoneName;
        j["kind"] = edgeKindToString(record.edge.value_or(EdgeKind::Entry));
    } else {
        j["accidentZoneId"] = record.zoneId;
        j["severity"] = severityToString(record.severity.value_or(Severity::Low));
        j["accidentCount"] = record.accidentCount;
        j["distanceM"] = record.distanceM;
        j["zoneCenter"] = pointToJson(record.zoneCenter);
        j["vehicleLocation"] = pointToJson(record.vehicleLocation);
    }

    if (!record.metadata.empty()) {
        j["metadata"] = record.metadata;
    }

    j["ts"] = timestampToJson(record.ts);
    j["serverTs"] = timestampToJson(serverTs);
    return j;
}

nlohmann::json JsonCodec::alarmEventToJson(const Telemetry& telemetry, const Alarm& alarm) {
    nlohmann::json j;
    j["type"] = "vehicle_telemetry_alarm";
    j["tenantId"] = telemetry.tenantId;
    j["vehicleId"] = telemetry.vehicleId;
    j["kind"] = alarm.kind;
    j["level"] = alarmLevelToString(alarm.level);
    j["detail"] = alarm.detail;
    j["ts"] = timestampToJson(telemetry.ts);
    return j;
}

nlohmann::json JsonCodec::alarmToJson(const Alarm& alarm) {
    return {
        {"kind", alarm.kind},
        {"level", alarmLevelToString(alarm.level)},
        {"detail", alarm.detail}
    };
}

nlohmann::json JsonCodec::alertRecordToJson(const AlertRecord& record) {
    nlohmann::json j = alertEventToJson(record, record.emittedAt);
    j.erase("serverTs");
    j["emittedAt"] = timestampToJson(record.emittedAt);
    if (record.driverId) j["driverId"] = *record.driverId;
    if (record.kind == AlertKind::Geofence) {
        j["vehicleLocation"] = pointToJson(record.vehicleLocation);
    }

    j["status"] = alertStatusToString(record.status);
    if (record.acknowledgedAt) j["acknowledgedAt"] = timestampToJson(*record.acknowledgedAt);
    if (record.acknowledgedBy) j["acknowledgedBy"] = *record.acknowledgedBy;
    if (record.resolvedAt) j["resolvedAt"] = timestampToJson(*record.resolvedAt);
    return j;
}

AlertRecord JsonCodec::jsonToAlertRecord(const nlohmann::json& json) {
    AlertRecord record;
    std::string type = requireString(json, "type");
    auto kind = stringToAlertKind(type);
    if (!kind) {
        throw std::invalid_argument("unknown alert type: " + type);
    }
    record.kind = *kind;
    record.alertId = requireString(json, "alertId");
    record.tenantId = json.value("tenantId", "");
    record.vehicleId = requireString(json, "vehicleId");
    record.shipmentId = optionalString(json, "shipmentId");
    record.driverId = optionalString(json, "driverId");

    if (record.kind == AlertKind::Geofence) {
        record.zoneId = requireString(json, "zoneId");
        record.zoneName = json.value("zoneName", "");
        record.edge = stringToEdgeKind(json.value("kind", "entry"));
    } else {
        record.zoneId = requireString(json, "accidentZoneId");
        record.severity = stringToSeverity(json.value("severity", "low"));
        record.accidentCount = json.value("accidentCount", 0);
        record.distanceM = json.value("distanceM", 0.0);
        if (json.contains("zoneCenter")) {
            record.zoneCenter = jsonToPoint(json["zoneCenter"]);
        }
    }
    if (json.contains("vehicleLocation")) {
        record.vehicleLocation = jsonToPoint(json["vehicleLocation"]);
    }

    if (json.contains("metadata") && json["metadata"].is_object()) {
        for (const auto& [key, value] : json["metadata"].items()) {
            record.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    record.ts = jsonToTimestamp(json.at("ts"));
    record.emittedAt = json.contains("emittedAt") ? jsonToTimestamp(json["emittedAt"]) : record.ts;

    record.status = stringToAlertStatus(json.value("status", "active")).value_or(AlertStatus::Active);
    if (json.contains("acknowledgedAt")) record.acknowledgedAt = jsonToTimestamp(json["acknowledgedAt"]);
    record.acknowledgedBy = optionalString(json, "acknowledgedBy");
    if (json.contains("resolvedAt")) record.resolvedAt = jsonToTimestamp(json["resolvedAt"]);
    return record;
}

std::string JsonCodec::requireString(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || !json[key].is_string()) {
        throw std::invalid_argument(std::string("missing field: ") + key);
    }
    return json[key].get<std::string>();
}

std::optional<std::string> JsonCodec::optionalString(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || json[key].is_null()) {
        return std::nullopt;
    }
    if (json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return json[key].dump();
}

std::optional<double> JsonCodec::optionalNumber(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || !json[key].is_number()) {
        return std::nullopt;
    }
    return json[key].get<double>();
}

} // namespace rtsae
