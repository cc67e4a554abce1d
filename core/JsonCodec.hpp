#pragma once

#include "Model.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace rtsae {

// Decoders throw std::invalid_argument (or nlohmann::json::exception for
// type mismatches) when a required field is missing or malformed.
class JsonCodec {
public:
    static Fix deserializeFix(const std::string& json);
    static Telemetry deserializeTelemetry(const std::string& json);

    static nlohmann::json fixToJson(const Fix& fix);
    static Fix jsonToFix(const nlohmann::json& json);

    static nlohmann::json telemetryToJson(const Telemetry& telemetry);
    static Telemetry jsonToTelemetry(const nlohmann::json& json);

    static nlohmann::json geofenceToJson(const Geofence& zone);
    static Geofence jsonToGeofence(const nlohmann::json& json);

    static nlohmann::json accidentZoneToJson(const AccidentZone& zone);
    static AccidentZone jsonToAccidentZone(const nlohmann::json& json);

    static nlohmann::json pointToJson(const GeoPoint& point);
    static GeoPoint jsonToPoint(const nlohmann::json& json);

    // ISO-8601 on output; ISO-8601 string or epoch milliseconds on input.
    static nlohmann::json timestampToJson(Timestamp ts);
    static Timestamp jsonToTimestamp(const nlohmann::json& json);

    // Published event bodies
    static nlohmann::json locationUpdateToJson(const Fix& fix, Timestamp serverTs);
    static nlohmann::json alertEventToJson(const AlertRecord& record, Timestamp serverTs);
    static nlohmann::json alarmEventToJson(const Telemetry& telemetry, const Alarm& alarm);

    static nlohmann::json alarmToJson(const Alarm& alarm);

    // Persisted alert shape: the published shape plus status and acknowledgement fields.
    static nlohmann::json alertRecordToJson(const AlertRecord& record);
    static AlertRecord jsonToAlertRecord(const nlohmann::json& json);

private:
    static std::string requireString(const nlohmann::json& json, const char* key);
    static std::optional<std::string> optionalString(const nlohmann::json& json, const char* key);
    static std::optional<double> optionalNumber(const nlohmann::json& json, const char* key);
};

} // namespace rtsae
