#include "Model.hpp"
#include <unordered_map>

namespace rtsae {

std::string severityToString(Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
    }
    return "low";
}

std::optional<Severity> stringToSeverity(const std::string& str) {
    static const std::unordered_map<std::string, Severity> severityMap = {
        {"low", Severity::Low},
        {"medium", Severity::Medium},
        {"high", Severity::High}
    };

    auto it = severityMap.find(str);
    if (it == severityMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

int severityRank(Severity severity) {
    return static_cast<int>(severity);
}

std::string edgeKindToString(EdgeKind kind) {
    return kind == EdgeKind::Entry ? "entry" : "exit";
}

std::optional<EdgeKind> stringToEdgeKind(const std::string& str) {
    if (str == "entry") return EdgeKind::Entry;
    if (str == "exit") return EdgeKind::Exit;
    return std::nullopt;
}

std::string alarmLevelToString(AlarmLevel level) {
    return level == AlarmLevel::Warning ? "warning" : "info";
}

std::string alertKindToString(AlertKind kind) {
    return kind == AlertKind::Geofence ? "geofence_alert" : "accident_proximity_alert";
}

std::optional<AlertKind> stringToAlertKind(const std::string& str) {
    if (str == "geofence_alert") return AlertKind::Geofence;
    if (str == "accident_proximity_alert") return AlertKind::AccidentProximity;
    return std::nullopt;
}

std::string alertStatusToString(AlertStatus status) {
    static const std::unordered_map<AlertStatus, std::string> statusMap = {
        {AlertStatus::Active, "active"},
        {AlertStatus::Acknowledged, "acknowledged"},
        {AlertStatus::Resolved, "resolved"}
    };

    auto it = statusMap.find(status);
    return (it != statusMap.end()) ? it->second : "active";
}

std::optional<AlertStatus> stringToAlertStatus(const std::string& str) {
    static const std::unordered_map<std::string, AlertStatus> stringMap = {
        {"active", AlertStatus::Active},
        {"acknowledged", AlertStatus::Acknowledged},
        {"resolved", AlertStatus::Resolved}
    };

    auto it = stringMap.find(str);
    if (it == stringMap.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace rtsae
