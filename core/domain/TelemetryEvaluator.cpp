#include "TelemetryEvaluator.hpp"
#include <iomanip>
#include <sstream>

namespace rtsae::domain {

namespace {

std::string belowDetail(const char* field, double value, double threshold) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << field << " " << value << " below " << threshold;
    return ss.str();
}

std::string aboveDetail(const char* field, double value, double threshold) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << field << " " << value << " above " << threshold;
    return ss.str();
}

} // namespace

TelemetryEvaluator::TelemetryEvaluator(TelemetryThresholds thresholds)
    : thresholds_(thresholds) {
}

std::vector<Alarm> TelemetryEvaluator::evaluate(const Telemetry& telemetry) const {
    std::vector<Alarm> alarms;

    if (telemetry.fuelPct && *telemetry.fuelPct < thresholds_.lowFuelPct) {
        alarms.push_back(Alarm{"low_fuel", AlarmLevel::Warning,
                               belowDetail("fuelPct", *telemetry.fuelPct, thresholds_.lowFuelPct)});
    }

    if (telemetry.engineTemperatureC && *telemetry.engineTemperatureC > thresholds_.overheatC) {
        alarms.push_back(Alarm{"overheat", AlarmLevel::Warning,
                               aboveDetail("engineTemperatureC", *telemetry.engineTemperatureC,
                                           thresholds_.overheatC)});
    }

    if (telemetry.batteryV && *telemetry.batteryV < thresholds_.lowBatteryV) {
        alarms.push_back(Alarm{"low_battery", AlarmLevel::Warning,
                               belowDetail("batteryV", *telemetry.batteryV, thresholds_.lowBatteryV)});
    }

    // Disabled unless a threshold is configured.
    if (thresholds_.lowOilPressure && telemetry.oilPressure &&
        *telemetry.oilPressure < *thresholds_.lowOilPressure) {
        alarms.push_back(Alarm{"low_oil_pressure", AlarmLevel::Warning,
                               belowDetail("oilPressure", *telemetry.oilPressure,
                                           *thresholds_.lowOilPressure)});
    }

    if (thresholds_.lowTirePressure && telemetry.tirePressure &&
        *telemetry.tirePressure < *thresholds_.lowTirePressure) {
        alarms.push_back(Alarm{"low_tire_pressure", AlarmLevel::Warning,
                               belowDetail("tirePressure", *telemetry.tirePressure,
                                           *thresholds_.lowTirePressure)});
    }

    if (!telemetry.diagnosticCodes.empty()) {
        std::string codes;
        for (const auto& code : telemetry.diagnosticCodes) {
            if (!codes.empty()) codes += ",";
            codes += code;
        }
        alarms.push_back(Alarm{"dtc", AlarmLevel::Info, codes});
    }

    return alarms;
}

} // namespace rtsae::domain
