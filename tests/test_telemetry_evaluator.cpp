#include <gtest/gtest.h>
#include "../core/domain/TelemetryEvaluator.hpp"
#include <string>
#include <vector>

using namespace rtsae;

namespace {

std::vector<std::string> kinds(const std::vector<Alarm>& alarms) {
    std::vector<std::string> result;
    for (const auto& alarm : alarms) {
        result.push_back(alarm.kind);
    }
    return result;
}

} // namespace

TEST(TelemetryEvaluatorTest, LowFuelAndLowBatteryButNoOverheat) {
    domain::TelemetryEvaluator evaluator;

    Telemetry telemetry;
    telemetry.tenantId = "t1";
    telemetry.vehicleId = "V";
    telemetry.fuelPct = 10.0;
    telemetry.batteryV = 11.2;
    telemetry.engineTemperatureC = 95.0;

    auto alarms = evaluator.evaluate(telemetry);
    ASSERT_EQ(alarms.size(), 2u);
    EXPECT_EQ(alarms[0].kind, "low_fuel");
    EXPECT_EQ(alarms[0].level, AlarmLevel::Warning);
    EXPECT_EQ(alarms[1].kind, "low_battery");
    EXPECT_EQ(alarms[1].level, AlarmLevel::Warning);
}

TEST(TelemetryEvaluatorTest, ThresholdsAreStrict) {
    domain::TelemetryEvaluator evaluator;

    Telemetry telemetry;
    telemetry.fuelPct = 15.0;
    telemetry.batteryV = 11.5;
    telemetry.engineTemperatureC = 100.0;
    EXPECT_TRUE(evaluator.evaluate(telemetry).empty());

    telemetry.engineTemperatureC = 100.5;
    EXPECT_EQ(kinds(evaluator.evaluate(telemetry)), std::vector<std::string>{"overheat"});
}

TEST(TelemetryEvaluatorTest, MissingFieldsRaiseNothing) {
    domain::TelemetryEvaluator evaluator;
    EXPECT_TRUE(evaluator.evaluate(Telemetry{}).empty());
}

TEST(TelemetryEvaluatorTest, OptionalPressureThresholds) {
    Telemetry telemetry;
    telemetry.oilPressure = 10.0;
    telemetry.tirePressure = 20.0;

    domain::TelemetryEvaluator defaults;
    EXPECT_TRUE(defaults.evaluate(telemetry).empty());

    TelemetryThresholds thresholds;
    thresholds.lowOilPressure = 15.0;
    thresholds.lowTirePressure = 25.0;
    domain::TelemetryEvaluator configured(thresholds);

    auto result = kinds(configured.evaluate(telemetry));
    EXPECT_EQ(result, (std::vector<std::string>{"low_oil_pressure", "low_tire_pressure"}));
}

TEST(TelemetryEvaluatorTest, DiagnosticCodesReportedAsInfo) {
    domain::TelemetryEvaluator evaluator;

    Telemetry telemetry;
    telemetry.diagnosticCodes = {"P0300", "P0171"};

    auto alarms = evaluator.evaluate(telemetry);
    ASSERT_EQ(alarms.size(), 1u);
    EXPECT_EQ(alarms[0].kind, "dtc");
    EXPECT_EQ(alarms[0].level, AlarmLevel::Info);
    EXPECT_EQ(alarms[0].detail, "P0171,P0300");
}
