#pragma once

#include "../EngineConfig.hpp"
#include "../Model.hpp"
#include <vector>

namespace rtsae::domain {

class TelemetryEvaluator {
public:
    explicit TelemetryEvaluator(TelemetryThresholds thresholds = {});

    std::vector<Alarm> evaluate(const Telemetry& telemetry) const;

    const TelemetryThresholds& thresholds() const { return thresholds_; }

private:
    TelemetryThresholds thresholds_;
};

} // namespace rtsae::domain
