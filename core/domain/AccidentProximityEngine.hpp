#pragma once

#include "ZoneRegistry.hpp"
#include "../EngineConfig.hpp"
#include "../Model.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rtsae::domain {

enum class ProximityState {
    Idle,
    Active
};

struct ProximityEntry {
    ProximityState state = ProximityState::Idle;
    Timestamp activatedAt{};
    Timestamp lastInsideTs{};
    std::string alertId;
};

// accidentZoneId -> debounce state for one vehicle. Idle pairs are not stored.
using ProximityTable = std::unordered_map<std::string, ProximityEntry>;

struct ProximityActivation {
    std::shared_ptr<const AccidentZone> zone;
    double distanceM = 0.0;
};

struct ProximityResolution {
    std::string zoneId;
    std::string alertId;
    std::string reason;
};

struct ProximityResult {
    std::optional<ProximityActivation> activated;
    std::vector<ProximityResolution> resolved;
    bool skippedStale = false;
};

class AccidentProximityEngine {
public:
    explicit AccidentProximityEngine(AccidentConfig config = {});

    // Hold and maximum-activity windows are measured on fix time; staleness of
    // the accident zone set on server time (now).
    ProximityResult evaluate(const Fix& fix, const ZoneSnapshot& snapshot,
                             ProximityTable& state, Timestamp now) const;

    bool isStale(const ZoneSnapshot& snapshot, Timestamp now) const;

private:
    AccidentConfig config_;
};

} // namespace rtsae::domain
