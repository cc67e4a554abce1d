#pragma once

#include "ZoneRegistry.hpp"
#include "../EngineConfig.hpp"
#include "../Model.hpp"
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace rtsae::domain {

// zoneId -> last classification (true = inside). A missing entry is "unknown".
using MembershipTable = std::unordered_map<std::string, bool>;

struct ZoneEvaluationError {
    std::string zoneId;
    std::string message;
};

struct GeofenceResult {
    std::set<std::string> memberships;
    std::vector<GeofenceEdge> edges;
    bool deferred = false;
    std::vector<ZoneEvaluationError> zoneErrors;
};

// Stateless: the caller owns the membership table of one vehicle and passes
// it in on every fix.
class GeofenceEngine {
public:
    explicit GeofenceEngine(GeofenceConfig config = {});

    GeofenceResult evaluate(const Fix& fix, const ZoneSnapshot& snapshot,
                            MembershipTable& state) const;

    static bool applies(const Geofence& zone, const Fix& fix);

private:
    bool classify(const Geofence& zone, const GeoPoint& point,
                  const bool* prior) const;

    GeofenceConfig config_;
};

} // namespace rtsae::domain
