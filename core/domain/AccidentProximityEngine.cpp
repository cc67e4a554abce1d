#include "AccidentProximityEngine.hpp"
#include "../Geo.hpp"
#include <cmath>
#include <iostream>
#include <set>

namespace rtsae::domain {

AccidentProximityEngine::AccidentProximityEngine(AccidentConfig config)
    : config_(config) {
}

bool AccidentProximityEngine::isStale(const ZoneSnapshot& snapshot, Timestamp now) const {
    if (config_.maxSnapshotAge.count() <= 0) {
        return false;
    }
    return now - snapshot.accidentZonesLoadedAt > config_.maxSnapshotAge;
}

ProximityResult AccidentProximityEngine::evaluate(const Fix& fix, const ZoneSnapshot& snapshot,
                                                  ProximityTable& state, Timestamp now) const {
    ProximityResult result;

    if (isStale(snapshot, now)) {
        std::cerr << "[AccidentProximity] Accident zone set is stale, skipping vehicle "
                  << fix.vehicleId << std::endl;
        result.skippedStale = true;
        return result;
    }

    const GeoPoint point = fix.point();
    std::set<std::string> resolvedNow;

    // Advance active pairs first.
    for (auto it = state.begin(); it != state.end();) {
        auto& entry = it->second;
        auto zone = snapshot.findAccidentZone(it->first);

        std::string reason;
        if (!zone) {
            reason = "zone_removed";
        } else {
            bool inside = Geo::distanceMeters(point, zone->center) <= zone->radiusM;
            if (inside) {
                entry.lastInsideTs = fix.ts;
            } else if (fix.ts - entry.lastInsideTs >= config_.exitHold) {
                reason = "exit_hold";
            }
            if (reason.empty() && fix.ts - entry.activatedAt >= config_.activeMax) {
                reason = "active_max";
            }
        }

        if (reason.empty()) {
            ++it;
            continue;
        }

        result.resolved.push_back(ProximityResolution{it->first, entry.alertId, reason});
        resolvedNow.insert(it->first);
        it = state.erase(it);
    }

    // Nearest zone within radius; severity breaks near-ties.
    std::shared_ptr<const AccidentZone> best;
    double bestDistance = 0.0;
    for (const auto& zone : snapshot.accidentCandidates(point)) {
        double distance = Geo::distanceMeters(point, zone->center);
        if (distance > zone->radiusM) {
            continue;
        }
        if (!best) {
            best = zone;
            bestDistance = distance;
            continue;
        }
        if (std::abs(distance - bestDistance) <= config_.tieToleranceM) {
            if (severityRank(zone->severity) > severityRank(best->severity)) {
                best = zone;
                bestDistance = distance;
            }
        } else if (distance < bestDistance) {
            best = zone;
            bestDistance = distance;
        }
    }

    if (!best || state.count(best->zoneId) > 0 || resolvedNow.count(best->zoneId) > 0) {
        return result;
    }

    ProximityEntry entry;
    entry.state = ProximityState::Active;
    entry.activatedAt = fix.ts;
    entry.lastInsideTs = fix.ts;
    state[best->zoneId] = entry;

    result.activated = ProximityActivation{best, bestDistance};
    return result;
}

} // namespace rtsae::domain
