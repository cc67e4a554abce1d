#include "GeofenceEngine.hpp"
#include "../Geo.hpp"
#include <iostream>

namespace rtsae::domain {

GeofenceEngine::GeofenceEngine(GeofenceConfig config)
    : config_(config) {
}

bool GeofenceEngine::applies(const Geofence& zone, const Fix& fix) {
    if (zone.vehicleIds.empty() && zone.shipmentIds.empty()) {
        return true;
    }
    if (zone.vehicleIds.count(fix.vehicleId) > 0) {
        return true;
    }
    return fix.shipmentId && zone.shipmentIds.count(*fix.shipmentId) > 0;
}

bool GeofenceEngine::classify(const Geofence& zone, const GeoPoint& point,
                              const bool* prior) const {
    const auto* circle = std::get_if<Circle>(&zone.shape);
    if (circle && zone.hysteresis && prior) {
        double distance = Geo::distanceMeters(point, circle->center);
        return *prior ? distance <= zone.hysteresis->outerRadiusM
                      : distance <= zone.hysteresis->innerRadiusM;
    }
    return Geo::contains(zone.shape, point);
}

GeofenceResult GeofenceEngine::evaluate(const Fix& fix, const ZoneSnapshot& snapshot,
                                        MembershipTable& state) const {
    GeofenceResult result;

    if (fix.accuracyM && *fix.accuracyM > config_.accuracyCeilingM) {
        result.deferred = true;
        for (const auto& [zoneId, inside] : state) {
            if (inside) result.memberships.insert(zoneId);
        }
        return result;
    }

    // Zones near the fix, plus every zone the vehicle is currently inside so
    // that an exit is seen even after a long jump.
    std::set<std::string> zoneIds;
    for (const auto& zone : snapshot.geofenceCandidates(fix.tenantId, fix.point())) {
        zoneIds.insert(zone->zoneId);
    }
    for (auto it = state.begin(); it != state.end();) {
        auto zone = snapshot.findGeofence(fix.tenantId, it->first);
        if (!zone || !zone->active || !applies(*zone, fix)) {
            // Removed, deactivated or out of scope: forget it without an edge.
            it = state.erase(it);
            continue;
        }
        if (it->second) {
            zoneIds.insert(it->first);
        }
        ++it;
    }

    for (const auto& zoneId : zoneIds) {
        auto zone = snapshot.findGeofence(fix.tenantId, zoneId);
        if (!zone || !zone->active || !applies(*zone, fix)) {
            continue;
        }

        auto prior = state.find(zoneId);
        const bool* priorInside = prior != state.end() ? &prior->second : nullptr;

        bool inside = false;
        try {
            inside = classify(*zone, fix.point(), priorInside);
        } catch (const std::exception& e) {
            std::cerr << "[Geofence] Zone " << zoneId << " skipped: " << e.what() << std::endl;
            result.zoneErrors.push_back(ZoneEvaluationError{zoneId, e.what()});
            if (priorInside && *priorInside) {
                result.memberships.insert(zoneId);
            }
            continue;
        }

        if (inside) {
            result.memberships.insert(zoneId);
        }

        if (!priorInside) {
            state[zoneId] = inside;
            continue;
        }
        if (*priorInside == inside) {
            continue;
        }

        state[zoneId] = inside;
        if (inside && zone->onEntry) {
            result.edges.push_back(GeofenceEdge{zoneId, zone->name, EdgeKind::Entry});
        } else if (!inside && zone->onExit) {
            result.edges.push_back(GeofenceEdge{zoneId, zone->name, EdgeKind::Exit});
        }
    }

    return result;
}

} // namespace rtsae::domain
