#pragma once

#include "../EngineConfig.hpp"
#include "../IClock.hpp"
#include "../Model.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace rtsae::domain {

using CellKey = std::int64_t;

// Coarse lat/lon tiling. A zone is registered in every cell its bounding circle touches.
class GridIndex {
public:
    static int lonIndexOf(double lon, double cellSizeDeg);
    // Throws std::length_error when more than maxCells would be touched.
    static std::vector<CellKey> cellsCovering(const Circle& bounds, double cellSizeDeg,
                                              std::size_t maxCells);
    static std::vector<CellKey> neighbourhood(const GeoPoint& point, double cellSizeDeg);

private:
    static CellKey makeKey(int latIndex, int lonIndex);
    static int lonColumns(double cellSizeDeg);
    static int wrapLon(int lonIndex, double cellSizeDeg);
};

template <typename Zone>
struct ZoneIndex {
    std::unordered_map<std::string, std::shared_ptr<const Zone>> zones;
    std::unordered_map<CellKey, std::vector<std::string>> cells;
    std::unordered_map<std::string, std::vector<CellKey>> zoneCells;

    // Caller validates the zone first.
    void insert(std::shared_ptr<const Zone> zone, const Circle& bounds,
                double cellSizeDeg, std::size_t maxCells) {
        auto covered = GridIndex::cellsCovering(bounds, cellSizeDeg, maxCells);
        const std::string id = zone->zoneId;
        erase(id);
        for (auto cell : covered) {
            cells[cell].push_back(id);
        }
        zoneCells[id] = std::move(covered);
        zones[id] = std::move(zone);
    }

    bool erase(const std::string& zoneId) {
        auto it = zoneCells.find(zoneId);
        if (it == zoneCells.end()) {
            return false;
        }
        for (auto cell : it->second) {
            auto& ids = cells[cell];
            ids.erase(std::remove(ids.begin(), ids.end(), zoneId), ids.end());
            if (ids.empty()) {
                cells.erase(cell);
            }
        }
        zoneCells.erase(it);
        zones.erase(zoneId);
        return true;
    }

    std::vector<std::shared_ptr<const Zone>> near(const GeoPoint& point, double cellSizeDeg) const {
        std::set<std::string> ids;
        for (auto cell : GridIndex::neighbourhood(point, cellSizeDeg)) {
            auto it = cells.find(cell);
            if (it != cells.end()) {
                ids.insert(it->second.begin(), it->second.end());
            }
        }
        std::vector<std::shared_ptr<const Zone>> result;
        result.reserve(ids.size());
        for (const auto& id : ids) {
            result.push_back(zones.at(id));
        }
        return result;
    }
};

using TenantZones = ZoneIndex<Geofence>;
using AccidentZones = ZoneIndex<AccidentZone>;

// Immutable once published. Evaluation of one fix holds a single snapshot.
struct ZoneSnapshot {
    std::uint64_t version = 0;
    double cellSizeDeg = 1.0;

    std::unordered_map<std::string, std::shared_ptr<const TenantZones>> tenants;
    std::shared_ptr<const AccidentZones> accidents = std::make_shared<AccidentZones>();
    Timestamp accidentZonesLoadedAt{};

    std::vector<std::shared_ptr<const Geofence>> geofenceCandidates(const std::string& tenantId,
                                                                    const GeoPoint& point) const;
    std::vector<std::shared_ptr<const AccidentZone>> accidentCandidates(const GeoPoint& point) const;

    std::shared_ptr<const Geofence> findGeofence(const std::string& tenantId,
                                                 const std::string& zoneId) const;
    std::shared_ptr<const AccidentZone> findAccidentZone(const std::string& zoneId) const;
};

using ZoneSnapshotPtr = std::shared_ptr<const ZoneSnapshot>;

struct RegistryResult {
    bool success = false;
    std::string zoneId;
    std::string error;
};

struct NearbyAccidentZone {
    AccidentZone zone;
    double distanceM = 0.0;
};

class ZoneRegistry {
public:
    ZoneRegistry(std::shared_ptr<IClock> clock,
                 RegistryConfig config = {},
                 AccidentConfig accidentConfig = {});

    RegistryResult upsertZone(const Geofence& zone);
    RegistryResult removeZone(const std::string& tenantId, const std::string& zoneId);
    std::optional<Geofence> getZone(const std::string& tenantId, const std::string& zoneId) const;
    std::vector<Geofence> listZones(const std::string& tenantId) const;

    RegistryResult upsertAccidentZone(const AccidentZone& zone);
    RegistryResult removeAccidentZone(const std::string& zoneId);
    RegistryResult replaceAccidentZones(const std::vector<AccidentZone>& zones);
    std::vector<AccidentZone> listAccidentZones() const;

    struct Candidates {
        std::vector<std::shared_ptr<const Geofence>> geofences;
        std::vector<std::shared_ptr<const AccidentZone>> accidentZones;
    };
    Candidates candidates(const std::string& tenantId, const GeoPoint& point) const;

    std::vector<NearbyAccidentZone> nearbyAccidentZones(const GeoPoint& point,
                                                        std::optional<double> radiusM = std::nullopt) const;

    ZoneSnapshotPtr snapshot() const;

    static std::optional<std::string> validate(const Geofence& zone);
    static std::optional<std::string> validate(const AccidentZone& zone);

private:
    std::string generateZoneId(const char* prefix);
    AccidentZone withDerivedRadius(AccidentZone zone) const;
    void publish(std::shared_ptr<ZoneSnapshot> next);

    std::shared_ptr<IClock> clock_;
    RegistryConfig config_;
    AccidentConfig accidentConfig_;

    std::mutex writeMutex_;
    ZoneSnapshotPtr current_;
    std::atomic<std::uint64_t> idCounter_{0};
};

} // namespace rtsae::domain
