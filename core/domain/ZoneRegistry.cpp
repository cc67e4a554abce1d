#include "ZoneRegistry.hpp"
#include "../Geo.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace rtsae::domain {

CellKey GridIndex::makeKey(int latIndex, int lonIndex) {
    return (static_cast<CellKey>(latIndex) << 32) |
           static_cast<CellKey>(static_cast<std::uint32_t>(lonIndex));
}

int GridIndex::lonColumns(double cellSizeDeg) {
    return std::max(1, static_cast<int>(std::ceil(360.0 / cellSizeDeg)));
}

// Columns count from -180 and wrap, so +180 and -180 share a column.
int GridIndex::wrapLon(int lonIndex, double cellSizeDeg) {
    int columns = lonColumns(cellSizeDeg);
    return ((lonIndex % columns) + columns) % columns;
}

int GridIndex::lonIndexOf(double lon, double cellSizeDeg) {
    return wrapLon(static_cast<int>(std::floor((lon + 180.0) / cellSizeDeg)), cellSizeDeg);
}

std::vector<CellKey> GridIndex::cellsCovering(const Circle& bounds, double cellSizeDeg,
                                              std::size_t maxCells) {
    double dLat = Geo::metersToLatDegrees(bounds.radiusM);
    double dLon = Geo::metersToLonDegrees(bounds.radiusM, bounds.center.lat);

    int latMin = static_cast<int>(std::floor(std::max(bounds.center.lat - dLat, -90.0) / cellSizeDeg));
    int latMax = static_cast<int>(std::floor(std::min(bounds.center.lat + dLat, 90.0) / cellSizeDeg));

    int columns = lonColumns(cellSizeDeg);
    int lonMin = 0;
    int lonSpan = columns;
    if (dLon < 180.0) {
        lonMin = static_cast<int>(std::floor((bounds.center.lon - dLon + 180.0) / cellSizeDeg));
        int lonMax = static_cast<int>(std::floor((bounds.center.lon + dLon + 180.0) / cellSizeDeg));
        lonSpan = std::min(lonMax - lonMin + 1, columns);
    }

    std::size_t count = static_cast<std::size_t>(latMax - latMin + 1) *
                        static_cast<std::size_t>(lonSpan);
    if (count > maxCells) {
        throw std::length_error("zone spans " + std::to_string(count) +
                                " index cells, limit is " + std::to_string(maxCells));
    }

    std::vector<CellKey> cells;
    cells.reserve(count);
    for (int lat = latMin; lat <= latMax; ++lat) {
        for (int lon = lonMin; lon < lonMin + lonSpan; ++lon) {
            cells.push_back(makeKey(lat, wrapLon(lon, cellSizeDeg)));
        }
    }
    return cells;
}

std::vector<CellKey> GridIndex::neighbourhood(const GeoPoint& point, double cellSizeDeg) {
    int latIndex = static_cast<int>(std::floor(point.lat / cellSizeDeg));
    int lonIndex = lonIndexOf(point.lon, cellSizeDeg);

    std::vector<CellKey> cells;
    cells.reserve(9);
    for (int dLat = -1; dLat <= 1; ++dLat) {
        for (int dLon = -1; dLon <= 1; ++dLon) {
            CellKey key = makeKey(latIndex + dLat, wrapLon(lonIndex + dLon, cellSizeDeg));
            if (std::find(cells.begin(), cells.end(), key) == cells.end()) {
                cells.push_back(key);
            }
        }
    }
    return cells;
}

std::vector<std::shared_ptr<const Geofence>> ZoneSnapshot::geofenceCandidates(
        const std::string& tenantId, const GeoPoint& point) const {
    auto it = tenants.find(tenantId);
    if (it == tenants.end()) {
        return {};
    }
    return it->second->near(point, cellSizeDeg);
}

std::vector<std::shared_ptr<const AccidentZone>> ZoneSnapshot::accidentCandidates(const GeoPoint& point) const {
    return accidents->near(point, cellSizeDeg);
}

std::shared_ptr<const Geofence> ZoneSnapshot::findGeofence(const std::string& tenantId,
                                                           const std::string& zoneId) const {
    auto tenant = tenants.find(tenantId);
    if (tenant == tenants.end()) {
        return nullptr;
    }
    auto zone = tenant->second->zones.find(zoneId);
    return zone == tenant->second->zones.end() ? nullptr : zone->second;
}

std::shared_ptr<const AccidentZone> ZoneSnapshot::findAccidentZone(const std::string& zoneId) const {
    auto zone = accidents->zones.find(zoneId);
    return zone == accidents->zones.end() ? nullptr : zone->second;
}

ZoneRegistry::ZoneRegistry(std::shared_ptr<IClock> clock,
                           RegistryConfig config,
                           AccidentConfig accidentConfig)
    : clock_(clock), config_(config), accidentConfig_(accidentConfig) {
    if (!(config_.cellSizeDeg > 0.0)) {
        throw std::invalid_argument("registry cell size must be positive");
    }
    auto initial = std::make_shared<ZoneSnapshot>();
    initial->cellSizeDeg = config_.cellSizeDeg;
    initial->accidentZonesLoadedAt = clock_->now();
    current_ = initial;
}

ZoneSnapshotPtr ZoneRegistry::snapshot() const {
    return std::atomic_load(&current_);
}

void ZoneRegistry::publish(std::shared_ptr<ZoneSnapshot> next) {
    next->version = snapshot()->version + 1;
    std::atomic_store(&current_, ZoneSnapshotPtr(std::move(next)));
}

std::string ZoneRegistry::generateZoneId(const char* prefix) {
    return std::string(prefix) + ":" + std::to_string(clock_->epochMillis()) +
           "-" + std::to_string(++idCounter_);
}

std::optional<std::string> ZoneRegistry::validate(const Geofence& zone) {
    if (zone.tenantId.empty()) {
        return "tenantId is required";
    }
    if (zone.name.empty()) {
        return "name is required";
    }

    if (const auto* circle = std::get_if<Circle>(&zone.shape)) {
        if (!Geo::isValidCoordinate(circle->center.lat, circle->center.lon)) {
            return "circle center out of range";
        }
        if (!std::isfinite(circle->radiusM) || circle->radiusM <= 0.0) {
            return "circle radius must be positive";
        }
        if (zone.hysteresis) {
            const auto& h = *zone.hysteresis;
            if (!(h.innerRadiusM > 0.0) || h.innerRadiusM > circle->radiusM ||
                h.outerRadiusM < circle->radiusM || !std::isfinite(h.outerRadiusM)) {
                return "hysteresis requires 0 < innerRadiusM <= radiusM <= outerRadiusM";
            }
        }
        return std::nullopt;
    }

    const auto& ring = std::get<Polygon>(zone.shape).ring;
    if (ring.size() < 3) {
        return "polygon needs at least 3 vertices";
    }
    for (const auto& vertex : ring) {
        if (!Geo::isValidCoordinate(vertex.lat, vertex.lon)) {
            return "polygon vertex out of range";
        }
    }
    if (zone.hysteresis) {
        return "hysteresis is only supported on circular zones";
    }
    return std::nullopt;
}

std::optional<std::string> ZoneRegistry::validate(const AccidentZone& zone) {
    if (!Geo::isValidCoordinate(zone.center.lat, zone.center.lon)) {
        return "accident zone center out of range";
    }
    if (!std::isfinite(zone.radiusM) || zone.radiusM < 0.0) {
        return "accident zone radius must not be negative";
    }
    if (zone.accidentCount < 0) {
        return "accidentCount must not be negative";
    }
    return std::nullopt;
}

AccidentZone ZoneRegistry::withDerivedRadius(AccidentZone zone) const {
    if (zone.radiusM <= 0.0) {
        zone.radiusM = accidentConfig_.radiusFor(zone.severity);
    }
    return zone;
}

RegistryResult ZoneRegistry::upsertZone(const Geofence& zone) {
    if (auto error = validate(zone)) {
        std::cerr << "[ZoneRegistry] Rejected geofence '" << zone.name << "': " << *error << std::endl;
        return RegistryResult{false, zone.zoneId, *error};
    }

    std::lock_guard<std::mutex> lock(writeMutex_);

    Geofence stored = zone;
    if (stored.zoneId.empty()) {
        stored.zoneId = generateZoneId("geofence");
    }

    auto base = snapshot();
    auto tenant = std::make_shared<TenantZones>();
    auto existing = base->tenants.find(stored.tenantId);
    if (existing != base->tenants.end()) {
        *tenant = *existing->second;
    }

    try {
        auto bounds = Geo::boundingCircle(stored.shape);
        tenant->insert(std::make_shared<const Geofence>(stored), bounds,
                       config_.cellSizeDeg, config_.maxCellsPerZone);
    } catch (const std::exception& e) {
        std::cerr << "[ZoneRegistry] Reindex failed for " << stored.zoneId << ": " << e.what() << std::endl;
        return RegistryResult{false, stored.zoneId, e.what()};
    }

    auto next = std::make_shared<ZoneSnapshot>(*base);
    next->tenants[stored.tenantId] = tenant;
    publish(next);

    return RegistryResult{true, stored.zoneId, ""};
}

RegistryResult ZoneRegistry::removeZone(const std::string& tenantId, const std::string& zoneId) {
    std::lock_guard<std::mutex> lock(writeMutex_);

    auto base = snapshot();
    auto existing = base->tenants.find(tenantId);
    if (existing == base->tenants.end() || existing->second->zones.count(zoneId) == 0) {
        return RegistryResult{false, zoneId, "zone not found"};
    }

    auto tenant = std::make_shared<TenantZones>(*existing->second);
    tenant->erase(zoneId);

    auto next = std::make_shared<ZoneSnapshot>(*base);
    if (tenant->zones.empty()) {
        next->tenants.erase(tenantId);
    } else {
        next->tenants[tenantId] = tenant;
    }
    publish(next);

    return RegistryResult{true, zoneId, ""};
}

std::optional<Geofence> ZoneRegistry::getZone(const std::string& tenantId, const std::string& zoneId) const {
    auto zone = snapshot()->findGeofence(tenantId, zoneId);
    if (!zone) {
        return std::nullopt;
    }
    return *zone;
}

std::vector<Geofence> ZoneRegistry::listZones(const std::string& tenantId) const {
    std::vector<Geofence> result;
    auto current = snapshot();
    auto tenant = current->tenants.find(tenantId);
    if (tenant == current->tenants.end()) {
        return result;
    }

    for (const auto& [id, zone] : tenant->second->zones) {
        result.push_back(*zone);
    }
    std::sort(result.begin(), result.end(), [](const Geofence& a, const Geofence& b) {
        return a.zoneId < b.zoneId;
    });
    return result;
}

RegistryResult ZoneRegistry::upsertAccidentZone(const AccidentZone& zone) {
    if (auto error = validate(zone)) {
        std::cerr << "[ZoneRegistry] Rejected accident zone " << zone.zoneId << ": " << *error << std::endl;
        return RegistryResult{false, zone.zoneId, *error};
    }

    std::lock_guard<std::mutex> lock(writeMutex_);

    AccidentZone stored = withDerivedRadius(zone);
    if (stored.zoneId.empty()) {
        stored.zoneId = generateZoneId("accident-zone");
    }

    auto base = snapshot();
    auto accidents = std::make_shared<AccidentZones>(*base->accidents);
    try {
        accidents->insert(std::make_shared<const AccidentZone>(stored),
                          Circle{stored.center, stored.radiusM},
                          config_.cellSizeDeg, config_.maxCellsPerZone);
    } catch (const std::exception& e) {
        std::cerr << "[ZoneRegistry] Reindex failed for " << stored.zoneId << ": " << e.what() << std::endl;
        return RegistryResult{false, stored.zoneId, e.what()};
    }

    auto next = std::make_shared<ZoneSnapshot>(*base);
    next->accidents = accidents;
    next->accidentZonesLoadedAt = clock_->now();
    publish(next);

    return RegistryResult{true, stored.zoneId, ""};
}

RegistryResult ZoneRegistry::removeAccidentZone(const std::string& zoneId) {
    std::lock_guard<std::mutex> lock(writeMutex_);

    auto base = snapshot();
    if (base->accidents->zones.count(zoneId) == 0) {
        return RegistryResult{false, zoneId, "zone not found"};
    }

    auto accidents = std::make_shared<AccidentZones>(*base->accidents);
    accidents->erase(zoneId);

    auto next = std::make_shared<ZoneSnapshot>(*base);
    next->accidents = accidents;
    publish(next);

    return RegistryResult{true, zoneId, ""};
}

RegistryResult ZoneRegistry::replaceAccidentZones(const std::vector<AccidentZone>& zones) {
    for (const auto& zone : zones) {
        if (auto error = validate(zone)) {
            std::cerr << "[ZoneRegistry] Accident zone set rejected, " << zone.zoneId << ": " << *error << std::endl;
            return RegistryResult{false, zone.zoneId, *error};
        }
    }

    std::lock_guard<std::mutex> lock(writeMutex_);

    auto accidents = std::make_shared<AccidentZones>();
    for (const auto& zone : zones) {
        AccidentZone stored = withDerivedRadius(zone);
        if (stored.zoneId.empty()) {
            stored.zoneId = generateZoneId("accident-zone");
        }
        try {
            accidents->insert(std::make_shared<const AccidentZone>(stored),
                              Circle{stored.center, stored.radiusM},
                              config_.cellSizeDeg, config_.maxCellsPerZone);
        } catch (const std::exception& e) {
            std::cerr << "[ZoneRegistry] Accident zone set rejected, " << stored.zoneId << ": " << e.what() << std::endl;
            return RegistryResult{false, stored.zoneId, e.what()};
        }
    }

    auto next = std::make_shared<ZoneSnapshot>(*snapshot());
    next->accidents = accidents;
    next->accidentZonesLoadedAt = clock_->now();
    publish(next);

    std::cout << "[ZoneRegistry] Loaded " << accidents->zones.size() << " accident zones" << std::endl;
    return RegistryResult{true, "", ""};
}

std::vector<AccidentZone> ZoneRegistry::listAccidentZones() const {
    std::vector<AccidentZone> result;
    for (const auto& [id, zone] : snapshot()->accidents->zones) {
        result.push_back(*zone);
    }
    std::sort(result.begin(), result.end(), [](const AccidentZone& a, const AccidentZone& b) {
        return a.zoneId < b.zoneId;
    });
    return result;
}

ZoneRegistry::Candidates ZoneRegistry::candidates(const std::string& tenantId, const GeoPoint& point) const {
    auto current = snapshot();
    return Candidates{current->geofenceCandidates(tenantId, point),
                      current->accidentCandidates(point)};
}

std::vector<NearbyAccidentZone> ZoneRegistry::nearbyAccidentZones(const GeoPoint& point,
                                                                  std::optional<double> radiusM) const {
    double limit = radiusM.value_or(accidentConfig_.nearbyRadiusM);

    std::vector<NearbyAccidentZone> result;
    for (const auto& [id, zone] : snapshot()->accidents->zones) {
        double distance = Geo::distanceMeters(point, zone->center);
        if (distance <= limit) {
            result.push_back(NearbyAccidentZone{*zone, distance});
        }
    }
    std::sort(result.begin(), result.end(), [](const NearbyAccidentZone& a, const NearbyAccidentZone& b) {
        return a.distanceM < b.distanceM;
    });
    return result;
}

} // namespace rtsae::domain
