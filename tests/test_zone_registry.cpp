#include <gtest/gtest.h>
#include "../core/domain/ZoneRegistry.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace rtsae;

namespace {

Geofence circleZone(const std::string& tenantId, const std::string& name,
                    GeoPoint center, double radiusM) {
    Geofence zone;
    zone.tenantId = tenantId;
    zone.name = name;
    zone.shape = Circle{center, radiusM};
    return zone;
}

AccidentZone accidentZone(const std::string& id, GeoPoint center, Severity severity, double radiusM = 0.0) {
    AccidentZone zone;
    zone.zoneId = id;
    zone.center = center;
    zone.severity = severity;
    zone.accidentCount = 4;
    zone.radiusM = radiusM;
    return zone;
}

} // namespace

class ZoneRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        clock_->freezeTime();
        registry_ = std::make_unique<domain::ZoneRegistry>(clock_);
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::unique_ptr<domain::ZoneRegistry> registry_;
};

TEST_F(ZoneRegistryTest, UpsertAssignsIdAndPublishesNewSnapshot) {
    auto before = registry_->snapshot();

    auto result = registry_->upsertZone(circleZone("t1", "Depot", {12.9716, 77.5946}, 500));
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_FALSE(result.zoneId.empty());

    auto after = registry_->snapshot();
    EXPECT_GT(after->version, before->version);
    // Snapshots are immutable: the one held before the write has no zones.
    EXPECT_EQ(before->findGeofence("t1", result.zoneId), nullptr);
    EXPECT_NE(after->findGeofence("t1", result.zoneId), nullptr);
}

TEST_F(ZoneRegistryTest, UpsertReplacesById) {
    auto zone = circleZone("t1", "Depot", {12.9716, 77.5946}, 500);
    zone.zoneId = "Z";
    ASSERT_TRUE(registry_->upsertZone(zone).success);

    zone.name = "Depot North";
    zone.shape = Circle{{20.0, 77.5946}, 300};
    ASSERT_TRUE(registry_->upsertZone(zone).success);

    auto zones = registry_->listZones("t1");
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].name, "Depot North");

    // Old cells no longer point at the zone.
    auto stale = registry_->candidates("t1", {12.9716, 77.5946});
    EXPECT_TRUE(stale.geofences.empty());
    auto fresh = registry_->candidates("t1", {20.0, 77.5946});
    ASSERT_EQ(fresh.geofences.size(), 1u);
}

TEST_F(ZoneRegistryTest, InvalidZonesRejected) {
    EXPECT_FALSE(registry_->upsertZone(circleZone("", "x", {0, 0}, 100)).success);
    EXPECT_FALSE(registry_->upsertZone(circleZone("t1", "x", {95, 0}, 100)).success);
    EXPECT_FALSE(registry_->upsertZone(circleZone("t1", "x", {0, 0}, -5)).success);

    Geofence polygon;
    polygon.tenantId = "t1";
    polygon.name = "line";
    polygon.shape = Polygon{{{0, 0}, {0, 1}}};
    EXPECT_FALSE(registry_->upsertZone(polygon).success);

    auto hysteresis = circleZone("t1", "h", {0, 0}, 200);
    hysteresis.hysteresis = Hysteresis{250, 300};
    EXPECT_FALSE(registry_->upsertZone(hysteresis).success);

    EXPECT_TRUE(registry_->listZones("t1").empty());
}

TEST_F(ZoneRegistryTest, TenantsAreIsolated) {
    ASSERT_TRUE(registry_->upsertZone(circleZone("t1", "A", {10, 10}, 500)).success);
    ASSERT_TRUE(registry_->upsertZone(circleZone("t2", "B", {10, 10}, 500)).success);

    auto candidates = registry_->candidates("t1", {10, 10});
    ASSERT_EQ(candidates.geofences.size(), 1u);
    EXPECT_EQ(candidates.geofences[0]->name, "A");
}

TEST_F(ZoneRegistryTest, RemoveZone) {
    auto result = registry_->upsertZone(circleZone("t1", "A", {10, 10}, 500));
    ASSERT_TRUE(result.success);

    EXPECT_TRUE(registry_->removeZone("t1", result.zoneId).success);
    EXPECT_FALSE(registry_->removeZone("t1", result.zoneId).success);
    EXPECT_FALSE(registry_->getZone("t1", result.zoneId).has_value());
    EXPECT_TRUE(registry_->candidates("t1", {10, 10}).geofences.empty());
}

TEST_F(ZoneRegistryTest, CandidatesOnlyNearPoint) {
    ASSERT_TRUE(registry_->upsertZone(circleZone("t1", "near", {10, 10}, 500)).success);
    ASSERT_TRUE(registry_->upsertZone(circleZone("t1", "far", {40, 40}, 500)).success);

    auto candidates = registry_->candidates("t1", {10.001, 10.001});
    ASSERT_EQ(candidates.geofences.size(), 1u);
    EXPECT_EQ(candidates.geofences[0]->name, "near");
}

TEST_F(ZoneRegistryTest, AccidentZoneRadiusDerivedFromSeverity) {
    ASSERT_TRUE(registry_->upsertAccidentZone(accidentZone("A", {18.52, 73.85}, Severity::High)).success);
    ASSERT_TRUE(registry_->upsertAccidentZone(accidentZone("B", {18.60, 73.85}, Severity::Low, 120)).success);

    auto zones = registry_->listAccidentZones();
    ASSERT_EQ(zones.size(), 2u);
    EXPECT_DOUBLE_EQ(zones[0].radiusM, AccidentConfig{}.radiusHighM);
    EXPECT_DOUBLE_EQ(zones[1].radiusM, 120.0);
}

TEST_F(ZoneRegistryTest, ReplaceAccidentZonesIsAllOrNothing) {
    ASSERT_TRUE(registry_->replaceAccidentZones({accidentZone("A", {18.52, 73.85}, Severity::High)}).success);

    auto bad = accidentZone("C", {18.52, 73.85}, Severity::Low);
    bad.accidentCount = -1;
    auto result = registry_->replaceAccidentZones({accidentZone("B", {18.6, 73.8}, Severity::Low), bad});
    EXPECT_FALSE(result.success);

    auto zones = registry_->listAccidentZones();
    ASSERT_EQ(zones.size(), 1u);
    EXPECT_EQ(zones[0].zoneId, "A");
}

TEST_F(ZoneRegistryTest, ReplaceStampsLoadTime) {
    auto loadedAt = clock_->now() + std::chrono::minutes(5);
    clock_->setCurrentTime(loadedAt);
    ASSERT_TRUE(registry_->replaceAccidentZones({}).success);
    EXPECT_EQ(registry_->snapshot()->accidentZonesLoadedAt, loadedAt);
}

TEST_F(ZoneRegistryTest, NearbyAccidentZonesSortedByDistance) {
    ASSERT_TRUE(registry_->replaceAccidentZones({
        accidentZone("far", {18.53, 73.85}, Severity::Low),
        accidentZone("near", {18.521, 73.85}, Severity::Low),
        accidentZone("out", {19.5, 73.85}, Severity::Low)
    }).success);

    auto nearby = registry_->nearbyAccidentZones({18.52, 73.85});
    ASSERT_EQ(nearby.size(), 2u);
    EXPECT_EQ(nearby[0].zone.zoneId, "near");
    EXPECT_EQ(nearby[1].zone.zoneId, "far");
    EXPECT_LT(nearby[0].distanceM, nearby[1].distanceM);
}

TEST_F(ZoneRegistryTest, OversizedZoneRejected) {
    RegistryConfig config;
    config.cellSizeDeg = 0.01;
    config.maxCellsPerZone = 16;
    domain::ZoneRegistry small(clock_, config);

    auto result = small.upsertZone(circleZone("t1", "huge", {10, 10}, 50000));
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(small.listZones("t1").empty());
}
