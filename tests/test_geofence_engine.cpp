#include <gtest/gtest.h>
#include "../core/domain/GeofenceEngine.hpp"
#include "../core/Geo.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace rtsae;

namespace {

const Timestamp BASE{std::chrono::seconds(1700000000)};
const GeoPoint DEPOT{12.9716, 77.5946};

Fix fixAt(double lat, double lon, int t, const std::string& vehicleId = "V") {
    Fix fix;
    fix.tenantId = "t1";
    fix.vehicleId = vehicleId;
    fix.lat = lat;
    fix.lon = lon;
    fix.ts = BASE + std::chrono::seconds(t);
    return fix;
}

Fix fixAtDistance(const GeoPoint& center, double meters, int t) {
    auto point = Geo::destination(center, 45.0, meters);
    return fixAt(point.lat, point.lon, t);
}

} // namespace

class GeofenceEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>(BASE);
        clock_->freezeTime();
        registry_ = std::make_shared<domain::ZoneRegistry>(clock_);
    }

    std::string addZone(Geofence zone) {
        zone.tenantId = zone.tenantId.empty() ? "t1" : zone.tenantId;
        auto result = registry_->upsertZone(zone);
        EXPECT_TRUE(result.success) << result.error;
        return result.zoneId;
    }

    Geofence depotZone(double radiusM = 500.0) {
        Geofence zone;
        zone.zoneId = "Z";
        zone.name = "Depot";
        zone.shape = Circle{DEPOT, radiusM};
        return zone;
    }

    domain::GeofenceResult evaluate(const Fix& fix) {
        return engine_.evaluate(fix, *registry_->snapshot(), memberships_);
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<domain::ZoneRegistry> registry_;
    domain::GeofenceEngine engine_;
    domain::MembershipTable memberships_;
};

TEST_F(GeofenceEngineTest, EntryEdgeAfterOutsideFix) {
    addZone(depotZone());

    auto first = evaluate(fixAt(12.980, 77.600, 1));
    EXPECT_TRUE(first.edges.empty());
    EXPECT_TRUE(first.memberships.empty());

    auto second = evaluate(fixAt(12.972, 77.595, 2));
    ASSERT_EQ(second.edges.size(), 1u);
    EXPECT_EQ(second.edges[0].kind, EdgeKind::Entry);
    EXPECT_EQ(second.edges[0].zoneId, "Z");
    EXPECT_EQ(second.edges[0].zoneName, "Depot");
    EXPECT_EQ(second.memberships.count("Z"), 1u);
}

TEST_F(GeofenceEngineTest, FirstClassificationNeverEmitsEdge) {
    addZone(depotZone());

    auto first = evaluate(fixAt(12.972, 77.595, 1));
    EXPECT_TRUE(first.edges.empty());
    EXPECT_EQ(first.memberships.count("Z"), 1u);
}

TEST_F(GeofenceEngineTest, ExitEdge) {
    addZone(depotZone());

    evaluate(fixAt(12.972, 77.595, 1));
    auto exit = evaluate(fixAt(12.990, 77.620, 2));
    ASSERT_EQ(exit.edges.size(), 1u);
    EXPECT_EQ(exit.edges[0].kind, EdgeKind::Exit);
    EXPECT_TRUE(exit.memberships.empty());
}

TEST_F(GeofenceEngineTest, DisabledTriggerUpdatesMembershipWithoutEdge) {
    auto zone = depotZone();
    zone.onEntry = false;
    addZone(zone);

    evaluate(fixAt(12.980, 77.600, 1));
    auto entered = evaluate(fixAt(12.972, 77.595, 2));
    EXPECT_TRUE(entered.edges.empty());
    EXPECT_EQ(entered.memberships.count("Z"), 1u);

    auto exited = evaluate(fixAt(12.990, 77.620, 3));
    ASSERT_EQ(exited.edges.size(), 1u);
    EXPECT_EQ(exited.edges[0].kind, EdgeKind::Exit);
}

TEST_F(GeofenceEngineTest, HysteresisSuppressesJitter) {
    auto zone = depotZone(200.0);
    zone.hysteresis = Hysteresis{180.0, 220.0};
    addZone(zone);

    int edges = 0;
    int t = 1;
    for (double distance : {190.0, 210.0, 190.0, 210.0}) {
        edges += static_cast<int>(evaluate(fixAtDistance(DEPOT, distance, t++)).edges.size());
    }
    EXPECT_EQ(edges, 0);
}

TEST_F(GeofenceEngineTest, HysteresisStillDetectsRealCrossings) {
    auto zone = depotZone(200.0);
    zone.hysteresis = Hysteresis{180.0, 220.0};
    addZone(zone);

    evaluate(fixAtDistance(DEPOT, 400.0, 1));
    auto entry = evaluate(fixAtDistance(DEPOT, 170.0, 2));
    ASSERT_EQ(entry.edges.size(), 1u);
    EXPECT_EQ(entry.edges[0].kind, EdgeKind::Entry);

    auto exit = evaluate(fixAtDistance(DEPOT, 230.0, 3));
    ASSERT_EQ(exit.edges.size(), 1u);
    EXPECT_EQ(exit.edges[0].kind, EdgeKind::Exit);
}

TEST_F(GeofenceEngineTest, WithoutHysteresisJitterProducesEdges) {
    addZone(depotZone(200.0));

    int edges = 0;
    int t = 1;
    for (double distance : {190.0, 210.0, 190.0, 210.0}) {
        edges += static_cast<int>(evaluate(fixAtDistance(DEPOT, distance, t++)).edges.size());
    }
    EXPECT_EQ(edges, 3);
}

TEST_F(GeofenceEngineTest, PoorAccuracyDefersEvaluation) {
    addZone(depotZone());

    evaluate(fixAt(12.980, 77.600, 1));
    auto noisy = fixAt(12.972, 77.595, 2);
    noisy.accuracyM = 400.0;
    auto deferred = evaluate(noisy);
    EXPECT_TRUE(deferred.deferred);
    EXPECT_TRUE(deferred.edges.empty());
    EXPECT_FALSE(memberships_.at("Z"));

    auto precise = evaluate(fixAt(12.972, 77.595, 3));
    ASSERT_EQ(precise.edges.size(), 1u);
}

TEST_F(GeofenceEngineTest, ScopeLimitsZoneToListedVehicles) {
    auto zone = depotZone();
    zone.vehicleIds = {"other"};
    addZone(zone);

    evaluate(fixAt(12.980, 77.600, 1));
    auto inside = evaluate(fixAt(12.972, 77.595, 2));
    EXPECT_TRUE(inside.edges.empty());
    EXPECT_TRUE(inside.memberships.empty());
}

TEST_F(GeofenceEngineTest, ShipmentScope) {
    auto zone = depotZone();
    zone.shipmentIds = {"s1"};
    addZone(zone);

    auto outside = fixAt(12.980, 77.600, 1);
    outside.shipmentId = "s1";
    evaluate(outside);
    auto inside = fixAt(12.972, 77.595, 2);
    inside.shipmentId = "s1";
    EXPECT_EQ(evaluate(inside).edges.size(), 1u);
}

TEST_F(GeofenceEngineTest, InactiveZoneForgottenWithoutEdge) {
    auto zone = depotZone();
    addZone(zone);
    evaluate(fixAt(12.972, 77.595, 1));

    zone.active = false;
    addZone(zone);
    auto result = evaluate(fixAt(12.990, 77.620, 2));
    EXPECT_TRUE(result.edges.empty());
    EXPECT_EQ(memberships_.count("Z"), 0u);
}

TEST_F(GeofenceEngineTest, ExitDetectedAfterLongJump) {
    addZone(depotZone());
    evaluate(fixAt(12.972, 77.595, 1));

    // Far outside the candidate cells of the zone.
    auto result = evaluate(fixAt(40.0, 10.0, 2));
    ASSERT_EQ(result.edges.size(), 1u);
    EXPECT_EQ(result.edges[0].kind, EdgeKind::Exit);
}

TEST_F(GeofenceEngineTest, BrokenZoneDoesNotAffectOthers) {
    addZone(depotZone());

    // Bypass registry validation to plant a degenerate polygon.
    auto snapshot = std::make_shared<domain::ZoneSnapshot>(*registry_->snapshot());
    auto tenant = std::make_shared<domain::TenantZones>(*snapshot->tenants.at("t1"));
    auto broken = std::make_shared<Geofence>();
    broken->zoneId = "broken";
    broken->tenantId = "t1";
    broken->name = "Broken";
    broken->shape = Polygon{{{12.97, 77.59}, {12.98, 77.60}}};
    tenant->insert(broken, Geo::boundingCircle(broken->shape), snapshot->cellSizeDeg, 4096);
    snapshot->tenants["t1"] = tenant;

    engine_.evaluate(fixAt(12.980, 77.600, 1), *snapshot, memberships_);
    auto result = engine_.evaluate(fixAt(12.972, 77.595, 2), *snapshot, memberships_);

    ASSERT_EQ(result.edges.size(), 1u);
    EXPECT_EQ(result.edges[0].zoneId, "Z");
    ASSERT_FALSE(result.zoneErrors.empty());
    EXPECT_EQ(result.zoneErrors[0].zoneId, "broken");
}

TEST_F(GeofenceEngineTest, PolygonEntryAndExit) {
    Geofence yard;
    yard.zoneId = "yard";
    yard.name = "Yard";
    yard.shape = Polygon{{{13.000, 77.000}, {13.000, 77.010}, {13.010, 77.010}, {13.010, 77.000}}};
    addZone(yard);

    auto outside = evaluate(fixAt(12.990, 77.005, 1));
    EXPECT_TRUE(outside.edges.empty());
    EXPECT_TRUE(outside.memberships.empty());

    auto entered = evaluate(fixAt(13.005, 77.005, 2));
    ASSERT_EQ(entered.edges.size(), 1u);
    EXPECT_EQ(entered.edges[0].kind, EdgeKind::Entry);
    EXPECT_EQ(entered.edges[0].zoneId, "yard");
    EXPECT_EQ(entered.memberships.count("yard"), 1u);

    auto inside = evaluate(fixAt(13.008, 77.002, 3));
    EXPECT_TRUE(inside.edges.empty());

    auto exited = evaluate(fixAt(13.020, 77.005, 4));
    ASSERT_EQ(exited.edges.size(), 1u);
    EXPECT_EQ(exited.edges[0].kind, EdgeKind::Exit);
    EXPECT_TRUE(exited.memberships.empty());
}

TEST_F(GeofenceEngineTest, EntryAcrossAntimeridian) {
    auto zone = depotZone(1000.0);
    zone.shape = Circle{GeoPoint{0.0, 179.999}, 1000.0};
    addZone(zone);

    auto outside = evaluate(fixAt(0.0, 179.97, 1));
    EXPECT_TRUE(outside.memberships.empty());

    // About 222 m from the centre, on the other side of the date line.
    auto entered = evaluate(fixAt(0.0, -179.999, 2));
    EXPECT_EQ(entered.memberships.count("Z"), 1u);
    ASSERT_EQ(entered.edges.size(), 1u);
    EXPECT_EQ(entered.edges[0].kind, EdgeKind::Entry);
}
