#include <gtest/gtest.h>
#include "../core/domain/AccidentProximityEngine.hpp"
#include "../core/Geo.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace rtsae;

namespace {

const Timestamp BASE{std::chrono::seconds(1700000000)};
const GeoPoint ZONE_A{18.5204, 73.8567};

Fix fixAt(double lat, double lon, int t) {
    Fix fix;
    fix.tenantId = "t1";
    fix.vehicleId = "V";
    fix.lat = lat;
    fix.lon = lon;
    fix.ts = BASE + std::chrono::seconds(t);
    return fix;
}

AccidentZone zone(const std::string& id, GeoPoint center, Severity severity, double radiusM) {
    AccidentZone z;
    z.zoneId = id;
    z.center = center;
    z.severity = severity;
    z.accidentCount = 5;
    z.radiusM = radiusM;
    return z;
}

} // namespace

class AccidentProximityTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>(BASE);
        clock_->freezeTime();
        registry_ = std::make_shared<domain::ZoneRegistry>(clock_);
    }

    void load(const std::vector<AccidentZone>& zones) {
        ASSERT_TRUE(registry_->replaceAccidentZones(zones).success);
    }

    domain::ProximityResult evaluate(const Fix& fix) {
        return engine_.evaluate(fix, *registry_->snapshot(), state_, clock_->now());
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<domain::ZoneRegistry> registry_;
    domain::AccidentProximityEngine engine_;
    domain::ProximityTable state_;
};

TEST_F(AccidentProximityTest, ActivatesOnceThenResolvesAfterExitHold) {
    load({zone("A", ZONE_A, Severity::High, 300)});

    auto entered = evaluate(fixAt(18.5210, 73.8570, 10));
    ASSERT_TRUE(entered.activated.has_value());
    EXPECT_EQ(entered.activated->zone->zoneId, "A");
    EXPECT_EQ(entered.activated->zone->severity, Severity::High);
    EXPECT_NEAR(entered.activated->distanceM,
                Geo::distanceMeters(ZONE_A, GeoPoint{18.5210, 73.8570}), 1e-6);
    state_["A"].alertId = "alert-A";

    for (int t = 11; t <= 69; ++t) {
        auto result = evaluate(fixAt(18.5400, 73.8900, t));
        EXPECT_FALSE(result.activated.has_value()) << "t=" << t;
        EXPECT_TRUE(result.resolved.empty()) << "t=" << t;
    }

    auto resolved = evaluate(fixAt(18.5400, 73.8900, 70));
    ASSERT_EQ(resolved.resolved.size(), 1u);
    EXPECT_EQ(resolved.resolved[0].zoneId, "A");
    EXPECT_EQ(resolved.resolved[0].alertId, "alert-A");
    EXPECT_EQ(resolved.resolved[0].reason, "exit_hold");
    EXPECT_TRUE(state_.empty());

    for (int t = 71; t <= 72; ++t) {
        auto result = evaluate(fixAt(18.5400, 73.8900, t));
        EXPECT_FALSE(result.activated.has_value());
        EXPECT_TRUE(result.resolved.empty());
    }
}

TEST_F(AccidentProximityTest, StayingInsideDoesNotReactivate) {
    load({zone("A", ZONE_A, Severity::High, 300)});

    EXPECT_TRUE(evaluate(fixAt(18.5210, 73.8570, 1)).activated.has_value());
    for (int t = 2; t <= 20; ++t) {
        EXPECT_FALSE(evaluate(fixAt(18.5205, 73.8568, t)).activated.has_value());
    }
}

TEST_F(AccidentProximityTest, ReturningInsideResetsExitHold) {
    load({zone("A", ZONE_A, Severity::High, 300)});

    evaluate(fixAt(18.5210, 73.8570, 0));
    evaluate(fixAt(18.5400, 73.8900, 30));
    evaluate(fixAt(18.5210, 73.8570, 50));

    EXPECT_TRUE(evaluate(fixAt(18.5400, 73.8900, 100)).resolved.empty());
    EXPECT_EQ(evaluate(fixAt(18.5400, 73.8900, 110)).resolved.size(), 1u);
}

TEST_F(AccidentProximityTest, ResolvesAfterMaximumActiveTime) {
    load({zone("A", ZONE_A, Severity::High, 300)});

    evaluate(fixAt(18.5210, 73.8570, 0));
    EXPECT_TRUE(evaluate(fixAt(18.5210, 73.8570, 899)).resolved.empty());

    auto expired = evaluate(fixAt(18.5210, 73.8570, 900));
    ASSERT_EQ(expired.resolved.size(), 1u);
    EXPECT_EQ(expired.resolved[0].reason, "active_max");
    EXPECT_FALSE(expired.activated.has_value());

    // Next fix still inside starts a new activation.
    EXPECT_TRUE(evaluate(fixAt(18.5210, 73.8570, 901)).activated.has_value());
}

TEST_F(AccidentProximityTest, NearestZoneWins) {
    GeoPoint vehicle{18.50, 73.85};
    load({
        zone("near-low", Geo::destination(vehicle, 0.0, 50.0), Severity::Low, 300),
        zone("far-high", Geo::destination(vehicle, 180.0, 150.0), Severity::High, 300)
    });

    auto result = evaluate(fixAt(vehicle.lat, vehicle.lon, 1));
    ASSERT_TRUE(result.activated.has_value());
    EXPECT_EQ(result.activated->zone->zoneId, "near-low");
}

TEST_F(AccidentProximityTest, SeverityBreaksDistanceTie) {
    GeoPoint vehicle{18.50, 73.85};
    load({
        zone("low", Geo::destination(vehicle, 0.0, 100.0), Severity::Low, 300),
        zone("high", Geo::destination(vehicle, 180.0, 100.0), Severity::High, 300)
    });

    auto result = evaluate(fixAt(vehicle.lat, vehicle.lon, 1));
    ASSERT_TRUE(result.activated.has_value());
    EXPECT_EQ(result.activated->zone->zoneId, "high");
    EXPECT_EQ(state_.size(), 1u);
}

TEST_F(AccidentProximityTest, RemovedZoneResolvesActivePair) {
    load({zone("A", ZONE_A, Severity::High, 300)});
    evaluate(fixAt(18.5210, 73.8570, 1));

    load({});
    auto result = evaluate(fixAt(18.5210, 73.8570, 2));
    ASSERT_EQ(result.resolved.size(), 1u);
    EXPECT_EQ(result.resolved[0].reason, "zone_removed");
}

TEST_F(AccidentProximityTest, StaleZoneSetSkipsEvaluation) {
    AccidentConfig config;
    config.maxSnapshotAge = std::chrono::seconds(60);
    domain::AccidentProximityEngine strict(config);
    load({zone("A", ZONE_A, Severity::High, 300)});

    auto snapshot = registry_->snapshot();
    auto fresh = strict.evaluate(fixAt(18.5210, 73.8570, 1), *snapshot, state_, clock_->now());
    EXPECT_FALSE(fresh.skippedStale);
    EXPECT_TRUE(fresh.activated.has_value());

    state_.clear();
    auto later = clock_->now() + std::chrono::seconds(61);
    auto stale = strict.evaluate(fixAt(18.5210, 73.8570, 2), *snapshot, state_, later);
    EXPECT_TRUE(stale.skippedStale);
    EXPECT_FALSE(stale.activated.has_value());
    EXPECT_TRUE(state_.empty());
}

TEST_F(AccidentProximityTest, ActivatesAcrossAntimeridian) {
    load({zone("A", GeoPoint{0.0, 179.999}, Severity::High, 300)});

    auto result = evaluate(fixAt(0.0, -179.9995, 1));
    ASSERT_TRUE(result.activated.has_value());
    EXPECT_EQ(result.activated->zone->zoneId, "A");
    EXPECT_LT(result.activated->distanceM, 300.0);
}
