#include <gtest/gtest.h>
#include "../core/domain/PositionStore.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace rtsae;

namespace {

constexpr auto WRITE_DEADLINE = std::chrono::milliseconds(200);
const Timestamp BASE{std::chrono::seconds(1700000000)};

Timestamp at(int seconds) {
    return BASE + std::chrono::seconds(seconds);
}

Fix makeFix(const std::string& vehicleId, int t, double lat = 12.97, double lon = 77.59) {
    Fix fix;
    fix.tenantId = "t1";
    fix.vehicleId = vehicleId;
    fix.lat = lat;
    fix.lon = lon;
    fix.ts = at(t);
    return fix;
}

} // namespace

class PositionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>(at(100));
        clock_->freezeTime();

        StoreConfig config;
        config.hotTtl = std::chrono::seconds(300);
        config.historyRetention = std::chrono::hours(24);
        config.shardCount = 4;
        store_ = std::make_unique<domain::PositionStore>(clock_, config);
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::unique_ptr<domain::PositionStore> store_;
};

TEST_F(PositionStoreTest, LatestIsLastWriterWinsUnderTimestamp) {
    EXPECT_EQ(store_->putLatest(makeFix("v1", 2, 1.0, 1.0), WRITE_DEADLINE), ports::StoreStatus::Written);
    EXPECT_EQ(store_->putLatest(makeFix("v1", 1, 2.0, 2.0), WRITE_DEADLINE), ports::StoreStatus::Stale);
    EXPECT_EQ(store_->putLatest(makeFix("v1", 2, 3.0, 3.0), WRITE_DEADLINE), ports::StoreStatus::Stale);

    auto latest = store_->getLatest("v1");
    ASSERT_TRUE(latest.has_value());
    EXPECT_DOUBLE_EQ(latest->lat, 1.0);
    EXPECT_EQ(latest->ts, at(2));
}

TEST_F(PositionStoreTest, ShipmentKeyFollowsVehicle) {
    auto fix = makeFix("v1", 5);
    fix.shipmentId = "s1";
    store_->putLatest(fix, WRITE_DEADLINE);

    auto byShipment = store_->getLatestForShipment("s1");
    ASSERT_TRUE(byShipment.has_value());
    EXPECT_EQ(byShipment->vehicleId, "v1");
    EXPECT_FALSE(store_->getLatestForShipment("s2").has_value());
}

TEST_F(PositionStoreTest, HotEntriesExpire) {
    store_->putLatest(makeFix("v1", 5), WRITE_DEADLINE);
    EXPECT_TRUE(store_->getLatest("v1").has_value());

    clock_->advance(std::chrono::seconds(301));
    EXPECT_FALSE(store_->getLatest("v1").has_value());
    EXPECT_EQ(store_->purgeExpired(), 1u);
}

TEST_F(PositionStoreTest, HistoryNewestFirstInclusiveRange) {
    for (int t = 1; t <= 5; ++t) {
        EXPECT_EQ(store_->appendHistory(makeFix("v1", t), WRITE_DEADLINE), ports::StoreStatus::Written);
    }
    EXPECT_EQ(store_->appendHistory(makeFix("v1", 3), WRITE_DEADLINE), ports::StoreStatus::Stale);

    auto track = store_->queryHistory("v1", at(2), at(4), 0);
    ASSERT_EQ(track.size(), 3u);
    EXPECT_EQ(track[0].ts, at(4));
    EXPECT_EQ(track[2].ts, at(2));

    auto limited = store_->queryHistory("v1", at(0), at(10), 2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[0].ts, at(5));
}

TEST_F(PositionStoreTest, HistoryRetentionPurge) {
    store_->appendHistory(makeFix("v1", 1), WRITE_DEADLINE);
    store_->appendHistory(makeFix("v1", 2), WRITE_DEADLINE);
    EXPECT_EQ(store_->historySize("v1"), 2u);

    clock_->advance(std::chrono::hours(25));
    store_->purgeExpired();
    EXPECT_EQ(store_->historySize("v1"), 0u);
}

TEST_F(PositionStoreTest, LatestForTenantSortedAndScoped) {
    store_->putLatest(makeFix("v2", 1), WRITE_DEADLINE);
    store_->putLatest(makeFix("v1", 1), WRITE_DEADLINE);
    auto other = makeFix("v3", 1);
    other.tenantId = "t2";
    store_->putLatest(other, WRITE_DEADLINE);

    auto fixes = store_->latestForTenant("t1");
    ASSERT_EQ(fixes.size(), 2u);
    EXPECT_EQ(fixes[0].vehicleId, "v1");
    EXPECT_EQ(fixes[1].vehicleId, "v2");
}

TEST_F(PositionStoreTest, HistoryPagesReportTotal) {
    for (int t = 1; t <= 7; ++t) {
        store_->appendHistory(makeFix("v1", t), WRITE_DEADLINE);
    }

    auto first = store_->queryHistoryPage("v1", at(0), at(10), 1, 3);
    EXPECT_EQ(first.total, 7u);
    EXPECT_EQ(first.page, 1u);
    EXPECT_EQ(first.limit, 3u);
    ASSERT_EQ(first.fixes.size(), 3u);
    EXPECT_EQ(first.fixes[0].ts, at(7));

    auto last = store_->queryHistoryPage("v1", at(0), at(10), 3, 3);
    EXPECT_EQ(last.total, 7u);
    ASSERT_EQ(last.fixes.size(), 1u);
    EXPECT_EQ(last.fixes[0].ts, at(1));

    auto beyond = store_->queryHistoryPage("v1", at(0), at(10), 4, 3);
    EXPECT_TRUE(beyond.fixes.empty());
    EXPECT_EQ(beyond.total, 7u);

    auto ranged = store_->queryHistoryPage("v1", at(3), at(5), 0, 0);
    EXPECT_EQ(ranged.page, 1u);
    EXPECT_EQ(ranged.total, 3u);
    EXPECT_EQ(ranged.fixes.size(), 3u);
}

TEST_F(PositionStoreTest, ShipmentHistorySpansVehicles) {
    auto tagged = [](const std::string& vehicleId, int t) {
        auto fix = makeFix(vehicleId, t);
        fix.shipmentId = "s1";
        return fix;
    };

    store_->appendHistory(tagged("v1", 1), WRITE_DEADLINE);
    store_->appendHistory(tagged("v1", 2), WRITE_DEADLINE);
    store_->appendHistory(makeFix("v1", 3), WRITE_DEADLINE);
    // Handed over to another vehicle whose clock runs slightly behind.
    store_->appendHistory(tagged("v2", 2), WRITE_DEADLINE);
    store_->appendHistory(tagged("v2", 4), WRITE_DEADLINE);
    // Rejected as stale on the vehicle track, so not added to the shipment either.
    EXPECT_EQ(store_->appendHistory(tagged("v2", 4), WRITE_DEADLINE), ports::StoreStatus::Stale);

    auto track = store_->queryShipmentHistory("s1", at(0), at(10), 0);
    ASSERT_EQ(track.size(), 4u);
    EXPECT_EQ(track[0].ts, at(4));
    EXPECT_EQ(track[0].vehicleId, "v2");
    EXPECT_EQ(track[3].ts, at(1));

    auto limited = store_->queryShipmentHistory("s1", at(2), at(10), 2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[1].ts, at(2));

    EXPECT_TRUE(store_->queryShipmentHistory("s2", at(0), at(10), 0).empty());
    EXPECT_EQ(store_->queryHistory("v1", at(0), at(10), 0).size(), 3u);
}

TEST_F(PositionStoreTest, ShipmentHistoryFollowsRetention) {
    auto fix = makeFix("v1", 1);
    fix.shipmentId = "s1";
    store_->appendHistory(fix, WRITE_DEADLINE);

    clock_->advance(std::chrono::hours(25));
    EXPECT_EQ(store_->purgeExpired(), 2u);
    EXPECT_TRUE(store_->queryShipmentHistory("s1", at(0), at(10), 0).empty());
}
