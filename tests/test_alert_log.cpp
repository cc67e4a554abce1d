#include <gtest/gtest.h>
#include "../core/domain/AlertLog.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>

using namespace rtsae;

namespace {

constexpr auto DEADLINE = std::chrono::milliseconds(100);
// 2023-11-14T22:13:20Z
const Timestamp BASE{std::chrono::seconds(1700000000)};

AlertRecord geofenceAlert(const std::string& id, const std::string& vehicleId, int t,
                          const std::string& zoneId = "Z") {
    AlertRecord record;
    record.alertId = id;
    record.kind = AlertKind::Geofence;
    record.tenantId = "t1";
    record.vehicleId = vehicleId;
    record.zoneId = zoneId;
    record.zoneName = "Depot";
    record.edge = EdgeKind::Entry;
    record.ts = BASE + std::chrono::seconds(t);
    record.emittedAt = record.ts;
    return record;
}

AlertRecord accidentAlert(const std::string& id, const std::string& vehicleId, int t,
                          Severity severity, const std::string& zoneId = "A") {
    AlertRecord record;
    record.alertId = id;
    record.kind = AlertKind::AccidentProximity;
    record.tenantId = "t1";
    record.vehicleId = vehicleId;
    record.zoneId = zoneId;
    record.severity = severity;
    record.accidentCount = 7;
    record.distanceM = 120.0;
    record.ts = BASE + std::chrono::seconds(t);
    record.emittedAt = record.ts;
    return record;
}

} // namespace

class AlertLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>(BASE + std::chrono::seconds(100));
        clock_->freezeTime();
        log_ = std::make_unique<domain::AlertLog>(clock_);
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::unique_ptr<domain::AlertLog> log_;
};

TEST_F(AlertLogTest, AppendIsIdempotentOnAlertId) {
    auto record = geofenceAlert("a1", "V", 1);
    EXPECT_EQ(log_->append(record, DEADLINE), ports::StoreStatus::Written);
    EXPECT_EQ(log_->append(record, DEADLINE), ports::StoreStatus::Stale);
    EXPECT_EQ(log_->size(), 1u);

    auto found = log_->find("a1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->vehicleId, "V");
    EXPECT_EQ(found->status, AlertStatus::Active);
}

TEST_F(AlertLogTest, RecordWithoutIdRejected) {
    EXPECT_EQ(log_->append(geofenceAlert("", "V", 1), DEADLINE), ports::StoreStatus::Failed);
    EXPECT_EQ(log_->size(), 0u);
}

TEST_F(AlertLogTest, AcknowledgeThenResolve) {
    log_->append(accidentAlert("a1", "V", 1, Severity::High), DEADLINE);

    EXPECT_EQ(log_->acknowledge("a1", "ops@example.com"), ports::StoreStatus::Written);
    auto acked = log_->find("a1");
    ASSERT_TRUE(acked.has_value());
    EXPECT_EQ(acked->status, AlertStatus::Acknowledged);
    EXPECT_EQ(acked->acknowledgedBy, std::optional<std::string>("ops@example.com"));
    EXPECT_EQ(acked->acknowledgedAt, std::optional<Timestamp>(clock_->now()));

    EXPECT_EQ(log_->acknowledge("a1", "again"), ports::StoreStatus::Stale);

    EXPECT_EQ(log_->resolve("a1"), ports::StoreStatus::Written);
    EXPECT_EQ(log_->find("a1")->status, AlertStatus::Resolved);

    // Resolved is terminal.
    EXPECT_EQ(log_->acknowledge("a1", "late"), ports::StoreStatus::Stale);
    EXPECT_EQ(log_->resolve("a1"), ports::StoreStatus::Stale);
}

TEST_F(AlertLogTest, UnknownAlertNotFound) {
    EXPECT_EQ(log_->acknowledge("missing", "ops"), ports::StoreStatus::NotFound);
    EXPECT_FALSE(log_->find("missing").has_value());
}

TEST_F(AlertLogTest, QueryFiltersAndOrdersNewestFirst) {
    log_->append(geofenceAlert("g1", "V", 1), DEADLINE);
    log_->append(accidentAlert("x1", "V", 2, Severity::High), DEADLINE);
    log_->append(accidentAlert("x2", "V", 3, Severity::Low), DEADLINE);
    log_->append(accidentAlert("x3", "W", 4, Severity::High), DEADLINE);

    ports::AlertQuery byVehicle;
    byVehicle.vehicleId = "V";
    auto page = log_->query(byVehicle);
    EXPECT_EQ(page.total, 3u);
    ASSERT_EQ(page.items.size(), 3u);
    EXPECT_EQ(page.items[0].alertId, "x2");
    EXPECT_EQ(page.items[2].alertId, "g1");

    ports::AlertQuery highAccidents;
    highAccidents.kind = AlertKind::AccidentProximity;
    highAccidents.severity = Severity::High;
    EXPECT_EQ(log_->query(highAccidents).total, 2u);

    ports::AlertQuery window;
    window.from = BASE + std::chrono::seconds(2);
    window.to = BASE + std::chrono::seconds(3);
    EXPECT_EQ(log_->query(window).total, 2u);

    log_->acknowledge("x1", "ops");
    ports::AlertQuery active;
    active.status = AlertStatus::Active;
    EXPECT_EQ(log_->query(active).total, 3u);
}

TEST_F(AlertLogTest, QueryPaging) {
    for (int i = 0; i < 25; ++i) {
        log_->append(geofenceAlert("g" + std::to_string(i), "V", i), DEADLINE);
    }

    ports::AlertQuery query;
    auto first = log_->query(query);
    EXPECT_EQ(first.total, 25u);
    EXPECT_EQ(first.pageSize, 20u);
    EXPECT_EQ(first.items.size(), 20u);

    query.page = 2;
    auto second = log_->query(query);
    ASSERT_EQ(second.items.size(), 5u);
    EXPECT_EQ(second.items.back().alertId, "g0");

    query.page = 3;
    EXPECT_TRUE(log_->query(query).items.empty());

    query.page = 1;
    query.pageSize = 1000;
    EXPECT_EQ(log_->query(query).pageSize, 100u);
}

TEST_F(AlertLogTest, StatsBySeverityHourAndZone) {
    log_->append(accidentAlert("x1", "V", 1, Severity::High, "A"), DEADLINE);
    log_->append(accidentAlert("x2", "V", 2, Severity::High, "A"), DEADLINE);
    log_->append(accidentAlert("x3", "V", 3, Severity::Medium, "B"), DEADLINE);
    log_->append(geofenceAlert("g1", "W", 4, "Z"), DEADLINE);

    auto all = log_->stats();
    EXPECT_EQ(all.total, 4u);
    EXPECT_EQ(all.bySeverity["high"], 2u);
    EXPECT_EQ(all.bySeverity["medium"], 1u);
    EXPECT_EQ(all.bySeverity.count("low"), 0u);
    EXPECT_EQ(all.byHour[22], 4u);
    ASSERT_FALSE(all.topZones.empty());
    EXPECT_EQ(all.topZones[0].first, "A");
    EXPECT_EQ(all.topZones[0].second, 2u);

    auto vehicleOnly = log_->stats(std::string("W"));
    EXPECT_EQ(vehicleOnly.total, 1u);

    auto recent = log_->stats(std::nullopt, BASE + std::chrono::seconds(3));
    EXPECT_EQ(recent.total, 2u);
}

TEST_F(AlertLogTest, ActiveCount) {
    log_->append(accidentAlert("x1", "V", 1, Severity::High), DEADLINE);
    log_->append(accidentAlert("x2", "V", 2, Severity::High), DEADLINE);
    log_->append(accidentAlert("x3", "W", 3, Severity::High), DEADLINE);
    log_->resolve("x2");

    EXPECT_EQ(log_->activeCount(), 2u);
    EXPECT_EQ(log_->activeCount(std::string("V")), 1u);
}

TEST_F(AlertLogTest, PurgeExpiredByRetention) {
    AlertLogConfig config;
    config.retention = std::chrono::hours(1);
    domain::AlertLog log(clock_, config);

    log.append(geofenceAlert("old", "V", 1), DEADLINE);
    clock_->advance(std::chrono::minutes(30));
    log.append(geofenceAlert("new", "V", 1800), DEADLINE);
    clock_->advance(std::chrono::minutes(40));

    EXPECT_EQ(log.purgeExpired(), 1u);
    EXPECT_FALSE(log.find("old").has_value());
    EXPECT_TRUE(log.find("new").has_value());
}

TEST_F(AlertLogTest, PurgeResolvedOlderThan) {
    log_->append(accidentAlert("resolved", "V", 1, Severity::High), DEADLINE);
    log_->append(accidentAlert("open", "V", 2, Severity::High), DEADLINE);
    log_->resolve("resolved");

    EXPECT_EQ(log_->purgeResolvedOlderThan(std::chrono::hours(24 * 7)), 0u);

    clock_->advance(std::chrono::hours(24 * 7 + 1));
    EXPECT_EQ(log_->purgeResolvedOlderThan(std::chrono::hours(24 * 7)), 1u);
    EXPECT_FALSE(log_->find("resolved").has_value());
    EXPECT_TRUE(log_->find("open").has_value());
}
