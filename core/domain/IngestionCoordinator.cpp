#include "IngestionCoordinator.hpp"
#include "../../crypto/AlertId.hpp"
#include "../Geo.hpp"
#include "../JsonCodec.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace rtsae::domain {

std::string ingestStatusToString(IngestStatus status) {
    switch (status) {
        case IngestStatus::Accepted: return "accepted";
        case IngestStatus::StaleIgnored: return "stale_ignored";
        case IngestStatus::Rejected: return "rejected";
    }
    return "rejected";
}

IngestionCoordinator::IngestionCoordinator(std::shared_ptr<ports::IEntityDirectory> directory,
                                           std::shared_ptr<ports::IPositionStore> store,
                                           std::shared_ptr<ZoneRegistry> registry,
                                           std::shared_ptr<ports::ISubscriptionBus> bus,
                                           std::shared_ptr<ports::IAlertLog> alertLog,
                                           std::shared_ptr<ports::IPolicyEngine> policyEngine,
                                           std::shared_ptr<IClock> clock,
                                           const EngineConfig& config)
    : directory_(std::move(directory)),
      store_(std::move(store)),
      registry_(std::move(registry)),
      bus_(std::move(bus)),
      alertLog_(std::move(alertLog)),
      policyEngine_(std::move(policyEngine)),
      clock_(std::move(clock)),
      config_(config.ingestion),
      geofenceEngine_(config.geofence),
      proximityEngine_(config.accident),
      telemetryEvaluator_(config.telemetry),
      pool_(config.ingestion.workerThreads) {
}

IngestionCoordinator::~IngestionCoordinator() {
    shutdown();
}

void IngestionCoordinator::shutdown() {
    pool_.shutdown();
}

std::optional<std::string> IngestionCoordinator::validateIdentity(const std::string& tenantId,
                                                                  const std::string& vehicleId) const {
    if (tenantId.empty()) return std::string("missing_tenant");
    if (vehicleId.empty()) return std::string("missing_vehicle");
    if (!directory_->tenantExists(tenantId)) return std::string("unknown_tenant");
    if (!directory_->vehicleExists(tenantId, vehicleId)) return std::string("unknown_vehicle");
    return std::nullopt;
}

std::optional<std::string> IngestionCoordinator::validate(const Fix& fix) const {
    if (fix.tenantId.empty()) return std::string("missing_tenant");
    if (fix.vehicleId.empty()) return std::string("missing_vehicle");
    if (!std::isfinite(fix.lat) || fix.lat < -90.0 || fix.lat > 90.0) {
        return std::string("invalid_latitude");
    }
    if (!std::isfinite(fix.lon) || fix.lon < -180.0 || fix.lon > 180.0) {
        return std::string("invalid_longitude");
    }

    auto now = clock_->now();
    if (fix.ts > now + config_.maxFutureSkew) return std::string("ts_in_future");
    if (fix.ts < now - config_.maxAge) return std::string("ts_too_old");

    return validateIdentity(fix.tenantId, fix.vehicleId);
}

IngestOutcome IngestionCoordinator::reject(const std::string& reason) {
    counters_.rejected++;
    IngestOutcome outcome;
    outcome.status = IngestStatus::Rejected;
    outcome.reason = reason;
    return outcome;
}

std::future<IngestOutcome> IngestionCoordinator::submit(const Fix& fix) {
    std::promise<IngestOutcome> promise;
    auto future = promise.get_future();

    if (auto reason = validate(fix)) {
        promise.set_value(reject(*reason));
        return future;
    }

    auto lane = laneFor(fix.vehicleId);
    bool schedule = false;
    {
        std::lock_guard<std::mutex> lock(lane->mutex);
        std::size_t capacity = std::max<std::size_t>(config_.laneCapacity, 1);
        if (lane->queue.size() >= capacity) {
            // Keep newest: the oldest waiting fix makes room.
            auto dropped = std::move(lane->queue.front());
            lane->queue.pop_front();
            counters_.queueDropped++;
            std::cerr << "[Ingestion] Lane for " << fix.vehicleId
                      << " full, dropping oldest queued fix" << std::endl;
            dropped.promise.set_value(reject("queue_overflow"));
        }
        lane->queue.push_back(PendingFix{fix, std::move(promise)});
        if (!lane->scheduled) {
            lane->scheduled = true;
            schedule = true;
        }
    }

    if (schedule) {
        scheduleLane(lane);
    }
    return future;
}

IngestOutcome IngestionCoordinator::ingest(const Fix& fix) {
    return submit(fix).get();
}

std::shared_ptr<IngestionCoordinator::VehicleLane> IngestionCoordinator::laneFor(const std::string& vehicleId) {
    std::lock_guard<std::mutex> lock(lanesMutex_);
    auto& lane = lanes_[vehicleId];
    if (!lane) {
        lane = std::make_shared<VehicleLane>();
    }
    return lane;
}

void IngestionCoordinator::scheduleLane(const std::shared_ptr<VehicleLane>& lane) {
    if (!pool_.post([this, lane] { drainLane(lane); })) {
        rejectQueued(lane, "shutting_down");
    }
}

void IngestionCoordinator::rejectQueued(const std::shared_ptr<VehicleLane>& lane, const std::string& reason) {
    std::lock_guard<std::mutex> lock(lane->mutex);
    while (!lane->queue.empty()) {
        lane->queue.front().promise.set_value(reject(reason));
        lane->queue.pop_front();
    }
    lane->scheduled = false;
}

void IngestionCoordinator::drainLane(const std::shared_ptr<VehicleLane>& lane) {
    PendingFix item;
    {
        std::lock_guard<std::mutex> lock(lane->mutex);
        if (lane->queue.empty()) {
            lane->scheduled = false;
            return;
        }
        item = std::move(lane->queue.front());
        lane->queue.pop_front();
    }

    item.promise.set_value(process(item.fix, lane->context));
    processRetries();

    bool more = false;
    {
        std::lock_guard<std::mutex> lock(lane->mutex);
        more = !lane->queue.empty();
        if (!more) {
            lane->scheduled = false;
        }
    }

    // One fix per task so a busy vehicle cannot starve the others.
    if (more) {
        scheduleLane(lane);
    }
}

IngestOutcome IngestionCoordinator::process(const Fix& fix, VehicleContext& context) {
    IngestOutcome outcome;

    if (context.lastAcceptedTs && fix.ts <= *context.lastAcceptedTs) {
        counters_.staleIgnored++;
        outcome.status = IngestStatus::StaleIgnored;
        return outcome;
    }

    try {
        const auto& deadlines = policyEngine_->getDeadlinePolicy();

        auto status = store_->putLatest(fix, deadlines.storeWriteDeadline());
        switch (status) {
            case ports::StoreStatus::Written:
                break;
            case ports::StoreStatus::Stale:
                counters_.staleIgnored++;
                outcome.status = IngestStatus::StaleIgnored;
                return outcome;
            case ports::StoreStatus::Timeout:
                std::cerr << "[Ingestion] Store write timed out for " << fix.vehicleId << std::endl;
                return reject("store_timeout");
            default:
                std::cerr << "[Ingestion] Store write failed for " << fix.vehicleId << ": "
                          << ports::storeStatusToString(status) << std::endl;
                return reject("store_failure");
        }
        context.lastAcceptedTs = fix.ts;

        auto historyStatus = store_->appendHistory(fix, deadlines.storeWriteDeadline());
        if (historyStatus != ports::StoreStatus::Written) {
            counters_.historyFailures++;
            std::cerr << "[Ingestion] History append for " << fix.vehicleId << " returned "
                      << ports::storeStatusToString(historyStatus) << std::endl;
        }

        auto snapshot = registry_->snapshot();
        auto now = clock_->now();

        auto geofence = geofenceEngine_.evaluate(fix, *snapshot, context.memberships);
        counters_.zoneErrors += geofence.zoneErrors.size();

        auto proximity = proximityEngine_.evaluate(fix, *snapshot, context.proximity, now);
        if (proximity.skippedStale) {
            counters_.staleRegistrySkips++;
        }

        publishLocation(fix, now);

        for (const auto& edge : geofence.edges) {
            auto record = geofenceRecord(fix, edge, now);
            publishAlert(record, now);
            writeAlert(record);
        }

        if (proximity.activated) {
            auto record = accidentRecord(fix, *proximity.activated, now);
            context.proximity[record.zoneId].alertId = record.alertId;
            publishAlert(record, now);
            writeAlert(record);
            outcome.accidentAlertId = record.alertId;
        }

        for (const auto& resolution : proximity.resolved) {
            std::cout << "[Ingestion] Proximity alert " << resolution.alertId << " for "
                      << fix.vehicleId << " resolved (" << resolution.reason << ")" << std::endl;
            if (!resolution.alertId.empty()) {
                resolveAlert(resolution.alertId, fix.ts);
            }
        }

        counters_.accepted++;
        outcome.status = IngestStatus::Accepted;
        outcome.edges = std::move(geofence.edges);
        return outcome;
    } catch (const std::exception& e) {
        std::cerr << "[Ingestion] Failed to process fix for " << fix.vehicleId << ": "
                  << e.what() << std::endl;
        return reject("internal_error");
    }
}

void IngestionCoordinator::publishLocation(const Fix& fix, Timestamp serverTs) {
    auto event = std::make_shared<const ports::BusEvent>(
        ports::BusEvent{"location_update", JsonCodec::locationUpdateToJson(fix, serverTs)});

    bus_->publish(ports::topics::vehicle(fix.vehicleId), event);
    if (fix.shipmentId) {
        bus_->publish(ports::topics::shipment(*fix.shipmentId), event);
    }
    bus_->publish(ports::topics::tenant(fix.tenantId), event);
}

void IngestionCoordinator::publishAlert(const AlertRecord& record, Timestamp serverTs) {
    auto event = std::make_shared<const ports::BusEvent>(
        ports::BusEvent{alertKindToString(record.kind), JsonCodec::alertEventToJson(record, serverTs)});

    bus_->publish(ports::topics::tenant(record.tenantId), event);
    bus_->publish(ports::topics::vehicle(record.vehicleId), event);
    if (record.shipmentId) {
        bus_->publish(ports::topics::shipment(*record.shipmentId), event);
    }
    if (record.kind == AlertKind::AccidentProximity) {
        bus_->publish(ports::topics::accidentZone(record.zoneId), event);
    }
}

AlertRecord IngestionCoordinator::geofenceRecord(const Fix& fix, const GeofenceEdge& edge, Timestamp now) const {
    AlertRecord record;
    record.alertId = AlertId::derive(fix.vehicleId, edge.zoneId, fix.ts);
    record.kind = AlertKind::Geofence;
    record.tenantId = fix.tenantId;
    record.vehicleId = fix.vehicleId;
    record.shipmentId = fix.shipmentId;
    record.driverId = fix.driverId;
    record.zoneId = edge.zoneId;
    record.zoneName = edge.zoneName;
    record.edge = edge.kind;
    record.vehicleLocation = fix.point();
    record.ts = fix.ts;
    record.emittedAt = now;
    return record;
}

AlertRecord IngestionCoordinator::accidentRecord(const Fix& fix, const ProximityActivation& activation,
                                                 Timestamp now) const {
    const auto& zone = *activation.zone;

    AlertRecord record;
    record.alertId = AlertId::derive(fix.vehicleId, zone.zoneId, fix.ts);
    record.kind = AlertKind::AccidentProximity;
    record.tenantId = fix.tenantId;
    record.vehicleId = fix.vehicleId;
    record.shipmentId = fix.shipmentId;
    record.driverId = fix.driverId;
    record.zoneId = zone.zoneId;
    record.severity = zone.severity;
    record.accidentCount = zone.accidentCount;
    record.distanceM = activation.distanceM;
    record.zoneCenter = zone.center;
    record.vehicleLocation = fix.point();
    record.ts = fix.ts;
    record.emittedAt = now;
    record.metadata = zone.metadata;
    if (fix.speedKph) {
        record.metadata["speedKph"] = std::to_string(*fix.speedKph);
    }
    return record;
}

void IngestionCoordinator::writeAlert(const AlertRecord& record) {
    PendingLogWrite pending;
    pending.op = LogOp::Append;
    pending.record = record;
    pending.alertId = record.alertId;

    auto status = attempt(pending);
    if (status == ports::StoreStatus::Written || status == ports::StoreStatus::Stale) {
        return;
    }

    counters_.logFailures++;
    std::cerr << "[Ingestion] Alert log append for " << record.alertId << " returned "
              << ports::storeStatusToString(status) << ", queued for retry" << std::endl;
    pending.attempts = 1;
    enqueueRetry(std::move(pending));
}

void IngestionCoordinator::resolveAlert(const std::string& alertId, Timestamp at) {
    PendingLogWrite pending;
    pending.op = LogOp::Resolve;
    pending.alertId = alertId;
    pending.at = at;

    auto status = attempt(pending);
    if (status == ports::StoreStatus::Written || status == ports::StoreStatus::Stale) {
        return;
    }

    if (status == ports::StoreStatus::NotFound) {
        std::lock_guard<std::mutex> lock(retryMutex_);
        bool appendPending = std::any_of(retryQueue_.begin(), retryQueue_.end(),
                                         [&](const PendingLogWrite& queued) {
                                             return queued.op == LogOp::Append && queued.alertId == alertId;
                                         });
        if (!appendPending) {
            std::cerr << "[Ingestion] Cannot resolve unknown alert " << alertId << std::endl;
            return;
        }
    }

    counters_.logFailures++;
    pending.attempts = 1;
    enqueueRetry(std::move(pending));
}

ports::StoreStatus IngestionCoordinator::attempt(const PendingLogWrite& pending) {
    auto deadline = policyEngine_->getDeadlinePolicy().logWriteDeadline();
    if (pending.op == LogOp::Append) {
        return alertLog_->append(pending.record, deadline);
    }
    return alertLog_->updateStatus(pending.alertId, AlertStatus::Resolved, pending.at, "", deadline);
}

void IngestionCoordinator::enqueueRetry(PendingLogWrite pending) {
    pending.nextRetry = clock_->now() +
        policyEngine_->getRetryPolicy().getBackoffDelay(pending.attempts);
    std::lock_guard<std::mutex> lock(retryMutex_);
    retryQueue_.push_back(std::move(pending));
}

void IngestionCoordinator::processRetries() {
    std::lock_guard<std::mutex> lock(retryMutex_);
    if (retryQueue_.empty()) return;

    auto now = clock_->now();
    const auto& retryPolicy = policyEngine_->getRetryPolicy();

    while (!retryQueue_.empty()) {
        auto& pending = retryQueue_.front();

        if (pending.nextRetry > now) break;

        if (!retryPolicy.shouldRetry(pending.attempts)) {
            std::cerr << "[Ingestion] Dropping alert log write for " << pending.alertId
                      << " after " << pending.attempts << " attempts" << std::endl;
            counters_.logGaveUp++;
            retryQueue_.pop_front();
            continue;
        }

        counters_.logRetries++;
        auto status = attempt(pending);
        if (status == ports::StoreStatus::Written || status == ports::StoreStatus::Stale) {
            retryQueue_.pop_front();
        } else {
            pending.attempts++;
            pending.nextRetry = now + retryPolicy.getBackoffDelay(pending.attempts);
            break; // Keep order: later writes may depend on this one
        }
    }
}

std::size_t IngestionCoordinator::pendingRetries() const {
    std::lock_guard<std::mutex> lock(retryMutex_);
    return retryQueue_.size();
}

TelemetryOutcome IngestionCoordinator::submitTelemetry(const Telemetry& telemetry) {
    TelemetryOutcome outcome;

    auto reason = validateIdentity(telemetry.tenantId, telemetry.vehicleId);
    if (!reason && telemetry.ts > clock_->now() + config_.maxFutureSkew) {
        reason = std::string("ts_in_future");
    }
    if (reason) {
        counters_.rejected++;
        outcome.status = IngestStatus::Rejected;
        outcome.reason = *reason;
        return outcome;
    }

    outcome.alarms = telemetryEvaluator_.evaluate(telemetry);
    for (const auto& alarm : outcome.alarms) {
        auto event = std::make_shared<const ports::BusEvent>(
            ports::BusEvent{"vehicle_telemetry_alarm", JsonCodec::alarmEventToJson(telemetry, alarm)});
        bus_->publish(ports::topics::tenant(telemetry.tenantId), event);
    }

    {
        std::lock_guard<std::mutex> lock(telemetryMutex_);
        auto& cached = latestTelemetry_[telemetry.vehicleId];
        if (cached.telemetry.vehicleId.empty() || telemetry.ts >= cached.telemetry.ts) {
            cached = CachedTelemetry{telemetry, clock_->now() + config_.telemetryCacheTtl};
        }
    }

    counters_.telemetryAccepted++;
    counters_.alarmsRaised += outcome.alarms.size();
    outcome.status = IngestStatus::Accepted;
    return outcome;
}

std::optional<Telemetry> IngestionCoordinator::getLatestTelemetry(const std::string& vehicleId) const {
    std::lock_guard<std::mutex> lock(telemetryMutex_);
    auto it = latestTelemetry_.find(vehicleId);
    if (it == latestTelemetry_.end() || it->second.expiresAt <= clock_->now()) {
        return std::nullopt;
    }
    return it->second.telemetry;
}

IngestCounters IngestionCoordinator::counters() const {
    IngestCounters snapshot;
    snapshot.accepted = counters_.accepted.load();
    snapshot.staleIgnored = counters_.staleIgnored.load();
    snapshot.rejected = counters_.rejected.load();
    snapshot.queueDropped = counters_.queueDropped.load();
    snapshot.historyFailures = counters_.historyFailures.load();
    snapshot.logFailures = counters_.logFailures.load();
    snapshot.logRetries = counters_.logRetries.load();
    snapshot.logGaveUp = counters_.logGaveUp.load();
    snapshot.zoneErrors = counters_.zoneErrors.load();
    snapshot.staleRegistrySkips = counters_.staleRegistrySkips.load();
    snapshot.telemetryAccepted = counters_.telemetryAccepted.load();
    snapshot.alarmsRaised = counters_.alarmsRaised.load();
    return snapshot;
}

} // namespace rtsae::domain
