#pragma once

#include "../ports/IAlertLog.hpp"
#include "../ports/IEntityDirectory.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/IPositionStore.hpp"
#include "../ports/ISubscriptionBus.hpp"
#include "../EngineConfig.hpp"
#include "../IClock.hpp"
#include "../Model.hpp"
#include "AccidentProximityEngine.hpp"
#include "GeofenceEngine.hpp"
#include "TelemetryEvaluator.hpp"
#include "WorkerPool.hpp"
#include "ZoneRegistry.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rtsae::domain {

enum class IngestStatus {
    Accepted,
    StaleIgnored,
    Rejected
};

std::string ingestStatusToString(IngestStatus status);

struct IngestOutcome {
    IngestStatus status = IngestStatus::Accepted;
    std::string reason;
    std::vector<GeofenceEdge> edges;
    std::optional<std::string> accidentAlertId;
};

struct TelemetryOutcome {
    IngestStatus status = IngestStatus::Accepted;
    std::string reason;
    std::vector<Alarm> alarms;
};

struct IngestCounters {
    std::uint64_t accepted = 0;
    std::uint64_t staleIgnored = 0;
    std::uint64_t rejected = 0;
    std::uint64_t queueDropped = 0;
    std::uint64_t historyFailures = 0;
    std::uint64_t logFailures = 0;
    std::uint64_t logRetries = 0;
    std::uint64_t logGaveUp = 0;
    std::uint64_t zoneErrors = 0;
    std::uint64_t staleRegistrySkips = 0;
    std::uint64_t telemetryAccepted = 0;
    std::uint64_t alarmsRaised = 0;
};

/**
 * @brief End-to-end path for incoming fixes and telemetry.
 *
 * Fixes are validated on the caller's thread, then queued on a per-vehicle
 * lane. At most one task drains a lane at a time, so every effect of a fix
 * (store writes, geofence and proximity evaluation, publication, alert log
 * writes) completes before the next fix of the same vehicle starts. Lanes of
 * different vehicles run in parallel on the worker pool.
 *
 * Alert log writes that miss their deadline are retried with the policy
 * engine's backoff. The alert id is derived from the idempotency key, so a
 * retried append never duplicates a record.
 */
class IngestionCoordinator {
public:
    IngestionCoordinator(std::shared_ptr<ports::IEntityDirectory> directory,
                         std::shared_ptr<ports::IPositionStore> store,
                         std::shared_ptr<ZoneRegistry> registry,
                         std::shared_ptr<ports::ISubscriptionBus> bus,
                         std::shared_ptr<ports::IAlertLog> alertLog,
                         std::shared_ptr<ports::IPolicyEngine> policyEngine,
                         std::shared_ptr<IClock> clock,
                         const EngineConfig& config);
    ~IngestionCoordinator();

    IngestionCoordinator(const IngestionCoordinator&) = delete;
    IngestionCoordinator& operator=(const IngestionCoordinator&) = delete;

    std::future<IngestOutcome> submit(const Fix& fix);
    IngestOutcome ingest(const Fix& fix);

    TelemetryOutcome submitTelemetry(const Telemetry& telemetry);
    std::optional<Telemetry> getLatestTelemetry(const std::string& vehicleId) const;

    void processRetries();
    std::size_t pendingRetries() const;

    IngestCounters counters() const;

    void shutdown();

private:
    struct VehicleContext {
        std::optional<Timestamp> lastAcceptedTs;
        MembershipTable memberships;
        ProximityTable proximity;
    };

    struct PendingFix {
        Fix fix;
        std::promise<IngestOutcome> promise;
    };

    struct VehicleLane {
        std::mutex mutex;
        std::deque<PendingFix> queue;
        bool scheduled = false;
        // Touched only by the task currently draining the lane.
        VehicleContext context;
    };

    enum class LogOp {
        Append,
        Resolve
    };

    struct PendingLogWrite {
        LogOp op = LogOp::Append;
        AlertRecord record;
        std::string alertId;
        Timestamp at{};
        int attempts = 0;
        Timestamp nextRetry{};
    };

    struct CachedTelemetry {
        Telemetry telemetry;
        Timestamp expiresAt;
    };

    std::optional<std::string> validate(const Fix& fix) const;
    std::optional<std::string> validateIdentity(const std::string& tenantId,
                                                const std::string& vehicleId) const;

    std::shared_ptr<VehicleLane> laneFor(const std::string& vehicleId);
    void scheduleLane(const std::shared_ptr<VehicleLane>& lane);
    void drainLane(const std::shared_ptr<VehicleLane>& lane);
    void rejectQueued(const std::shared_ptr<VehicleLane>& lane, const std::string& reason);

    IngestOutcome process(const Fix& fix, VehicleContext& context);

    void publishLocation(const Fix& fix, Timestamp serverTs);
    void publishAlert(const AlertRecord& record, Timestamp serverTs);

    AlertRecord geofenceRecord(const Fix& fix, const GeofenceEdge& edge, Timestamp now) const;
    AlertRecord accidentRecord(const Fix& fix, const ProximityActivation& activation, Timestamp now) const;

    void writeAlert(const AlertRecord& record);
    void resolveAlert(const std::string& alertId, Timestamp at);
    ports::StoreStatus attempt(const PendingLogWrite& pending);
    void enqueueRetry(PendingLogWrite pending);

    IngestOutcome reject(const std::string& reason);

    std::shared_ptr<ports::IEntityDirectory> directory_;
    std::shared_ptr<ports::IPositionStore> store_;
    std::shared_ptr<ZoneRegistry> registry_;
    std::shared_ptr<ports::ISubscriptionBus> bus_;
    std::shared_ptr<ports::IAlertLog> alertLog_;
    std::shared_ptr<ports::IPolicyEngine> policyEngine_;
    std::shared_ptr<IClock> clock_;

    IngestionConfig config_;
    GeofenceEngine geofenceEngine_;
    AccidentProximityEngine proximityEngine_;
    TelemetryEvaluator telemetryEvaluator_;

    std::mutex lanesMutex_;
    std::unordered_map<std::string, std::shared_ptr<VehicleLane>> lanes_;

    mutable std::mutex retryMutex_;
    std::deque<PendingLogWrite> retryQueue_;

    mutable std::mutex telemetryMutex_;
    std::unordered_map<std::string, CachedTelemetry> latestTelemetry_;

    struct Counters {
        std::atomic<std::uint64_t> accepted{0};
        std::atomic<std::uint64_t> staleIgnored{0};
        std::atomic<std::uint64_t> rejected{0};
        std::atomic<std::uint64_t> queueDropped{0};
        std::atomic<std::uint64_t> historyFailures{0};
        std::atomic<std::uint64_t> logFailures{0};
        std::atomic<std::uint64_t> logRetries{0};
        std::atomic<std::uint64_t> logGaveUp{0};
        std::atomic<std::uint64_t> zoneErrors{0};
        std::atomic<std::uint64_t> staleRegistrySkips{0};
        std::atomic<std::uint64_t> telemetryAccepted{0};
        std::atomic<std::uint64_t> alarmsRaised{0};
    } counters_;

    // Declared last: workers are joined before anything they touch is destroyed.
    WorkerPool pool_;
};

} // namespace rtsae::domain
