#pragma once

#include "../ports/IPositionStore.hpp"
#include "../EngineConfig.hpp"
#include "../IClock.hpp"
#include <deque>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace rtsae::domain {

// In-memory hot cache plus bounded track history. Keys are spread over shards,
// each behind its own timed reader/writer lock; a writer that cannot take its
// shard before the deadline reports Timeout and leaves the store untouched.
class PositionStore : public ports::IPositionStore {
public:
    PositionStore(std::shared_ptr<IClock> clock, StoreConfig config = {});
    ~PositionStore() override = default;

    ports::StoreStatus putLatest(const Fix& fix, std::chrono::milliseconds deadline) override;
    std::optional<Fix> getLatest(const std::string& vehicleId) const override;
    std::optional<Fix> getLatestForShipment(const std::string& shipmentId) const override;

    ports::StoreStatus appendHistory(const Fix& fix, std::chrono::milliseconds deadline) override;
    std::vector<Fix> queryHistory(const std::string& vehicleId,
                                  Timestamp from, Timestamp to,
                                  std::size_t limit) const override;

    ports::HistoryPage queryHistoryPage(const std::string& vehicleId,
                                        Timestamp from, Timestamp to,
                                        std::size_t page, std::size_t limit) const override;
    std::vector<Fix> queryShipmentHistory(const std::string& shipmentId,
                                          Timestamp from, Timestamp to,
                                          std::size_t limit) const override;

    std::vector<Fix> latestForTenant(const std::string& tenantId) const override;
    std::size_t purgeExpired() override;

    std::size_t historySize(const std::string& vehicleId) const;

private:
    struct HotEntry {
        Fix fix;
        Timestamp expiresAt;
    };

    struct Shard {
        mutable std::shared_timed_mutex mutex;
        std::unordered_map<std::string, HotEntry> vehicles;
        std::unordered_map<std::string, HotEntry> shipments;
        std::unordered_map<std::string, std::deque<Fix>> history;
        // Ordered by ts; a shipment may move between vehicles.
        std::unordered_map<std::string, std::deque<Fix>> shipmentHistory;
    };

    std::size_t shardIndex(const std::string& key) const;
    Shard& shardFor(const std::string& key);
    const Shard& shardFor(const std::string& key) const;

    std::optional<Fix> readHot(const std::string& key, bool isShipment) const;
    std::size_t clampLimit(std::size_t limit, std::size_t fallback) const;
    static void appendShipmentFix(std::deque<Fix>& track, const Fix& fix);

    std::shared_ptr<IClock> clock_;
    StoreConfig config_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace rtsae::domain
