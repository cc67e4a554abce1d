#pragma once

#include "../ports/IPositionStore.hpp"
#include <atomic>
#include <future>
#include <memory>

namespace rtsae::sim {

// Forwards to an inner store, but holds the first putLatest until release().
// Lets tests back up a vehicle lane at a known point.
class GatedPositionStore : public ports::IPositionStore {
public:
    explicit GatedPositionStore(std::shared_ptr<ports::IPositionStore> inner);

    ports::StoreStatus putLatest(const Fix& fix, std::chrono::milliseconds deadline) override;
    std::optional<Fix> getLatest(const std::string& vehicleId) const override;
    std::optional<Fix> getLatestForShipment(const std::string& shipmentId) const override;

    ports::StoreStatus appendHistory(const Fix& fix, std::chrono::milliseconds deadline) override;
    std::vector<Fix> queryHistory(const std::string& vehicleId, Timestamp from, Timestamp to,
                                  std::size_t limit) const override;
    ports::HistoryPage queryHistoryPage(const std::string& vehicleId, Timestamp from, Timestamp to,
                                        std::size_t page, std::size_t limit) const override;
    std::vector<Fix> queryShipmentHistory(const std::string& shipmentId, Timestamp from, Timestamp to,
                                          std::size_t limit) const override;

    std::vector<Fix> latestForTenant(const std::string& tenantId) const override;
    std::size_t purgeExpired() override;

    // Ready once the gated write is blocked.
    std::future<void> entered();
    void release();

private:
    std::shared_ptr<ports::IPositionStore> inner_;
    std::atomic<bool> first_{true};
    std::promise<void> entered_;
    std::promise<void> release_;
    std::shared_future<void> released_;
};

} // namespace rtsae::sim
