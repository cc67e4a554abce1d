#pragma once

#include "StoreStatus.hpp"
#include "../Model.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rtsae::ports {

// One page of a vehicle track, newest first. page is 1-based.
struct HistoryPage {
    std::vector<Fix> fixes;
    std::size_t page = 1;
    std::size_t limit = 0;
    std::size_t total = 0;
};

class IPositionStore {
public:
    virtual ~IPositionStore() = default;

    // Last-writer-wins under ts. Also refreshes the shipment key when the fix carries one.
    virtual StoreStatus putLatest(const Fix& fix, std::chrono::milliseconds deadline) = 0;
    virtual std::optional<Fix> getLatest(const std::string& vehicleId) const = 0;
    virtual std::optional<Fix> getLatestForShipment(const std::string& shipmentId) const = 0;

    virtual StoreStatus appendHistory(const Fix& fix, std::chrono::milliseconds deadline) = 0;

    // Inclusive range, newest first.
    virtual std::vector<Fix> queryHistory(const std::string& vehicleId,
                                          Timestamp from, Timestamp to,
                                          std::size_t limit) const = 0;
    virtual HistoryPage queryHistoryPage(const std::string& vehicleId,
                                         Timestamp from, Timestamp to,
                                         std::size_t page, std::size_t limit) const = 0;

    // Every fix tagged with the shipment, across the vehicles that carried it.
    virtual std::vector<Fix> queryShipmentHistory(const std::string& shipmentId,
                                                  Timestamp from, Timestamp to,
                                                  std::size_t limit) const = 0;

    virtual std::vector<Fix> latestForTenant(const std::string& tenantId) const = 0;
    virtual std::size_t purgeExpired() = 0;
};

} // namespace rtsae::ports
