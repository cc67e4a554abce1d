#include "GatedPositionStore.hpp"

namespace rtsae::sim {

GatedPositionStore::GatedPositionStore(std::shared_ptr<ports::IPositionStore> inner)
    : inner_(std::move(inner)), released_(release_.get_future().share()) {
}

ports::StoreStatus GatedPositionStore::putLatest(const Fix& fix, std::chrono::milliseconds deadline) {
    if (first_.exchange(false)) {
        entered_.set_value();
        released_.wait();
    }
    return inner_->putLatest(fix, deadline);
}

std::optional<Fix> GatedPositionStore::getLatest(const std::string& vehicleId) const {
    return inner_->getLatest(vehicleId);
}

std::optional<Fix> GatedPositionStore::getLatestForShipment(const std::string& shipmentId) const {
    return inner_->getLatestForShipment(shipmentId);
}

ports::StoreStatus GatedPositionStore::appendHistory(const Fix& fix, std::chrono::milliseconds deadline) {
    return inner_->appendHistory(fix, deadline);
}

std::vector<Fix> GatedPositionStore::queryHistory(const std::string& vehicleId, Timestamp from,
                                                  Timestamp to, std::size_t limit) const {
    return inner_->queryHistory(vehicleId, from, to, limit);
}

ports::HistoryPage GatedPositionStore::queryHistoryPage(const std::string& vehicleId, Timestamp from,
                                                        Timestamp to, std::size_t page,
                                                        std::size_t limit) const {
    return inner_->queryHistoryPage(vehicleId, from, to, page, limit);
}

std::vector<Fix> GatedPositionStore::queryShipmentHistory(const std::string& shipmentId, Timestamp from,
                                                          Timestamp to, std::size_t limit) const {
    return inner_->queryShipmentHistory(shipmentId, from, to, limit);
}

std::vector<Fix> GatedPositionStore::latestForTenant(const std::string& tenantId) const {
    return inner_->latestForTenant(tenantId);
}

std::size_t GatedPositionStore::purgeExpired() {
    return inner_->purgeExpired();
}

std::future<void> GatedPositionStore::entered() {
    return entered_.get_future();
}

void GatedPositionStore::release() {
    release_.set_value();
}

} // namespace rtsae::sim
