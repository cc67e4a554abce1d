#include "PositionStore.hpp"
#include <algorithm>
#include <functional>
#include <iterator>
#include <mutex>

namespace rtsae::domain {

namespace {

std::string shipmentKey(const std::string& shipmentId) {
    return "shipment:" + shipmentId;
}

} // namespace

PositionStore::PositionStore(std::shared_ptr<IClock> clock, StoreConfig config)
    : clock_(clock), config_(config) {
    std::size_t count = std::max<std::size_t>(config_.shardCount, 1);
    shards_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

std::size_t PositionStore::shardIndex(const std::string& key) const {
    return std::hash<std::string>{}(key) % shards_.size();
}

PositionStore::Shard& PositionStore::shardFor(const std::string& key) {
    return *shards_[shardIndex(key)];
}

const PositionStore::Shard& PositionStore::shardFor(const std::string& key) const {
    return *shards_[shardIndex(key)];
}

ports::StoreStatus PositionStore::putLatest(const Fix& fix, std::chrono::milliseconds deadline) {
    auto until = std::chrono::steady_clock::now() + deadline;

    std::size_t vehicleShard = shardIndex(fix.vehicleId);
    std::vector<std::size_t> lockOrder{vehicleShard};
    std::size_t shipmentShard = vehicleShard;
    if (fix.shipmentId) {
        shipmentShard = shardIndex(shipmentKey(*fix.shipmentId));
        if (shipmentShard != vehicleShard) {
            lockOrder.push_back(shipmentShard);
        }
    }
    // Fixed order so two writers never wait on each other crosswise.
    std::sort(lockOrder.begin(), lockOrder.end());

    std::vector<std::unique_lock<std::shared_timed_mutex>> locks;
    for (auto index : lockOrder) {
        std::unique_lock<std::shared_timed_mutex> lock(shards_[index]->mutex, std::defer_lock);
        if (!lock.try_lock_until(until)) {
            return ports::StoreStatus::Timeout;
        }
        locks.push_back(std::move(lock));
    }

    auto& vehicles = shards_[vehicleShard]->vehicles;
    auto it = vehicles.find(fix.vehicleId);
    if (it != vehicles.end() && fix.ts <= it->second.fix.ts) {
        return ports::StoreStatus::Stale;
    }

    Timestamp expiresAt = clock_->now() + config_.hotTtl;
    vehicles[fix.vehicleId] = HotEntry{fix, expiresAt};

    if (fix.shipmentId) {
        auto& shipments = shards_[shipmentShard]->shipments;
        auto key = shipmentKey(*fix.shipmentId);
        auto sit = shipments.find(key);
        if (sit == shipments.end() || fix.ts > sit->second.fix.ts) {
            shipments[key] = HotEntry{fix, expiresAt};
        }
    }

    return ports::StoreStatus::Written;
}

std::optional<Fix> PositionStore::readHot(const std::string& key, bool isShipment) const {
    const Shard& shard = shardFor(key);
    std::shared_lock<std::shared_timed_mutex> lock(shard.mutex);

    const auto& table = isShipment ? shard.shipments : shard.vehicles;
    auto it = table.find(key);
    if (it == table.end() || it->second.expiresAt <= clock_->now()) {
        return std::nullopt;
    }
    return it->second.fix;
}

std::optional<Fix> PositionStore::getLatest(const std::string& vehicleId) const {
    return readHot(vehicleId, false);
}

std::optional<Fix> PositionStore::getLatestForShipment(const std::string& shipmentId) const {
    return readHot(shipmentKey(shipmentId), true);
}

ports::StoreStatus PositionStore::appendHistory(const Fix& fix, std::chrono::milliseconds deadline) {
    auto until = std::chrono::steady_clock::now() + deadline;

    std::size_t vehicleShard = shardIndex(fix.vehicleId);
    std::vector<std::size_t> lockOrder{vehicleShard};
    std::size_t shipmentShard = vehicleShard;
    if (fix.shipmentId) {
        shipmentShard = shardIndex(shipmentKey(*fix.shipmentId));
        if (shipmentShard != vehicleShard) {
            lockOrder.push_back(shipmentShard);
        }
    }
    std::sort(lockOrder.begin(), lockOrder.end());

    std::vector<std::unique_lock<std::shared_timed_mutex>> locks;
    for (auto index : lockOrder) {
        std::unique_lock<std::shared_timed_mutex> lock(shards_[index]->mutex, std::defer_lock);
        if (!lock.try_lock_until(until)) {
            return ports::StoreStatus::Timeout;
        }
        locks.push_back(std::move(lock));
    }

    auto& track = shards_[vehicleShard]->history[fix.vehicleId];
    if (!track.empty() && fix.ts <= track.back().ts) {
        return ports::StoreStatus::Stale;
    }
    track.push_back(fix);

    Timestamp cutoff = clock_->now() - config_.historyRetention;
    while (!track.empty() && track.front().ts < cutoff) {
        track.pop_front();
    }

    if (fix.shipmentId) {
        auto& shipmentTrack = shards_[shipmentShard]->shipmentHistory[*fix.shipmentId];
        appendShipmentFix(shipmentTrack, fix);
        while (!shipmentTrack.empty() && shipmentTrack.front().ts < cutoff) {
            shipmentTrack.pop_front();
        }
    }
    return ports::StoreStatus::Written;
}

void PositionStore::appendShipmentFix(std::deque<Fix>& track, const Fix& fix) {
    auto pos = std::upper_bound(track.begin(), track.end(), fix.ts,
                                [](Timestamp ts, const Fix& stored) { return ts < stored.ts; });
    for (auto it = pos; it != track.begin() && std::prev(it)->ts == fix.ts; --it) {
        if (std::prev(it)->vehicleId == fix.vehicleId) {
            return;
        }
    }
    track.insert(pos, fix);
}

std::size_t PositionStore::clampLimit(std::size_t limit, std::size_t fallback) const {
    if (limit == 0) {
        limit = fallback;
    }
    return std::min(limit, config_.maxQueryLimit);
}

std::vector<Fix> PositionStore::queryHistory(const std::string& vehicleId,
                                             Timestamp from, Timestamp to,
                                             std::size_t limit) const {
    return queryHistoryPage(vehicleId, from, to, 1, limit).fixes;
}

ports::HistoryPage PositionStore::queryHistoryPage(const std::string& vehicleId,
                                                   Timestamp from, Timestamp to,
                                                   std::size_t page, std::size_t limit) const {
    ports::HistoryPage result;
    result.page = std::max<std::size_t>(page, 1);
    result.limit = clampLimit(limit, config_.defaultQueryLimit);
    std::size_t skip = (result.page - 1) * result.limit;

    const Shard& shard = shardFor(vehicleId);
    std::shared_lock<std::shared_timed_mutex> lock(shard.mutex);

    auto it = shard.history.find(vehicleId);
    if (it == shard.history.end()) {
        return result;
    }

    for (auto fix = it->second.rbegin(); fix != it->second.rend(); ++fix) {
        if (fix->ts > to) continue;
        if (fix->ts < from) break;
        if (result.total >= skip && result.fixes.size() < result.limit) {
            result.fixes.push_back(*fix);
        }
        ++result.total;
    }
    return result;
}

std::vector<Fix> PositionStore::queryShipmentHistory(const std::string& shipmentId,
                                                     Timestamp from, Timestamp to,
                                                     std::size_t limit) const {
    limit = clampLimit(limit, config_.shipmentQueryLimit);

    std::vector<Fix> result;
    const Shard& shard = shardFor(shipmentKey(shipmentId));
    std::shared_lock<std::shared_timed_mutex> lock(shard.mutex);

    auto it = shard.shipmentHistory.find(shipmentId);
    if (it == shard.shipmentHistory.end()) {
        return result;
    }

    for (auto fix = it->second.rbegin(); fix != it->second.rend() && result.size() < limit; ++fix) {
        if (fix->ts > to) continue;
        if (fix->ts < from) break;
        result.push_back(*fix);
    }
    return result;
}

std::vector<Fix> PositionStore::latestForTenant(const std::string& tenantId) const {
    std::vector<Fix> result;
    Timestamp now = clock_->now();

    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_timed_mutex> lock(shard->mutex);
        for (const auto& [vehicleId, entry] : shard->vehicles) {
            if (entry.fix.tenantId == tenantId && entry.expiresAt > now) {
                result.push_back(entry.fix);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const Fix& a, const Fix& b) {
        return a.vehicleId < b.vehicleId;
    });
    return result;
}

std::size_t PositionStore::purgeExpired() {
    std::size_t removed = 0;
    Timestamp now = clock_->now();
    Timestamp cutoff = now - config_.historyRetention;

    for (auto& shard : shards_) {
        std::unique_lock<std::shared_timed_mutex> lock(shard->mutex);

        for (auto* table : {&shard->vehicles, &shard->shipments}) {
            for (auto it = table->begin(); it != table->end();) {
                if (it->second.expiresAt <= now) {
                    it = table->erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }

        for (auto* tracks : {&shard->history, &shard->shipmentHistory}) {
            for (auto it = tracks->begin(); it != tracks->end();) {
                auto& track = it->second;
                while (!track.empty() && track.front().ts < cutoff) {
                    track.pop_front();
                    ++removed;
                }
                if (track.empty()) {
                    it = tracks->erase(it);
                } else {
                    ++it;
                }
            }
        }
    }
    return removed;
}

std::size_t PositionStore::historySize(const std::string& vehicleId) const {
    const Shard& shard = shardFor(vehicleId);
    std::shared_lock<std::shared_timed_mutex> lock(shard.mutex);
    auto it = shard.history.find(vehicleId);
    return it == shard.history.end() ? 0 : it->second.size();
}

} // namespace rtsae::domain
