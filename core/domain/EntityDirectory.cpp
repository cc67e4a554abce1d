#include "EntityDirectory.hpp"
#include <algorithm>

namespace rtsae::domain {

bool InMemoryEntityDirectory::tenantExists(const std::string& tenantId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tenants_.count(tenantId) > 0;
}

bool InMemoryEntityDirectory::vehicleExists(const std::string& tenantId, const std::string& vehicleId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tenants_.find(tenantId);
    return it != tenants_.end() && it->second.count(vehicleId) > 0;
}

void InMemoryEntityDirectory::registerVehicle(const std::string& tenantId, const std::string& vehicleId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    tenants_[tenantId].insert(vehicleId);
}

bool InMemoryEntityDirectory::removeVehicle(const std::string& tenantId, const std::string& vehicleId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tenants_.find(tenantId);
    if (it == tenants_.end() || it->second.erase(vehicleId) == 0) {
        return false;
    }
    if (it->second.empty()) {
        tenants_.erase(it);
    }
    return true;
}

std::set<std::string> InMemoryEntityDirectory::vehicles(const std::string& tenantId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tenants_.find(tenantId);
    return it == tenants_.end() ? std::set<std::string>{} : it->second;
}

CachedEntityDirectory::CachedEntityDirectory(std::shared_ptr<ports::IEntityDirectory> directory,
                                             std::shared_ptr<IClock> clock,
                                             std::chrono::seconds ttl,
                                             std::size_t maxEntries)
    : directory_(std::move(directory)),
      clock_(std::move(clock)),
      ttl_(ttl),
      maxEntries_(std::max<std::size_t>(maxEntries, 1)) {
}

template <typename Lookup>
bool CachedEntityDirectory::cached(const std::string& key, Lookup&& lookup) const {
    auto now = clock_->now();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = answers_.find(key);
        if (it != answers_.end() && it->second.expiresAt > now) {
            return it->second.exists;
        }
    }

    bool exists = lookup();

    std::lock_guard<std::mutex> lock(mutex_);
    if (answers_.count(key) == 0) {
        makeRoomLocked(now);
    }
    answers_[key] = CachedAnswer{exists, now + ttl_};
    return exists;
}

std::size_t CachedEntityDirectory::eraseExpiredLocked(Timestamp now) const {
    std::size_t removed = 0;
    for (auto it = answers_.begin(); it != answers_.end();) {
        if (it->second.expiresAt <= now) {
            it = answers_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void CachedEntityDirectory::makeRoomLocked(Timestamp now) const {
    if (answers_.size() < maxEntries_) {
        return;
    }
    eraseExpiredLocked(now);
    if (answers_.size() < maxEntries_) {
        return;
    }
    auto oldest = std::min_element(answers_.begin(), answers_.end(), [](const auto& a, const auto& b) {
        return a.second.expiresAt < b.second.expiresAt;
    });
    answers_.erase(oldest);
}

bool CachedEntityDirectory::tenantExists(const std::string& tenantId) const {
    return cached("t|" + tenantId, [&] { return directory_->tenantExists(tenantId); });
}

bool CachedEntityDirectory::vehicleExists(const std::string& tenantId, const std::string& vehicleId) const {
    return cached("v|" + tenantId + "|" + vehicleId,
                  [&] { return directory_->vehicleExists(tenantId, vehicleId); });
}

void CachedEntityDirectory::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    answers_.clear();
}

std::size_t CachedEntityDirectory::purgeExpired() {
    auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    return eraseExpiredLocked(now);
}

std::size_t CachedEntityDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return answers_.size();
}

} // namespace rtsae::domain
