#pragma once

#include "../ports/IEntityDirectory.hpp"
#include "../IClock.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace rtsae::domain {

// Tenants and their vehicles. A tenant exists once it has a registered vehicle.
class InMemoryEntityDirectory : public ports::IEntityDirectory {
public:
    bool tenantExists(const std::string& tenantId) const override;
    bool vehicleExists(const std::string& tenantId, const std::string& vehicleId) const override;

    void registerVehicle(const std::string& tenantId, const std::string& vehicleId);
    bool removeVehicle(const std::string& tenantId, const std::string& vehicleId);

    std::set<std::string> vehicles(const std::string& tenantId) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::set<std::string>> tenants_;
};

// Memoizes lookups against a slower directory, negative answers included.
// Keys come from untrusted topics, so the cache is bounded: once full, expired
// answers are swept and then the answer closest to expiry makes room.
class CachedEntityDirectory : public ports::IEntityDirectory {
public:
    CachedEntityDirectory(std::shared_ptr<ports::IEntityDirectory> directory,
                          std::shared_ptr<IClock> clock,
                          std::chrono::seconds ttl,
                          std::size_t maxEntries = 10000);

    bool tenantExists(const std::string& tenantId) const override;
    bool vehicleExists(const std::string& tenantId, const std::string& vehicleId) const override;

    void invalidate();
    std::size_t purgeExpired();
    std::size_t size() const;

private:
    struct CachedAnswer {
        bool exists = false;
        Timestamp expiresAt;
    };

    template <typename Lookup>
    bool cached(const std::string& key, Lookup&& lookup) const;

    // Caller holds mutex_.
    std::size_t eraseExpiredLocked(Timestamp now) const;
    void makeRoomLocked(Timestamp now) const;

    std::shared_ptr<ports::IEntityDirectory> directory_;
    std::shared_ptr<IClock> clock_;
    std::chrono::seconds ttl_;
    std::size_t maxEntries_;

    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, CachedAnswer> answers_;
};

} // namespace rtsae::domain
