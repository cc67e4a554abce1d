#pragma once

#include "../ports/IAlertLog.hpp"
#include "../EngineConfig.hpp"
#include "../IClock.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rtsae::domain {

/**
 * @brief In-memory alert log keyed by alertId.
 *
 * Geofence and accident-proximity alerts only. Entries expire after the
 * configured retention measured from emission time.
 */
class AlertLog : public ports::IAlertLog {
public:
    AlertLog(std::shared_ptr<IClock> clock, AlertLogConfig config = {});
    ~AlertLog() override = default;

    ports::StoreStatus append(const AlertRecord& record, std::chrono::milliseconds deadline) override;
    ports::StoreStatus updateStatus(const std::string& alertId, AlertStatus status,
                                    Timestamp at, const std::string& by,
                                    std::chrono::milliseconds deadline) override;

    std::optional<AlertRecord> find(const std::string& alertId) const override;
    ports::AlertPage query(const ports::AlertQuery& query) const override;

    ports::StoreStatus acknowledge(const std::string& alertId, const std::string& by);
    ports::StoreStatus resolve(const std::string& alertId);

    ports::AlertStats stats(const std::optional<std::string>& vehicleId = std::nullopt,
                            std::optional<Timestamp> since = std::nullopt) const;

    std::size_t activeCount(const std::optional<std::string>& vehicleId = std::nullopt) const;

    std::size_t purgeExpired();
    std::size_t purgeResolvedOlderThan(std::chrono::hours age);

    std::size_t size() const;

private:
    static bool matches(const AlertRecord& record, const ports::AlertQuery& query);

    std::shared_ptr<IClock> clock_;
    AlertLogConfig config_;

    mutable std::timed_mutex mutex_;
    std::unordered_map<std::string, AlertRecord> records_;
};

} // namespace rtsae::domain
