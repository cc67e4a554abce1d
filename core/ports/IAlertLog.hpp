#pragma once

#include "StoreStatus.hpp"
#include "../Model.hpp"
#include <array>
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rtsae::ports {

struct AlertQuery {
    std::optional<std::string> tenantId;
    std::optional<std::string> vehicleId;
    std::optional<std::string> driverId;
    std::optional<Severity> severity;
    std::optional<AlertStatus> status;
    std::optional<AlertKind> kind;
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;

    std::size_t page = 1;       // 1-based
    std::size_t pageSize = 0;   // 0 selects the configured default
};

struct AlertPage {
    std::vector<AlertRecord> items;
    std::size_t total = 0;
    std::size_t page = 1;
    std::size_t pageSize = 0;
};

struct AlertStats {
    std::size_t total = 0;
    std::map<std::string, std::size_t> bySeverity;
    std::array<std::size_t, 24> byHour{};
    std::vector<std::pair<std::string, std::size_t>> topZones;
};

class IAlertLog {
public:
    virtual ~IAlertLog() = default;

    // Idempotent on alertId: a second append of the same id returns Stale.
    virtual StoreStatus append(const AlertRecord& record, std::chrono::milliseconds deadline) = 0;

    virtual StoreStatus updateStatus(const std::string& alertId, AlertStatus status,
                                     Timestamp at, const std::string& by,
                                     std::chrono::milliseconds deadline) = 0;

    virtual std::optional<AlertRecord> find(const std::string& alertId) const = 0;
    virtual AlertPage query(const AlertQuery& query) const = 0;
};

} // namespace rtsae::ports
