#include "AlertLog.hpp"
#include <algorithm>
#include <iostream>
#include <vector>

namespace rtsae::domain {

namespace {

// Generous lock wait for operator-driven calls that carry no deadline of their own.
constexpr std::chrono::milliseconds OPERATOR_DEADLINE{1000};

int utcHour(Timestamp ts) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    auto secondOfDay = seconds % 86400;
    if (secondOfDay < 0) {
        secondOfDay += 86400;
    }
    return static_cast<int>(secondOfDay / 3600);
}

} // namespace

AlertLog::AlertLog(std::shared_ptr<IClock> clock, AlertLogConfig config)
    : clock_(std::move(clock)), config_(config) {
}

ports::StoreStatus AlertLog::append(const AlertRecord& record, std::chrono::milliseconds deadline) {
    if (record.alertId.empty()) {
        std::cerr << "[AlertLog] Refusing record without alertId" << std::endl;
        return ports::StoreStatus::Failed;
    }

    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(deadline)) {
        return ports::StoreStatus::Timeout;
    }

    auto inserted = records_.emplace(record.alertId, record);
    return inserted.second ? ports::StoreStatus::Written : ports::StoreStatus::Stale;
}

ports::StoreStatus AlertLog::updateStatus(const std::string& alertId, AlertStatus status,
                                          Timestamp at, const std::string& by,
                                          std::chrono::milliseconds deadline) {
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(deadline)) {
        return ports::StoreStatus::Timeout;
    }

    auto it = records_.find(alertId);
    if (it == records_.end()) {
        return ports::StoreStatus::NotFound;
    }

    auto& record = it->second;
    if (record.status == AlertStatus::Resolved) {
        // Resolved is terminal.
        return ports::StoreStatus::Stale;
    }

    switch (status) {
        case AlertStatus::Acknowledged:
            if (record.status == AlertStatus::Acknowledged) {
                return ports::StoreStatus::Stale;
            }
            record.acknowledgedAt = at;
            if (!by.empty()) {
                record.acknowledgedBy = by;
            }
            break;
        case AlertStatus::Resolved:
            record.resolvedAt = at;
            break;
        case AlertStatus::Active:
            return ports::StoreStatus::Stale;
    }
    record.status = status;
    return ports::StoreStatus::Written;
}

std::optional<AlertRecord> AlertLog::find(const std::string& alertId) const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    auto it = records_.find(alertId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool AlertLog::matches(const AlertRecord& record, const ports::AlertQuery& query) {
    if (query.tenantId && record.tenantId != *query.tenantId) return false;
    if (query.vehicleId && record.vehicleId != *query.vehicleId) return false;
    if (query.driverId && record.driverId != *query.driverId) return false;
    if (query.severity && record.severity != *query.severity) return false;
    if (query.status && record.status != *query.status) return false;
    if (query.kind && record.kind != *query.kind) return false;
    if (query.from && record.emittedAt < *query.from) return false;
    if (query.to && record.emittedAt > *query.to) return false;
    return true;
}

ports::AlertPage AlertLog::query(const ports::AlertQuery& query) const {
    std::vector<AlertRecord> hits;
    {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        for (const auto& [id, record] : records_) {
            if (matches(record, query)) {
                hits.push_back(record);
            }
        }
    }

    std::sort(hits.begin(), hits.end(), [](const AlertRecord& a, const AlertRecord& b) {
        if (a.emittedAt != b.emittedAt) {
            return a.emittedAt > b.emittedAt;
        }
        return a.alertId < b.alertId;
    });

    ports::AlertPage page;
    page.total = hits.size();
    page.page = std::max<std::size_t>(query.page, 1);
    page.pageSize = query.pageSize == 0 ? config_.defaultPageSize
                                        : std::min(query.pageSize, config_.maxPageSize);

    std::size_t offset = (page.page - 1) * page.pageSize;
    if (offset >= hits.size()) {
        return page;
    }
    std::size_t end = std::min(hits.size(), offset + page.pageSize);
    page.items.assign(std::make_move_iterator(hits.begin() + offset),
                      std::make_move_iterator(hits.begin() + end));
    return page;
}

ports::StoreStatus AlertLog::acknowledge(const std::string& alertId, const std::string& by) {
    return updateStatus(alertId, AlertStatus::Acknowledged, clock_->now(), by, OPERATOR_DEADLINE);
}

ports::StoreStatus AlertLog::resolve(const std::string& alertId) {
    return updateStatus(alertId, AlertStatus::Resolved, clock_->now(), "", OPERATOR_DEADLINE);
}

ports::AlertStats AlertLog::stats(const std::optional<std::string>& vehicleId,
                                  std::optional<Timestamp> since) const {
    ports::AlertStats stats;
    std::map<std::string, std::size_t> zoneCounts;
    {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        for (const auto& [id, record] : records_) {
            if (vehicleId && record.vehicleId != *vehicleId) continue;
            if (since && record.emittedAt < *since) continue;

            ++stats.total;
            if (record.severity) {
                ++stats.bySeverity[severityToString(*record.severity)];
            }
            ++stats.byHour[static_cast<std::size_t>(utcHour(record.emittedAt))];
            ++zoneCounts[record.zoneId];
        }
    }

    stats.topZones.assign(zoneCounts.begin(), zoneCounts.end());
    std::stable_sort(stats.topZones.begin(), stats.topZones.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (stats.topZones.size() > config_.topZones) {
        stats.topZones.resize(config_.topZones);
    }
    return stats;
}

std::size_t AlertLog::activeCount(const std::optional<std::string>& vehicleId) const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(), [&](const auto& entry) {
        const auto& record = entry.second;
        return record.status == AlertStatus::Active &&
               (!vehicleId || record.vehicleId == *vehicleId);
    }));
}

std::size_t AlertLog::purgeExpired() {
    auto cutoff = clock_->now() - config_.retention;
    std::lock_guard<std::timed_mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (it->second.emittedAt < cutoff) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t AlertLog::purgeResolvedOlderThan(std::chrono::hours age) {
    auto cutoff = clock_->now() - age;
    std::lock_guard<std::timed_mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        const auto& record = it->second;
        if (record.status == AlertStatus::Resolved && record.resolvedAt && *record.resolvedAt < cutoff) {
            it = records_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        std::cout << "[AlertLog] Cleared " << removed << " resolved alerts" << std::endl;
    }
    return removed;
}

std::size_t AlertLog::size() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return records_.size();
}

} // namespace rtsae::domain
