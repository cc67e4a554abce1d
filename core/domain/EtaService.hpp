#pragma once

#include "../ports/IPositionStore.hpp"
#include "../EngineConfig.hpp"
#include "../IClock.hpp"
#include "../Model.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace rtsae::domain {

enum class Confidence {
    High,
    Medium,
    Low
};

std::string confidenceToString(Confidence confidence);

enum class EtaStatus {
    Ok,
    NoLocation,
    InvalidRequest
};

struct EtaEstimate {
    double remainingDistanceKm = 0.0;
    double speedEstimateKmh = 0.0;
    double etaSeconds = 0.0;
    Confidence confidence = Confidence::Low;
    std::size_t sampleCount = 0;
    Timestamp positionTs{};
};

struct EtaResult {
    EtaStatus status = EtaStatus::Ok;
    std::optional<EtaEstimate> estimate;
    std::string errorMessage;

    bool ok() const { return status == EtaStatus::Ok; }
};

/**
 * @brief Great-circle ETA from the hot position to a destination.
 *
 * Speed comes from the vehicle's recent track when enough samples carry a
 * speed; otherwise the last reported speed, otherwise the configured default.
 */
class EtaService {
public:
    EtaService(std::shared_ptr<ports::IPositionStore> store,
               std::shared_ptr<IClock> clock,
               EtaConfig config = {});

    EtaResult estimateForVehicle(const std::string& vehicleId, const GeoPoint& destination) const;
    EtaResult estimateForShipment(const std::string& shipmentId, const GeoPoint& destination) const;

private:
    EtaResult estimateFrom(const std::optional<Fix>& latest, const GeoPoint& destination) const;

    std::shared_ptr<ports::IPositionStore> store_;
    std::shared_ptr<IClock> clock_;
    EtaConfig config_;
};

} // namespace rtsae::domain
