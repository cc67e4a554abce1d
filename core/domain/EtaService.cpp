#include "EtaService.hpp"
#include "../Geo.hpp"
#include <algorithm>
#include <vector>

namespace rtsae::domain {

std::string confidenceToString(Confidence confidence) {
    switch (confidence) {
        case Confidence::High: return "high";
        case Confidence::Medium: return "medium";
        case Confidence::Low: return "low";
    }
    return "low";
}

EtaService::EtaService(std::shared_ptr<ports::IPositionStore> store,
                       std::shared_ptr<IClock> clock,
                       EtaConfig config)
    : store_(std::move(store)), clock_(std::move(clock)), config_(config) {
}

EtaResult EtaService::estimateForVehicle(const std::string& vehicleId, const GeoPoint& destination) const {
    if (vehicleId.empty()) {
        return EtaResult{EtaStatus::InvalidRequest, std::nullopt, "vehicleId is required"};
    }
    return estimateFrom(store_->getLatest(vehicleId), destination);
}

EtaResult EtaService::estimateForShipment(const std::string& shipmentId, const GeoPoint& destination) const {
    if (shipmentId.empty()) {
        return EtaResult{EtaStatus::InvalidRequest, std::nullopt, "shipmentId is required"};
    }
    return estimateFrom(store_->getLatestForShipment(shipmentId), destination);
}

EtaResult EtaService::estimateFrom(const std::optional<Fix>& latest, const GeoPoint& destination) const {
    if (!Geo::isValidCoordinate(destination.lat, destination.lon)) {
        return EtaResult{EtaStatus::InvalidRequest, std::nullopt, "destination out of range"};
    }
    if (!latest) {
        return EtaResult{EtaStatus::NoLocation, std::nullopt, "no_location"};
    }

    // History comes back newest first.
    auto history = store_->queryHistory(latest->vehicleId,
                                        latest->ts - config_.sampleWindow, latest->ts,
                                        0);
    std::vector<double> speeds;
    for (const auto& fix : history) {
        if (fix.speedKph) {
            speeds.push_back(*fix.speedKph);
        }
    }

    EtaEstimate estimate;
    estimate.positionTs = latest->ts;
    estimate.sampleCount = speeds.size();

    bool sampled = speeds.size() >= config_.minSamples;
    bool lastKnown = false;
    if (sampled) {
        double weight = 1.0;
        double weightedSum = 0.0;
        double weightTotal = 0.0;
        for (double speed : speeds) {
            weightedSum += weight * speed;
            weightTotal += weight;
            weight *= (1.0 - config_.smoothingAlpha);
        }
        estimate.speedEstimateKmh = std::clamp(weightedSum / weightTotal,
                                               config_.minSpeedKph, config_.maxSpeedKph);
    } else if (latest->speedKph && *latest->speedKph > 0.0) {
        estimate.speedEstimateKmh = *latest->speedKph;
        lastKnown = true;
    } else {
        estimate.speedEstimateKmh = config_.defaultSpeedKph;
    }

    estimate.remainingDistanceKm = Geo::distanceMeters(latest->point(), destination) / 1000.0;
    estimate.etaSeconds = estimate.remainingDistanceKm / estimate.speedEstimateKmh * 3600.0;

    auto age = clock_->now() - latest->ts;
    if (sampled && age <= config_.highConfidenceAge) {
        estimate.confidence = Confidence::High;
    } else if ((sampled || lastKnown) && age <= config_.mediumConfidenceAge) {
        estimate.confidence = Confidence::Medium;
    } else {
        estimate.confidence = Confidence::Low;
    }

    return EtaResult{EtaStatus::Ok, estimate, ""};
}

} // namespace rtsae::domain
