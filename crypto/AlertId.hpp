#pragma once

#include "../core/Model.hpp"
#include <string>

namespace rtsae {

// Deterministic alert identifier derived from the idempotency key
// {vehicleId, zoneId, transitionTs}. A retried log write reuses the same id.
class AlertId {
public:
    static std::string derive(const std::string& vehicleId,
                              const std::string& zoneId,
                              Timestamp transitionTs);

    static std::string sha256Hex(const std::string& data);

private:
    static std::string idempotencyKey(const std::string& vehicleId,
                                      const std::string& zoneId,
                                      Timestamp transitionTs);
};

} // namespace rtsae
