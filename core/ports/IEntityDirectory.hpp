#pragma once

#include <string>

namespace rtsae::ports {

class IEntityDirectory {
public:
    virtual ~IEntityDirectory() = default;

    virtual bool tenantExists(const std::string& tenantId) const = 0;
    virtual bool vehicleExists(const std::string& tenantId, const std::string& vehicleId) const = 0;
};

} // namespace rtsae::ports
