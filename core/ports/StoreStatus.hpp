#pragma once

#include <string>

namespace rtsae::ports {

enum class StoreStatus {
    Written,
    Stale,      // ts not newer than stored, or id already present
    Timeout,
    NotFound,
    Failed
};

inline std::string storeStatusToString(StoreStatus status) {
    switch (status) {
        case StoreStatus::Written: return "written";
        case StoreStatus::Stale: return "stale";
        case StoreStatus::Timeout: return "timeout";
        case StoreStatus::NotFound: return "not_found";
        case StoreStatus::Failed: return "failed";
    }
    return "failed";
}

} // namespace rtsae::ports
