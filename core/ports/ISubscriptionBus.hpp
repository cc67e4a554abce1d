#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace rtsae::ports {

struct BusEvent {
    std::string type;
    nlohmann::json body;
};

using BusEventPtr = std::shared_ptr<const BusEvent>;

class ISubscriber {
public:
    virtual ~ISubscriber() = default;

    virtual const std::string& id() const = 0;

    // Must not block past the deadline. false means the event could not be taken
    // and the bus will evict the subscriber.
    virtual bool offer(const std::string& topic, const BusEventPtr& event,
                       std::chrono::milliseconds deadline) = 0;

    virtual void close(const std::string& reason) = 0;
    virtual bool isOpen() const = 0;
};

class ISubscriptionBus {
public:
    virtual ~ISubscriptionBus() = default;

    virtual bool join(const std::string& topic, const std::shared_ptr<ISubscriber>& subscriber) = 0;
    virtual void leave(const std::string& topic, const std::string& subscriberId) = 0;
    virtual void leaveAll(const std::string& subscriberId) = 0;

    // Returns the number of subscribers that accepted the event.
    virtual std::size_t publish(const std::string& topic, const BusEventPtr& event) = 0;

    virtual std::size_t subscriberCount(const std::string& topic) const = 0;
};

namespace topics {

inline std::string vehicle(const std::string& id) { return "vehicle:" + id; }
inline std::string shipment(const std::string& id) { return "shipment:" + id; }
inline std::string tenant(const std::string& id) { return "tenant:" + id; }
inline std::string accidentZone(const std::string& id) { return "accident-zone:" + id; }
inline std::string chat(const std::string& roomId) { return "chat:" + roomId; }

} // namespace topics

} // namespace rtsae::ports
