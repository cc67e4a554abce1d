#pragma once

#include "../ports/ITransport.hpp"
#include "../domain/SubscriptionBus.hpp"
#include <memory>
#include <string>

namespace rtsae::adapters {

// Bus subscriber that relays its buffered events to the broker.
// Bus topic "tenant:t1" is published on "<eventsRoot>/tenant/t1".
class MqttSubscriberSink : public domain::BufferedSubscriber {
public:
    MqttSubscriberSink(std::string id,
                       std::shared_ptr<ports::ITransport> transport,
                       std::string eventsRoot,
                       std::size_t capacity,
                       int qos = 1);

    // Publishes everything buffered so far. Returns the number sent.
    std::size_t flush();

    std::string brokerTopic(const std::string& busTopic) const;

private:
    std::shared_ptr<ports::ITransport> transport_;
    std::string eventsRoot_;
    int qos_;
};

} // namespace rtsae::adapters
