#include "MqttSubscriberSink.hpp"
#include <algorithm>
#include <iostream>

namespace rtsae::adapters {

MqttSubscriberSink::MqttSubscriberSink(std::string id,
                                       std::shared_ptr<ports::ITransport> transport,
                                       std::string eventsRoot,
                                       std::size_t capacity,
                                       int qos)
    : BufferedSubscriber(std::move(id), capacity),
      transport_(std::move(transport)),
      eventsRoot_(std::move(eventsRoot)),
      qos_(qos) {
}

std::string MqttSubscriberSink::brokerTopic(const std::string& busTopic) const {
    std::string suffix = busTopic;
    std::replace(suffix.begin(), suffix.end(), ':', '/');
    return eventsRoot_ + "/" + suffix;
}

std::size_t MqttSubscriberSink::flush() {
    std::size_t sent = 0;
    for (const auto& delivery : drain()) {
        if (transport_->publish(brokerTopic(delivery.topic), delivery.event->body.dump(), qos_)) {
            ++sent;
        } else {
            std::cerr << "[Sink] " << id() << " failed to relay " << delivery.event->type
                      << " on " << delivery.topic << std::endl;
        }
    }
    return sent;
}

} // namespace rtsae::adapters
