#include "MqttEventRelay.hpp"
#include <iostream>

namespace rtsae::adapters {

MqttEventRelay::MqttEventRelay(std::shared_ptr<ports::ISubscriptionBus> bus,
                               std::shared_ptr<ports::ITransport> transport,
                               std::string eventsRoot,
                               std::size_t capacity,
                               int qos)
    : bus_(std::move(bus)),
      transport_(std::move(transport)),
      eventsRoot_(std::move(eventsRoot)),
      capacity_(capacity),
      qos_(qos) {
}

void MqttEventRelay::start(std::vector<std::string> topics) {
    topics_ = std::move(topics);
    attach();
}

void MqttEventRelay::stop() {
    if (!sink_) return;
    sink_->flush();
    bus_->leaveAll(sink_->id());
    sink_->close("stopped");
    sink_.reset();
}

std::size_t MqttEventRelay::pump() {
    if (!sink_) return 0;

    if (!sink_->isOpen()) {
        // Whatever was buffered before the eviction is still worth sending.
        std::size_t sent = sink_->flush();
        std::cerr << "[Relay] Sink " << sink_->id() << " closed (" << sink_->closeReason()
                  << "), rejoining " << topics_.size() << " topics" << std::endl;
        bus_->leaveAll(sink_->id());
        ++restarts_;
        attach();
        return sent;
    }
    return sink_->flush();
}

void MqttEventRelay::attach() {
    // A fresh id per generation: an eviction still in flight for the old
    // sink must not remove its replacement.
    std::string id = "mqtt-events-" + std::to_string(restarts_ + 1);
    sink_ = std::make_shared<MqttSubscriberSink>(id, transport_, eventsRoot_, capacity_, qos_);
    for (const auto& topic : topics_) {
        if (!bus_->join(topic, sink_)) {
            std::cerr << "[Relay] Could not join " << topic << std::endl;
        }
    }
}

} // namespace rtsae::adapters
