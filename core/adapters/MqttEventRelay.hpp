#pragma once

#include "MqttSubscriberSink.hpp"
#include "../ports/ISubscriptionBus.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rtsae::adapters {

// Keeps one MqttSubscriberSink joined to a fixed set of bus topics.
// A sink the bus evicted is replaced on the next pump, so a burst the
// broker cannot keep up with costs events, never the relay.
class MqttEventRelay {
public:
    MqttEventRelay(std::shared_ptr<ports::ISubscriptionBus> bus,
                   std::shared_ptr<ports::ITransport> transport,
                   std::string eventsRoot,
                   std::size_t capacity,
                   int qos = 1);

    void start(std::vector<std::string> topics);
    void stop();

    // Flushes the current sink, replacing it first if it was closed.
    // Returns the number of events sent.
    std::size_t pump();

    std::uint64_t restarts() const { return restarts_; }
    std::shared_ptr<MqttSubscriberSink> sink() const { return sink_; }

private:
    void attach();

    std::shared_ptr<ports::ISubscriptionBus> bus_;
    std::shared_ptr<ports::ITransport> transport_;
    std::string eventsRoot_;
    std::size_t capacity_;
    int qos_;

    std::vector<std::string> topics_;
    std::shared_ptr<MqttSubscriberSink> sink_;
    std::uint64_t restarts_ = 0;
};

} // namespace rtsae::adapters
