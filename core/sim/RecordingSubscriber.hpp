#pragma once

#include "../ports/ISubscriptionBus.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace rtsae::sim {

struct RecordedEvent {
    std::string topic;
    ports::BusEventPtr event;
};

// Accepts everything until closed. Optional capacity to exercise overflow eviction.
class RecordingSubscriber : public ports::ISubscriber {
public:
    explicit RecordingSubscriber(std::string id, std::size_t capacity = 0);

    const std::string& id() const override { return id_; }
    bool offer(const std::string& topic, const ports::BusEventPtr& event,
               std::chrono::milliseconds deadline) override;
    void close(const std::string& reason) override;
    bool isOpen() const override;

    std::vector<RecordedEvent> events() const;
    std::vector<RecordedEvent> events(const std::string& topic) const;
    std::vector<std::string> types(const std::string& topic) const;
    std::string closeReason() const;

private:
    std::string id_;
    std::size_t capacity_;

    mutable std::mutex mutex_;
    std::vector<RecordedEvent> events_;
    bool open_ = true;
    std::string closeReason_;
};

} // namespace rtsae::sim
