#include "RecordingSubscriber.hpp"

namespace rtsae::sim {

RecordingSubscriber::RecordingSubscriber(std::string id, std::size_t capacity)
    : id_(std::move(id)), capacity_(capacity) {
}

bool RecordingSubscriber::offer(const std::string& topic, const ports::BusEventPtr& event,
                                std::chrono::milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) return false;
    if (capacity_ > 0 && events_.size() >= capacity_) return false;

    events_.push_back(RecordedEvent{topic, event});
    return true;
}

void RecordingSubscriber::close(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    closeReason_ = reason;
}

bool RecordingSubscriber::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::vector<RecordedEvent> RecordingSubscriber::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<RecordedEvent> RecordingSubscriber::events(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RecordedEvent> matching;
    for (const auto& recorded : events_) {
        if (recorded.topic == topic) {
            matching.push_back(recorded);
        }
    }
    return matching;
}

std::vector<std::string> RecordingSubscriber::types(const std::string& topic) const {
    std::vector<std::string> result;
    for (const auto& recorded : events(topic)) {
        result.push_back(recorded.event->type);
    }
    return result;
}

std::string RecordingSubscriber::closeReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closeReason_;
}

} // namespace rtsae::sim
