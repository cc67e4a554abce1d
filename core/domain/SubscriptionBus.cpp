#include "SubscriptionBus.hpp"
#include <iostream>

namespace rtsae::domain {

SubscriptionBus::SubscriptionBus(BusConfig config)
    : config_(config) {
}

bool SubscriptionBus::join(const std::string& topic, const std::shared_ptr<ports::ISubscriber>& subscriber) {
    if (!subscriber || !subscriber->isOpen()) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    topics_[topic][subscriber->id()] = subscriber;
    return true;
}

void SubscriptionBus::leave(const std::string& topic, const std::string& subscriberId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = topics_.find(topic);
    if (it == topics_.end()) return;

    it->second.erase(subscriberId);
    if (it->second.empty()) {
        topics_.erase(it);
    }
}

void SubscriptionBus::leaveAll(const std::string& subscriberId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = topics_.begin(); it != topics_.end();) {
        it->second.erase(subscriberId);
        if (it->second.empty()) {
            it = topics_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t SubscriptionBus::publish(const std::string& topic, const ports::BusEventPtr& event) {
    std::vector<std::shared_ptr<ports::ISubscriber>> targets;
    std::vector<std::string> dropped;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = topics_.find(topic);
        if (it == topics_.end()) {
            return 0;
        }
        for (const auto& [id, weak] : it->second) {
            if (auto subscriber = weak.lock()) {
                targets.push_back(std::move(subscriber));
            } else {
                dropped.push_back(id);
            }
        }
    }

    // Offers happen outside the lock so a slow subscriber cannot stall joins.
    std::size_t delivered = 0;
    for (const auto& subscriber : targets) {
        if (!subscriber->isOpen()) {
            dropped.push_back(subscriber->id());
            continue;
        }
        if (subscriber->offer(topic, event, config_.publishDeadline)) {
            ++delivered;
        } else {
            std::cerr << "[Bus] Subscriber " << subscriber->id() << " overflowed on "
                      << topic << ", evicting" << std::endl;
            subscriber->close("overflow");
            dropped.push_back(subscriber->id());
        }
    }

    if (!dropped.empty()) {
        evict(dropped);
    }
    return delivered;
}

void SubscriptionBus::evict(const std::vector<std::string>& subscriberIds) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = topics_.begin(); it != topics_.end();) {
        for (const auto& id : subscriberIds) {
            it->second.erase(id);
        }
        if (it->second.empty()) {
            it = topics_.erase(it);
        } else {
            ++it;
        }
    }
    evicted_ += subscriberIds.size();
}

std::size_t SubscriptionBus::subscriberCount(const std::string& topic) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = topics_.find(topic);
    if (it == topics_.end()) {
        return 0;
    }
    std::size_t count = 0;
    for (const auto& [id, weak] : it->second) {
        if (!weak.expired()) ++count;
    }
    return count;
}

std::size_t SubscriptionBus::evictedCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return evicted_;
}

BufferedSubscriber::BufferedSubscriber(std::string id, std::size_t capacity)
    : id_(std::move(id)), capacity_(capacity) {
}

bool BufferedSubscriber::offer(const std::string& topic, const ports::BusEventPtr& event,
                               std::chrono::milliseconds deadline) {
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(deadline)) {
        return false;
    }
    if (!open_ || buffer_.size() >= capacity_) {
        return false;
    }
    buffer_.push_back(Delivery{topic, event});
    lock.unlock();
    available_.notify_one();
    return true;
}

void BufferedSubscriber::close(const std::string& reason) {
    {
        std::lock_guard<std::timed_mutex> lock(mutex_);
        if (!open_) return;
        open_ = false;
        closeReason_ = reason;
    }
    available_.notify_all();
}

bool BufferedSubscriber::isOpen() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return open_;
}

std::optional<Delivery> BufferedSubscriber::poll(std::chrono::milliseconds wait) {
    std::unique_lock<std::timed_mutex> lock(mutex_);
    available_.wait_for(lock, wait, [this] { return !buffer_.empty() || !open_; });
    if (buffer_.empty()) {
        return std::nullopt;
    }
    Delivery delivery = std::move(buffer_.front());
    buffer_.pop_front();
    return delivery;
}

std::vector<Delivery> BufferedSubscriber::drain() {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    std::vector<Delivery> deliveries(std::make_move_iterator(buffer_.begin()),
                                     std::make_move_iterator(buffer_.end()));
    buffer_.clear();
    return deliveries;
}

std::size_t BufferedSubscriber::pending() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return buffer_.size();
}

std::string BufferedSubscriber::closeReason() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return closeReason_;
}

} // namespace rtsae::domain
