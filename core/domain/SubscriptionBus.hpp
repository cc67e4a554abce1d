#pragma once

#include "../ports/ISubscriptionBus.hpp"
#include "../EngineConfig.hpp"
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rtsae::domain {

// Topic -> weak subscriber references. Subscribers own their buffers and
// connections; the bus never keeps one alive.
class SubscriptionBus : public ports::ISubscriptionBus {
public:
    explicit SubscriptionBus(BusConfig config = {});
    ~SubscriptionBus() override = default;

    bool join(const std::string& topic, const std::shared_ptr<ports::ISubscriber>& subscriber) override;
    void leave(const std::string& topic, const std::string& subscriberId) override;
    void leaveAll(const std::string& subscriberId) override;

    std::size_t publish(const std::string& topic, const ports::BusEventPtr& event) override;

    std::size_t subscriberCount(const std::string& topic) const override;

    std::size_t evictedCount() const;

private:
    void evict(const std::vector<std::string>& subscriberIds);

    BusConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::map<std::string, std::weak_ptr<ports::ISubscriber>>> topics_;
    std::size_t evicted_ = 0;
};

struct Delivery {
    std::string topic;
    ports::BusEventPtr event;
};

// Bounded outbound buffer drained by the owning connection.
class BufferedSubscriber : public ports::ISubscriber {
public:
    BufferedSubscriber(std::string id, std::size_t capacity);
    ~BufferedSubscriber() override = default;

    const std::string& id() const override { return id_; }
    bool offer(const std::string& topic, const ports::BusEventPtr& event,
               std::chrono::milliseconds deadline) override;
    void close(const std::string& reason) override;
    bool isOpen() const override;

    std::optional<Delivery> poll(std::chrono::milliseconds wait);
    std::vector<Delivery> drain();

    std::size_t pending() const;
    std::string closeReason() const;

private:
    std::string id_;
    std::size_t capacity_;

    mutable std::timed_mutex mutex_;
    std::condition_variable_any available_;
    std::deque<Delivery> buffer_;
    bool open_ = true;
    std::string closeReason_;
};

} // namespace rtsae::domain
