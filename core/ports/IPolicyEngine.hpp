#pragma once

#include <chrono>

namespace rtsae::ports {

struct RetryPolicy {
    virtual ~RetryPolicy() = default;
    virtual std::chrono::milliseconds getBackoffDelay(int attemptCount) const = 0;
    virtual bool shouldRetry(int attemptCount) const = 0;
};

struct DeadlinePolicy {
    virtual ~DeadlinePolicy() = default;
    virtual std::chrono::milliseconds storeWriteDeadline() const = 0;
    virtual std::chrono::milliseconds logWriteDeadline() const = 0;
};

class IPolicyEngine {
public:
    virtual ~IPolicyEngine() = default;

    virtual const RetryPolicy& getRetryPolicy() const = 0;
    virtual const DeadlinePolicy& getDeadlinePolicy() const = 0;
};

} // namespace rtsae::ports
