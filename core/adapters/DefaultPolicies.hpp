#pragma once

#include "../ports/IPolicyEngine.hpp"
#include "../EngineConfig.hpp"
#include <algorithm>
#include <cmath>

namespace rtsae::adapters {

class ExponentialBackoffRetryPolicy : public ports::RetryPolicy {
public:
    ExponentialBackoffRetryPolicy(std::chrono::milliseconds baseDelay = std::chrono::milliseconds(1000),
                                double multiplier = 2.0,
                                std::chrono::milliseconds maxDelay = std::chrono::minutes(5),
                                int maxAttempts = 5)
        : baseDelay_(baseDelay), multiplier_(multiplier), maxDelay_(maxDelay), maxAttempts_(maxAttempts) {}

    std::chrono::milliseconds getBackoffDelay(int attemptCount) const override {
        auto delay = std::chrono::milliseconds(static_cast<long long>(
            baseDelay_.count() * std::pow(multiplier_, std::max(attemptCount, 1) - 1)));
        return std::min(delay, maxDelay_);
    }

    bool shouldRetry(int attemptCount) const override {
        return attemptCount < maxAttempts_;
    }

private:
    std::chrono::milliseconds baseDelay_;
    double multiplier_;
    std::chrono::milliseconds maxDelay_;
    int maxAttempts_;
};

class FixedDeadlinePolicy : public ports::DeadlinePolicy {
public:
    FixedDeadlinePolicy(std::chrono::milliseconds storeWrite = std::chrono::milliseconds(200),
                        std::chrono::milliseconds logWrite = std::chrono::milliseconds(500))
        : storeWrite_(storeWrite), logWrite_(logWrite) {}

    std::chrono::milliseconds storeWriteDeadline() const override { return storeWrite_; }
    std::chrono::milliseconds logWriteDeadline() const override { return logWrite_; }

private:
    std::chrono::milliseconds storeWrite_;
    std::chrono::milliseconds logWrite_;
};

class DefaultPolicyEngine : public ports::IPolicyEngine {
public:
    DefaultPolicyEngine() = default;

    explicit DefaultPolicyEngine(const IngestionConfig& config)
        : retryPolicy_(config.retryBaseDelay, config.retryMultiplier,
                       config.retryMaxDelay, config.retryMaxAttempts),
          deadlinePolicy_(config.storeWriteDeadline, config.logWriteDeadline) {}

    const ports::RetryPolicy& getRetryPolicy() const override {
        return retryPolicy_;
    }

    const ports::DeadlinePolicy& getDeadlinePolicy() const override {
        return deadlinePolicy_;
    }

private:
    ExponentialBackoffRetryPolicy retryPolicy_;
    FixedDeadlinePolicy deadlinePolicy_;
};

} // namespace rtsae::adapters
