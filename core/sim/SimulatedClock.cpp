#include "SimulatedClock.hpp"

namespace rtsae::sim {

SimulatedClock::SimulatedClock(Timestamp startTime)
    : simulatedTime_(startTime), realStartTime_(std::chrono::steady_clock::now()) {
}

Timestamp SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen_) {
        return simulatedTime_;
    }

    // Simulated time + elapsed real time since the last reference point
    auto realElapsed = std::chrono::steady_clock::now() - realStartTime_;
    return simulatedTime_ + std::chrono::duration_cast<Timestamp::duration>(realElapsed);
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ += duration;
    realStartTime_ = std::chrono::steady_clock::now();
}

void SimulatedClock::setCurrentTime(Timestamp time) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = time;
    realStartTime_ = std::chrono::steady_clock::now();
}

void SimulatedClock::freezeTime() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (frozen_) return;
    // Keep the time we had reached when freezing.
    simulatedTime_ += std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::steady_clock::now() - realStartTime_);
    frozen_ = true;
}

void SimulatedClock::unfreezeTime() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!frozen_) return;
    realStartTime_ = std::chrono::steady_clock::now();
    frozen_ = false;
}

bool SimulatedClock::isFrozen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frozen_;
}

} // namespace rtsae::sim
