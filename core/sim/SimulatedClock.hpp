#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>

namespace rtsae::sim {

// Wall clock that tests can freeze and move. While running it advances with
// real time from the last reference point.
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(Timestamp startTime = std::chrono::system_clock::now());
    ~SimulatedClock() override = default;

    Timestamp now() const override;

    // Simulation controls
    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(Timestamp time);

    void freezeTime();
    void unfreezeTime();
    bool isFrozen() const;

private:
    mutable std::mutex mutex_;
    Timestamp simulatedTime_;
    std::chrono::steady_clock::time_point realStartTime_;
    bool frozen_ = false;
};

} // namespace rtsae::sim
