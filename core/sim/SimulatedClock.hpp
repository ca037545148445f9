#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <string>

namespace senate::sim {

class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(std::chrono::system_clock::time_point startTime = std::chrono::system_clock::now());
    ~SimulatedClock() override = default;

    std::chrono::system_clock::time_point now() const override;
    std::string iso8601() const override;

    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(std::chrono::system_clock::time_point time);

    void freezeTime() { frozen_ = true; }
    void unfreezeTime() { frozen_ = false; }
    bool isFrozen() const { return frozen_; }

private:
    std::chrono::system_clock::time_point simulatedTime_;
    std::chrono::steady_clock::time_point realReference_;
    bool frozen_ = false;
};

} // namespace senate::sim
