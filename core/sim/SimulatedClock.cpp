#include "SimulatedClock.hpp"

namespace senate::sim {

SimulatedClock::SimulatedClock(std::chrono::system_clock::time_point startTime)
    : simulatedTime_(startTime), realReference_(std::chrono::steady_clock::now()) {
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    if (frozen_) {
        return simulatedTime_;
    }

    // Simulated time plus real time elapsed since the last adjustment
    auto realElapsed = std::chrono::steady_clock::now() - realReference_;
    return simulatedTime_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(realElapsed);
}

std::string SimulatedClock::iso8601() const {
    return formatIso8601(now());
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    simulatedTime_ = now() + duration;
    realReference_ = std::chrono::steady_clock::now();
}

void SimulatedClock::setCurrentTime(std::chrono::system_clock::time_point time) {
    simulatedTime_ = time;
    realReference_ = std::chrono::steady_clock::now();
}

} // namespace senate::sim
