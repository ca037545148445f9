#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace senate {

class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual std::string iso8601() const = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    std::string iso8601() const override;
};

std::string formatIso8601(std::chrono::system_clock::time_point time);

} // namespace senate
