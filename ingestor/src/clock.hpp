#pragma once

#include <chrono>

class Clock {
public:
    virtual ~Clock() = default;
    virtual std::chrono::steady_clock::time_point now() = 0;
    virtual void sleep_for(std::chrono::nanoseconds duration) = 0;
};

class SteadyClock : public Clock {
public:
    std::chrono::steady_clock::time_point now() override;
    void sleep_for(std::chrono::nanoseconds duration) override;
};
