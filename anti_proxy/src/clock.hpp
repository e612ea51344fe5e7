#pragma once
#include <chrono>

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleep_for(duration delay) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override;
    void sleep_for(duration delay) override;
};
