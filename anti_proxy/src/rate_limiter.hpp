#pragma once
#include "clock.hpp"
#include <chrono>
#include <mutex>
#include <optional>

// Enforces a minimum spacing between dispatch starts. Charged once per
// inbound call, however many endpoints that call ends up trying.
class RateLimiter {
public:
    RateLimiter(std::chrono::milliseconds min_interval, Clock& clock);

    // Sleeps out whatever is left of the interval since the previous dispatch,
    // then records now as the new dispatch start and returns it.
    Clock::time_point wait_turn();

    std::optional<Clock::time_point> last_dispatch() const;
    std::chrono::milliseconds min_interval() const { return min_interval_; }

private:
    const std::chrono::milliseconds min_interval_;
    Clock& clock_;

    std::optional<Clock::time_point> last_dispatch_;
    mutable std::mutex mutex_;
};
