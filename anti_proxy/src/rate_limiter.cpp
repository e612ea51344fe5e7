#include "rate_limiter.hpp"
#include <spdlog/spdlog.h>

RateLimiter::RateLimiter(std::chrono::milliseconds min_interval, Clock& clock)
    : min_interval_(min_interval), clock_(clock) {}

Clock::time_point RateLimiter::wait_turn() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (last_dispatch_) {
        auto elapsed = clock_.now() - *last_dispatch_;
        if (elapsed < min_interval_) {
            auto wait_time = min_interval_ - elapsed;
            spdlog::info("Rate limit: waiting {}ms",
                std::chrono::duration_cast<std::chrono::milliseconds>(wait_time).count());
            clock_.sleep_for(wait_time);
        }
    }

    last_dispatch_ = clock_.now();
    return *last_dispatch_;
}

std::optional<Clock::time_point> RateLimiter::last_dispatch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_dispatch_;
}
