#include "clock.hpp"
#include <thread>

Clock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep_for(duration delay) {
    std::this_thread::sleep_for(delay);
}
