#include "clock.hpp"
#include <thread>

std::chrono::steady_clock::time_point SteadyClock::now() {
    return std::chrono::steady_clock::now();
}

void SteadyClock::sleep_for(std::chrono::nanoseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}
