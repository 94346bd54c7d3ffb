#include "clock.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

SystemClock& SystemClock::instance() {
    static SystemClock clock;
    return clock;
}

double SystemClock::now() {
    auto since = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since).count();
}

void SystemClock::sleep_for(double seconds, const std::atomic<bool>* cancel) {
    // Sleep in 100ms increments for responsive cancellation
    int remaining_ms = static_cast<int>(seconds * 1000);
    while (remaining_ms > 0) {
        if (cancel && cancel->load()) return;
        int step = std::min(remaining_ms, 100);
        std::this_thread::sleep_for(std::chrono::milliseconds(step));
        remaining_ms -= step;
    }
}
