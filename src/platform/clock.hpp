#pragma once

#include <atomic>

// Time source for backoff sleeps and polling deadlines. Workers only ever
// touch their own notion of "now", so implementations must be thread-safe.
class Clock {
public:
    virtual ~Clock() = default;

    // Monotonic seconds since an arbitrary epoch
    virtual double now() = 0;

    // Block the calling thread. Returns early once *cancel becomes true.
    virtual void sleep_for(double seconds, const std::atomic<bool>* cancel = nullptr) = 0;
};

class SystemClock : public Clock {
public:
    static SystemClock& instance();

    double now() override;
    void sleep_for(double seconds, const std::atomic<bool>* cancel = nullptr) override;
};
