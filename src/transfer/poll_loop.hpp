#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <platform/clock.hpp>

enum class PollState {
    Pending,
    Settled,
    Failed,
    TimedOut,
    Canceled,
};

struct PollOutcome {
    PollState state = PollState::Pending;
    std::string detail;      // failure reason or terminal status text
    int probes = 0;
    double elapsed = 0;

    bool settled() const { return state == PollState::Settled; }
};

// Result of one probe. Pending means "ask again after the interval".
struct PollStep {
    PollState state;
    std::string detail;

    static PollStep pending() { return {PollState::Pending, ""}; }
    static PollStep settled(std::string d = "") { return {PollState::Settled, std::move(d)}; }
    static PollStep failed(std::string d) { return {PollState::Failed, std::move(d)}; }
};

// Deadline-bounded poll: check deadline, sleep interval, probe. The first
// probe therefore happens one interval after start.
class PollLoop {
public:
    using Probe = std::function<PollStep()>;

    PollLoop(Clock& clock, double interval, double timeout,
             const std::atomic<bool>* cancel = nullptr);

    PollOutcome run(const Probe& probe) const;

private:
    Clock& clock_;
    double interval_;
    double timeout_;
    const std::atomic<bool>* cancel_;

    bool canceled() const { return cancel_ && cancel_->load(); }
};

const char* poll_state_name(PollState s);
