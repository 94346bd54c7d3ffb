#include "poll_loop.hpp"
#include <fmt/format.h>

PollLoop::PollLoop(Clock& clock, double interval, double timeout,
                   const std::atomic<bool>* cancel)
    : clock_(clock), interval_(interval), timeout_(timeout), cancel_(cancel) {}

PollOutcome PollLoop::run(const Probe& probe) const {
    PollOutcome out;
    double start = clock_.now();

    while (true) {
        out.elapsed = clock_.now() - start;
        if (out.elapsed > timeout_) {
            out.state = PollState::TimedOut;
            out.detail = fmt::format("Timeout after {}s", timeout_);
            return out;
        }
        if (canceled()) {
            out.state = PollState::Canceled;
            out.detail = "canceled";
            return out;
        }

        clock_.sleep_for(interval_, cancel_);
        if (canceled()) {
            out.state = PollState::Canceled;
            out.detail = "canceled";
            return out;
        }

        ++out.probes;
        PollStep step = probe();
        if (step.state != PollState::Pending) {
            out.state = step.state;
            out.detail = std::move(step.detail);
            out.elapsed = clock_.now() - start;
            return out;
        }
    }
}

const char* poll_state_name(PollState s) {
    switch (s) {
        case PollState::Pending:  return "pending";
        case PollState::Settled:  return "settled";
        case PollState::Failed:   return "failed";
        case PollState::TimedOut: return "timed out";
        case PollState::Canceled: return "canceled";
    }
    return "unknown";
}
