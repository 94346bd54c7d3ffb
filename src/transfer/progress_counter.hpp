#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>

// Completed-task counter for one orchestration run. Tasks are identified by
// their index in the run; each counts once no matter how often it reports.
// The callback runs under the lock so observers see counts in order.
class ProgressCounter {
public:
    ProgressCounter(int total, ProgressCallback on_progress);

    ProgressCounter(const ProgressCounter&) = delete;
    ProgressCounter& operator=(const ProgressCounter&) = delete;

    // Record task `task` as finished. Returns false (and logs) when the task
    // was already reported or is out of range.
    bool complete(size_t task, bool succeeded);

    // (0, 0) signal for runs with nothing to do
    void announce_empty();

    // True once complete() has accepted `task`
    bool reported(size_t task) const;

    int completed() const;
    int total() const { return total_; }
    TransferSummary summary() const;

private:
    const int total_;
    ProgressCallback on_progress_;

    mutable std::mutex mutex_;
    std::vector<bool> done_;
    int completed_ = 0;
    int succeeded_ = 0;

    void notify(int completed, int total);
};

// Call a caller-supplied error callback. An exception thrown by it is logged
// and stops there.
void report_error(const ErrorCallback& on_error, const std::string& label, const std::string& error);
