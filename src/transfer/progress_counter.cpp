#include "progress_counter.hpp"
#include <core/log.hpp>
#include <exception>
#include <fmt/format.h>

ProgressCounter::ProgressCounter(int total, ProgressCallback on_progress)
    : total_(total), on_progress_(std::move(on_progress)),
      done_(static_cast<size_t>(total > 0 ? total : 0), false) {}

bool ProgressCounter::complete(size_t task, bool succeeded) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (task >= done_.size()) {
        docsync_error(fmt::format("progress: task {} is outside this run ({} tasks)", task, total_));
        return false;
    }
    if (done_[task]) {
        docsync_error(fmt::format("progress: task {} reported twice, ignoring", task));
        return false;
    }

    done_[task] = true;
    ++completed_;
    if (succeeded) ++succeeded_;

    notify(completed_, total_);
    return true;
}

void ProgressCounter::announce_empty() {
    std::lock_guard<std::mutex> lock(mutex_);
    notify(0, 0);
}

// Caller holds mutex_
void ProgressCounter::notify(int completed, int total) {
    if (!on_progress_) return;
    try {
        on_progress_(completed, total);
    } catch (const std::exception& e) {
        docsync_error(fmt::format("progress: callback threw at {}/{}: {}", completed, total, e.what()));
    }
}

bool ProgressCounter::reported(size_t task) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return task < done_.size() && done_[task];
}

int ProgressCounter::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}

TransferSummary ProgressCounter::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    TransferSummary s;
    s.total = total_;
    s.succeeded = succeeded_;
    s.failed = completed_ - succeeded_;
    return s;
}

void report_error(const ErrorCallback& on_error, const std::string& label, const std::string& error) {
    if (!on_error) return;
    try {
        on_error(label, error);
    } catch (const std::exception& e) {
        docsync_error(fmt::format("error callback threw for {}: {}", label, e.what()));
    }
}
