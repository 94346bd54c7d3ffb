#pragma once

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include <fmt/format.h>
#include <core/log.hpp>

// Fixed-size worker pool that drains a task list once. Workers claim tasks
// through a shared index, so each task runs exactly once. run() returns only
// after every worker has joined.
template <typename Task>
class TaskRunner {
public:
    using Handler = std::function<void(const Task&, int worker_id)>;

    explicit TaskRunner(int workers) : workers_(std::max(1, workers)) {}

    // Handler exceptions are logged and reported through on_crash so the
    // caller can still account for the task. The handler may already have
    // accounted for it before throwing; on_crash must tolerate that.
    void run(const std::vector<Task>& tasks, const Handler& handler,
             const std::function<void(const Task&, const std::string&)>& on_crash = nullptr) const {
        if (tasks.empty()) return;

        std::atomic<size_t> next{0};
        int count = std::min<int>(workers_, static_cast<int>(tasks.size()));

        auto worker = [&](int id) {
            set_log_thread_name(fmt::format("worker-{}", id));
            while (true) {
                size_t i = next.fetch_add(1);
                if (i >= tasks.size()) break;

                try {
                    handler(tasks[i], id);
                } catch (const std::exception& e) {
                    docsync_error(fmt::format("worker-{}: task {} threw: {}", id, i, e.what()));
                    if (!on_crash) continue;
                    try {
                        on_crash(tasks[i], e.what());
                    } catch (const std::exception& again) {
                        docsync_error(fmt::format("worker-{}: crash report for task {} threw: {}",
                                                  id, i, again.what()));
                    }
                }
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(count);
        for (int id = 0; id < count; ++id) {
            threads.emplace_back(worker, id);
        }
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    }

    int workers() const { return workers_; }

private:
    int workers_;
};
