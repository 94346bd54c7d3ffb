#include "upload_orchestrator.hpp"
#include "poll_loop.hpp"
#include "progress_counter.hpp"
#include "task_runner.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

UploadOrchestrator::UploadOrchestrator(const DocumentApi& api, Clock& clock, PollConfig poll,
                                       int workers, const std::atomic<bool>* cancel)
    : api_(api), clock_(clock), poll_(poll), workers_(workers), cancel_(cancel) {}

TransferSummary UploadOrchestrator::upload_folder(const UploadJob& job,
                                                  const ProgressCallback& on_progress,
                                                  const ErrorCallback& on_error) const {
    ProgressCounter progress(static_cast<int>(job.files.size()), on_progress);

    if (job.files.empty()) {
        docsync_log(fmt::format("upload: no files for dataset '{}'", job.dataset));
        progress.announce_empty();
        return progress.summary();
    }

    docsync_log(fmt::format("upload: {} file(s) to dataset '{}'{} with {} worker(s)",
                            job.files.size(), job.dataset,
                            job.schema_id ? " (schema " + *job.schema_id + ")" : "",
                            workers_));

    std::vector<UploadTask> tasks;
    tasks.reserve(job.files.size());
    for (const auto& f : job.files) {
        tasks.push_back({tasks.size(), f});
    }

    // A task runs on one worker only, so reported() cannot race with complete()
    auto report_failure = [&](const UploadTask& task, const std::string& error) {
        std::string name = task.file.filename().string();
        if (progress.reported(task.index)) {
            docsync_error(fmt::format("upload: {}: already counted, dropping late error: {}", name, error));
            return;
        }
        docsync_error(fmt::format("upload: {}: {}", name, error));
        report_error(on_error, name, error);
        progress.complete(task.index, false);
    };

    TaskRunner<UploadTask> runner(workers_);
    runner.run(tasks,
        [&](const UploadTask& task, int) {
            auto r = upload_one(task.file, job);
            if (r.is_err()) {
                report_failure(task, r.error);
                return;
            }
            docsync_log(fmt::format("upload: {} done", task.file.filename().string()));
            progress.complete(task.index, true);
        },
        report_failure);

    auto summary = progress.summary();
    docsync_log(fmt::format("upload: finished, {}/{} succeeded", summary.succeeded, summary.total));
    return summary;
}

// ── Per-file pipeline ───────────────────────────────────────

Result<void> UploadOrchestrator::upload_one(const fs::path& file, const UploadJob& job) const {
    std::string name = file.filename().string();

    auto doc = submit(file, job.dataset);
    if (doc.is_err()) {
        return Result<void>::Err(fmt::format("[UPLOAD FAIL] {}: {}", name, doc.error));
    }
    const std::string& document_id = doc.value;
    docsync_log(fmt::format("upload: {} submitted as {}", name, document_id));

    auto processed = wait_processed(document_id);
    if (processed.is_err()) {
        return Result<void>::Err(fmt::format("[DOC POLL FAIL] {}, docId={}: {}",
                                             name, document_id, processed.error));
    }

    if (job.schema_id) {
        auto std_result = standardize(document_id, *job.schema_id);
        if (std_result.is_err()) {
            return Result<void>::Err(fmt::format("[STANDARDIZE FAIL] {}, docId={}: {}",
                                                 name, document_id, std_result.error));
        }
    }
    return Result<void>::Ok();
}

Result<std::string> UploadOrchestrator::submit(const fs::path& file, const std::string& dataset) const {
    auto bytes = read_file_bytes(file);
    if (bytes.is_err()) {
        return Result<std::string>::Err(bytes.error);
    }
    return api_.submit_document(dataset, file.filename().string(), base64_encode(bytes.value));
}

Result<void> UploadOrchestrator::wait_processed(const std::string& document_id) const {
    PollLoop loop(clock_, poll_.interval, poll_.timeout, cancel_);

    auto outcome = loop.run([&]() {
        auto status = api_.document_status(document_id);
        if (status.is_err()) {
            return PollStep::failed(status.error);
        }
        if (status.value == "completed") {
            return PollStep::settled(status.value);
        }
        if (status.value == "failed") {
            return PollStep::failed(fmt::format("Doc {} failed during processing.", document_id));
        }
        return PollStep::pending();
    });

    switch (outcome.state) {
        case PollState::Settled:
            return Result<void>::Ok();
        case PollState::TimedOut:
            return Result<void>::Err(fmt::format("{}: doc {} never completed.", outcome.detail, document_id));
        default:
            return Result<void>::Err(outcome.detail);
    }
}

Result<void> UploadOrchestrator::standardize(const std::string& document_id,
                                             const std::string& schema_id) const {
    auto started = api_.start_standardization(document_id, schema_id);
    if (started.is_err()) {
        return Result<void>::Err(started.error);
    }
    const std::string& std_id = started.value;
    docsync_log(fmt::format("upload: doc {} standardizing as {}", document_id, std_id));

    PollLoop loop(clock_, poll_.interval, poll_.timeout, cancel_);
    auto outcome = loop.run([&]() {
        auto ready = api_.standardization_ready(std_id);
        if (ready.is_err()) {
            return PollStep::failed(ready.error);
        }
        return ready.value ? PollStep::settled() : PollStep::pending();
    });

    switch (outcome.state) {
        case PollState::Settled:
            return Result<void>::Ok();
        case PollState::TimedOut:
            return Result<void>::Err(fmt::format("{}: standardization {} never completed.",
                                                 outcome.detail, std_id));
        default:
            return Result<void>::Err(outcome.detail);
    }
}
