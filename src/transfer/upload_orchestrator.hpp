#pragma once

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <platform/clock.hpp>
#include <service/document_api.hpp>

namespace fs = std::filesystem;

struct UploadJob {
    std::vector<fs::path> files;
    std::string dataset;
    std::optional<std::string> schema_id;   // standardize after processing when set
};

struct UploadTask {
    size_t index = 0;   // position in UploadJob::files
    fs::path file;
};

// Uploads files on a bounded worker pool. Per file: submit, wait for the
// document to finish processing, then (with a schema) standardize and wait
// for the result to become retrievable. A failing file never affects the
// others; every file produces exactly one progress call.
class UploadOrchestrator {
public:
    UploadOrchestrator(const DocumentApi& api, Clock& clock, PollConfig poll, int workers,
                       const std::atomic<bool>* cancel = nullptr);

    TransferSummary upload_folder(const UploadJob& job,
                                  const ProgressCallback& on_progress,
                                  const ErrorCallback& on_error = nullptr) const;

private:
    const DocumentApi& api_;
    Clock& clock_;
    PollConfig poll_;
    int workers_;
    const std::atomic<bool>* cancel_;

    Result<void> upload_one(const fs::path& file, const UploadJob& job) const;

    // Pipeline stages
    Result<std::string> submit(const fs::path& file, const std::string& dataset) const;
    Result<void> wait_processed(const std::string& document_id) const;
    Result<void> standardize(const std::string& document_id, const std::string& schema_id) const;
};
