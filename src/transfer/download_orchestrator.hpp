#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <service/document_api.hpp>

namespace fs = std::filesystem;

// A listed document and the local name its files are written under
struct DownloadTask {
    size_t index = 0;   // position in the listing
    Document doc;
    std::string stem;
};

// Downloads every document of a dataset: OCR artifact as <stem>.pdf plus,
// when the service has one, the first standardization as <stem>.json.
class DownloadOrchestrator {
public:
    DownloadOrchestrator(const DocumentApi& api, const TransferConfig& transfer,
                         const std::atomic<bool>* cancel = nullptr);

    TransferSummary download_dataset(const std::string& dataset,
                                     const fs::path& output_dir,
                                     const ProgressCallback& on_progress,
                                     const ErrorCallback& on_error = nullptr) const;

    // Local names for a listing. With `disambiguate`, documents sharing a
    // filename get "<filename>__<documentId>" instead of overwriting each other.
    static std::vector<DownloadTask> plan(const std::vector<Document>& docs, bool disambiguate);

private:
    const DocumentApi& api_;
    TransferConfig transfer_;
    const std::atomic<bool>* cancel_;

    Result<void> download_one(const DownloadTask& task, const fs::path& output_dir) const;
};
