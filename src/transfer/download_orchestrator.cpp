#include "download_orchestrator.hpp"
#include "paginated_lister.hpp"
#include "progress_counter.hpp"
#include "task_runner.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <fstream>
#include <map>

static Result<void> write_file(const fs::path& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::Err("Cannot write " + path.string());
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        return Result<void>::Err("Write failed for " + path.string());
    }
    return Result<void>::Ok();
}

// Display names come from the service; keep them inside output_dir
static std::string safe_stem(const std::string& filename) {
    std::string s = filename;
    for (auto& c : s) {
        if (c == '/' || c == '\\') c = '_';
    }
    if (s == "." || s == "..") s = "_";
    return s;
}

DownloadOrchestrator::DownloadOrchestrator(const DocumentApi& api, const TransferConfig& transfer,
                                           const std::atomic<bool>* cancel)
    : api_(api), transfer_(transfer), cancel_(cancel) {}

std::vector<DownloadTask> DownloadOrchestrator::plan(const std::vector<Document>& docs,
                                                     bool disambiguate) {
    std::map<std::string, int> seen;
    for (const auto& d : docs) {
        seen[safe_stem(d.filename)]++;
    }

    std::vector<DownloadTask> tasks;
    tasks.reserve(docs.size());
    for (const auto& d : docs) {
        std::string stem = safe_stem(d.filename);
        if (seen[stem] > 1) {
            if (disambiguate) {
                docsync_warn(fmt::format("download: '{}' is shared by {} documents, writing {} as {}__{}",
                                         stem, seen[stem], d.document_id, stem, d.document_id));
                stem += "__" + d.document_id;
            } else {
                docsync_warn(fmt::format("download: '{}' is shared by {} documents, last write wins",
                                         stem, seen[stem]));
            }
        }
        tasks.push_back({tasks.size(), d, stem});
    }
    return tasks;
}

TransferSummary DownloadOrchestrator::download_dataset(const std::string& dataset,
                                                       const fs::path& output_dir,
                                                       const ProgressCallback& on_progress,
                                                       const ErrorCallback& on_error) const {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        docsync_error(fmt::format("download: cannot create {}: {}", output_dir.string(), ec.message()));
        report_error(on_error, output_dir.string(), "Cannot create output directory: " + ec.message());
        TransferSummary s;
        s.listing_truncated = true;
        return s;
    }

    PaginatedLister lister(
        [&](int limit, int offset) { return api_.list_documents_page(dataset, limit, offset); },
        transfer_.page_size, transfer_.max_pages);
    auto listing = lister.list_all("dataset " + dataset);

    if (listing.error) {
        report_error(on_error, "dataset " + dataset, "Listing stopped early: " + *listing.error);
    }

    auto tasks = plan(listing.items, transfer_.disambiguate_collisions);
    ProgressCounter progress(static_cast<int>(tasks.size()), on_progress);

    if (tasks.empty()) {
        docsync_log(fmt::format("download: dataset '{}' has no documents", dataset));
        progress.announce_empty();
        auto s = progress.summary();
        s.listing_truncated = !listing.complete();
        return s;
    }

    docsync_log(fmt::format("download: {} document(s) from '{}' into {} with {} worker(s)",
                            tasks.size(), dataset, output_dir.string(), transfer_.workers));

    // A task runs on one worker only, so reported() cannot race with complete()
    auto report_failure = [&](const DownloadTask& task, const std::string& error) {
        std::string label = task.doc.label();
        if (progress.reported(task.index)) {
            docsync_error(fmt::format("download: {}: already counted, dropping late error: {}", label, error));
            return;
        }
        docsync_error(fmt::format("download: {}: {}", label, error));
        report_error(on_error, label, error);
        progress.complete(task.index, false);
    };

    TaskRunner<DownloadTask> runner(transfer_.workers);
    runner.run(tasks,
        [&](const DownloadTask& task, int) {
            if (cancel_ && cancel_->load()) {
                report_failure(task, "canceled");
                return;
            }
            auto r = download_one(task, output_dir);
            if (r.is_err()) {
                report_failure(task, r.error);
                return;
            }
            progress.complete(task.index, true);
        },
        report_failure);

    auto summary = progress.summary();
    summary.listing_truncated = !listing.complete();
    docsync_log(fmt::format("download: finished, {}/{} succeeded{}", summary.succeeded, summary.total,
                            summary.listing_truncated ? " (listing incomplete)" : ""));
    return summary;
}

Result<void> DownloadOrchestrator::download_one(const DownloadTask& task, const fs::path& output_dir) const {
    const Document& doc = task.doc;

    auto url = api_.ocr_url(doc.document_id, transfer_.url_expiry_hours);
    if (url.is_err()) return Result<void>::Err(url.error);

    auto bytes = api_.fetch_artifact(url.value);
    if (bytes.is_err()) return Result<void>::Err(bytes.error);

    fs::path artifact = output_dir / (task.stem + "." + OCR_ARTIFACT_EXT);
    auto wrote = write_file(artifact, bytes.value);
    if (wrote.is_err()) return wrote;
    docsync_log(fmt::format("download: {} -> {} ({} bytes)", doc.label(), artifact.string(), bytes.value.size()));

    auto data = api_.standardization_data(doc.document_id, transfer_.standardization_page_size);
    if (data.is_err()) return Result<void>::Err(data.error);
    if (!data.value) return Result<void>::Ok();

    fs::path json_path = output_dir / (task.stem + ".json");
    auto wrote_json = write_file(json_path, data.value->dump(2));
    if (wrote_json.is_err()) return wrote_json;
    docsync_log(fmt::format("download: {} -> {}", doc.label(), json_path.string()));
    return Result<void>::Ok();
}
