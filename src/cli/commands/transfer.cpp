#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/log.hpp>
#include <platform/clock.hpp>
#include <platform/terminal.hpp>
#include <transfer/file_discovery.hpp>
#include <transfer/upload_orchestrator.hpp>
#include <transfer/download_orchestrator.hpp>
#include <algorithm>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <fmt/format.h>

// Single redrawn progress line; failures print above it as they arrive.
// Both callbacks fire from worker threads.
class ConsoleProgress {
public:
    ConsoleProgress()
        : tty_(platform::stdout_is_tty()),
          width_(std::max(10, std::min(40, platform::term_width() - 24))) {}

    void on_progress(int completed, int total) {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_ = completed;
        total_ = total;
        if (tty_) {
            std::cout << "\r\033[K" << theme::progress_bar(completed, total, width_) << std::flush;
        } else if (completed == total) {
            std::cout << theme::progress_bar(completed, total, width_) << "\n";
        }
    }

    void on_error(const std::string& label, const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tty_) std::cout << "\r\033[K";
        std::cout << theme::fail(label + ": " + error);
        if (tty_ && total_ > 0) {
            std::cout << theme::progress_bar(completed_, total_, width_) << std::flush;
        }
    }

    void finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tty_) std::cout << "\n";
    }

    ProgressCallback progress_cb() {
        return [this](int c, int t) { on_progress(c, t); };
    }
    ErrorCallback error_cb() {
        return [this](const std::string& l, const std::string& e) { on_error(l, e); };
    }

private:
    bool tty_;
    int width_;
    std::mutex mutex_;
    int completed_ = 0;
    int total_ = 0;
};

static bool apply_workers(BaseCLI& cli, const CommandArgs& args) {
    auto w = args.option("--workers");
    if (!w) return true;
    try {
        int n = std::stoi(*w);
        if (n < 1) throw std::invalid_argument("must be positive");
        cli.config->set_workers(n);
        return true;
    } catch (const std::exception&) {
        std::cout << theme::fail("--workers expects a positive integer, got '" + *w + "'");
        return false;
    }
}

static void print_summary(const TransferSummary& s) {
    std::cout << theme::divider();
    std::cout << theme::kv("total", std::to_string(s.total));
    std::cout << theme::kv("succeeded", theme::green(std::to_string(s.succeeded)));
    std::cout << theme::kv("failed", s.failed ? theme::red(std::to_string(s.failed)) : "0");
    if (s.listing_truncated) {
        std::cout << theme::warn("Listing stopped early; some documents were not attempted.");
    }
    std::cout << theme::kv("log", log_path().string()) << "\n";
}

// ── upload ──────────────────────────────────────────────────

static int do_upload(BaseCLI& cli, const CommandArgs& args) {
    if (args.positional.size() != 2) {
        std::cout << theme::fail("Usage: docsync upload <folder> <dataset> [--schema <id>] [--workers N] [-v]");
        return 1;
    }
    if (!cli.require_config() || !apply_workers(cli, args)) return 1;

    const fs::path folder = args.positional[0];
    const auto& transfer = cli.config->transfer();

    auto found = discover_files(folder, transfer.allowed_extensions, transfer.recursive);
    if (found.is_err()) {
        std::cout << theme::fail(found.error);
        return 1;
    }
    docsync_log(fmt::format("upload: {} file(s) in {}, {} with an allowed extension",
                            found.value.all.size(), folder.string(), found.value.allowed.size()));

    std::cout << theme::section("Upload");
    std::cout << theme::kv("folder", folder.string());
    std::cout << theme::kv("dataset", args.positional[1]);
    std::cout << theme::kv("files", fmt::format("{} of {}", found.value.allowed.size(), found.value.all.size()));

    UploadJob job;
    job.files = std::move(found.value.allowed);
    job.dataset = args.positional[1];
    job.schema_id = args.option("--schema");
    if (job.schema_id) {
        std::cout << theme::kv("schema", *job.schema_id);
    }
    std::cout << "\n";

    if (job.files.empty()) {
        std::cout << theme::warn("No files with an allowed extension; nothing to upload.");
        return 0;
    }
    if (!cli.open_service()) return 1;

    UploadOrchestrator orchestrator(*cli.api, SystemClock::instance(), cli.config->poll(),
                                    transfer.workers, &cli.interrupted);
    ConsoleProgress console;
    auto summary = orchestrator.upload_folder(job, console.progress_cb(), console.error_cb());
    console.finish();

    print_summary(summary);
    return summary.all_ok() ? 0 : 1;
}

// ── download ────────────────────────────────────────────────

static int do_download(BaseCLI& cli, const CommandArgs& args) {
    if (args.positional.size() != 2) {
        std::cout << theme::fail("Usage: docsync download <dataset> <output_dir> [--workers N] [-v]");
        return 1;
    }
    if (!cli.require_config() || !apply_workers(cli, args)) return 1;
    if (!cli.open_service()) return 1;

    const std::string& dataset = args.positional[0];
    const fs::path output_dir = args.positional[1];

    std::cout << theme::section("Download");
    std::cout << theme::kv("dataset", dataset);
    std::cout << theme::kv("output", output_dir.string()) << "\n";
    std::cout << theme::step("Listing documents...");

    DownloadOrchestrator orchestrator(*cli.api, cli.config->transfer(), &cli.interrupted);
    ConsoleProgress console;
    auto summary = orchestrator.download_dataset(dataset, output_dir,
                                                 console.progress_cb(), console.error_cb());
    console.finish();

    if (summary.total == 0 && !summary.listing_truncated) {
        std::cout << theme::info("Dataset '" + dataset + "' has no documents.");
    }
    print_summary(summary);
    return summary.all_ok() ? 0 : 1;
}

void register_transfer_commands(BaseCLI& cli) {
    cli.add_command("upload", do_upload,
                    "upload <folder> <dataset> [--schema <id>]",
                    "Upload a folder, optionally standardize");
    cli.add_command("download", do_download,
                    "download <dataset> <output_dir>",
                    "Download OCR artifacts and standardizations");
}
