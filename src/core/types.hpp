#pragma once

#include <string>
#include <optional>
#include <vector>
#include <set>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// A document record as returned by the service's listing endpoint.
struct Document {
    std::string document_id;     // server-assigned, opaque
    std::string filename;        // display name, used for local file names
    std::string file_extension;  // original extension of the ingested file

    std::string label() const { return filename + " (" + document_id + ")"; }
};

struct Schema {
    std::string name;
    std::string id;
};

// Configuration structures
struct ApiConfig {
    std::string base_url;
    int submit_timeout = 100;     // POST /document carries the whole file
    int request_timeout = 10;
    int download_timeout = 40;
};

struct RetryConfig {
    int max_attempts = 10;
    double backoff_base = 2;
    double backoff_cap = 600;
    std::set<long> retry_statuses;
};

struct PollConfig {
    double interval = 5;
    double timeout = 900;
};

struct TransferConfig {
    int workers = 20;
    int page_size = 20000;
    int max_pages = 500;
    int url_expiry_hours = 6;
    int standardization_page_size = 20;
    bool recursive = false;
    std::vector<std::string> allowed_extensions;
    bool disambiguate_collisions = true;
};

struct LoggingConfig {
    std::string dir;              // empty = <app data dir>/logs
    bool verbose = false;
};

// Aggregate outcome of one orchestration run
struct TransferSummary {
    int total = 0;
    int succeeded = 0;
    int failed = 0;
    bool listing_truncated = false;

    bool all_ok() const { return failed == 0 && !listing_truncated; }
};

// (completed_count, total_count); called from worker threads
using ProgressCallback = std::function<void(int, int)>;

// (task_label, error_message); called from worker threads
using ErrorCallback = std::function<void(const std::string&, const std::string&)>;
