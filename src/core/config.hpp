#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from <app data dir>/config.yaml (defaults if the file is absent)
    static Result<Config> load();

    // Load config from an explicit path. Missing keys fall back to defaults.
    static Result<Config> load_file(const fs::path& path);

    // All defaults, no file involved
    static Config defaults();

    // Accessors
    const ApiConfig& api() const { return api_; }
    const RetryConfig& retry() const { return retry_; }
    const PollConfig& poll() const { return poll_; }
    const TransferConfig& transfer() const { return transfer_; }
    const LoggingConfig& logging() const { return logging_; }
    const fs::path& source() const { return source_; }

    // Command-line overrides
    void set_workers(int workers) { transfer_.workers = workers; }
    void set_verbose(bool verbose) { logging_.verbose = verbose; }

public:
    Config() = default;

private:
    ApiConfig api_;
    RetryConfig retry_;
    PollConfig poll_;
    TransferConfig transfer_;
    LoggingConfig logging_;
    fs::path source_;
};

// Helper to check if the config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_log_dir(const Config& config);

// Create default global config
Result<void> create_default_global_config();
