#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::app_data_dir();
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_log_dir(const Config& config) {
    if (!config.logging().dir.empty()) {
        return fs::path(config.logging().dir);
    }
    return get_global_config_dir() / "logs";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# docsync configuration
# Every key is optional; the values below are the built-in defaults.

api:
  base_url: "https://app.docupipe.ai"
  submit_timeout: 100
  request_timeout: 10
  download_timeout: 40

retry:
  max_attempts: 10
  backoff_base: 2
  backoff_cap: 600                  # circuit breaker trips at twice this total
  retry_statuses: [408, 429, 500, 502, 503, 504]

poll:
  interval: 5
  timeout: 900

transfer:
  workers: 20
  page_size: 20000
  max_pages: 500
  url_expiry_hours: 6
  standardization_page_size: 20
  recursive: false
  allowed_extensions: [".pdf", ".jpg", ".jpeg", ".png", ".txt", ".tiff", ".tif", ".webp"]
  disambiguate_collisions: true

logging:
  dir: ""                           # default <data dir>/logs
  verbose: false
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static ApiConfig parse_api_config(const YAML::Node& node) {
    ApiConfig api;
    api.base_url = node["base_url"].as<std::string>(DEFAULT_BASE_URL);
    api.submit_timeout = node["submit_timeout"].as<int>(SUBMIT_TIMEOUT_SECS);
    api.request_timeout = node["request_timeout"].as<int>(REQUEST_TIMEOUT_SECS);
    api.download_timeout = node["download_timeout"].as<int>(DOWNLOAD_TIMEOUT_SECS);

    // Endpoint templates append paths directly
    while (!api.base_url.empty() && api.base_url.back() == '/') {
        api.base_url.pop_back();
    }
    return api;
}

static RetryConfig parse_retry_config(const YAML::Node& node) {
    RetryConfig retry;
    retry.max_attempts = node["max_attempts"].as<int>(RETRY_MAX_ATTEMPTS);
    retry.backoff_base = node["backoff_base"].as<double>(RETRY_BACKOFF_BASE_SECS);
    retry.backoff_cap = node["backoff_cap"].as<double>(RETRY_BACKOFF_CAP_SECS);

    if (node["retry_statuses"] && node["retry_statuses"].IsSequence()) {
        for (const auto& s : node["retry_statuses"]) {
            retry.retry_statuses.insert(s.as<long>());
        }
    } else {
        retry.retry_statuses.insert(std::begin(RETRY_STATUSES), std::end(RETRY_STATUSES));
    }

    if (retry.max_attempts < 1) retry.max_attempts = 1;
    if (retry.backoff_base < 0) retry.backoff_base = RETRY_BACKOFF_BASE_SECS;
    if (retry.backoff_cap < 0) retry.backoff_cap = RETRY_BACKOFF_CAP_SECS;
    return retry;
}

static PollConfig parse_poll_config(const YAML::Node& node) {
    PollConfig poll;
    poll.interval = node["interval"].as<double>(POLL_INTERVAL_SECS);
    poll.timeout = node["timeout"].as<double>(POLL_TIMEOUT_SECS);

    // A zero interval would spin every worker against the status endpoint
    if (poll.interval < POLL_MIN_INTERVAL_SECS) poll.interval = POLL_MIN_INTERVAL_SECS;
    if (poll.timeout <= 0) poll.timeout = POLL_TIMEOUT_SECS;
    return poll;
}

static TransferConfig parse_transfer_config(const YAML::Node& node) {
    TransferConfig t;
    t.workers = node["workers"].as<int>(DEFAULT_WORKERS);
    t.page_size = node["page_size"].as<int>(LIST_PAGE_SIZE);
    t.max_pages = node["max_pages"].as<int>(LIST_MAX_PAGES);
    t.url_expiry_hours = node["url_expiry_hours"].as<int>(OCR_URL_EXPIRY_HOURS);
    t.standardization_page_size = node["standardization_page_size"].as<int>(STANDARDIZATION_PAGE_SIZE);
    t.recursive = node["recursive"].as<bool>(false);
    t.disambiguate_collisions = node["disambiguate_collisions"].as<bool>(true);

    // Accept a single string or a list
    if (node["allowed_extensions"] && node["allowed_extensions"].IsSequence()) {
        t.allowed_extensions = node["allowed_extensions"].as<std::vector<std::string>>(std::vector<std::string>());
    } else if (node["allowed_extensions"] && node["allowed_extensions"].IsScalar()) {
        t.allowed_extensions.push_back(node["allowed_extensions"].as<std::string>());
    } else {
        t.allowed_extensions.assign(std::begin(DEFAULT_ALLOWED_EXTENSIONS),
                                    std::end(DEFAULT_ALLOWED_EXTENSIONS));
    }

    if (t.workers < 1) t.workers = 1;
    if (t.page_size < 1) t.page_size = LIST_PAGE_SIZE;
    return t;
}

static LoggingConfig parse_logging_config(const YAML::Node& node) {
    LoggingConfig logging;
    logging.dir = node["dir"].as<std::string>("");
    logging.verbose = node["verbose"].as<bool>(false);
    return logging;
}

Config Config::defaults() {
    Config config;
    config.api_ = parse_api_config(YAML::Node());
    config.retry_ = parse_retry_config(YAML::Node());
    config.poll_ = parse_poll_config(YAML::Node());
    config.transfer_ = parse_transfer_config(YAML::Node());
    config.logging_ = parse_logging_config(YAML::Node());
    return config;
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        config.api_ = parse_api_config(root["api"] ? root["api"] : YAML::Node());
        config.retry_ = parse_retry_config(root["retry"] ? root["retry"] : YAML::Node());
        config.poll_ = parse_poll_config(root["poll"] ? root["poll"] : YAML::Node());
        config.transfer_ = parse_transfer_config(root["transfer"] ? root["transfer"] : YAML::Node());
        config.logging_ = parse_logging_config(root["logging"] ? root["logging"] : YAML::Node());
        config.source_ = path;

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err("Failed to parse config " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(defaults());
    }
    return load_file(get_global_config_path());
}
