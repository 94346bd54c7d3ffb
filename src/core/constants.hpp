#pragma once

// ── Application ─────────────────────────────────────────────
constexpr const char* APP_NAME           = "docsync";
constexpr const char* APP_DIR_ENV        = "DOCSYNC_HOME";   // overrides the per-user data dir

// ── Service ─────────────────────────────────────────────────
constexpr const char* DEFAULT_BASE_URL   = "https://app.docupipe.ai";
constexpr const char* API_KEY_HEADER     = "X-API-Key";
constexpr const char* API_KEY_ENV        = "DOCSYNC_API_KEY";
constexpr const char* API_KEY_CREDENTIAL = "api_key";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SUBMIT_TIMEOUT_SECS        = 100;   // Upload POST carries the whole file
constexpr int REQUEST_TIMEOUT_SECS       = 10;    // Status / standardize calls
constexpr int DOWNLOAD_TIMEOUT_SECS      = 40;    // Download-side calls
constexpr int POLL_INTERVAL_SECS         = 5;     // Seconds between status checks
constexpr int POLL_TIMEOUT_SECS          = 900;   // Total wait for a doc or standardization
constexpr double POLL_MIN_INTERVAL_SECS  = 0.5;

// ── Retry policy ────────────────────────────────────────────
constexpr int RETRY_MAX_ATTEMPTS         = 10;
constexpr int RETRY_BACKOFF_BASE_SECS    = 2;
constexpr int RETRY_BACKOFF_CAP_SECS     = 600;   // Circuit breaker trips at 2x this
constexpr long RETRY_STATUSES[]          = {408, 429, 500, 502, 503, 504};

// ── Transfer ────────────────────────────────────────────────
constexpr int DEFAULT_WORKERS            = 20;
constexpr int LIST_PAGE_SIZE             = 20000;
constexpr int LIST_MAX_PAGES             = 500;   // Guards against server pagination bugs
constexpr int OCR_URL_EXPIRY_HOURS       = 6;
constexpr int STANDARDIZATION_PAGE_SIZE  = 20;
constexpr int SCHEMA_LIST_LIMIT          = 1000;
constexpr const char* OCR_ARTIFACT_EXT   = "pdf";
constexpr const char* DEFAULT_ALLOWED_EXTENSIONS[] = {
    ".pdf", ".jpg", ".jpeg", ".png", ".txt", ".tiff", ".tif", ".webp"
};

// ── Endpoint templates ──────────────────────────────────────
// Use fmt::format with these: fmt::format(ENDPOINT_DOCUMENT_STATUS, base_url, document_id)
constexpr const char* ENDPOINT_DOCUMENTS          = "{}/documents?dataset={}&limit={}&offset={}&exclude_payload=true";
constexpr const char* ENDPOINT_DOCUMENT_SUBMIT    = "{}/document";
constexpr const char* ENDPOINT_DOCUMENT_STATUS    = "{}/document/{}";
constexpr const char* ENDPOINT_OCR_URL            = "{}/document/{}/download/ocr-url?hours={}";
constexpr const char* ENDPOINT_STANDARDIZE_BATCH  = "{}/v2/standardize/batch";
constexpr const char* ENDPOINT_STANDARDIZATION    = "{}/standardization/{}";
constexpr const char* ENDPOINT_STANDARDIZATIONS   = "{}/standardizations?document_id={}&limit={}&offset=0&exclude_payload=false";
constexpr const char* ENDPOINT_SCHEMAS            = "{}/schemas?limit={}&offset=0&exclude_payload=true";
constexpr const char* ENDPOINT_DATASET_NAMES      = "{}/dataset-names";
