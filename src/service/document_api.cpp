#include "document_api.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

using nlohmann::json;

// ── Helpers ─────────────────────────────────────────────────

static Result<json> parse_body(const ExecResult& r) {
    if (r.failed()) {
        return Result<json>::Err(r.error);
    }
    try {
        return Result<json>::Ok(json::parse(r.response.body.empty() ? "null" : r.response.body));
    } catch (const json::exception& e) {
        return Result<json>::Err(fmt::format("malformed JSON response ({}): {}",
                                             e.what(), clip(r.response.body, 120)));
    }
}

// Non-empty string field of a JSON object
static std::optional<std::string> string_field(const json& j, const char* key) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    auto s = it->get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

DocumentApi::DocumentApi(const RequestExecutor& executor, const ApiConfig& api, std::string api_key)
    : executor_(executor), api_(api), api_key_(std::move(api_key)) {}

HttpHeaders DocumentApi::json_headers() const {
    return {
        {"accept", "application/json"},
        {"content-type", "application/json"},
        {API_KEY_HEADER, api_key_},
    };
}

RequestOptions DocumentApi::options(int timeout_secs, std::string body) const {
    RequestOptions opts;
    opts.headers = json_headers();
    opts.timeout_secs = timeout_secs;
    opts.body = std::move(body);
    return opts;
}

// ── Upload side ─────────────────────────────────────────────

Result<std::string> DocumentApi::submit_document(const std::string& dataset,
                                                 const std::string& filename,
                                                 const std::string& contents_b64) const {
    json payload = {
        {"dataset", dataset},
        {"document", {{"file", {{"contents", contents_b64}, {"filename", filename}}}}},
    };

    auto r = executor_.execute("POST", fmt::format(ENDPOINT_DOCUMENT_SUBMIT, api_.base_url),
                               options(api_.submit_timeout, payload.dump()));
    auto body = parse_body(r);
    if (body.is_err()) return Result<std::string>::Err(body.error);

    auto id = string_field(body.value, "documentId");
    if (!id) {
        return Result<std::string>::Err("No documentId returned for " + filename);
    }
    return Result<std::string>::Ok(*id);
}

Result<std::string> DocumentApi::document_status(const std::string& document_id) const {
    auto r = executor_.execute("GET", fmt::format(ENDPOINT_DOCUMENT_STATUS, api_.base_url, document_id),
                               options(api_.request_timeout));
    auto body = parse_body(r);
    if (body.is_err()) return Result<std::string>::Err(body.error);

    auto status = string_field(body.value, "status");
    if (!status) {
        return Result<std::string>::Err("No status field for doc " + document_id);
    }
    return Result<std::string>::Ok(*status);
}

Result<std::string> DocumentApi::start_standardization(const std::string& document_id,
                                                       const std::string& schema_id) const {
    json payload = {
        {"documentIds", json::array({document_id})},
        {"schemaId", schema_id},
    };

    auto r = executor_.execute("POST", fmt::format(ENDPOINT_STANDARDIZE_BATCH, api_.base_url),
                               options(api_.request_timeout, payload.dump()));
    auto body = parse_body(r);
    if (body.is_err()) return Result<std::string>::Err(body.error);

    const json& j = body.value;
    if (j.is_object() && j.contains("standardizationIds") && j["standardizationIds"].is_array()
        && !j["standardizationIds"].empty() && j["standardizationIds"][0].is_string()) {
        return Result<std::string>::Ok(j["standardizationIds"][0].get<std::string>());
    }
    return Result<std::string>::Err("No standardizationId returned for doc " + document_id);
}

Result<bool> DocumentApi::standardization_ready(const std::string& standardization_id) const {
    auto opts = options(api_.request_timeout);
    opts.accept_statuses = {404};

    auto r = executor_.execute("GET", fmt::format(ENDPOINT_STANDARDIZATION, api_.base_url, standardization_id),
                               opts);
    if (r.failed()) {
        return Result<bool>::Err(r.error);
    }
    return Result<bool>::Ok(r.response.status != 404);
}

// ── Download side ───────────────────────────────────────────

Result<std::vector<Document>> DocumentApi::parse_documents(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return Result<std::vector<Document>>::Err(std::string("malformed document listing: ") + e.what());
    }
    if (!j.is_array()) {
        return Result<std::vector<Document>>::Err("document listing is not a JSON array");
    }

    std::vector<Document> docs;
    docs.reserve(j.size());
    for (const auto& item : j) {
        auto id = string_field(item, "documentId");
        if (!id) {
            return Result<std::vector<Document>>::Err("document record without documentId");
        }
        Document d;
        d.document_id = *id;
        d.filename = string_field(item, "filename").value_or("");
        d.file_extension = string_field(item, "fileExtension").value_or("");
        if (d.filename.empty()) d.filename = d.document_id;
        docs.push_back(std::move(d));
    }
    return Result<std::vector<Document>>::Ok(std::move(docs));
}

Result<std::vector<Document>> DocumentApi::list_documents_page(const std::string& dataset,
                                                               int limit, int offset) const {
    auto url = fmt::format(ENDPOINT_DOCUMENTS, api_.base_url, url_encode(dataset), limit, offset);
    auto r = executor_.execute("GET", url, options(api_.download_timeout));
    if (r.failed()) {
        return Result<std::vector<Document>>::Err(r.error);
    }
    return parse_documents(r.response.body);
}

Result<std::string> DocumentApi::ocr_url(const std::string& document_id, int expiry_hours) const {
    auto r = executor_.execute("GET", fmt::format(ENDPOINT_OCR_URL, api_.base_url, document_id, expiry_hours),
                               options(api_.download_timeout));
    auto body = parse_body(r);
    if (body.is_err()) return Result<std::string>::Err(body.error);

    auto url = string_field(body.value, "url");
    if (!url) {
        return Result<std::string>::Err("No download URL found in response.");
    }
    return Result<std::string>::Ok(*url);
}

Result<std::string> DocumentApi::fetch_artifact(const std::string& url) const {
    RequestOptions opts;
    opts.timeout_secs = api_.download_timeout;

    auto r = executor_.execute("GET", url, opts);
    if (r.failed()) {
        return Result<std::string>::Err(r.error);
    }
    return Result<std::string>::Ok(std::move(r.response.body));
}

Result<std::optional<nlohmann::json>> DocumentApi::standardization_data(const std::string& document_id,
                                                                        int page_size) const {
    using R = Result<std::optional<json>>;

    auto url = fmt::format(ENDPOINT_STANDARDIZATIONS, api_.base_url, url_encode(document_id), page_size);
    auto body = parse_body(executor_.execute("GET", url, options(api_.download_timeout)));
    if (body.is_err()) return R::Err(body.error);

    const json& j = body.value;
    if (!j.is_array()) {
        return R::Err("standardization listing is not a JSON array");
    }
    if (j.empty()) return R::Ok(std::nullopt);

    const json& first = j[0];
    if (!first.is_object() || !first.contains("data")) return R::Ok(std::nullopt);

    const json& data = first["data"];
    bool empty = data.is_null() || ((data.is_object() || data.is_array()) && data.empty());
    if (empty) return R::Ok(std::nullopt);
    return R::Ok(data);
}

// ── Enumeration ─────────────────────────────────────────────

Result<std::vector<Schema>> DocumentApi::parse_schemas(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return Result<std::vector<Schema>>::Err(std::string("malformed schema listing: ") + e.what());
    }
    if (!j.is_array()) {
        return Result<std::vector<Schema>>::Err("schema listing is not a JSON array");
    }

    std::vector<Schema> schemas;
    for (const auto& item : j) {
        auto id = string_field(item, "schemaId");
        if (!id) continue;
        schemas.push_back({string_field(item, "schemaName").value_or(""), *id});
    }
    return Result<std::vector<Schema>>::Ok(std::move(schemas));
}

Result<std::vector<Schema>> DocumentApi::list_schemas() const {
    auto opts = options(api_.request_timeout);
    opts.max_attempts = 1;

    auto r = executor_.execute("GET", fmt::format(ENDPOINT_SCHEMAS, api_.base_url, SCHEMA_LIST_LIMIT), opts);
    if (r.failed()) {
        return Result<std::vector<Schema>>::Err(r.error);
    }
    return parse_schemas(r.response.body);
}

Result<std::vector<std::string>> DocumentApi::list_dataset_names() const {
    using R = Result<std::vector<std::string>>;

    auto opts = options(api_.request_timeout);
    opts.max_attempts = 1;

    auto body = parse_body(executor_.execute("GET", fmt::format(ENDPOINT_DATASET_NAMES, api_.base_url), opts));
    if (body.is_err()) return R::Err(body.error);

    const json& j = body.value;
    if (!j.is_object() || !j.contains("datasetNames") || !j["datasetNames"].is_array()) {
        return R::Err("No datasetNames field in response");
    }

    std::vector<std::string> names;
    for (const auto& n : j["datasetNames"]) {
        if (n.is_string()) names.push_back(n.get<std::string>());
    }
    return R::Ok(std::move(names));
}
