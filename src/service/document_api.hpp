#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include <http/request_executor.hpp>

// Remote document-processing service. Every call goes through the
// RequestExecutor; responses are shape-checked here so callers get a plain
// Result with a message naming what was missing.
class DocumentApi {
public:
    DocumentApi(const RequestExecutor& executor, const ApiConfig& api, std::string api_key);

    // ── Upload side ─────────────────────────────────────────
    // POST /document; returns the new documentId
    Result<std::string> submit_document(const std::string& dataset,
                                        const std::string& filename,
                                        const std::string& contents_b64) const;

    // GET /document/{id}; returns the raw "status" value
    Result<std::string> document_status(const std::string& document_id) const;

    // POST /v2/standardize/batch; returns the first standardizationId
    Result<std::string> start_standardization(const std::string& document_id,
                                              const std::string& schema_id) const;

    // GET /standardization/{id}; false while the service answers 404
    Result<bool> standardization_ready(const std::string& standardization_id) const;

    // ── Download side ───────────────────────────────────────
    Result<std::vector<Document>> list_documents_page(const std::string& dataset,
                                                      int limit, int offset) const;

    // Short-lived signed URL for the OCR artifact
    Result<std::string> ocr_url(const std::string& document_id, int expiry_hours) const;

    // Raw bytes behind a signed URL (no API key attached)
    Result<std::string> fetch_artifact(const std::string& url) const;

    // "data" of the first standardization for the document, if any
    Result<std::optional<nlohmann::json>> standardization_data(const std::string& document_id,
                                                               int page_size) const;

    // ── Enumeration (single attempt) ────────────────────────
    Result<std::vector<Schema>> list_schemas() const;
    Result<std::vector<std::string>> list_dataset_names() const;

    // Response parsing, exposed for tests
    static Result<std::vector<Document>> parse_documents(const std::string& body);
    static Result<std::vector<Schema>> parse_schemas(const std::string& body);

private:
    const RequestExecutor& executor_;
    ApiConfig api_;
    std::string api_key_;

    HttpHeaders json_headers() const;
    RequestOptions options(int timeout_secs, std::string body = "") const;
};
