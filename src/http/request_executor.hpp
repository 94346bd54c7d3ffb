#pragma once

#include <atomic>
#include <set>
#include <string>
#include <core/types.hpp>
#include <platform/clock.hpp>
#include "transport.hpp"

struct RetryPolicy {
    int max_attempts = 10;
    double backoff_base = 2;     // seconds
    double backoff_cap = 600;    // seconds
    std::set<long> retry_statuses{408, 429, 500, 502, 503, 504};

    static RetryPolicy from_config(const RetryConfig& cfg);

    // min(base * 2^(attempt-1), cap), attempt is 1-based
    double backoff_for(int attempt) const;

    // Cumulative sleep ceiling
    double circuit_limit() const { return backoff_cap * 2; }
};

struct RequestOptions {
    HttpHeaders headers;
    std::string body;
    int timeout_secs = 40;
    std::set<long> accept_statuses;  // error statuses handed back instead of failing
    int max_attempts = 0;            // 0 = policy default
};

enum class ExecFailure {
    None,
    HttpError,        // non-retryable status
    Exhausted,        // attempt budget used up
    CircuitBreaker,   // next sleep would push total backoff past the limit
    Canceled,
};

// Outcome of one executed request, retries included
struct ExecResult {
    HttpResponse response;
    ExecFailure failure = ExecFailure::None;
    std::string error;
    int attempts = 0;
    int retries = 0;
    double slept = 0;

    bool ok() const { return failure == ExecFailure::None; }
    bool failed() const { return failure != ExecFailure::None; }
};

// Issues a request with bounded retries and exponential backoff. Retry
// decisions are logged; callers only see the final response or failure.
class RequestExecutor {
public:
    RequestExecutor(HttpTransport& transport, Clock& clock, RetryPolicy policy,
                    const std::atomic<bool>* cancel = nullptr);

    ExecResult execute(const std::string& method, const std::string& url,
                       const RequestOptions& options = {}) const;

    const RetryPolicy& policy() const { return policy_; }

private:
    HttpTransport& transport_;
    Clock& clock_;
    RetryPolicy policy_;
    const std::atomic<bool>* cancel_;

    bool canceled() const { return cancel_ && cancel_->load(); }
};
