#include "request_executor.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

RetryPolicy RetryPolicy::from_config(const RetryConfig& cfg) {
    RetryPolicy p;
    p.max_attempts = std::max(1, cfg.max_attempts);
    p.backoff_base = cfg.backoff_base;
    p.backoff_cap = cfg.backoff_cap;
    if (!cfg.retry_statuses.empty()) {
        p.retry_statuses = cfg.retry_statuses;
    }
    return p;
}

double RetryPolicy::backoff_for(int attempt) const {
    double raw = backoff_base * std::pow(2.0, attempt - 1);
    return std::min(raw, backoff_cap);
}

RequestExecutor::RequestExecutor(HttpTransport& transport, Clock& clock, RetryPolicy policy,
                                 const std::atomic<bool>* cancel)
    : transport_(transport), clock_(clock), policy_(std::move(policy)), cancel_(cancel) {}

ExecResult RequestExecutor::execute(const std::string& method, const std::string& url,
                                    const RequestOptions& options) const {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.headers = options.headers;
    req.body = options.body;
    req.timeout_secs = options.timeout_secs;

    int max_attempts = options.max_attempts > 0 ? options.max_attempts : policy_.max_attempts;
    double limit = policy_.circuit_limit();

    ExecResult result;
    std::string last_failure = "no attempt made";

    while (result.attempts < max_attempts) {
        if (canceled()) {
            result.failure = ExecFailure::Canceled;
            result.error = fmt::format("{} {} canceled after {} attempt(s)", method, url, result.attempts);
            return result;
        }

        int attempt = ++result.attempts;
        auto r = transport_.perform(req);

        if (r.is_ok()) {
            long status = r.value.status;
            if (r.value.ok() || options.accept_statuses.count(status)) {
                result.response = std::move(r.value);
                return result;
            }
            if (!policy_.retry_statuses.count(status)) {
                docsync_error(fmt::format("Request {} {} attempt={} failed with status={}: {}",
                                          method, url, attempt, status, clip(r.value.body)));
                result.response = std::move(r.value);
                result.failure = ExecFailure::HttpError;
                result.error = fmt::format("{} {} failed with status {}", method, url, status);
                return result;
            }
            last_failure = fmt::format("status={}", status);
            result.response = std::move(r.value);
        } else {
            last_failure = r.error;
        }

        if (attempt >= max_attempts) {
            docsync_warn(fmt::format("Request {} {} attempt={} failed with {}.",
                                     method, url, attempt, last_failure));
            break;
        }
        docsync_warn(fmt::format("Request {} {} attempt={} failed with {}. Will retry...",
                                 method, url, attempt, last_failure));

        double sleep = policy_.backoff_for(attempt);
        if (result.slept + sleep > limit) {
            docsync_error(fmt::format("Circuit breaker triggered: total sleep time {} "
                                      "would exceed limit of {} seconds.",
                                      result.slept + sleep, limit));
            result.failure = ExecFailure::CircuitBreaker;
            result.error = fmt::format("{} {} aborted by circuit breaker after {} attempt(s), "
                                       "last error: {}", method, url, attempt, last_failure);
            return result;
        }

        clock_.sleep_for(sleep, cancel_);
        result.slept += sleep;
        ++result.retries;
    }

    if (result.failure == ExecFailure::None && result.attempts >= max_attempts) {
        docsync_error(fmt::format("Exhausted retries for {} {}, last error: {}. Failing permanently.",
                                  method, url, last_failure));
        result.failure = ExecFailure::Exhausted;
        result.error = fmt::format("{} {} failed after {} attempt(s), last error: {}",
                                   method, url, result.attempts, last_failure);
    }
    return result;
}
