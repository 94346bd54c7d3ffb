#include <gtest/gtest.h>
#include <http/request_executor.hpp>
#include <core/log.hpp>
#include <filesystem>
#include <fstream>
#include "fakes.hpp"

namespace fs = std::filesystem;

static const std::string URL = "http://svc/thing";

static RetryPolicy policy(int max_attempts, double base, double cap) {
    RetryPolicy p;
    p.max_attempts = max_attempts;
    p.backoff_base = base;
    p.backoff_cap = cap;
    return p;
}

TEST(RetryPolicy, BackoffDoublesUntilCap) {
    RetryPolicy p = policy(10, 2, 600);
    EXPECT_DOUBLE_EQ(p.backoff_for(1), 2);
    EXPECT_DOUBLE_EQ(p.backoff_for(2), 4);
    EXPECT_DOUBLE_EQ(p.backoff_for(3), 8);
    EXPECT_DOUBLE_EQ(p.backoff_for(9), 512);
    EXPECT_DOUBLE_EQ(p.backoff_for(10), 600);
    EXPECT_DOUBLE_EQ(p.circuit_limit(), 1200);
}

TEST(RetryPolicy, FromConfigKeepsDefaultStatusesWhenUnset) {
    RetryConfig cfg;
    cfg.max_attempts = 0;
    auto p = RetryPolicy::from_config(cfg);
    EXPECT_EQ(p.max_attempts, 1);
    EXPECT_EQ(p.retry_statuses, (std::set<long>{408, 429, 500, 502, 503, 504}));
}

TEST(RequestExecutor, SucceedsAfterRetryableStatuses) {
    FakeTransport transport;
    FakeClock clock;
    transport.script("GET", URL, {respond(503), respond(429), respond(200, "ok")});

    RequestExecutor exec(transport, clock, policy(10, 2, 600));
    auto r = exec.execute("GET", URL);

    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.response.status, 200);
    EXPECT_EQ(r.response.body, "ok");
    EXPECT_EQ(r.attempts, 3);
    EXPECT_EQ(r.retries, 2);
    EXPECT_EQ(clock.sleeps(), (std::vector<double>{2, 4}));
    EXPECT_DOUBLE_EQ(r.slept, 6);
}

TEST(RequestExecutor, TransportErrorsAreRetried) {
    FakeTransport transport;
    FakeClock clock;
    transport.script("GET", URL, {transport_error("connection refused"), respond(204)});

    RequestExecutor exec(transport, clock, policy(10, 2, 600));
    auto r = exec.execute("GET", URL);

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(transport.calls("GET", URL), 2);
    EXPECT_EQ(clock.sleeps().size(), 1u);
}

TEST(RequestExecutor, ExhaustsAttemptBudget) {
    FakeTransport transport;
    FakeClock clock;
    transport.script("POST", URL, {respond(500, "boom")});

    RequestExecutor exec(transport, clock, policy(4, 1, 100));
    auto r = exec.execute("POST", URL);

    EXPECT_EQ(r.failure, ExecFailure::Exhausted);
    EXPECT_EQ(transport.calls("POST", URL), 4);
    EXPECT_EQ(clock.sleeps(), (std::vector<double>{1, 2, 4}));
    EXPECT_NE(r.error.find("POST"), std::string::npos);
    EXPECT_NE(r.error.find(URL), std::string::npos);
    EXPECT_NE(r.error.find("status=500"), std::string::npos);
}

TEST(RequestExecutor, CircuitBreakerStopsBeforeOversleeping) {
    FakeTransport transport;
    FakeClock clock;
    transport.script("GET", URL, {respond(502)});

    // limit 8: sleeps 2 then 4, the next 4 would reach 10
    RequestExecutor exec(transport, clock, policy(10, 2, 4));
    auto r = exec.execute("GET", URL);

    EXPECT_EQ(r.failure, ExecFailure::CircuitBreaker);
    EXPECT_EQ(transport.calls("GET", URL), 3);
    EXPECT_EQ(clock.sleeps(), (std::vector<double>{2, 4}));
    EXPECT_NE(r.error.find("circuit breaker"), std::string::npos);
}

TEST(RequestExecutor, CircuitBreakerAllowsSleepingExactlyToLimit) {
    FakeTransport transport;
    FakeClock clock;
    transport.script("GET", URL, {respond(503)});

    // limit 4: 2 + 2 lands on the limit, the third sleep would pass it
    RequestExecutor exec(transport, clock, policy(10, 2, 2));
    auto r = exec.execute("GET", URL);

    EXPECT_EQ(r.failure, ExecFailure::CircuitBreaker);
    EXPECT_EQ(transport.calls("GET", URL), 3);
    EXPECT_EQ(clock.sleeps(), (std::vector<double>{2, 2}));
    EXPECT_DOUBLE_EQ(r.slept, 4);
}

TEST(RequestExecutor, FinalAttemptIsNotLoggedAsRetry) {
    fs::path saved = log_path();
    fs::path run_log = fs::temp_directory_path() / "docsync_executor_log_test.log";
    fs::remove(run_log);
    log_init(run_log);

    FakeTransport transport;
    FakeClock clock;
    transport.script("GET", URL, {respond(500)});
    RequestExecutor exec(transport, clock, policy(2, 1, 60));
    auto r = exec.execute("GET", URL);
    log_init(saved);

    EXPECT_EQ(r.failure, ExecFailure::Exhausted);

    std::ifstream in(run_log);
    std::string line;
    int will_retry = 0, exhausted = 0;
    while (std::getline(in, line)) {
        if (line.find("Will retry") != std::string::npos) ++will_retry;
        if (line.find("Exhausted retries") != std::string::npos) ++exhausted;
    }
    EXPECT_EQ(will_retry, 1);
    EXPECT_EQ(exhausted, 1);
    fs::remove(run_log);
}

TEST(RequestExecutor, NonRetryableStatusFailsImmediately) {
    FakeTransport transport;
    FakeClock clock;
    transport.script("GET", URL, {respond(404, "missing"), respond(200)});

    RequestExecutor exec(transport, clock, policy(10, 2, 600));
    auto r = exec.execute("GET", URL);

    EXPECT_EQ(r.failure, ExecFailure::HttpError);
    EXPECT_EQ(r.response.status, 404);
    EXPECT_EQ(transport.calls("GET", URL), 1);
    EXPECT_TRUE(clock.sleeps().empty());
}

TEST(RequestExecutor, AcceptedStatusIsReturnedAsResponse) {
    FakeTransport transport;
    FakeClock clock;
    transport.script("GET", URL, {respond(404)});

    RequestOptions opts;
    opts.accept_statuses = {404};
    RequestExecutor exec(transport, clock, policy(10, 2, 600));
    auto r = exec.execute("GET", URL, opts);

    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.response.status, 404);
}

TEST(RequestExecutor, PerCallAttemptOverride) {
    FakeTransport transport;
    FakeClock clock;
    transport.script("GET", URL, {respond(503)});

    RequestOptions opts;
    opts.max_attempts = 1;
    RequestExecutor exec(transport, clock, policy(10, 2, 600));
    auto r = exec.execute("GET", URL, opts);

    EXPECT_EQ(r.failure, ExecFailure::Exhausted);
    EXPECT_EQ(transport.calls("GET", URL), 1);
    EXPECT_TRUE(clock.sleeps().empty());
}

TEST(RequestExecutor, CanceledBeforeFirstAttempt) {
    FakeTransport transport;
    FakeClock clock;
    transport.script("GET", URL, {respond(200)});
    std::atomic<bool> cancel{true};

    RequestExecutor exec(transport, clock, policy(10, 2, 600), &cancel);
    auto r = exec.execute("GET", URL);

    EXPECT_EQ(r.failure, ExecFailure::Canceled);
    EXPECT_EQ(transport.calls("GET", URL), 0);
}

TEST(RequestExecutor, SendsRequestFields) {
    FakeTransport transport;
    FakeClock clock;
    transport.script("POST", URL, {respond(201)});

    RequestOptions opts;
    opts.headers = {{"X-API-Key", "k"}};
    opts.body = "{}";
    opts.timeout_secs = 100;
    RequestExecutor exec(transport, clock, policy(10, 2, 600));
    ASSERT_TRUE(exec.execute("POST", URL, opts).ok());

    auto reqs = transport.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].body, "{}");
    EXPECT_EQ(reqs[0].timeout_secs, 100);
    ASSERT_EQ(reqs[0].headers.size(), 1u);
    EXPECT_EQ(reqs[0].headers[0].second, "k");
}
