#pragma once

#include <string>
#include <vector>
#include <utility>
#include <core/types.hpp>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HttpHeaders headers;
    std::string body;
    int timeout_secs = 40;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    // Same rule as an HTTP client's raise-for-status: anything below 400 is fine
    bool ok() const { return status > 0 && status < 400; }
};

// One HTTP exchange, no retries. A transport-level failure (DNS, connect,
// timeout, TLS) is an Err; any HTTP status, including 5xx, is an Ok response.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual Result<HttpResponse> perform(const HttpRequest& request) = 0;
};
