#pragma once

#include "transport.hpp"

// libcurl-backed transport. Each perform() uses its own easy handle, so one
// instance can be shared by every worker thread.
class CurlTransport : public HttpTransport {
public:
    CurlTransport();

    Result<HttpResponse> perform(const HttpRequest& request) override;
};
