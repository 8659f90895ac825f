#pragma once

#include "util/result.hpp"

#include <string>

namespace luasync {

struct HttpResponse {
    long status = 0;
    std::string body;

    bool IsSuccess() const { return status >= 200 && status < 300; }
};

// Blocking HTTP GET. A returned Ok means the exchange completed; the status
// code is left for the caller to judge.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    virtual Result Get(const std::string& url, long timeout_sec, HttpResponse& out) = 0;
};

} // namespace luasync
