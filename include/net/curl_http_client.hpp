#pragma once

#include "net/http_client.hpp"

#include <string>

namespace luasync {

class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(std::string user_agent);

    Result Get(const std::string& url, long timeout_sec, HttpResponse& out) override;

private:
    std::string user_agent_;
};

} // namespace luasync
