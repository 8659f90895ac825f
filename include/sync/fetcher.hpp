#pragma once

#include "net/http_client.hpp"
#include "sync/sync_observer.hpp"
#include "util/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace luasync {

class Fetcher {
  public:
    Fetcher(IHttpClient& http, ISyncObserver& observer, long timeout_sec = 15);

    // Reports the outcome through the observer and never propagates a fault.
    bool Download(const std::string& url, const std::filesystem::path& destination);

    // GET |url| and replace |destination| with the body. NetworkError for
    // transport faults and non-2xx status, FileSystemError for write faults.
    Result Fetch(const std::string& url, const std::filesystem::path& destination) const;

    // Creates parent directories, writes |body| to "<destination>.tmp" and
    // renames it over |destination|.
    static Result WriteBody(std::string_view body, const std::filesystem::path& destination);

  private:
    IHttpClient& http_;
    ISyncObserver& observer_;
    long timeout_sec_ = 15;
};

} // namespace luasync
