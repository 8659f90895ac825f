#pragma once

#include "net/http_client.hpp"
#include "util/result.hpp"
#include "util/sync_config.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace luasync {

struct ReleaseAsset {
    std::string name;
    std::string download_url;
};

class ReleaseResolver {
  public:
    struct Options {
        std::string endpoint;
        std::string keyword = "tvsources";
        std::string extension = ".zip";
        long timeout_sec = 10;

        static Options FromConfig(const config::SyncConfig& cfg);
    };

    ReleaseResolver(IHttpClient& http, Options opt);

    // Ok with an empty |out| means the release carries no matching asset.
    // NetworkError on transport faults, non-2xx status or a malformed body.
    Result ResolveLatestArchive(std::optional<ReleaseAsset>& out) const;

    // Picks the first asset whose lowercased name ends with |extension| and
    // contains |keyword|.
    static Result SelectArchiveAsset(std::string_view release_json,
                                     std::string_view keyword,
                                     std::string_view extension,
                                     std::optional<ReleaseAsset>& out);

  private:
    IHttpClient& http_;
    Options opt_;
};

} // namespace luasync
