#include "sync/release_resolver.hpp"

#include "util/logger.hpp"
#include "util/string_utils.hpp"

#include <nlohmann/json.hpp>

namespace luasync {

using json = nlohmann::json;

ReleaseResolver::Options ReleaseResolver::Options::FromConfig(const config::SyncConfig& cfg) {
    Options opt;
    opt.endpoint = cfg.release_api_url;
    opt.keyword = cfg.asset_keyword;
    opt.extension = cfg.asset_extension;
    opt.timeout_sec = cfg.release_timeout_sec;
    return opt;
}

ReleaseResolver::ReleaseResolver(IHttpClient& http, Options opt) : http_(http), opt_(std::move(opt)) {}

Result ReleaseResolver::ResolveLatestArchive(std::optional<ReleaseAsset>& out) const {
    out.reset();

    HttpResponse resp;
    auto res = http_.Get(opt_.endpoint, opt_.timeout_sec, resp);
    if (!res.is_ok()) return res;

    if (!resp.IsSuccess()) {
        return Result::Fail(ErrorKind::NetworkError,
                            "release lookup " + opt_.endpoint + " returned HTTP " +
                                std::to_string(resp.status));
    }

    return SelectArchiveAsset(resp.body, opt_.keyword, opt_.extension, out);
}

Result ReleaseResolver::SelectArchiveAsset(std::string_view release_json,
                                           std::string_view keyword,
                                           std::string_view extension,
                                           std::optional<ReleaseAsset>& out) {
    out.reset();

    const std::string want_keyword = ToLower(keyword);
    const std::string want_ext = ToLower(extension);

    try {
        const auto j = json::parse(release_json);
        if (!j.is_object()) {
            return Result::Fail(ErrorKind::NetworkError, "release metadata root must be an object");
        }

        auto it = j.find("assets");
        if (it == j.end()) {
            LogDebug("release metadata has no 'assets'");
            return Result::Ok();
        }
        if (!it->is_array()) {
            return Result::Fail(ErrorKind::NetworkError, "release 'assets' must be an array");
        }

        for (const auto& asset : *it) {
            if (!asset.is_object()) continue;
            const std::string name = asset.value("name", "");
            const std::string lower = ToLower(name);
            if (!EndsWith(lower, want_ext) || !Contains(lower, want_keyword)) continue;

            auto url = asset.find("browser_download_url");
            if (url == asset.end() || !url->is_string() || url->get<std::string>().empty()) {
                return Result::Fail(ErrorKind::NetworkError,
                                    "asset '" + name + "' has no browser_download_url");
            }
            out = ReleaseAsset{.name = name, .download_url = url->get<std::string>()};
            return Result::Ok();
        }
        return Result::Ok();
    } catch (const json::exception& e) {
        return Result::Fail(ErrorKind::NetworkError,
                            std::string("malformed release metadata: ") + e.what());
    }
}

} // namespace luasync
