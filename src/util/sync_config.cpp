#include "util/sync_config.hpp"

#include "util/config_json_utils.hpp"
#include "util/path_utils.hpp"

namespace luasync::config {

std::filesystem::path SyncConfig::VideoDir() const {
    return ResolveUnder(install_root, video_dir);
}

std::filesystem::path SyncConfig::ScrapersDir() const {
    return ResolveUnder(install_root, scrapers_dir);
}

std::filesystem::path SyncConfig::TimeshiftDir() const {
    return ResolveUnder(install_root, timeshift_dir);
}

std::filesystem::path SyncConfig::ManifestPath() const {
    if (manifest_path.empty()) return install_root / kDefaultManifestName;
    return ResolveUnder(install_root, manifest_path);
}

Result SyncConfig::LoadFile(const std::string& path) {
    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::ConfigError, err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        return Result::Fail(ErrorKind::ConfigError, err + " in " + path);
    }

    return Result::Ok();
}

} // namespace luasync::config
