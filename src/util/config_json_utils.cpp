#include "util/config_json_utils.hpp"

#include <fstream>

namespace luasync::config::detail {

namespace {

// Absent keys leave |out| untouched; a present key of the wrong type is an error.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetPathIfPresent(const nlohmann::json& j, const char* key, std::filesystem::path& out, std::string& err) {
    std::string s;
    if (!GetStringIfPresent(j, key, s, err))
        return false;
    if (!s.empty())
        out = s;
    return true;
}

bool GetTimeoutIfPresent(const nlohmann::json& j, const char* key, long& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_number_integer()) {
        err = std::string("'") + key + "' must be an integer";
        return false;
    }
    const auto v = it->get<long long>();
    if (v <= 0) {
        err = std::string("'") + key + "' must be positive";
        return false;
    }
    out = static_cast<long>(v);
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, SyncConfig& cfg, std::string& err) {
    if (!GetPathIfPresent(j, "InstallRoot", cfg.install_root, err)) return false;
    if (!GetPathIfPresent(j, "ManifestPath", cfg.manifest_path, err)) return false;
    if (!GetPathIfPresent(j, "VideoDir", cfg.video_dir, err)) return false;
    if (!GetPathIfPresent(j, "ScrapersDir", cfg.scrapers_dir, err)) return false;
    if (!GetPathIfPresent(j, "TimeshiftDir", cfg.timeshift_dir, err)) return false;

    if (!GetStringIfPresent(j, "VideoUrl", cfg.video_url, err)) return false;
    if (!GetStringIfPresent(j, "ScrapersUrl", cfg.scrapers_url, err)) return false;
    if (!GetStringIfPresent(j, "TimeshiftUrl", cfg.timeshift_url, err)) return false;
    if (!GetStringIfPresent(j, "YouTubeUrl", cfg.youtube_url, err)) return false;
    if (!GetStringIfPresent(j, "ReleaseApiUrl", cfg.release_api_url, err)) return false;
    if (!GetStringIfPresent(j, "UserAgent", cfg.user_agent, err)) return false;

    if (!GetTimeoutIfPresent(j, "ReleaseTimeoutSec", cfg.release_timeout_sec, err)) return false;
    if (!GetTimeoutIfPresent(j, "DownloadTimeoutSec", cfg.download_timeout_sec, err)) return false;

    {
        std::string level;
        if (!GetStringIfPresent(j, "LogLevel", level, err)) return false;
        if (!level.empty()) {
            LogLevel lvl{};
            if (!ParseLogLevel(level, lvl)) {
                err = "unknown LogLevel '" + level + "'";
                return false;
            }
            cfg.log_level = lvl;
        }
    }

    for (const auto* url : {&cfg.video_url, &cfg.scrapers_url, &cfg.timeshift_url, &cfg.youtube_url}) {
        if (url->empty() || url->back() != '/') {
            err = "base URLs must end with '/': " + *url;
            return false;
        }
    }

    return true;
}

} // namespace luasync::config::detail
