#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace luasync::config {

inline constexpr const char kDefaultManifestName[] = "luasync.ini";

class SyncConfig {
public:
    std::filesystem::path install_root;
    // Empty means <install_root>/luasync.ini.
    std::filesystem::path manifest_path;

    // Relative folders resolve against install_root.
    std::filesystem::path video_dir = "luaScr/user/video";
    std::filesystem::path scrapers_dir = "luaScr/user/TVSources/AutoSetup";
    std::filesystem::path timeshift_dir = "luaScr/user/httptimeshift/extensions";

    std::string video_url =
        "https://raw.githubusercontent.com/Nexterr-origin/simpleTV-Scripts/main/Video%20Scripts/";
    std::string scrapers_url =
        "https://raw.githubusercontent.com/Nexterr-origin/simpleTV-Scripts/main/Scrapers%20TVSources/";
    std::string timeshift_url =
        "https://raw.githubusercontent.com/Nexterr-origin/simpleTV-Addons/main/timeshift-extensions/";
    std::string youtube_url = "https://raw.githubusercontent.com/Nexterr-origin/simpleTV-YouTube/main/";
    std::string release_api_url = "https://api.github.com/repos/BMSimple/SimpleTV/releases/latest";

    std::string aggregate_archive_name = "TVSources.zip";
    std::string asset_keyword = "tvsources";
    std::string asset_extension = ".zip";
    std::string user_agent = "luasync/1.0";

    long release_timeout_sec = 10;
    long download_timeout_sec = 15;

    std::optional<LogLevel> log_level;

    std::filesystem::path VideoDir() const;
    std::filesystem::path ScrapersDir() const;
    std::filesystem::path TimeshiftDir() const;
    std::filesystem::path ManifestPath() const;

    // Overlays keys present in the JSON file onto the current values.
    Result LoadFile(const std::string& path);
};

} // namespace luasync::config
