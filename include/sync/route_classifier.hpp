#pragma once

#include "util/sync_config.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace luasync {

enum class RouteKind : int {
    Direct = 0,
    AggregateArchive,
    Unknown,
};

const char* ToString(RouteKind kind);

struct Route {
    RouteKind kind = RouteKind::Unknown;
    std::string name;
    // Set for Direct routes only.
    std::filesystem::path destination;
    std::string source_url;

    bool operator==(const Route&) const = default;
};

// Folders and base URLs the naming rules route into.
struct RouteLayout {
    std::filesystem::path video_dir;
    std::filesystem::path scrapers_dir;
    std::filesystem::path timeshift_dir;

    std::string video_url;
    std::string scrapers_url;
    std::string timeshift_url;
    std::string youtube_url;

    std::string aggregate_archive_name;

    static RouteLayout FromConfig(const config::SyncConfig& cfg);
};

// Name markers, evaluated in the order Classify() applies them.
inline constexpr std::string_view kScraperPlaylistMarker = "_pls.lua";
inline constexpr std::string_view kYouTubePrefix = "YT.lua";
inline constexpr std::string_view kTimeshiftMarker = "timeshift_ext.lua";
inline constexpr std::string_view kPlayerCorePrefix = "playerjs.lua";
inline constexpr std::string_view kScriptExtension = ".lua";
inline constexpr std::string_view kPlayerCoreSubdir = "core";

class RouteClassifier {
  public:
    explicit RouteClassifier(RouteLayout layout);

    // Total: every input yields a route, Unknown when no rule matches.
    Route Classify(std::string_view name) const;

  private:
    Route Direct(std::string_view name,
                 const std::filesystem::path& dir,
                 const std::string& base_url) const;

    RouteLayout layout_;
};

} // namespace luasync
