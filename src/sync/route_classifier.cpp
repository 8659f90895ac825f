#include "sync/route_classifier.hpp"

#include "util/string_utils.hpp"

namespace luasync {

const char* ToString(RouteKind kind) {
    switch (kind) {
        case RouteKind::Direct:           return "direct";
        case RouteKind::AggregateArchive: return "aggregate-archive";
        case RouteKind::Unknown:          return "unknown";
    }
    return "unknown";
}

RouteLayout RouteLayout::FromConfig(const config::SyncConfig& cfg) {
    RouteLayout layout;
    layout.video_dir = cfg.VideoDir();
    layout.scrapers_dir = cfg.ScrapersDir();
    layout.timeshift_dir = cfg.TimeshiftDir();
    layout.video_url = cfg.video_url;
    layout.scrapers_url = cfg.scrapers_url;
    layout.timeshift_url = cfg.timeshift_url;
    layout.youtube_url = cfg.youtube_url;
    layout.aggregate_archive_name = cfg.aggregate_archive_name;
    return layout;
}

RouteClassifier::RouteClassifier(RouteLayout layout) : layout_(std::move(layout)) {}

Route RouteClassifier::Direct(std::string_view name,
                              const std::filesystem::path& dir,
                              const std::string& base_url) const {
    Route r;
    r.kind = RouteKind::Direct;
    r.name = std::string(name);
    r.destination = dir / r.name;
    r.source_url = base_url + r.name;
    return r;
}

// First match wins. The prefix rules must stay ahead of the generic
// extension rule: "YT.lua" also ends with ".lua".
Route RouteClassifier::Classify(std::string_view name) const {
    if (EqualsIgnoreCase(name, layout_.aggregate_archive_name)) {
        return Route{.kind = RouteKind::AggregateArchive, .name = std::string(name)};
    }
    if (Contains(name, kScraperPlaylistMarker)) {
        return Direct(name, layout_.scrapers_dir, layout_.scrapers_url);
    }
    if (StartsWith(name, kYouTubePrefix)) {
        return Direct(name, layout_.video_dir, layout_.youtube_url);
    }
    if (Contains(name, kTimeshiftMarker)) {
        return Direct(name, layout_.timeshift_dir, layout_.timeshift_url);
    }
    if (StartsWith(name, kPlayerCorePrefix)) {
        Route r = Direct(name, layout_.video_dir / kPlayerCoreSubdir, layout_.video_url);
        r.source_url = layout_.video_url + std::string(kPlayerCoreSubdir) + "/" + r.name;
        return r;
    }
    if (EndsWith(name, kScriptExtension)) {
        return Direct(name, layout_.video_dir, layout_.video_url);
    }
    return Route{.kind = RouteKind::Unknown, .name = std::string(name)};
}

} // namespace luasync
