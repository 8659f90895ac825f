#include <gtest/gtest.h>

#include "sync/route_classifier.hpp"

namespace luasync {

namespace {

RouteLayout TestLayout() {
    RouteLayout layout;
    layout.video_dir = "/tv/video";
    layout.scrapers_dir = "/tv/scrapers";
    layout.timeshift_dir = "/tv/timeshift";
    layout.video_url = "https://v.example/";
    layout.scrapers_url = "https://s.example/";
    layout.timeshift_url = "https://t.example/";
    layout.youtube_url = "https://y.example/";
    layout.aggregate_archive_name = "TVSources.zip";
    return layout;
}

} // namespace

TEST(RouteClassifierTest, RoutesEachCategory) {
    const RouteClassifier classifier(TestLayout());

    struct RouteCase {
        const char* name;
        RouteKind kind;
        const char* destination;
        const char* source_url;
    };
    const RouteCase cases[] = {
        {"TVSources.zip", RouteKind::AggregateArchive, "", ""},
        {"tvsources.ZIP", RouteKind::AggregateArchive, "", ""},
        {"foo_pls.lua", RouteKind::Direct, "/tv/scrapers/foo_pls.lua", "https://s.example/foo_pls.lua"},
        {"YT.lua", RouteKind::Direct, "/tv/video/YT.lua", "https://y.example/YT.lua"},
        {"wink-timeshift_ext.lua", RouteKind::Direct, "/tv/timeshift/wink-timeshift_ext.lua",
         "https://t.example/wink-timeshift_ext.lua"},
        {"playerjs.lua", RouteKind::Direct, "/tv/video/core/playerjs.lua",
         "https://v.example/core/playerjs.lua"},
        {"rutube.lua", RouteKind::Direct, "/tv/video/rutube.lua", "https://v.example/rutube.lua"},
        {"readme.txt", RouteKind::Unknown, "", ""},
        {"TVSources_v5.zip", RouteKind::Unknown, "", ""},
    };

    for (const auto& c : cases) {
        const Route r = classifier.Classify(c.name);
        EXPECT_EQ(r.kind, c.kind) << c.name;
        EXPECT_EQ(r.name, c.name);
        EXPECT_EQ(r.destination, std::filesystem::path(c.destination)) << c.name;
        EXPECT_EQ(r.source_url, c.source_url) << c.name;
    }
}

TEST(RouteClassifierTest, FirstMatchingRuleWins) {
    const RouteClassifier classifier(TestLayout());

    // Starts with the YouTube prefix and ends with the script extension.
    EXPECT_EQ(classifier.Classify("YT.lua").source_url, "https://y.example/YT.lua");

    // Scraper marker beats the YouTube prefix.
    const Route yt_pls = classifier.Classify("YT.lua_pls.lua");
    EXPECT_EQ(yt_pls.destination, std::filesystem::path("/tv/scrapers/YT.lua_pls.lua"));

    // Scraper marker beats the timeshift marker.
    EXPECT_EQ(classifier.Classify("x-timeshift_ext.lua_pls.lua").source_url,
              "https://s.example/x-timeshift_ext.lua_pls.lua");

    // YouTube prefix beats the timeshift marker.
    EXPECT_EQ(classifier.Classify("YT.lua-timeshift_ext.lua").source_url,
              "https://y.example/YT.lua-timeshift_ext.lua");

    // Timeshift marker beats the player-core prefix.
    EXPECT_EQ(classifier.Classify("playerjs.lua.timeshift_ext.lua").destination,
              std::filesystem::path("/tv/timeshift/playerjs.lua.timeshift_ext.lua"));

    // Prefix rules apply even without the generic extension at the end.
    EXPECT_EQ(classifier.Classify("YT.lua.bak").kind, RouteKind::Direct);
    EXPECT_EQ(classifier.Classify("playerjs.lua.old").destination,
              std::filesystem::path("/tv/video/core/playerjs.lua.old"));
}

TEST(RouteClassifierTest, PrefixChecksAreCaseSensitive) {
    const RouteClassifier classifier(TestLayout());
    EXPECT_EQ(classifier.Classify("yt.lua").source_url, "https://v.example/yt.lua");
    EXPECT_EQ(classifier.Classify("rutv.LUA").kind, RouteKind::Unknown);
}

TEST(RouteClassifierTest, IsTotalAndDeterministic) {
    const RouteClassifier classifier(TestLayout());
    for (const char* name : {"a", "'", ".lua", "_pls.lua", "zip", "TVSources.zip", " \t"}) {
        const Route first = classifier.Classify(name);
        const Route second = classifier.Classify(name);
        EXPECT_EQ(first, second) << name;
    }
}

TEST(RouteClassifierTest, LayoutFromConfigResolvesAgainstRoot) {
    config::SyncConfig cfg;
    cfg.install_root = "/opt/tv";
    const RouteClassifier classifier(RouteLayout::FromConfig(cfg));

    const Route r = classifier.Classify("foo_pls.lua");
    EXPECT_EQ(r.destination, std::filesystem::path("/opt/tv/luaScr/user/TVSources/AutoSetup/foo_pls.lua"));
    EXPECT_EQ(r.source_url, cfg.scrapers_url + "foo_pls.lua");
}

} // namespace luasync
