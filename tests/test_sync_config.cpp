#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/sync_config.hpp"

namespace luasync::config {

TEST(SyncConfigTest, DefaultsMatchPlayerLayout) {
    SyncConfig cfg;
    cfg.install_root = "/opt/simpletv";

    EXPECT_EQ(cfg.VideoDir(), std::filesystem::path("/opt/simpletv/luaScr/user/video"));
    EXPECT_EQ(cfg.ScrapersDir(), std::filesystem::path("/opt/simpletv/luaScr/user/TVSources/AutoSetup"));
    EXPECT_EQ(cfg.TimeshiftDir(),
              std::filesystem::path("/opt/simpletv/luaScr/user/httptimeshift/extensions"));
    EXPECT_EQ(cfg.ManifestPath(), std::filesystem::path("/opt/simpletv/luasync.ini"));
    EXPECT_EQ(cfg.release_timeout_sec, 10);
    EXPECT_EQ(cfg.download_timeout_sec, 15);
}

TEST(SyncConfigTest, LoadFileOverlaysPresentKeys) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/luasync.json";
    testutil::WriteFile(path, R"({
        "InstallRoot": "/srv/tv",
        "ManifestPath": "lists/scripts.ini",
        "YouTubeUrl": "https://mirror.example/yt/",
        "DownloadTimeoutSec": 30,
        "LogLevel": "debug",
        "SomethingElse": true
    })");

    SyncConfig cfg;
    auto res = cfg.LoadFile(path);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(cfg.install_root, std::filesystem::path("/srv/tv"));
    EXPECT_EQ(cfg.ManifestPath(), std::filesystem::path("/srv/tv/lists/scripts.ini"));
    EXPECT_EQ(cfg.youtube_url, "https://mirror.example/yt/");
    EXPECT_EQ(cfg.download_timeout_sec, 30);
    EXPECT_EQ(cfg.release_timeout_sec, 10);
    ASSERT_TRUE(cfg.log_level.has_value());
    EXPECT_EQ(*cfg.log_level, LogLevel::Debug);
}

TEST(SyncConfigTest, RejectsInvalidValues) {
    struct FailCase {
        const char* json;
        const char* expected_error_substr;
    };
    const FailCase cases[] = {
        {"not json", "invalid JSON"},
        {"[1, 2]", "root must be JSON object"},
        {R"({"VideoUrl": 5})", "'VideoUrl' must be a string"},
        {R"({"ReleaseTimeoutSec": 0})", "'ReleaseTimeoutSec' must be positive"},
        {R"({"DownloadTimeoutSec": "15"})", "'DownloadTimeoutSec' must be an integer"},
        {R"({"ScrapersUrl": "https://example/no-slash"})", "must end with '/'"},
        {R"({"LogLevel": "loud"})", "unknown LogLevel"},
    };

    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.Path() + "/bad.json";
    for (const auto& c : cases) {
        testutil::WriteFile(path, c.json);
        SyncConfig cfg;
        auto res = cfg.LoadFile(path);
        ASSERT_FALSE(res.is_ok()) << c.json;
        EXPECT_EQ(res.kind, ErrorKind::ConfigError);
        EXPECT_NE(res.msg.find(c.expected_error_substr), std::string::npos) << res.msg;
    }
}

TEST(SyncConfigTest, MissingFileIsConfigError) {
    SyncConfig cfg;
    auto res = cfg.LoadFile("/nonexistent/luasync.json");
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ConfigError);
}

} // namespace luasync::config
