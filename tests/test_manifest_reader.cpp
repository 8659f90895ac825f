#include <gtest/gtest.h>

#include "sync/manifest_reader.hpp"
#include "testing.hpp"

#include <algorithm>

namespace luasync {

class ManifestReaderTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    ManifestReader reader;

    std::string ManifestPath() const { return temp_dir.Path() + "/luasync.ini"; }
};

TEST_F(ManifestReaderTest, MissingFileIsManifestMissing) {
    std::vector<std::string> out{"stale"};
    auto res = reader.Read(ManifestPath(), out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ManifestMissing);
    EXPECT_TRUE(out.empty());
}

TEST_F(ManifestReaderTest, TrimsAndDropsBlankLinesKeepingOrder) {
    testutil::WriteFile(ManifestPath(), "  YT.lua  \r\n\r\n'disabled.lua\n\t\nrutv_pls.lua\nTVSources.zip");

    std::vector<std::string> out;
    auto res = reader.Read(ManifestPath(), out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, (std::vector<std::string>{"YT.lua", "'disabled.lua", "rutv_pls.lua", "TVSources.zip"}));
}

TEST_F(ManifestReaderTest, EmptyFileYieldsEmptyList) {
    testutil::WriteFile(ManifestPath(), "\n  \n");
    std::vector<std::string> out;
    auto res = reader.Read(ManifestPath(), out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_TRUE(out.empty());
}

TEST_F(ManifestReaderTest, SkipsUtf8BomAndAcceptsNonAsciiNames) {
    testutil::WriteFile(ManifestPath(), "\xEF\xBB\xBF" "first.lua\n\xD1\x82\xD0\xB2.lua\n");
    std::vector<std::string> out;
    auto res = reader.Read(ManifestPath(), out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], "first.lua");
    EXPECT_EQ(out[1], "\xD1\x82\xD0\xB2.lua");
}

TEST_F(ManifestReaderTest, InvalidUtf8IsReadError) {
    testutil::WriteFile(ManifestPath(), "ok.lua\n\xFF\xFE bad.lua\n");
    std::vector<std::string> out;
    auto res = reader.Read(ManifestPath(), out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ManifestReadError);
    EXPECT_NE(res.msg.find("invalid UTF-8"), std::string::npos);
}

TEST_F(ManifestReaderTest, DirectoryIsReadError) {
    std::filesystem::create_directories(ManifestPath());
    std::vector<std::string> out;
    auto res = reader.Read(ManifestPath(), out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::ManifestReadError);
}

TEST(ManifestEntriesTest, ActiveEntriesDropsCommentLinesOnly) {
    const std::vector<std::string> raw = {"'disabled.lua", "real.lua", "a'b.lua", "'"};
    EXPECT_EQ(ActiveEntries(raw), (std::vector<std::string>{"real.lua", "a'b.lua"}));
}

TEST_F(ManifestReaderTest, TemplateIsSortedAndReadable) {
    auto res = WriteManifestTemplate(ManifestPath());
    ASSERT_TRUE(res.is_ok()) << res.msg;

    std::vector<std::string> out;
    res = reader.Read(ManifestPath(), out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, DefaultManifestTemplate());
    EXPECT_TRUE(std::is_sorted(out.begin(), out.end()));
    EXPECT_NE(std::find(out.begin(), out.end(), "TVSources.zip"), out.end());
    EXPECT_NE(std::find(out.begin(), out.end(), "YT.lua"), out.end());
}

} // namespace luasync
