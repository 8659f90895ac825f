#include <gtest/gtest.h>

#include "sync/archive_path_policy.hpp"

namespace luasync {

TEST(ArchivePathPolicyTest, NormalizesSafeEntryPath) {
    const ArchivePathPolicy policy{};
    std::string out;

    auto res = policy.NormalizeEntryPath("./luaScr//user/TVSources/core.lua", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "luaScr/user/TVSources/core.lua");
}

TEST(ArchivePathPolicyTest, RejectsEscapingEntryPaths) {
    const ArchivePathPolicy policy{};
    for (const char* raw : {"../escape.lua", "luaScr/../../escape.lua", "..\\escape.lua", "C:/Windows/x.dll"}) {
        std::string out;
        auto res = policy.NormalizeEntryPath(raw, out);
        ASSERT_FALSE(res.is_ok()) << raw;
        EXPECT_EQ(res.kind, ErrorKind::ArchiveError);
        EXPECT_NE(res.msg.find("Unsafe path in archive"), std::string::npos);
    }
}

TEST(ArchivePathPolicyTest, DotDotInsideNameIsAllowed) {
    EXPECT_TRUE(ArchivePathPolicy::IsSafeRelativePath("luaScr/a..b/x.lua"));
    EXPECT_TRUE(ArchivePathPolicy::IsSafeRelativePath("..hidden"));
}

TEST(ArchivePathPolicyTest, RejectsUnsafeHardlinkTarget) {
    const ArchivePathPolicy policy{};
    std::string out;

    auto res = policy.NormalizeHardlinkPath("../etc/passwd", out);
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Unsafe hardlink target"), std::string::npos);

    res = policy.NormalizeHardlinkPath(nullptr, out);
    ASSERT_TRUE(res.is_ok());
    EXPECT_TRUE(out.empty());
}

TEST(ArchivePathPolicyTest, RejectsBackslashPaths) {
    const ArchivePathPolicy policy{};
    for (const char* raw : {"\\etc\\x.lua", "luaScr\\user\\x.lua"}) {
        std::string out;
        auto res = policy.NormalizeEntryPath(raw, out);
        ASSERT_FALSE(res.is_ok()) << raw;
        EXPECT_EQ(res.kind, ErrorKind::ArchiveError);
    }
    EXPECT_FALSE(ArchivePathPolicy::IsSafeRelativePath("a\\b.lua"));
}

TEST(ArchivePathPolicyTest, LeadingSlashIsStripped) {
    const ArchivePathPolicy policy{};
    std::string out;
    auto res = policy.NormalizeEntryPath("/luaScr/x.lua", out);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out, "luaScr/x.lua");
}

} // namespace luasync
