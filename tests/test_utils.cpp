#include <gtest/gtest.h>
#include <core/utils.hpp>

TEST(Utils, RemoteDirname) {
    EXPECT_EQ(remote_dirname("/a/b/c"), "/a/b");
    EXPECT_EQ(remote_dirname("/etc/file"), "/etc");
    EXPECT_EQ(remote_dirname("/x"), "/");
    EXPECT_EQ(remote_dirname("c"), ".");
}

TEST(Utils, StripNewlines) {
    EXPECT_EQ(strip_newlines("644\n"), "644");
    EXPECT_EQ(strip_newlines("a\nb\n"), "ab");
    EXPECT_EQ(strip_newlines(""), "");
}

TEST(Utils, SafeStoll) {
    EXPECT_EQ(safe_stoll("1000"), 1000);
    EXPECT_EQ(safe_stoll("UNKNOWN", -1), -1);
    EXPECT_EQ(safe_stoll("", 7), 7);
}

TEST(Utils, NowIsoShape) {
    std::string ts = now_iso();
    ASSERT_EQ(ts.size(), 19u);
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
}
