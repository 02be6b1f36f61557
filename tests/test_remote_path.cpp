#include <gtest/gtest.h>
#include <util/remote_path.hpp>
#include <util/string_utils.hpp>
#include <core/utils.hpp>

TEST(RemotePathTest, JoinNormalizes) {
    EXPECT_EQ(RemotePath::join({"/backup", "a.txt"}), "/backup/a.txt");
    EXPECT_EQ(RemotePath::join({"/backup/", "/sub//b.txt"}), "/backup/sub/b.txt");
    EXPECT_EQ(RemotePath::join({"backup", "sub\\win\\c.txt"}), "backup/sub/win/c.txt");
    EXPECT_EQ(RemotePath::join({"/a/./b", "../c"}), "/a/c");
    EXPECT_EQ(RemotePath::join({"", "/x", "y"}), "/x/y");
}

TEST(RemotePathTest, JoinEdgeCases) {
    EXPECT_EQ(RemotePath::join({"/", ""}), "/");
    EXPECT_EQ(RemotePath::join({"", ""}), ".");
    EXPECT_EQ(RemotePath::join({"/a", "../../b"}), "/b");
    EXPECT_EQ(RemotePath::join({"a", "../../b"}), "../b");
}

TEST(RemotePathTest, ParentAndBasename) {
    EXPECT_EQ(RemotePath::parent("/backup/sub/b.txt"), "/backup/sub");
    EXPECT_EQ(RemotePath::parent("/a.txt"), "");
    EXPECT_EQ(RemotePath::parent("a.txt"), "");
    EXPECT_EQ(RemotePath::basename("/backup/sub/b.txt"), "b.txt");
    EXPECT_EQ(RemotePath::basename("/backup/sub/"), "sub");
    EXPECT_EQ(RemotePath::basename("plain"), "plain");
}

TEST(RemotePathTest, DirectoryKeyIgnoresSlashes) {
    EXPECT_EQ(RemotePath::directory_key("/backup/sub/"), "backup/sub");
    EXPECT_EQ(RemotePath::directory_key("backup//sub"), "backup/sub");
    EXPECT_EQ(RemotePath::directory_key("/"), "");
}

TEST(RemotePathTest, EncodeEachSegment) {
    EXPECT_EQ(RemotePath::encode("/backup/my file.txt"), "backup/my%20file.txt");
    EXPECT_EQ(RemotePath::encode("a&b/c#d?"), "a%26b/c%23d%3F");
    EXPECT_EQ(RemotePath::encode("/docs/caf\xc3\xa9"), "docs/caf%C3%A9");
}

TEST(UtilsTest, PercentCoding) {
    EXPECT_EQ(percent_encode("a-b_c.d!e~f*g'h(i)"), "a-b_c.d!e~f*g'h(i)");
    EXPECT_EQ(percent_encode("a b/c"), "a%20b%2Fc");
    EXPECT_EQ(percent_decode("a%20b%2fc").value(), "a b/c");
    EXPECT_FALSE(percent_decode("bad%2").has_value());
    EXPECT_FALSE(percent_decode("bad%zz").has_value());
}

TEST(UtilsTest, Base64) {
    EXPECT_EQ(base64_encode("user:pass"), "dXNlcjpwYXNz");
    EXPECT_EQ(base64_encode("ab"), "YWI=");
    EXPECT_EQ(base64_decode("YWI=").value(), "ab");
    EXPECT_EQ(base64_decode("YWI").value(), "ab");
    EXPECT_FALSE(base64_decode("Y").has_value());
    EXPECT_FALSE(base64_decode("YW*=").has_value());
}

TEST(UtilsTest, ParseInt64) {
    EXPECT_EQ(parse_int64("1234").value(), 1234);
    EXPECT_EQ(parse_int64(" 42 ").value(), 42);
    EXPECT_FALSE(parse_int64("").has_value());
    EXPECT_FALSE(parse_int64("-1").has_value());
    EXPECT_FALSE(parse_int64("12a").has_value());
}

TEST(UtilsTest, Utf8Validation) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("caf\xc3\xa9"));
    EXPECT_FALSE(is_valid_utf8("\xc3"));
    EXPECT_FALSE(is_valid_utf8("\xff\xfe"));
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));
}

TEST(StringUtilsTest, SplitJoinEndsWith) {
    auto parts = StringUtils::split("a//b", '/');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(StringUtils::join({"x", "y", "z"}, '/'), "x/y/z");
    EXPECT_TRUE(StringUtils::ends_with("dir/", "/"));
    EXPECT_FALSE(StringUtils::ends_with("/", "dir/"));
    EXPECT_TRUE(StringUtils::iequals("ABCdef", "abcDEF"));
    EXPECT_FALSE(StringUtils::iequals("abc", "abcd"));
}
