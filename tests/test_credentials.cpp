#include <gtest/gtest.h>
#include <core/credentials.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// ── INI ────────────────────────────────────────────────────

TEST(IniTest, ParsesSectionsAndPairs) {
    auto doc = parse_ini(
        "# rclone config\n"
        "[myalist]\n"
        "type = webdav\n"
        "url = https://dav.example.com/dav\n"
        "\n"
        "; another remote\n"
        "[backup]\n"
        "user=alice\n");

    ASSERT_TRUE(doc.is_ok()) << doc.error;
    ASSERT_EQ(doc.value.size(), 2u);
    EXPECT_EQ(doc.value["myalist"]["type"], "webdav");
    EXPECT_EQ(doc.value["myalist"]["url"], "https://dav.example.com/dav");
    EXPECT_EQ(doc.value["backup"]["user"], "alice");
}

TEST(IniTest, StripsQuotesAndKeepsEqualsInValue) {
    auto doc = parse_ini("[r]\npass = \"a=b\"\ntoken = x=y=z\n");
    ASSERT_TRUE(doc.is_ok());
    EXPECT_EQ(doc.value["r"]["pass"], "a=b");
    EXPECT_EQ(doc.value["r"]["token"], "x=y=z");
}

TEST(IniTest, EmptySectionIsKept) {
    auto doc = parse_ini("[empty]\n");
    ASSERT_TRUE(doc.is_ok());
    EXPECT_EQ(doc.value.count("empty"), 1u);
    EXPECT_TRUE(doc.value["empty"].empty());
}

TEST(IniTest, MalformedInputIsAnError) {
    EXPECT_TRUE(parse_ini("[broken\nurl = x\n").is_err());
    EXPECT_TRUE(parse_ini("[r]\njust a line\n").is_err());
    EXPECT_TRUE(parse_ini("url = x\n").is_err());
    EXPECT_TRUE(parse_ini("[r]\n = value\n").is_err());
}

// ── reveal / obscure ───────────────────────────────────────

TEST(RevealTest, KnownVectors) {
    auto a = reveal("YWFhYWFhYWFhYWFhYWFhYXMaGgIlEQ");
    EXPECT_TRUE(a.decrypted);
    EXPECT_EQ(a.text, "potato");

    auto b = reveal("YmJiYmJiYmJiYmJiYmJiYp3gcEWbAw");
    EXPECT_TRUE(b.decrypted);
    EXPECT_EQ(b.text, "potato");
}

TEST(RevealTest, IvOnlyDecodesToEmpty) {
    auto r = reveal("YWFhYWFhYWFhYWFhYWFhYQ");
    EXPECT_TRUE(r.decrypted);
    EXPECT_EQ(r.text, "");
}

TEST(RevealTest, ShortInputComesBackUnchanged) {
    auto r = reveal("hunter2");
    EXPECT_FALSE(r.decrypted);
    EXPECT_EQ(r.text, "hunter2");
}

TEST(RevealTest, NonBase64ComesBackUnchanged) {
    auto r = reveal("not base64 at all!!");
    EXPECT_FALSE(r.decrypted);
    EXPECT_EQ(r.text, "not base64 at all!!");
}

TEST(RevealTest, EmptyInput) {
    auto r = reveal("");
    EXPECT_FALSE(r.decrypted);
    EXPECT_EQ(r.text, "");
}

TEST(RevealTest, BadKeyFallsBack) {
    auto r = reveal("YWFhYWFhYWFhYWFhYWFhYXMaGgIlEQ", "abcd");
    EXPECT_FALSE(r.decrypted);
    EXPECT_EQ(r.text, "YWFhYWFhYWFhYWFhYWFhYXMaGgIlEQ");
}

TEST(ObscureTest, RoundTripAcrossBlocks) {
    // Longer than one AES block so the counter advances
    const std::string secret = "correct horse battery staple, twice over: correct horse";
    auto hidden = obscure(secret);
    ASSERT_TRUE(hidden.is_ok()) << hidden.error;
    EXPECT_EQ(hidden.value.find('='), std::string::npos);
    EXPECT_EQ(hidden.value.find('+'), std::string::npos);
    EXPECT_EQ(hidden.value.find('/'), std::string::npos);

    auto shown = reveal(hidden.value);
    EXPECT_TRUE(shown.decrypted);
    EXPECT_EQ(shown.text, secret);
}

TEST(ObscureTest, RandomIv) {
    auto a = obscure("same");
    auto b = obscure("same");
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_NE(a.value, b.value);
}

TEST(ObscureTest, CustomKey) {
    const std::string key = "000102030405060708090a0b0c0d0e0f";
    auto hidden = obscure("s3cret", key);
    ASSERT_TRUE(hidden.is_ok());
    EXPECT_EQ(reveal(hidden.value, key).text, "s3cret");
}

TEST(ObscureTest, RejectsBadKey) {
    EXPECT_TRUE(obscure("x", "zz").is_err());
    EXPECT_TRUE(obscure("x", "0011").is_err());
}

// ── Remote resolution ──────────────────────────────────────

TEST(ResolveRemoteTest, RevealsPassword) {
    auto remote = resolve_remote(
        "[myalist]\n"
        "type = webdav\n"
        "url = https://dav.example.com/dav\n"
        "user = admin\n"
        "pass = YWFhYWFhYWFhYWFhYWFhYXMaGgIlEQ\n",
        "myalist");

    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->url, "https://dav.example.com/dav");
    EXPECT_EQ(remote->user, "admin");
    EXPECT_EQ(remote->pass, "potato");
    ASSERT_TRUE(remote->type.has_value());
    EXPECT_EQ(*remote->type, "webdav");
}

TEST(ResolveRemoteTest, PlaintextPasswordPassesThrough) {
    auto remote = resolve_remote("[r]\nurl = http://h\nuser = u\npass = plain\n", "r");
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->pass, "plain");
    EXPECT_FALSE(remote->type.has_value());
}

TEST(ResolveRemoteTest, MissingFieldsAreEmpty) {
    auto remote = resolve_remote("[r]\nurl = http://h\n", "r");
    ASSERT_TRUE(remote.has_value());
    EXPECT_EQ(remote->user, "");
    EXPECT_EQ(remote->pass, "");
}

TEST(ResolveRemoteTest, AbsentSectionOrBadDocument) {
    EXPECT_FALSE(resolve_remote("[other]\nurl = x\n", "myalist").has_value());
    EXPECT_FALSE(resolve_remote("garbage line\n", "myalist").has_value());
}

TEST(LoadRemoteTest, ReadsFileAndReportsMissingRemote) {
    fs::path path = fs::temp_directory_path() / "davsync_rclone_test.conf";
    std::ofstream(path) << "[myalist]\nurl = http://h/dav\nuser = u\npass = p\n";

    auto ok = load_remote(path, "myalist");
    ASSERT_TRUE(ok.is_ok()) << ok.error;
    EXPECT_EQ(ok.value.url, "http://h/dav");

    auto missing = load_remote(path, "nope");
    ASSERT_TRUE(missing.is_err());
    EXPECT_NE(missing.error.find("[nope]"), std::string::npos);

    fs::remove(path);
    EXPECT_TRUE(load_remote(path, "myalist").is_err());
}
