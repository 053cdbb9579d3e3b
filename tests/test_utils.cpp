/*
 * ScriptCell C++ - Utility Tests
 */
#include <scriptcell/core/utils.hpp>
#include <scriptcell/core/json.hpp>
#include <scriptcell/core/logger.hpp>

#include <gtest/gtest.h>

#include <set>

using namespace scriptcell;

TEST(UtilsTest, Trim) {
    EXPECT_EQ(trim("  hello \n"), "hello");
    EXPECT_EQ(trim("\t\r\n"), "");
    EXPECT_EQ(trim("x"), "x");
}

TEST(UtilsTest, SplitAndJoin) {
    std::vector<std::string> parts = split("limits.timeout_seconds", '.');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "limits");
    EXPECT_EQ(parts[1], "timeout_seconds");
    EXPECT_EQ(join(parts, ", "), "limits, timeout_seconds");
    EXPECT_EQ(join(std::vector<std::string>(), ","), "");
}

TEST(UtilsTest, TruncateSafeKeepsUtf8Intact) {
    std::string s = "ab\xc3\xa9";   // "abé"
    EXPECT_EQ(truncate_safe(s, 3), "ab");
    EXPECT_EQ(truncate_safe(s, 4), s);
    EXPECT_EQ(truncate_safe("hello", 2), "he");
}

TEST(UtilsTest, FormatSeconds) {
    EXPECT_EQ(format_seconds(30.0), "30");
    EXPECT_EQ(format_seconds(1.5), "1.5");
    EXPECT_EQ(format_seconds(0.25), "0.25");
}

TEST(UtilsTest, JoinPath) {
    EXPECT_EQ(join_path("/a", "b"), "/a/b");
    EXPECT_EQ(join_path("/a/", "/b"), "/a/b");
    EXPECT_EQ(join_path("", "b"), "b");
    EXPECT_EQ(join_path("/a", ""), "/a");
}

TEST(UtilsTest, ExecutableDirIsAbsolute) {
    std::string dir = executable_dir();
    ASSERT_FALSE(dir.empty());
    EXPECT_EQ(dir[0], '/');
}

TEST(UtilsTest, MonotonicClockDoesNotGoBackwards) {
    int64_t a = monotonic_ms();
    int64_t b = monotonic_ms();
    EXPECT_LE(a, b);
}

TEST(UtilsTest, UuidFormatAndUniqueness) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = generate_uuid();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_TRUE(seen.insert(id).second);
    }
}

TEST(UtilsTest, SecureTokenIsRandomHex) {
    std::string a = secure_token();
    std::string b = secure_token();
    EXPECT_EQ(a.size(), 32u);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_NE(a, b);
}

TEST(UtilsTest, Sha256) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256_hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(UtilsTest, DumpJsonReplacesInvalidUtf8) {
    Json j;
    j["stdout"] = std::string("ok\xff\n");
    std::string text = dump_json(j);
    EXPECT_NE(text.find("ok"), std::string::npos);
    EXPECT_NO_THROW(Json::parse(text));
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("bogus"), LogLevel::INFO);
}

TEST(LoggerTest, SinkCanBeDetached) {
    Logger& logger = Logger::instance();
    FILE* previous = logger.sink();
    logger.set_sink(nullptr);
    EXPECT_EQ(logger.sink(), nullptr);
    LOG_ERROR("dropped %d", 1);
    logger.set_sink(previous);
}
