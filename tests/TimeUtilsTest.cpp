#include <gtest/gtest.h>

#include "loglens/utils/StringUtils.hpp"
#include "loglens/utils/TimeUtils.hpp"

using namespace LogLens::Utils;

TEST(TimeUtilsTest, ParsesTimestampAsUtc) {
    auto ts = parseTimestamp("2024-01-01 00:00:00");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(toMillisSinceEpoch(*ts), 1704067200000LL);
    EXPECT_EQ(toIso8601(*ts), "2024-01-01T00:00:00Z");
}

TEST(TimeUtilsTest, ParsesIsoSeparatorAndMilliseconds) {
    auto ts = parseTimestamp("2024-01-01T00:00:01.250Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(toMillisSinceEpoch(*ts), 1704067201250LL);

    auto truncated = parseTimestamp("2024-01-01 00:00:01.123456");
    ASSERT_TRUE(truncated.has_value());
    EXPECT_EQ(toMillisSinceEpoch(*truncated), 1704067201123LL);
}

TEST(TimeUtilsTest, RejectsMalformedTimestamps) {
    EXPECT_FALSE(parseTimestamp("").has_value());
    EXPECT_FALSE(parseTimestamp("2024/01/01 00:00:00").has_value());
    EXPECT_FALSE(parseTimestamp("2024-13-01 00:00:00").has_value());
    EXPECT_FALSE(parseTimestamp("2024-01-01 00:00:00 extra").has_value());
    EXPECT_FALSE(parseTimestamp("2024-01-01 00:00:00.").has_value());
}

TEST(TimeUtilsTest, ParsesDurations) {
    EXPECT_EQ(parseDuration("250ms"), Duration(250));
    EXPECT_EQ(parseDuration("30s"), Duration(30000));
    EXPECT_EQ(parseDuration("5m"), Duration(300000));
    EXPECT_EQ(parseDuration("1H"), Duration(3600000));
    EXPECT_EQ(parseDuration("2d"), Duration(172800000));
}

TEST(TimeUtilsTest, RejectsInvalidDurations) {
    EXPECT_FALSE(parseDuration("").has_value());
    EXPECT_FALSE(parseDuration("0s").has_value());
    EXPECT_FALSE(parseDuration("-5m").has_value());
    EXPECT_FALSE(parseDuration("5").has_value());
    EXPECT_FALSE(parseDuration("m").has_value());
    EXPECT_FALSE(parseDuration("5w").has_value());
    EXPECT_FALSE(parseDuration("1.5h").has_value());
}

TEST(TimeUtilsTest, FormatsDurationInLargestExactUnit) {
    EXPECT_EQ(formatDuration(Duration(300000)), "5m");
    EXPECT_EQ(formatDuration(Duration(90000)), "90s");
    EXPECT_EQ(formatDuration(Duration(1500)), "1500ms");
    EXPECT_EQ(formatDuration(Duration(86400000)), "1d");
}

TEST(TimeUtilsTest, ElapsedSecondsIsFractional) {
    const auto a = fromMillisSinceEpoch(1000);
    const auto b = fromMillisSinceEpoch(3500);
    EXPECT_DOUBLE_EQ(elapsedSeconds(a, b), 2.5);
    EXPECT_DOUBLE_EQ(toEpochSeconds(b), 3.5);
}

TEST(StringUtilsTest, TrimSplitAndCase) {
    EXPECT_EQ(trim("  a b  "), "a b");
    auto parts = split("a,,b", ',');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(split("a,,b", ',', true).size(), 3u);
    EXPECT_TRUE(iequals("Error", "ERROR"));
    EXPECT_EQ(toLower("WARN"), "warn");
}

TEST(StringUtilsTest, ParsesNumbersAndBooleans) {
    EXPECT_EQ(parseInt64(" 42 "), 42);
    EXPECT_EQ(parseInt64("-7"), -7);
    EXPECT_FALSE(parseInt64("42x").has_value());
    EXPECT_FALSE(parseInt64("2.5").has_value());
    EXPECT_DOUBLE_EQ(*parseDouble("2.5"), 2.5);
    EXPECT_DOUBLE_EQ(*parseDouble("1e3"), 1000.0);
    EXPECT_FALSE(parseDouble("inf").has_value());
    EXPECT_FALSE(parseDouble("").has_value());
    EXPECT_EQ(parseBool("Yes"), true);
    EXPECT_EQ(parseBool("off"), false);
    EXPECT_FALSE(parseBool("maybe").has_value());
}

TEST(StringUtilsTest, FormatsNumbersAndEscapesCsv) {
    EXPECT_EQ(formatNumber(3.0), "3");
    EXPECT_EQ(formatNumber(2.5), "2.5");
    EXPECT_EQ(escapeCsv("plain"), "plain");
    EXPECT_EQ(escapeCsv("a,b"), "\"a,b\"");
    EXPECT_EQ(escapeCsv("say \"hi\""), "\"say \"\"hi\"\"\"");
}
