#include <gtest/gtest.h>

#include "loglens/utils/ConfigLoader.hpp"

using namespace LogLens::Utils;

class ConfigLoaderTest : public ::testing::Test {
protected:
    ConfigLoader loader;
};

TEST_F(ConfigLoaderTest, ParsesKeysCommentsAndTypes) {
    loader.loadFromString(R"(
# comment
; also a comment
log_level = debug
anomaly.errors.threshold = 2.5
anomaly.errors.window_size = 30
anomaly.errors.enabled = off
metric.errors.filter = level == 'ERROR'
)");

    EXPECT_EQ(loader.getStringOr("log_level", ""), "debug");
    EXPECT_DOUBLE_EQ(*loader.getDouble("anomaly.errors.threshold"), 2.5);
    EXPECT_EQ(loader.getIntOr("anomaly.errors.window_size", 0), 30);
    EXPECT_EQ(loader.getBool("anomaly.errors.enabled"), false);
    // Only the first '=' separates key from value.
    EXPECT_EQ(loader.getStringOr("metric.errors.filter", ""), "level == 'ERROR'");
    EXPECT_FALSE(loader.getInt("log_level").has_value());
    EXPECT_EQ(loader.malformedLines(), 0u);
}

TEST_F(ConfigLoaderTest, SectionNamesAreSortedAndDistinct) {
    loader.loadFromString(
        "metric.b.window = 5m\n"
        "metric.a.window = 1m\n"
        "metric.a.aggregation = count\n"
        "metrics.other = 1\n"
        "anomaly.a.threshold = 3\n");

    EXPECT_EQ(loader.sectionNames("metric"), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(loader.sectionNames("anomaly"), (std::vector<std::string>{"a"}));
    EXPECT_TRUE(loader.sectionNames("missing").empty());
}

TEST_F(ConfigLoaderTest, ContinuationLinesJoinOneEntry) {
    loader.loadFromString(
        "metric.slow.filter = level in ('WARNING', 'ERROR') \\\n"
        "    and metadata.latency_ms > 500\n"
        "metric.slow.window = 5m\n");

    EXPECT_EQ(loader.getStringOr("metric.slow.filter", ""),
              "level in ('WARNING', 'ERROR') and metadata.latency_ms > 500");
    EXPECT_EQ(loader.getStringOr("metric.slow.window", ""), "5m");
}

TEST_F(ConfigLoaderTest, MalformedLinesAreCounted) {
    loader.loadFromString("no equals sign here\n= value without key\ngood = yes\n");
    EXPECT_EQ(loader.malformedLines(), 2u);
    EXPECT_TRUE(loader.hasKey("good"));
}

TEST_F(ConfigLoaderTest, ReloadReplacesAndSetOverrides) {
    loader.loadFromString("a = 1\nb = 2\n");
    loader.loadFromString("a = 3\n");
    EXPECT_FALSE(loader.hasKey("b"));
    EXPECT_EQ(loader.getIntOr("a", 0), 3);

    loader.set("a", "4");
    EXPECT_EQ(loader.getIntOr("a", 0), 4);
    EXPECT_EQ(loader.all().size(), 1u);
}

TEST_F(ConfigLoaderTest, MissingFileKeepsContents) {
    loader.loadFromString("a = 1\n");
    EXPECT_FALSE(loader.loadFromFile("/nonexistent/loglens.conf"));
    EXPECT_TRUE(loader.hasKey("a"));
}
