#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include "TestSupport.hpp"
#include "loglens/input/FileReader.hpp"
#include "loglens/input/LineParser.hpp"

using namespace LogLens;
using namespace LogLens::Input;
using Core::EventLevel;
using Testing::atSeconds;

class LineParserTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!tempPath.empty()) {
            std::error_code ec;
            std::filesystem::remove(tempPath, ec);
        }
    }

    std::string writeTempFile(const std::string &contents) {
        tempPath = (std::filesystem::temp_directory_path() /
                    ("loglens_parser_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".log"))
                       .string();
        std::ofstream out(tempPath, std::ios::binary);
        out << contents;
        return tempPath;
    }

    LineParser parser;
    std::string tempPath;
};

TEST_F(LineParserTest, ParsesFullLine) {
    auto event = parser.parseLine(
        "2024-01-01 00:01:30 ERROR payments: Timeout talking to ledger latency_ms=250.5 retries=3 user=alice");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->timestamp(), atSeconds(90));
    EXPECT_EQ(event->level(), EventLevel::Error);
    EXPECT_EQ(event->source(), "payments");
    EXPECT_EQ(event->message(), "Timeout talking to ledger");
    ASSERT_EQ(event->metadata().size(), 3u);

    const auto *latency = event->findMetadata("latency_ms");
    ASSERT_NE(latency, nullptr);
    EXPECT_DOUBLE_EQ(*latency->asNumber(), 250.5);
    const auto *user = event->findMetadata("user");
    ASSERT_NE(user, nullptr);
    ASSERT_NE(user->asString(), nullptr);
    EXPECT_EQ(*user->asString(), "alice");
}

TEST_F(LineParserTest, IsoTimestampAndMilliseconds) {
    auto event = parser.parseLine("2024-01-01T00:00:05.250Z WARN cache miss rate climbing");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->timestamp(), atSeconds(5) + std::chrono::milliseconds(250));
    EXPECT_EQ(event->level(), EventLevel::Warning);
    EXPECT_TRUE(event->source().empty());
    EXPECT_EQ(event->message(), "cache miss rate climbing");
}

TEST_F(LineParserTest, LevelAliases) {
    EXPECT_EQ(parser.parseLine("2024-01-01 00:00:00 FATAL boom")->level(), EventLevel::Critical);
    EXPECT_EQ(parser.parseLine("2024-01-01 00:00:00 warning slow")->level(), EventLevel::Warning);
    EXPECT_EQ(parser.parseLine("2024-01-01 00:00:00 debug detail")->level(), EventLevel::Debug);
}

TEST_F(LineParserTest, TypedMetadataValues) {
    EXPECT_TRUE(std::holds_alternative<std::int64_t>(LineParser::parseValue("503").storage()));
    EXPECT_TRUE(std::holds_alternative<double>(LineParser::parseValue("0.25").storage()));
    EXPECT_TRUE(std::holds_alternative<bool>(LineParser::parseValue("true").storage()));
    EXPECT_TRUE(std::holds_alternative<bool>(LineParser::parseValue("FALSE").storage()));
    EXPECT_TRUE(LineParser::parseValue("GET").isString());

    // Quoted numbers stay strings.
    const auto quoted = LineParser::parseValue("\"42\"");
    ASSERT_TRUE(quoted.isString());
    EXPECT_EQ(*quoted.asString(), "42");
}

TEST_F(LineParserTest, QuotedValueKeepsSpaces) {
    auto event = parser.parseLine("2024-01-01 00:00:00 INFO api: request done path=\"/v1/orders list\" ok=true");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->message(), "request done");
    const auto *path = event->findMetadata("path");
    ASSERT_NE(path, nullptr);
    EXPECT_EQ(*path->asString(), "/v1/orders list");
    EXPECT_TRUE(*event->findMetadata("ok")->asBool());
}

TEST_F(LineParserTest, DottedKeysResolveByPath) {
    auto event = parser.parseLine("2024-01-01 00:00:00 ERROR gateway: upstream failed http.status=503");
    ASSERT_TRUE(event.has_value());
    const auto *status = event->findMetadata("http.status");
    ASSERT_NE(status, nullptr);
    EXPECT_DOUBLE_EQ(*status->asNumber(), 503.0);
}

TEST_F(LineParserTest, KeyValueInsideMessageIsNotMetadata) {
    auto event = parser.parseLine("2024-01-01 00:00:00 INFO set mode=fast for worker 3");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->message(), "set mode=fast for worker 3");
    EXPECT_TRUE(event->metadata().empty());
}

TEST_F(LineParserTest, BlankAndMalformedLines) {
    auto blank = parser.parseLineDetailed("   ");
    EXPECT_TRUE(blank.blank);
    EXPECT_FALSE(blank.event.has_value());

    auto badTime = parser.parseLineDetailed("yesterday ERROR something broke");
    EXPECT_FALSE(badTime.blank);
    EXPECT_FALSE(badTime.event.has_value());
    EXPECT_FALSE(badTime.error.empty());

    auto badLevel = parser.parseLineDetailed("2024-01-01 00:00:00 LOUD something broke");
    EXPECT_FALSE(badLevel.event.has_value());
    EXPECT_NE(badLevel.error.find("LOUD"), std::string::npos);

    EXPECT_FALSE(parser.parseLine("2024-13-01 00:00:00 INFO bad month").has_value());
}

TEST_F(LineParserTest, ReadAllSkipsMalformedLines) {
    const auto path = writeTempFile(
        "2024-01-01 00:00:00 INFO api: started\r\n"
        "\r\n"
        "garbage line\r\n"
        "2024-01-01 00:00:10 ERROR db: connection lost retries=2\r\n"
        "2024-01-01 00:00:20 NOPE api: bad level\n"
        "2024-01-01 00:00:30 WARN api: slow latency_ms=900\n");

    FileReader reader(path);
    ASSERT_TRUE(reader.isOpen());

    std::vector<Core::Event> events;
    const auto stats = parser.readAll(reader, [&](Core::Event e) { events.push_back(std::move(e)); });

    EXPECT_EQ(stats.lines, 6u);
    EXPECT_EQ(stats.events, 3u);
    EXPECT_EQ(stats.malformed, 2u);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].message(), "started");
    EXPECT_EQ(events[1].source(), "db");
    EXPECT_EQ(events[1].message(), "connection lost");
    EXPECT_EQ(events[2].timestamp(), atSeconds(30));
}

TEST_F(LineParserTest, FileReaderRewindAndLineNumbers) {
    const auto path = writeTempFile("first\nsecond\n");

    FileReader reader;
    EXPECT_FALSE(reader.isOpen());
    ASSERT_TRUE(reader.open(path));
    EXPECT_EQ(reader.nextLine().value_or(""), "first");
    EXPECT_EQ(reader.lineNumber(), 1u);
    EXPECT_EQ(reader.nextLine().value_or(""), "second");
    EXPECT_FALSE(reader.nextLine().has_value());

    ASSERT_TRUE(reader.rewind());
    EXPECT_EQ(reader.lineNumber(), 0u);
    EXPECT_EQ(reader.nextLine().value_or(""), "first");

    FileReader moved(std::move(reader));
    EXPECT_TRUE(moved.isOpen());
    EXPECT_EQ(moved.nextLine().value_or(""), "second");
}

TEST_F(LineParserTest, ReadsAttachedStream) {
    std::istringstream input(
        "2024-01-01 00:00:00 ERROR db: down\n"
        "2024-01-01 00:00:01 ERROR db: still down\n");
    FileReader reader;
    reader.attach(input, "memory");
    EXPECT_EQ(reader.filePath(), "memory");

    std::vector<Core::Event> events;
    const auto stats = parser.readAll(reader, [&](Core::Event e) { events.push_back(std::move(e)); });
    EXPECT_EQ(stats.events, 2u);
    EXPECT_EQ(reader.lineNumber(), 2u);
    EXPECT_EQ(reader.bytesRead(), input.str().size());
    EXPECT_EQ(events[1].message(), "still down");
}

TEST_F(LineParserTest, FileReaderReportsMissingFile) {
    FileReader reader;
    EXPECT_FALSE(reader.open("/nonexistent/loglens/input.log"));
    EXPECT_FALSE(reader.isOpen());
    EXPECT_FALSE(reader.nextLine().has_value());
}
