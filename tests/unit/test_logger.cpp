/**
 * @file test_logger.cpp
 * @brief Unit tests for the logger and its sinks.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace mic_scheduler;

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    auto sink = std::make_unique<MemorySink>();
    auto* raw = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.debug("test", "hidden");
    logger.info("test", "hidden");
    logger.warn("test", "shown");
    logger.error("test", "shown");

    auto lines = raw->lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find(R"("level":"warn")"), std::string::npos);
    EXPECT_NE(lines[1].find(R"("level":"error")"), std::string::npos);
}

TEST(LoggerTest, RecordShape) {
    auto sink = std::make_unique<MemorySink>();
    auto* raw = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.info("optimizer", "done");
    auto lines = raw->lines();
    ASSERT_EQ(lines.size(), 1u);
    const auto& line = lines[0];
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("component":"optimizer")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"done")"), std::string::npos);
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
}

TEST(LoggerTest, SetLevel) {
    auto sink = std::make_unique<MemorySink>();
    auto* raw = sink.get();
    Logger logger(std::move(sink));
    logger.debug("test", "a");
    logger.set_level(LogLevel::Debug);
    logger.debug("test", "b");
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    EXPECT_EQ(raw->lines().size(), 1u);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST(JsonEscapeTest, EscapesControlAndQuotes) {
    EXPECT_EQ(json_escape(R"(a"b\c)"), R"(a\"b\\c)");
    EXPECT_EQ(json_escape("line\nbreak"), "line\\nbreak");
    EXPECT_EQ(json_escape(std::string_view{"\x01", 1}), "\\u0001");
}

TEST(JsonFileSinkTest, RotatesWhenFull) {
    auto dir = std::filesystem::temp_directory_path() / "mic_test_sink";
    std::filesystem::remove_all(dir);
    {
        JsonFileSink sink(dir, "log", 1, 2);
        sink.set_max_file_size_bytes(32);
        for (int i = 0; i < 10; ++i) {
            sink.write(R"({"n":"0123456789"})");
        }
        sink.flush();
    }
    EXPECT_TRUE(std::filesystem::exists(dir / "log.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir / "log.1.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir / "log.2.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir / "log.3.ndjson"));
    EXPECT_LE(std::filesystem::file_size(dir / "log.1.ndjson"), 64u);
    std::filesystem::remove_all(dir);
}
