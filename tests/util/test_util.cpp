// STAKELEDGER - Util Module Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include <stakeledger/util/logging.h>
#include <stakeledger/util/time.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace stakeledger {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().EnableAllCategories();
        Logger::Instance().SetLevel(LogLevel::Info);
    }

    std::shared_ptr<CallbackSink> Capture(std::vector<LogEntry>& entries,
                                          LogLevel level = LogLevel::Trace) {
        auto sink = std::make_shared<CallbackSink>(
            [&entries](const LogEntry& entry) { entries.push_back(entry); }, level);
        Logger::Instance().AddSink(sink);
        return sink;
    }
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("loud"), LogLevel::Info);
}

TEST_F(LoggingTest, AddRemoveSink) {
    auto& logger = Logger::Instance();
    EXPECT_EQ(logger.SinkCount(), 0u);

    auto sink = std::make_shared<ConsoleSink>();
    logger.AddSink(sink);
    EXPECT_EQ(logger.SinkCount(), 1u);

    logger.RemoveSink(sink);
    EXPECT_EQ(logger.SinkCount(), 0u);
}

TEST_F(LoggingTest, NothingLogsWithoutSinks) {
    Logger::Instance().SetLevel(LogLevel::Trace);
    EXPECT_FALSE(Logger::Instance().WillLog(LogLevel::Fatal, LogCategory::LEDGER));
}

TEST_F(LoggingTest, LevelFiltering) {
    std::vector<LogEntry> entries;
    Capture(entries);
    Logger::Instance().SetLevel(LogLevel::Warn);

    LOG_INFO(LogCategory::LEDGER) << "hidden";
    LOG_WARN(LogCategory::LEDGER) << "shown " << 42;

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Warn);
    EXPECT_EQ(entries[0].category, "ledger");
    EXPECT_EQ(entries[0].message, "shown 42");
    EXPECT_GT(entries[0].line, 0);
}

TEST_F(LoggingTest, CategoryFiltering) {
    std::vector<LogEntry> entries;
    Capture(entries);
    Logger::Instance().SetLevel(LogLevel::Debug);
    Logger::Instance().EnableCategory(LogCategory::TOKEN);

    EXPECT_TRUE(Logger::Instance().IsCategoryEnabled(LogCategory::TOKEN));
    EXPECT_FALSE(Logger::Instance().IsCategoryEnabled(LogCategory::DB));

    LOG_DEBUG(LogCategory::DB) << "db";
    LOG_DEBUG(LogCategory::TOKEN) << "token";

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "token");
}

TEST_F(LoggingTest, SinkLevelIsIndependent) {
    std::vector<LogEntry> entries;
    Capture(entries, LogLevel::Error);
    Logger::Instance().SetLevel(LogLevel::Trace);

    LOG_INFO(LogCategory::CLI) << "info";
    LOG_ERROR(LogCategory::CLI) << "error";

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "error");
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    char filename[] = "/tmp/stakeledger_log_test_XXXXXX";
    int fd = mkstemp(filename);
    ASSERT_GE(fd, 0);
    close(fd);

    {
        auto sink = std::make_shared<FileSink>(filename, LogLevel::Info);
        ASSERT_TRUE(sink->IsOpen());
        Logger::Instance().AddSink(sink);
        Logger::Instance().SetLevel(LogLevel::Info);

        LOG_INFO(LogCategory::LEDGER) << "staked 100";
        Logger::Instance().ClearSinks();
    }

    std::ifstream in(filename);
    std::stringstream content;
    content << in.rdbuf();
    std::remove(filename);

    EXPECT_NE(content.str().find("[INFO] [ledger] staked 100"), std::string::npos);
}

TEST_F(LoggingTest, GetBasename) {
    EXPECT_EQ(GetBasename("/root/repo/src/ledger/ledger.cpp"), "ledger.cpp");
    EXPECT_EQ(GetBasename("ledger.cpp"), "ledger.cpp");
}

// ============================================================================
// Time Tests
// ============================================================================

class TimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        DisableMockTime();
    }

    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, GetTime) {
    EXPECT_GT(GetTime(), 1600000000);
}

TEST_F(TimeTest, MockTime) {
    EXPECT_FALSE(IsMockTimeEnabled());

    EnableMockTime();
    EXPECT_TRUE(IsMockTimeEnabled());

    SetMockTime(1000);
    EXPECT_EQ(GetTime(), 1000);

    AdvanceMockTime(Seconds{100});
    EXPECT_EQ(GetTime(), 1100);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 1100);
}

TEST_F(TimeTest, PinnedClockSurvivesDisable) {
    EnableMockTime();
    SetMockTime(1700000000);
    AdvanceMockTime(Seconds{7 * 86400});
    DisableMockTime();

    EnableMockTime();
    EXPECT_EQ(GetTime(), 1700000000 + 7 * 86400);
}

TEST_F(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1704067200), "2024-01-01T00:00:00Z");
}

TEST_F(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(Seconds{0}), "0s");
    EXPECT_EQ(FormatDuration(Seconds{59}), "59s");
    EXPECT_EQ(FormatDuration(Seconds{3600}), "1h");
    EXPECT_EQ(FormatDuration(Seconds{7 * 86400 + 2 * 3600 + 5}), "7d 2h 5s");
    EXPECT_EQ(FormatDuration(Seconds{-90}), "-1m 30s");
}

TEST_F(TimeTest, FromUnixTime) {
    auto tp = FromUnixTime(1704067200);
    EXPECT_EQ(std::chrono::duration_cast<Seconds>(tp.time_since_epoch()).count(), 1704067200);
}

} // namespace
} // namespace util
} // namespace stakeledger
