#include <gtest/gtest.h>
#include "utils/logger.h"
#include "infrastructure/error_handling.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace sciencefund;
using namespace sciencefund::utils;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto uniq = std::to_string(static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
        testDir = std::filesystem::temp_directory_path() / ("sciencefund_logging_" + uniq);
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        Logger::onLog(nullptr);
        Logger::shutdown();
        Logger::init(LogSettings{});
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    std::filesystem::path testDir;
};

TEST_F(LoggingTest, ParsesLevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parseLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parseLevel("off", level));
    EXPECT_EQ(level, LogLevel::OFF);
    EXPECT_FALSE(Logger::parseLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::OFF);
    EXPECT_STREQ(Logger::levelName(LogLevel::WARN), "WARN");
}

TEST_F(LoggingTest, LevelFiltersEntries) {
    LogSettings settings;
    settings.console = false;
    settings.level = LogLevel::WARN;
    ASSERT_TRUE(Logger::init(settings));

    std::vector<LogEntry> seen;
    Logger::onLog([&seen](const LogEntry& e) { seen.push_back(e); });
    LOG_INFO("ledger", "dropped");
    LOG_DEBUG("store", "dropped too");
    LOG_WARN("ledger", "kept");
    LOG_ERROR("db", "kept too");

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].category, "ledger");
    EXPECT_EQ(seen[0].message, "kept");
    EXPECT_EQ(seen[1].level, LogLevel::ERROR);
}

TEST_F(LoggingTest, WritesCategoryTaggedLines) {
    LogSettings settings;
    settings.console = false;
    settings.path = (testDir / "nested" / "ledger.log").string();
    ASSERT_TRUE(Logger::init(settings));
    LOG_INFO("ledger", "fundProject by f1");
    Logger::shutdown();

    std::string text = readFile(settings.path);
    EXPECT_NE(text.find("INFO [ledger] fundProject by f1"), std::string::npos);
}

TEST_F(LoggingTest, RotatesBySize) {
    LogSettings settings;
    settings.console = false;
    settings.path = (testDir / "ledger.log").string();
    settings.maxFileSize = 64;
    settings.maxFiles = 3;
    ASSERT_TRUE(Logger::init(settings));
    for (int i = 0; i < 20; i++) {
        LOG_INFO("ledger", "entry number " + std::to_string(i));
    }
    Logger::shutdown();

    EXPECT_TRUE(std::filesystem::exists(settings.path + ".1"));
    EXPECT_TRUE(std::filesystem::exists(settings.path + ".2"));
    EXPECT_FALSE(std::filesystem::exists(settings.path + ".3"));
    EXPECT_NE(readFile(settings.path + ".1").find("entry number 19"), std::string::npos);
}

TEST_F(LoggingTest, ErrorHandlerCountsAndLogsReports) {
    LogSettings settings;
    settings.console = false;
    ASSERT_TRUE(Logger::init(settings));
    std::vector<LogEntry> seen;
    Logger::onLog([&seen](const LogEntry& e) { seen.push_back(e); });

    auto& handler = ErrorHandler::instance();
    uint64_t total = handler.getErrorCount();
    uint64_t db = handler.getErrorCount(ErrorCode::DATABASE_ERROR);

    handler.report(makeError(ErrorCode::DATABASE_ERROR, "disk full", "store"));
    handler.report(makeError(ErrorCode::NOT_FOUND, "no project 9"));

    EXPECT_EQ(handler.getErrorCount(), total + 2);
    EXPECT_EQ(handler.getErrorCount(ErrorCode::DATABASE_ERROR), db + 1);
    EXPECT_EQ(handler.getLastError().code, ErrorCode::NOT_FOUND);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].level, LogLevel::ERROR);
    EXPECT_EQ(seen[0].category, "store");
    EXPECT_EQ(seen[0].message, "Database error: disk full [store]");
    EXPECT_EQ(seen[1].level, LogLevel::WARN);
    EXPECT_EQ(seen[1].category, "error");
}
