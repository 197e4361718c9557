/**
 * @file test_logger.cpp
 * @brief Unit tests for log line formatting and file rotation.
 */

#include <gtest/gtest.h>
#include "logger.h"
#include "test_helpers.h"
#include <regex>

TEST(LoggerTest, FormatsLevelAndComponent) {
    std::string line = Logger::formatLine(LogLevel::Info, "VideoRecorder", "Recording complete");
    std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} - INFO - \[VideoRecorder\] Recording complete)");
    EXPECT_TRUE(std::regex_match(line, pattern)) << line;
}

TEST(LoggerTest, LevelNames) {
    EXPECT_EQ(Logger::levelName(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(Logger::levelName(LogLevel::Warning), "WARNING");
    EXPECT_EQ(Logger::levelName(LogLevel::Error), "ERROR");
}

// Small size limit forces rotation; only backup_count backups survive
TEST(LoggerTest, RotatesAndKeepsBackupCount) {
    TempDir dir;
    Logger& logger = Logger::instance();
    logger.init(dir.str(), 200, 2);

    for (int i = 0; i < 40; ++i) {
        logDebug("LoggerTest", "line number " + std::to_string(i));
    }
    logger.shutdown();

    std::string base = logger.logFilePath();
    EXPECT_TRUE(std::filesystem::exists(base));
    EXPECT_TRUE(std::filesystem::exists(base + ".1"));
    EXPECT_TRUE(std::filesystem::exists(base + ".2"));
    EXPECT_FALSE(std::filesystem::exists(base + ".3"));
    EXPECT_LE(std::filesystem::file_size(base), 200u);

    std::ifstream current(base);
    std::string contents((std::istreambuf_iterator<char>(current)), std::istreambuf_iterator<char>());
    EXPECT_NE(contents.find("line number 39"), std::string::npos);
}
