/**
 * @file test_system_monitor.cpp
 * @brief Tests for status collection from procfs-style files.
 */

#include <gtest/gtest.h>
#include "system_monitor.h"
#include "test_helpers.h"

TEST(SystemMonitorTest, MemoryUsageFromMeminfo) {
    TempDir dir;
    std::string meminfo = dir.file("meminfo",
        "MemTotal:        1000000 kB\n"
        "MemFree:          100000 kB\n"
        "MemAvailable:     250000 kB\n");

    SystemMonitor monitor(meminfo, dir.str() + "/missing");
    EXPECT_NEAR(monitor.getMemoryUsage(), 75.0, 0.001);
}

TEST(SystemMonitorTest, CpuTemperatureInCelsius) {
    TempDir dir;
    std::string thermal = dir.file("temp", "48312\n");
    SystemMonitor monitor(dir.str() + "/missing", thermal);
    EXPECT_NEAR(monitor.getCpuTemperature(), 48.312, 0.001);
}

TEST(SystemMonitorTest, MissingSourcesReadAsZero) {
    SystemMonitor monitor("/nonexistent/meminfo", "/nonexistent/temp");
    EXPECT_EQ(monitor.getMemoryUsage(), 0.0);
    EXPECT_EQ(monitor.getCpuTemperature(), 0.0);
    EXPECT_EQ(monitor.countRecordings("/nonexistent/recordings"), 0);
}

TEST(SystemMonitorTest, CountsOnlyMp4Files) {
    TempDir dir;
    dir.file("motion_1.mp4", "a");
    dir.file("motion_2.mp4", "b");
    dir.file("notes.txt", "c");
    SystemMonitor monitor;
    EXPECT_EQ(monitor.countRecordings(dir.str()), 2);
}

TEST(SystemMonitorTest, DiskUsageIsPercentage) {
    TempDir dir;
    SystemMonitor monitor;
    double pct = monitor.getDiskUsage(dir.str());
    EXPECT_GE(pct, 0.0);
    EXPECT_LE(pct, 100.0);
}

TEST(SystemMonitorTest, DegradedAboveThresholds) {
    EXPECT_EQ(SystemMonitor::determineStatus(50.0, 50.0), "normal");
    EXPECT_EQ(SystemMonitor::determineStatus(95.0, 50.0), "degraded");
    EXPECT_EQ(SystemMonitor::determineStatus(50.0, 91.0), "degraded");
}

TEST(SystemMonitorTest, CollectStatusFields) {
    TempDir dir;
    SystemMonitor monitor;
    auto status = monitor.collectStatus(dir.str());
    EXPECT_TRUE(status.contains("disk_pct"));
    EXPECT_TRUE(status.contains("mem_pct"));
    EXPECT_TRUE(status.contains("cpu_temp_c"));
    EXPECT_EQ(status["pending_recordings"], 0);
    EXPECT_TRUE(status["status"] == "normal" || status["status"] == "degraded");
}
