/**
 * @file test_motion_trigger.cpp
 * @brief Tests for detection handling: cooldown, upload and notifications.
 */

#include <gtest/gtest.h>
#include "motion_trigger.h"
#include "test_helpers.h"
#include <vector>

namespace {

SensorData movingTarget() {
    SensorData data;
    data.moving_target = true;
    data.distance = 150;
    data.signal_strength = 60;
    data.timestamp = std::chrono::system_clock::now();
    return data;
}

} // namespace

// A successful recording starts the cooldown
TEST(MotionTriggerTest, CooldownSkipsFollowingDetections) {
    TempDir dir;
    int recordings = 0;
    MotionTrigger trigger(30, std::chrono::seconds(3600), [&](int duration) -> std::optional<std::string> {
        EXPECT_EQ(duration, 30);
        ++recordings;
        return dir.file("motion_" + std::to_string(recordings) + ".mp4", "video");
    });

    trigger.onDetection(movingTarget());
    trigger.onDetection(movingTarget());
    EXPECT_EQ(recordings, 1);
    EXPECT_EQ(trigger.recordingsTriggered(), 1);
}

TEST(MotionTriggerTest, ZeroCooldownRecordsEveryTime) {
    TempDir dir;
    int recordings = 0;
    MotionTrigger trigger(5, std::chrono::seconds(0), [&](int) -> std::optional<std::string> {
        ++recordings;
        return dir.file("motion_" + std::to_string(recordings) + ".mp4", "video");
    });

    trigger.onDetection(movingTarget());
    trigger.onDetection(movingTarget());
    EXPECT_EQ(recordings, 2);
}

// A failed recording does not start the cooldown
TEST(MotionTriggerTest, FailedRecordingDoesNotStartCooldown) {
    int attempts = 0;
    MotionTrigger trigger(5, std::chrono::seconds(3600), [&](int) -> std::optional<std::string> {
        ++attempts;
        return std::nullopt;
    });

    trigger.onDetection(movingTarget());
    trigger.onDetection(movingTarget());
    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(trigger.recordingsTriggered(), 0);
    EXPECT_TRUE(trigger.lastDetection().has_value());
}

TEST(MotionTriggerTest, UploadsFinishedRecording) {
    TempDir dir;
    std::string file = dir.file("motion_a.mp4", "video");
    std::vector<std::string> uploaded;

    MotionTrigger trigger(5, std::chrono::seconds(0),
        [&](int) -> std::optional<std::string> { return file; },
        [&](const std::string& path) {
            uploaded.push_back(path);
            std::filesystem::remove(path);
            return true;
        });

    trigger.onDetection(movingTarget());
    ASSERT_EQ(uploaded.size(), 1u);
    EXPECT_EQ(uploaded[0], file);
    EXPECT_EQ(trigger.uploadsSucceeded(), 1);
}

TEST(MotionTriggerTest, FailedUploadKeepsFile) {
    TempDir dir;
    std::string file = dir.file("motion_b.mp4", "video");

    MotionTrigger trigger(5, std::chrono::seconds(0),
        [&](int) -> std::optional<std::string> { return file; },
        [&](const std::string&) { return false; });

    trigger.onDetection(movingTarget());
    EXPECT_TRUE(std::filesystem::exists(file));
    EXPECT_EQ(trigger.uploadsSucceeded(), 0);
}

TEST(MotionTriggerTest, PublishesEventSequence) {
    TempDir dir;
    std::string file = dir.file("motion_c.mp4", "abc");
    std::vector<std::pair<std::string, nlohmann::json>> events;

    MotionTrigger trigger(7, std::chrono::seconds(0),
        [&](int) -> std::optional<std::string> { return file; },
        [&](const std::string&) { return true; },
        [&](const std::string& type, const nlohmann::json& data) { events.emplace_back(type, data); });

    SensorData data = movingTarget();
    data.presence = true;
    trigger.onDetection(data);

    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].first, "detection");
    EXPECT_EQ(events[0].second["distance_cm"], 150);
    EXPECT_EQ(events[0].second["presence_pin"], true);
    EXPECT_EQ(events[1].first, "recording");
    EXPECT_EQ(events[1].second["file"], "motion_c.mp4");
    EXPECT_EQ(events[1].second["duration_s"], 7);
    EXPECT_EQ(events[1].second["sha256"], "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(events[2].first, "upload");
    EXPECT_EQ(events[2].second["success"], true);
}

// A throwing notifier must not stop the recording path
TEST(MotionTriggerTest, NotifierErrorsAreContained) {
    TempDir dir;
    std::string file = dir.file("motion_d.mp4", "video");
    int recordings = 0;

    MotionTrigger trigger(5, std::chrono::seconds(0),
        [&](int) -> std::optional<std::string> { ++recordings; return file; },
        nullptr,
        [](const std::string&, const nlohmann::json&) { throw std::runtime_error("broker down"); });

    EXPECT_NO_THROW(trigger.onDetection(movingTarget()));
    EXPECT_EQ(recordings, 1);
}

TEST(MotionTriggerTest, ClockFormat) {
    std::string clock = MotionTrigger::formatClock(std::chrono::system_clock::now());
    ASSERT_EQ(clock.size(), 8u);
    EXPECT_EQ(clock[2], ':');
    EXPECT_EQ(clock[5], ':');
}
