/**
 * @file test_security_cam.cpp
 * @brief End-to-end tests of the camera pipeline with fake radar and camera.
 */

#include <gtest/gtest.h>
#include "security_cam.h"
#include "ld2410_sensor.h"
#include "video_recorder.h"
#include "test_helpers.h"
#include <atomic>
#include <regex>
#include <thread>

namespace {

struct Pipeline {
    FakeByteSource* radar = nullptr;
    std::atomic<int> camera_runs{0};
};

CamConfig testConfig(const TempDir& dir) {
    CamConfig config;
    config.video_duration = 1;
    config.recording_cooldown = 3600;
    config.video.recordings_path = (dir.path() / "recordings").string();
    config.ftp.enabled = false;
    config.mqtt.enabled = false;
    config.status_frequency = "1s";
    return config;
}

std::unique_ptr<SecurityCam> makeCam(const CamConfig& config, Pipeline& pipeline) {
    auto source = std::make_unique<FakeByteSource>();
    pipeline.radar = source.get();

    Ld2410Sensor::Options options;
    options.min_target_interval = std::chrono::milliseconds(0);
    options.poll_interval = std::chrono::milliseconds(5);
    auto sensor = std::make_unique<Ld2410Sensor>(std::move(source), std::make_unique<PacketDecoder>(), options);

    auto recorder = std::make_unique<VideoRecorder>(config.video,
        [&pipeline](const std::string& command, std::string&) {
            if (command.find("--version") != std::string::npos) {
                return 0;
            }
            ++pipeline.camera_runs;
            std::smatch match;
            if (std::regex_search(command, match, std::regex(R"(-o '([^']+)')"))) {
                std::ofstream(match[1].str()) << "mp4";
            }
            return 0;
        });

    return std::make_unique<SecurityCam>(config, std::move(sensor), std::move(recorder));
}

} // namespace

TEST(SecurityCamTest, ParseFrequency) {
    EXPECT_EQ(SecurityCam::parseFrequency("15s"), std::chrono::seconds(15));
    EXPECT_EQ(SecurityCam::parseFrequency("2m"), std::chrono::seconds(120));
    EXPECT_EQ(SecurityCam::parseFrequency("1h"), std::chrono::seconds(3600));
    EXPECT_EQ(SecurityCam::parseFrequency("1d"), std::chrono::seconds(86400));
    EXPECT_EQ(SecurityCam::parseFrequency("soon"), std::chrono::seconds(60));
    EXPECT_EQ(SecurityCam::parseFrequency("0s"), std::chrono::seconds(60));
}

// Radar frame in, one recording out; the cooldown absorbs the second frame
TEST(SecurityCamTest, DetectionProducesRecording) {
    TempDir dir;
    CamConfig config = testConfig(dir);
    Pipeline pipeline;
    auto cam = makeCam(config, pipeline);

    cam->start();
    EXPECT_TRUE(cam->isRunning());

    pipeline.radar->push({0xF8, 0x01, 0x00, 0x0A, 0x40, 0x00, 0xFE});
    pipeline.radar->push({0xF8, 0x01, 0x00, 0x0B, 0x40, 0x00, 0xFE});

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (pipeline.radar->available() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto status = cam->buildStatus();
    EXPECT_EQ(pipeline.camera_runs.load(), 1);
    EXPECT_EQ(status["recordings_triggered"], 1);
    EXPECT_EQ(status["pending_recordings"], 1);
    EXPECT_EQ(status["ftp_enabled"], false);
    EXPECT_FALSE(status["last_detection"].is_null());

    cam->stop();
    EXPECT_FALSE(cam->isRunning());
    EXPECT_FALSE(pipeline.radar->isOpen());
}

TEST(SecurityCamTest, StopIsIdempotent) {
    TempDir dir;
    Pipeline pipeline;
    auto cam = makeCam(testConfig(dir), pipeline);

    cam->stop();
    cam->start();
    cam->start();
    cam->stop();
    cam->stop();
    EXPECT_FALSE(cam->isRunning());
}
