#pragma once

#include "config.h"
#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>

// Forward declarations
class Ld2410Sensor;
class VideoRecorder;
class FtpUploader;
class EventPublisher;
class SystemMonitor;
class MotionTrigger;

class SecurityCam {
public:
    explicit SecurityCam(const CamConfig& config);
    SecurityCam(const CamConfig& config, std::unique_ptr<Ld2410Sensor> sensor,
                std::unique_ptr<VideoRecorder> recorder);
    ~SecurityCam();

    void start();
    void stop();
    bool isRunning() const { return running_; }

    nlohmann::json buildStatus();

    static std::chrono::seconds parseFrequency(const std::string& freq);

private:
    CamConfig config_;

    // Core components
    std::unique_ptr<Ld2410Sensor> sensor_;
    std::unique_ptr<VideoRecorder> recorder_;
    std::unique_ptr<FtpUploader> uploader_;
    std::unique_ptr<EventPublisher> publisher_;
    std::unique_ptr<SystemMonitor> monitor_;
    std::unique_ptr<MotionTrigger> trigger_;

    // Threading
    std::atomic<bool> running_;
    std::thread status_thread_;
    std::chrono::seconds status_interval_;

    void initialize();
    void statusLoop();
    void publishStatus();
};
