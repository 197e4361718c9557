#include "security_cam.h"
#include "ld2410_sensor.h"
#include "video_recorder.h"
#include "ftp_uploader.h"
#include "event_publisher.h"
#include "system_monitor.h"
#include "motion_trigger.h"
#include "logger.h"
#include <regex>
#include <map>

SecurityCam::SecurityCam(const CamConfig& config)
    : SecurityCam(config, Ld2410Sensor::open(config.radar),
                  std::make_unique<VideoRecorder>(config.video)) {
}

SecurityCam::SecurityCam(const CamConfig& config, std::unique_ptr<Ld2410Sensor> sensor,
                         std::unique_ptr<VideoRecorder> recorder)
    : config_(config)
    , sensor_(std::move(sensor))
    , recorder_(std::move(recorder))
    , running_(false)
    , status_interval_(std::chrono::seconds(60)) {

    try {
        initialize();
        logInfo("SecurityCam", "Initialized successfully");
    } catch (const std::exception& e) {
        logError("SecurityCam", std::string("Failed to initialize: ") + e.what());
        throw;
    }
}

SecurityCam::~SecurityCam() {
    stop();
}

void SecurityCam::initialize() {
    monitor_ = std::make_unique<SystemMonitor>();

    if (config_.ftp.enabled) {
        uploader_ = std::make_unique<FtpUploader>(config_.ftp);
    }

    if (config_.mqtt.enabled) {
        publisher_ = std::make_unique<EventPublisher>(config_.mqtt);
    }

    MotionTrigger::UploadFunction upload;
    if (uploader_) {
        upload = [this](const std::string& path) { return uploader_->upload(path); };
    }

    MotionTrigger::NotifyFunction notify;
    if (publisher_) {
        notify = [this](const std::string& type, const nlohmann::json& data) {
            publisher_->publishEvent(type, data);
        };
    }

    trigger_ = std::make_unique<MotionTrigger>(
        config_.video_duration,
        std::chrono::seconds(config_.recording_cooldown),
        [this](int duration) { return recorder_->record(duration); },
        upload,
        notify);

    status_interval_ = parseFrequency(config_.status_frequency);
}

void SecurityCam::start() {
    if (running_) {
        logInfo("SecurityCam", "Already running");
        return;
    }

    if (!recorder_->checkCamera()) {
        logWarning("SecurityCam", "Camera check failed, recordings will fail until the camera is available");
    }

    if (publisher_ && !publisher_->connect()) {
        logWarning("SecurityCam", "MQTT client could not be started, events will be dropped");
    }

    running_ = true;
    sensor_->startMonitoring([this](const SensorData& data) { trigger_->onDetection(data); });
    status_thread_ = std::thread(&SecurityCam::statusLoop, this);

    logInfo("SecurityCam", "Monitoring for motion... Press Ctrl+C to stop");
}

void SecurityCam::stop() {
    if (!running_) {
        return;
    }

    logInfo("SecurityCam", "Stopping...");
    running_ = false;

    sensor_->stopMonitoring();

    if (status_thread_.joinable()) {
        status_thread_.join();
    }

    sensor_->cleanup();

    if (uploader_) {
        uploader_->close();
    }
    if (publisher_) {
        publisher_->disconnect();
    }

    logInfo("SecurityCam", "Stopped");
}

nlohmann::json SecurityCam::buildStatus() {
    nlohmann::json status = monitor_->collectStatus(config_.video.recordings_path);
    status["recording"] = recorder_->isRecording();
    status["monitoring"] = sensor_->isMonitoring();
    status["recordings_triggered"] = trigger_->recordingsTriggered();
    status["uploads_succeeded"] = trigger_->uploadsSucceeded();
    status["ftp_enabled"] = config_.ftp.enabled;

    auto last = trigger_->lastDetection();
    if (last) {
        status["last_detection"] = static_cast<long long>(std::chrono::system_clock::to_time_t(*last));
    } else {
        status["last_detection"] = nullptr;
    }
    return status;
}

void SecurityCam::statusLoop() {
    logDebug("SecurityCam", "Status loop started with interval: " + std::to_string(status_interval_.count()) + "s");

    while (running_) {
        try {
            publishStatus();
        } catch (const std::exception& e) {
            logError("SecurityCam", std::string("Status report failed: ") + e.what());
        }

        auto start = std::chrono::steady_clock::now();
        while (running_ && (std::chrono::steady_clock::now() - start) < status_interval_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    logDebug("SecurityCam", "Status loop stopped");
}

void SecurityCam::publishStatus() {
    nlohmann::json status = buildStatus();
    logDebug("SecurityCam", "Status: " + status.dump());

    if (status.value("status", "normal") == "degraded") {
        logWarning("SecurityCam", "System degraded: disk " + std::to_string(status.value("disk_pct", 0.0)) +
                   "%, memory " + std::to_string(status.value("mem_pct", 0.0)) + "%");
    }

    if (publisher_ && publisher_->isConnected()) {
        publisher_->publishStatus(status);
    }
}

std::chrono::seconds SecurityCam::parseFrequency(const std::string& freq) {
    static const std::map<char, int> multipliers = {
        {'s', 1},
        {'m', 60},
        {'h', 3600},
        {'d', 86400}
    };

    static const std::regex freq_regex(R"((\d+)([smhd]))");
    std::smatch match;

    if (std::regex_match(freq, match, freq_regex)) {
        try {
            int value = std::stoi(match[1].str());
            auto it = multipliers.find(match[2].str()[0]);
            if (value > 0 && it != multipliers.end()) {
                return std::chrono::seconds(static_cast<long long>(value) * it->second);
            }
        } catch (const std::out_of_range&) {
            // falls through to the default
        }
    }

    logError("SecurityCam", "Invalid frequency format: " + freq + ", using default 60s");
    return std::chrono::seconds(60);
}
