#pragma once

#include "sensor_data.h"
#include <string>
#include <optional>
#include <functional>
#include <mutex>
#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>

// Turns radar detections into recordings, honouring the cooldown between
// recordings, and hands finished files to the uploader.
class MotionTrigger {
public:
    using RecordFunction = std::function<std::optional<std::string>(int duration_seconds)>;
    using UploadFunction = std::function<bool(const std::string& local_path)>;
    using NotifyFunction = std::function<void(const std::string& type, const nlohmann::json& data)>;

    MotionTrigger(int video_duration_seconds,
                  std::chrono::seconds cooldown,
                  RecordFunction record,
                  UploadFunction upload = nullptr,
                  NotifyFunction notify = nullptr);

    void onDetection(const SensorData& data);

    int recordingsTriggered() const { return recordings_triggered_; }
    int uploadsSucceeded() const { return uploads_succeeded_; }
    std::optional<std::chrono::system_clock::time_point> lastDetection() const;

    static std::string formatClock(std::chrono::system_clock::time_point when);

private:
    int video_duration_;
    std::chrono::seconds cooldown_;
    RecordFunction record_;
    UploadFunction upload_;
    NotifyFunction notify_;

    mutable std::mutex state_mutex_;
    std::optional<std::chrono::steady_clock::time_point> last_recording_time_;
    std::optional<std::chrono::system_clock::time_point> last_detection_;
    std::atomic<int> recordings_triggered_;
    std::atomic<int> uploads_succeeded_;

    void notify(const std::string& type, const nlohmann::json& data);
    void handleRecording(const std::string& file_path);
};
