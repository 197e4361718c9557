#include "motion_trigger.h"
#include "checksum.h"
#include "logger.h"
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace fs = std::filesystem;

MotionTrigger::MotionTrigger(int video_duration_seconds,
                             std::chrono::seconds cooldown,
                             RecordFunction record,
                             UploadFunction upload,
                             NotifyFunction notify)
    : video_duration_(video_duration_seconds)
    , cooldown_(cooldown)
    , record_(std::move(record))
    , upload_(std::move(upload))
    , notify_(std::move(notify))
    , recordings_triggered_(0)
    , uploads_succeeded_(0) {
}

std::string MotionTrigger::formatClock(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local_tm{};
    localtime_r(&t, &local_tm);

    std::ostringstream out;
    out << std::put_time(&local_tm, "%H:%M:%S");
    return out.str();
}

std::optional<std::chrono::system_clock::time_point> MotionTrigger::lastDetection() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_detection_;
}

void MotionTrigger::onDetection(const SensorData& data) {
    auto now = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (last_recording_time_ && (now - *last_recording_time_) < cooldown_) {
            return;
        }
        last_detection_ = data.timestamp;
    }

    logInfo("MotionTrigger", "Target Detected!");
    logInfo("MotionTrigger", "Time: " + formatClock(data.timestamp));

    std::string strength = "(strength: " + std::to_string(data.signal_strength) + ")";
    if (data.moving_target) {
        logInfo("MotionTrigger", "Moving target at " + std::to_string(data.distance) + "cm " + strength);
    }
    if (data.stationary_target) {
        logInfo("MotionTrigger", "Stationary target at " + std::to_string(data.distance) + "cm " + strength);
    }

    nlohmann::json detection;
    detection["moving"] = data.moving_target;
    detection["stationary"] = data.stationary_target;
    detection["distance_cm"] = data.distance;
    detection["signal_strength"] = data.signal_strength;
    if (data.presence) {
        detection["presence_pin"] = *data.presence;
    }
    notify("detection", detection);

    auto file_path = record_(video_duration_);
    if (!file_path) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_recording_time_ = now;
    }
    ++recordings_triggered_;

    handleRecording(*file_path);
}

void MotionTrigger::handleRecording(const std::string& file_path) {
    nlohmann::json recording;
    recording["path"] = file_path;
    recording["file"] = fs::path(file_path).filename().string();
    recording["duration_s"] = video_duration_;
    try {
        recording["sha256"] = sha256File(file_path);
        recording["size_bytes"] = static_cast<long long>(fs::file_size(file_path));
    } catch (const std::exception& e) {
        logError("MotionTrigger", std::string("Cannot fingerprint recording: ") + e.what());
    }
    notify("recording", recording);

    if (!upload_) {
        logInfo("MotionTrigger", "FTP disabled, keeping local file " + file_path);
        return;
    }

    bool success = upload_(file_path);
    if (success) {
        ++uploads_succeeded_;
    } else if (fs::exists(file_path)) {
        logInfo("MotionTrigger", "Upload failed, keeping local file " + file_path);
    }

    nlohmann::json upload;
    upload["file"] = recording["file"];
    upload["success"] = success;
    notify("upload", upload);
}

void MotionTrigger::notify(const std::string& type, const nlohmann::json& data) {
    if (!notify_) {
        return;
    }
    try {
        notify_(type, data);
    } catch (const std::exception& e) {
        logError("MotionTrigger", "Failed to publish " + type + " event: " + e.what());
    }
}
