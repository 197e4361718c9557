#include "video_recorder.h"
#include "logger.h"
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <array>
#include <memory>
#include <cstdio>
#include <ctime>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace {

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

bool isFullFrame(const std::array<double, 4>& zoom) {
    return zoom[0] == 0.0 && zoom[1] == 0.0 && zoom[2] == 1.0 && zoom[3] == 1.0;
}

} // namespace

VideoRecorder::VideoRecorder(const VideoSettings& settings, CommandRunner runner)
    : settings_(settings)
    , runner_(std::move(runner))
    , is_recording_(false) {
}

bool VideoRecorder::isRecording() const {
    std::lock_guard<std::mutex> lock(recording_mutex_);
    return is_recording_;
}

std::optional<std::string> VideoRecorder::record(int duration_seconds) {
    {
        std::lock_guard<std::mutex> lock(recording_mutex_);
        if (is_recording_) {
            logInfo("VideoRecorder", "Already recording, skipping this trigger");
            return std::nullopt;
        }
        is_recording_ = true;
    }

    std::optional<std::string> result;
    try {
        result = doRecord(duration_seconds);
    } catch (const std::exception& e) {
        logError("VideoRecorder", std::string("Error during recording: ") + e.what());
        result = std::nullopt;
    }

    std::lock_guard<std::mutex> lock(recording_mutex_);
    is_recording_ = false;
    return result;
}

std::optional<std::string> VideoRecorder::doRecord(int duration_seconds) {
    fs::create_directories(settings_.recordings_path);

    std::string file_path = (fs::path(settings_.recordings_path) /
                             makeFileName(std::chrono::system_clock::now())).string();
    std::string command = buildCommand(file_path, duration_seconds);

    logInfo("VideoRecorder", "Starting " + std::to_string(duration_seconds) + " second recording...");
    logDebug("VideoRecorder", "Camera command: " + command);

    std::string output;
    int status = runner_(command, output);
    if (status != 0) {
        logError("VideoRecorder", "Error during recording: camera exited with status " +
                 std::to_string(status) + ": " + output);
        return std::nullopt;
    }

    if (!fs::exists(file_path)) {
        logError("VideoRecorder", "Error during recording: no output file " + file_path);
        return std::nullopt;
    }

    logInfo("VideoRecorder", "Recording complete");
    return file_path;
}

std::string VideoRecorder::makeFileName(std::chrono::system_clock::time_point when) const {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local_tm{};
    localtime_r(&t, &local_tm);

    std::ostringstream name;
    name << "motion_" << std::put_time(&local_tm, "%Y%m%d_%H%M%S") << ".mp4";
    return name.str();
}

std::string VideoRecorder::buildCommand(const std::string& output_path, int duration_seconds) const {
    std::ostringstream cmd;

    cmd << settings_.camera_command;
    cmd << " --nopreview";
    cmd << " -t " << (static_cast<long long>(duration_seconds) * 1000);
    cmd << " --width " << settings_.width;
    cmd << " --height " << settings_.height;
    cmd << " --framerate " << settings_.fps;
    cmd << " --bitrate " << settings_.bitrate;
    cmd << " --codec libav --libav-format mp4";

    int rotation = ((settings_.rotation % 360) + 360) % 360;
    if (rotation == 180) {
        cmd << " --rotation 180";
    } else if (rotation != 0) {
        logWarning("VideoRecorder", "Camera supports rotation 0 or 180 only, ignoring " +
                   std::to_string(settings_.rotation));
    }

    if (settings_.hflip) {
        cmd << " --hflip";
    }
    if (settings_.vflip) {
        cmd << " --vflip";
    }

    if (!isFullFrame(settings_.zoom)) {
        cmd << " --roi " << settings_.zoom[0] << "," << settings_.zoom[1] << ","
            << settings_.zoom[2] << "," << settings_.zoom[3];
    }

    cmd << " -o " << shellQuote(output_path);
    return cmd.str();
}

bool VideoRecorder::checkCamera() {
    std::string output;
    int status = -1;
    try {
        status = runner_(settings_.camera_command + " --version", output);
    } catch (const std::exception& e) {
        logError("VideoRecorder", std::string("Camera check failed: ") + e.what());
        return false;
    }

    if (status != 0) {
        logError("VideoRecorder", settings_.camera_command + " not available: " + output);
        return false;
    }
    logInfo("VideoRecorder", "Camera stack available");
    return true;
}

int VideoRecorder::runShellCommand(const std::string& command, std::string& output) {
    std::array<char, 512> buffer;
    output.clear();

    FILE* pipe = popen((command + " 2>&1").c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("popen() failed for command: " + command);
    }

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        output += buffer.data();
    }

    int status = pclose(pipe);
    if (status == -1) {
        throw std::runtime_error("pclose() failed for command: " + command);
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}
