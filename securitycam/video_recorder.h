#pragma once

#include "config.h"
#include <string>
#include <optional>
#include <functional>
#include <mutex>
#include <chrono>

class VideoRecorder {
public:
    // Runs a shell command, fills `output` with its stdout/stderr and
    // returns the exit status.
    using CommandRunner = std::function<int(const std::string& command, std::string& output)>;

    explicit VideoRecorder(const VideoSettings& settings, CommandRunner runner = runShellCommand);

    // Records `duration_seconds` of video; returns the file path, or nullopt
    // when busy or the camera failed.
    std::optional<std::string> record(int duration_seconds);

    bool isRecording() const;
    bool checkCamera();

    std::string buildCommand(const std::string& output_path, int duration_seconds) const;
    std::string makeFileName(std::chrono::system_clock::time_point when) const;

    static int runShellCommand(const std::string& command, std::string& output);

private:
    VideoSettings settings_;
    CommandRunner runner_;

    mutable std::mutex recording_mutex_;
    bool is_recording_;

    std::optional<std::string> doRecord(int duration_seconds);
};
