#pragma once

#include <cstdint>
#include <vector>
#include <optional>
#include <chrono>

// One decoded LD2410 reading.
struct SensorData {
    bool moving_target = false;
    bool stationary_target = false;
    int distance = 0;          // cm
    int signal_strength = 0;
    std::vector<uint8_t> raw_data;
    std::chrono::system_clock::time_point timestamp;
    std::optional<bool> presence; // presence pin level, when a pin is wired

    bool hasTarget() const { return moving_target || stationary_target; }
};
