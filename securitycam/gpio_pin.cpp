#include "gpio_pin.h"
#include "logger.h"
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <chrono>

namespace fs = std::filesystem;

GpioPin::GpioPin(int pin, const std::string& base_path, int offset)
    : pin_(pin)
    , sysfs_number_(pin + offset)
    , base_path_(base_path)
    , exported_by_us_(false) {

    if (pin < 0) {
        throw std::invalid_argument("Invalid GPIO pin: " + std::to_string(pin));
    }

    pin_path_ = (fs::path(base_path_) / ("gpio" + std::to_string(sysfs_number_))).string();

    if (!fs::exists(pin_path_)) {
        writeFile((fs::path(base_path_) / "export").string(), std::to_string(sysfs_number_));
        exported_by_us_ = true;

        // udev needs a moment to create the attribute files
        for (int i = 0; i < 20 && !fs::exists(fs::path(pin_path_) / "direction"); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    writeFile((fs::path(pin_path_) / "direction").string(), "in");
    logInfo("GpioPin", "Presence pin " + std::to_string(pin_) + " configured as input");
}

GpioPin::~GpioPin() {
    if (!exported_by_us_) {
        return;
    }
    try {
        writeFile((fs::path(base_path_) / "unexport").string(), std::to_string(sysfs_number_));
    } catch (const std::exception& e) {
        logError("GpioPin", std::string("Failed to release pin: ") + e.what());
    }
}

bool GpioPin::read() const {
    std::ifstream value_file(fs::path(pin_path_) / "value");
    if (!value_file.is_open()) {
        throw std::runtime_error("Cannot read GPIO value: " + pin_path_);
    }

    char level = '0';
    value_file >> level;
    return level == '1';
}

void GpioPin::writeFile(const std::string& path, const std::string& value) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    file << value;
    file.flush();
    if (!file) {
        throw std::runtime_error("Cannot write '" + value + "' to " + path);
    }
}
