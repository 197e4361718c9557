#pragma once

#include <string>

// Input pin through the sysfs GPIO interface. The pull resistor is set by
// the board configuration, not here.
class GpioPin {
public:
    GpioPin(int pin, const std::string& base_path = "/sys/class/gpio", int offset = 0);
    ~GpioPin();

    GpioPin(const GpioPin&) = delete;
    GpioPin& operator=(const GpioPin&) = delete;

    bool read() const;
    int pin() const { return pin_; }

private:
    int pin_;
    int sysfs_number_;
    std::string base_path_;
    std::string pin_path_;
    bool exported_by_us_;

    void writeFile(const std::string& path, const std::string& value) const;
};
