#pragma once

#include <string>
#include <nlohmann/json.hpp>

class SystemMonitor {
public:
    SystemMonitor(std::string meminfo_path = "/proc/meminfo",
                  std::string thermal_path = "/sys/class/thermal/thermal_zone0/temp");

    nlohmann::json collectStatus(const std::string& recordings_path);

    // Individual metric collection
    double getDiskUsage(const std::string& path);
    double getMemoryUsage();
    double getCpuTemperature();
    int countRecordings(const std::string& recordings_path);

    static std::string determineStatus(double disk_pct, double mem_pct);

private:
    std::string meminfo_path_;
    std::string thermal_path_;

    // Thresholds for degraded status
    static constexpr double DISK_THRESHOLD = 90.0;
    static constexpr double MEMORY_THRESHOLD = 90.0;
};
