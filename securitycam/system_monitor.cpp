#include "system_monitor.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <ctime>
#include <stdexcept>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

SystemMonitor::SystemMonitor(std::string meminfo_path, std::string thermal_path)
    : meminfo_path_(std::move(meminfo_path))
    , thermal_path_(std::move(thermal_path)) {
}

nlohmann::json SystemMonitor::collectStatus(const std::string& recordings_path) {
    nlohmann::json status;

    double disk_pct = getDiskUsage(recordings_path);
    double mem_pct = getMemoryUsage();

    status["disk_pct"] = disk_pct;
    status["mem_pct"] = mem_pct;
    status["cpu_temp_c"] = getCpuTemperature();
    status["pending_recordings"] = countRecordings(recordings_path);
    status["status"] = determineStatus(disk_pct, mem_pct);
    status["timestamp"] = static_cast<long long>(std::time(nullptr));

    return status;
}

double SystemMonitor::getDiskUsage(const std::string& path) {
    struct statvfs stats;
    if (statvfs(path.c_str(), &stats) != 0) {
        logError("SystemMonitor", "Error getting disk usage for " + path);
        return 0.0;
    }

    double total = static_cast<double>(stats.f_blocks) * stats.f_frsize;
    double available = static_cast<double>(stats.f_bavail) * stats.f_frsize;
    if (total <= 0.0) {
        return 0.0;
    }
    return (total - available) / total * 100.0;
}

double SystemMonitor::getMemoryUsage() {
    try {
        std::ifstream meminfo(meminfo_path_);
        if (!meminfo.is_open()) {
            throw std::runtime_error("Cannot open " + meminfo_path_);
        }

        std::string line;
        long mem_total = 0, mem_available = 0;

        while (std::getline(meminfo, line)) {
            std::istringstream iss(line);
            std::string label;
            long value = 0;
            iss >> label >> value;

            if (label == "MemTotal:") {
                mem_total = value;
            } else if (label == "MemAvailable:") {
                mem_available = value;
            }

            if (mem_total > 0 && mem_available > 0) {
                break;
            }
        }

        if (mem_total > 0) {
            return (static_cast<double>(mem_total - mem_available) / mem_total) * 100.0;
        }
    } catch (const std::exception& e) {
        logError("SystemMonitor", std::string("Error getting memory usage: ") + e.what());
    }

    return 0.0;
}

double SystemMonitor::getCpuTemperature() {
    std::ifstream thermal(thermal_path_);
    long millidegrees = 0;
    if (!thermal.is_open() || !(thermal >> millidegrees)) {
        return 0.0;
    }
    return millidegrees / 1000.0;
}

int SystemMonitor::countRecordings(const std::string& recordings_path) {
    std::error_code ec;
    if (!fs::is_directory(recordings_path, ec)) {
        return 0;
    }

    int count = 0;
    for (const auto& entry : fs::directory_iterator(recordings_path, ec)) {
        if (entry.is_regular_file(ec) && entry.path().extension() == ".mp4") {
            ++count;
        }
    }
    return count;
}

std::string SystemMonitor::determineStatus(double disk_pct, double mem_pct) {
    if (disk_pct > DISK_THRESHOLD || mem_pct > MEMORY_THRESHOLD) {
        return "degraded";
    }
    return "normal";
}
