#include "logger.h"
#include <iostream>
#include <filesystem>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const std::string& log_dir, std::uintmax_t max_bytes, int backup_count) {
    std::lock_guard<std::mutex> lock(mutex_);

    max_bytes_ = max_bytes;
    backup_count_ = backup_count;

    std::error_code ec;
    fs::create_directories(log_dir, ec);
    if (ec) {
        std::cerr << "[Logger] Cannot create log directory " << log_dir << ": " << ec.message() << std::endl;
        return;
    }

    log_path_ = (fs::path(log_dir) / "security_cam.log").string();
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(log_path_, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "[Logger] Cannot open log file " << log_path_ << std::endl;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

std::string Logger::formatLine(LogLevel level, const std::string& component,
                               const std::string& message) {
    std::time_t now = std::time(nullptr);
    std::tm local_tm{};
    localtime_r(&now, &local_tm);

    std::ostringstream line;
    line << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
         << " - " << levelName(level)
         << " - [" << component << "] " << message;
    return line.str();
}

void Logger::write(LogLevel level, const std::string& component, const std::string& message) {
    std::string line = formatLine(level, component, message);

    std::lock_guard<std::mutex> lock(mutex_);

    if (level >= console_level_) {
        if (level >= LogLevel::Error) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }

    if (!file_.is_open()) {
        return;
    }

    try {
        std::error_code ec;
        std::uintmax_t size = fs::file_size(log_path_, ec);
        if (!ec && size + line.size() + 1 > max_bytes_) {
            rotate();
        }
        file_ << line << "\n";
        file_.flush();
    } catch (const std::exception& e) {
        // the file sink is best effort; the console already has the line
        std::cerr << "[Logger] Failed to write log file: " << e.what() << std::endl;
    }
}

// security_cam.log -> .1 -> .2 ... -> .<backup_count>, oldest dropped
void Logger::rotate() {
    file_.close();

    std::error_code ec;
    if (backup_count_ > 0) {
        fs::remove(log_path_ + "." + std::to_string(backup_count_), ec);
        for (int i = backup_count_ - 1; i >= 1; --i) {
            std::string from = log_path_ + "." + std::to_string(i);
            if (fs::exists(from, ec)) {
                fs::rename(from, log_path_ + "." + std::to_string(i + 1), ec);
            }
        }
        fs::rename(log_path_, log_path_ + ".1", ec);
    } else {
        fs::remove(log_path_, ec);
    }

    file_.open(log_path_, std::ios::trunc);
}

void logDebug(const std::string& component, const std::string& message) {
    Logger::instance().write(LogLevel::Debug, component, message);
}

void logInfo(const std::string& component, const std::string& message) {
    Logger::instance().write(LogLevel::Info, component, message);
}

void logWarning(const std::string& component, const std::string& message) {
    Logger::instance().write(LogLevel::Warning, component, message);
}

void logError(const std::string& component, const std::string& message) {
    Logger::instance().write(LogLevel::Error, component, message);
}
