#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <cstdint>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

// Process-wide log sink. INFO and above go to the console, everything goes
// to a size-rotated file once init() has been called.
class Logger {
public:
    static Logger& instance();

    void init(const std::string& log_dir,
              std::uintmax_t max_bytes = 1024 * 1024,
              int backup_count = 5);
    void shutdown();

    void write(LogLevel level, const std::string& component, const std::string& message);

    void setConsoleLevel(LogLevel level) { console_level_ = level; }
    std::string logFilePath() const { return log_path_; }

    static std::string levelName(LogLevel level);
    static std::string formatLine(LogLevel level, const std::string& component,
                                  const std::string& message);

private:
    Logger() = default;

    void rotate();

    std::mutex mutex_;
    std::ofstream file_;
    std::string log_path_;
    std::uintmax_t max_bytes_ = 1024 * 1024;
    int backup_count_ = 5;
    LogLevel console_level_ = LogLevel::Info;
};

void logDebug(const std::string& component, const std::string& message);
void logInfo(const std::string& component, const std::string& message);
void logWarning(const std::string& component, const std::string& message);
void logError(const std::string& component, const std::string& message);
