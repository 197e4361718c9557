#pragma once

#include <string>
#include <vector>
#include <array>
#include <map>
#include <optional>
#include <functional>
#include <stdexcept>
#include <nlohmann/json.hpp>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

// dotenv-style KEY=VALUE files
class EnvFile {
public:
    using Entries = std::vector<std::pair<std::string, std::string>>;

    static Entries parse(const std::string& text);
    static Entries load(const std::string& path);
    static void apply(const Entries& entries, bool override_existing = false);
};

// Typed reads of variables; unset variables fall back to the default.
class EnvArgumentParser {
public:
    using Lookup = std::function<std::optional<std::string>(const std::string& name)>;

    EnvArgumentParser();
    explicit EnvArgumentParser(Lookup lookup);

    int getInt(const std::string& name, int default_value) const;
    std::string getString(const std::string& name, const std::string& default_value) const;
    bool getBool(const std::string& name, bool default_value) const;
    std::vector<double> getFloatTuple(const std::string& name,
                                      const std::vector<double>& default_value) const;

    static int parseInt(const std::string& name, const std::string& value);
    static bool parseBool(const std::string& name, const std::string& value);
    static std::vector<double> parseFloatTuple(const std::string& name, const std::string& value);

    static std::optional<std::string> processEnv(const std::string& name);

private:
    Lookup lookup_;
};

struct RadarSettings {
    std::string uart_device = "/dev/ttyS0";
    int baud_rate = 256000;
    std::string protocol = "packet";   // "packet" | "marker"
    int motion_threshold = 140;
    bool debug = true;
    int presence_pin = 17;             // BCM numbering, < 0 disables
    int gpio_base = 0;
    std::string gpio_sysfs_path = "/sys/class/gpio";
};

struct VideoSettings {
    int width = 1920;
    int height = 1080;
    int fps = 30;
    std::array<double, 4> zoom = {0.0, 0.0, 1.0, 1.0}; // x, y, w, h as fractions
    int rotation = 0;
    bool hflip = false;
    bool vflip = false;
    int bitrate = 1900000;
    std::string recordings_path = "/app/recordings";
    std::string camera_command = "rpicam-vid";
};

struct FtpSettings {
    bool enabled = true;
    std::string host = "127.0.0.1";
    int port = 21;
    std::string username = "username";
    std::string password = "password";
    std::string remote_path = "/";
    bool use_tls = false;
    std::string ca_cert_path;
};

struct MqttSettings {
    bool enabled = false;
    std::string host = "127.0.0.1";
    int port = 1883;
    std::string username;
    std::string password;
    std::string client_id = "securitycam";
    std::string topic_prefix = "securitycam";
    bool use_tls = false;
    std::string ca_cert_path;
};

struct CamConfig {
    RadarSettings radar;
    VideoSettings video;
    FtpSettings ftp;
    MqttSettings mqtt;

    int video_duration = 30;       // seconds
    int recording_cooldown = 5;    // seconds
    std::string status_frequency = "60s";
    std::string log_dir = "logs";

    // defaults < JSON file < .env file < process environment
    static CamConfig load(const std::string& json_path, const std::string& env_path);
    static CamConfig fromSources(const nlohmann::json& file_config, const EnvArgumentParser& env);

    void validate() const;
    nlohmann::json toJson(bool redact_secrets = true) const;
};
