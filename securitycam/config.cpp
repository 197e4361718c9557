#include "config.h"
#include "logger.h"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <regex>
#include <cstdlib>
#include <climits>
#include <cmath>
#include <type_traits>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unescapeDoubleQuoted(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\\' && i + 1 < s.size()) {
            char next = s[++i];
            switch (next) {
                case 'n':  out.push_back('\n'); break;
                case 't':  out.push_back('\t'); break;
                case 'r':  out.push_back('\r'); break;
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                default:
                    out.push_back('\\');
                    out.push_back(next);
                    break;
            }
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

// Missing is fine; anything else the filesystem reports is a config error
bool configFileExists(const std::string& path) {
    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) {
        throw ConfigError("Cannot access " + path + ": " + ec.message());
    }
    return exists;
}

// JSON file values become the defaults for the environment lookup
template <typename T>
T fileValue(const json& file_config, const std::string& key, const T& fallback) {
    if (!file_config.is_object() || !file_config.contains(key)) {
        return fallback;
    }
    const json& value = file_config.at(key);
    if constexpr (std::is_same_v<T, int>) {
        if (!value.is_number_integer()) {
            throw ConfigError("Config key '" + key + "' must be an integer, got " + value.dump());
        }
        bool in_range = value.is_number_unsigned()
            ? value.get<unsigned long long>() <= static_cast<unsigned long long>(INT_MAX)
            : (value.get<long long>() >= INT_MIN && value.get<long long>() <= INT_MAX);
        if (!in_range) {
            throw ConfigError("Config key '" + key + "' is out of range: " + value.dump());
        }
    }
    try {
        return value.get<T>();
    } catch (const json::exception& e) {
        throw ConfigError("Config key '" + key + "' has the wrong type: " + e.what());
    }
}

} // namespace

/*==================  EnvFile  ==================*/

EnvFile::Entries EnvFile::parse(const std::string& text) {
    Entries entries;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        if (trimmed.rfind("export ", 0) == 0) {
            trimmed = trim(trimmed.substr(7));
        }

        size_t eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        std::string key = trim(trimmed.substr(0, eq));
        std::string value = trim(trimmed.substr(eq + 1));
        if (key.empty()) {
            continue;
        }

        if (value.size() >= 2 && value.front() == '\'') {
            size_t close = value.find('\'', 1);
            value = value.substr(1, close == std::string::npos ? std::string::npos : close - 1);
        } else if (value.size() >= 2 && value.front() == '"') {
            // closing quote is the first one not escaped by a backslash
            size_t close = 1;
            while (close < value.size()) {
                if (value[close] == '\\') {
                    close += 2;
                    continue;
                }
                if (value[close] == '"') {
                    break;
                }
                ++close;
            }
            value = unescapeDoubleQuoted(value.substr(1, close - 1));
        } else {
            size_t comment = value.find(" #");
            if (comment != std::string::npos) {
                value = trim(value.substr(0, comment));
            }
        }

        entries.emplace_back(key, value);
    }

    return entries;
}

EnvFile::Entries EnvFile::load(const std::string& path) {
    if (path.empty() || !configFileExists(path)) {
        return {};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open env file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

void EnvFile::apply(const Entries& entries, bool override_existing) {
    for (const auto& [key, value] : entries) {
        if (setenv(key.c_str(), value.c_str(), override_existing ? 1 : 0) != 0) {
            throw ConfigError("Cannot export environment variable " + key);
        }
    }
}

/*==================  EnvArgumentParser  ==================*/

EnvArgumentParser::EnvArgumentParser()
    : lookup_(&EnvArgumentParser::processEnv) {
}

EnvArgumentParser::EnvArgumentParser(Lookup lookup)
    : lookup_(std::move(lookup)) {
}

std::optional<std::string> EnvArgumentParser::processEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

int EnvArgumentParser::getInt(const std::string& name, int default_value) const {
    auto value = lookup_(name);
    return value ? parseInt(name, *value) : default_value;
}

std::string EnvArgumentParser::getString(const std::string& name, const std::string& default_value) const {
    auto value = lookup_(name);
    return value ? *value : default_value;
}

bool EnvArgumentParser::getBool(const std::string& name, bool default_value) const {
    auto value = lookup_(name);
    return value ? parseBool(name, *value) : default_value;
}

std::vector<double> EnvArgumentParser::getFloatTuple(const std::string& name,
                                                     const std::vector<double>& default_value) const {
    auto value = lookup_(name);
    return value ? parseFloatTuple(name, *value) : default_value;
}

int EnvArgumentParser::parseInt(const std::string& name, const std::string& value) {
    static const std::regex int_regex(R"([+-]?\d+)");

    std::string trimmed = trim(value);
    if (!std::regex_match(trimmed, int_regex)) {
        throw ConfigError("Argument " + name + "=" + value + " is not an integer");
    }

    try {
        long long parsed = std::stoll(trimmed);
        if (parsed < INT_MIN || parsed > INT_MAX) {
            throw std::out_of_range(trimmed);
        }
        return static_cast<int>(parsed);
    } catch (const std::out_of_range&) {
        throw ConfigError("Argument " + name + "=" + value + " is out of range");
    }
}

bool EnvArgumentParser::parseBool(const std::string& name, const std::string& value) {
    std::string trimmed = trim(value);
    if (trimmed == "True" || trimmed == "true" || trimmed == "1") {
        return true;
    }
    if (trimmed == "False" || trimmed == "false" || trimmed == "0") {
        return false;
    }
    throw ConfigError("Argument " + name + "=" + value + " is not a boolean (use True or False)");
}

std::vector<double> EnvArgumentParser::parseFloatTuple(const std::string& name, const std::string& value) {
    std::string trimmed = trim(value);
    if (trimmed.size() < 2 ||
        !((trimmed.front() == '(' && trimmed.back() == ')') ||
          (trimmed.front() == '[' && trimmed.back() == ']'))) {
        throw ConfigError("Argument " + name + "=" + value + " is not a tuple, expected (a, b, ...)");
    }

    std::vector<double> result;
    std::string body = trimmed.substr(1, trimmed.size() - 2);
    if (trim(body).empty()) {
        return result;
    }

    std::istringstream stream(body);
    std::string item;
    std::vector<std::string> items;
    while (std::getline(stream, item, ',')) {
        items.push_back(trim(item));
    }
    // getline drops the empty token after a single trailing comma: "(1.0,)"

    for (const auto& element : items) {
        size_t consumed = 0;
        double number = 0.0;
        try {
            number = std::stod(element, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (element.empty() || consumed != element.size() || !std::isfinite(number)) {
            throw ConfigError("Argument " + name + "=" + value + " contains a non-numeric element '" + element + "'");
        }
        result.push_back(number);
    }

    return result;
}

/*==================  CamConfig  ==================*/

CamConfig CamConfig::load(const std::string& json_path, const std::string& env_path) {
    json file_config = json::object();

    if (!json_path.empty() && configFileExists(json_path)) {
        std::ifstream file(json_path);
        if (!file.is_open()) {
            throw ConfigError("Cannot open config: " + json_path);
        }
        try {
            file >> file_config;
        } catch (const json::exception& e) {
            throw ConfigError("Malformed config " + json_path + ": " + e.what());
        }
        logInfo("Config", "Loaded config file " + json_path);
    }

    auto entries = EnvFile::load(env_path);
    if (!entries.empty()) {
        EnvFile::apply(entries, false);
        logInfo("Config", "Loaded " + std::to_string(entries.size()) + " variables from " + env_path);
    }

    CamConfig config = fromSources(file_config, EnvArgumentParser());
    config.validate();
    return config;
}

CamConfig CamConfig::fromSources(const json& f, const EnvArgumentParser& env) {
    CamConfig c;

    c.video_duration     = env.getInt("VIDEO_DURATION", fileValue(f, "video_duration", c.video_duration));
    c.recording_cooldown = env.getInt("RECORDING_COOLDOWN", fileValue(f, "recording_cooldown", c.recording_cooldown));
    c.status_frequency   = env.getString("STATUS_FREQUENCY", fileValue(f, "status_frequency", c.status_frequency));
    c.log_dir            = env.getString("LOG_DIR", fileValue(f, "log_dir", c.log_dir));

    // Camera
    VideoSettings& v = c.video;
    v.recordings_path = env.getString("RECORDINGS_PATH", fileValue(f, "recordings_path", v.recordings_path));
    v.width           = env.getInt("CAMERA_WIDTH", fileValue(f, "camera_width", v.width));
    v.height          = env.getInt("CAMERA_HEIGHT", fileValue(f, "camera_height", v.height));
    v.fps             = env.getInt("CAMERA_FPS", fileValue(f, "camera_fps", v.fps));
    v.rotation        = env.getInt("CAMERA_ROTATION", fileValue(f, "camera_rotation", v.rotation));
    v.hflip           = env.getBool("CAMERA_HFLIP", fileValue(f, "camera_hflip", v.hflip));
    v.vflip           = env.getBool("CAMERA_VFLIP", fileValue(f, "camera_vflip", v.vflip));
    v.bitrate         = env.getInt("CAMERA_BITRATE", fileValue(f, "camera_bitrate", v.bitrate));
    v.camera_command  = env.getString("CAMERA_COMMAND", fileValue(f, "camera_command", v.camera_command));

    std::vector<double> default_zoom(v.zoom.begin(), v.zoom.end());
    std::vector<double> zoom = env.getFloatTuple("CAMERA_ZOOM", fileValue(f, "camera_zoom", default_zoom));
    if (zoom.size() != 4) {
        throw ConfigError("CAMERA_ZOOM must have 4 elements (x, y, width, height), got " +
                          std::to_string(zoom.size()));
    }
    for (size_t i = 0; i < 4; ++i) {
        v.zoom[i] = zoom[i];
    }

    // Radar
    RadarSettings& r = c.radar;
    r.uart_device      = env.getString("UART_DEVICE", fileValue(f, "uart_device", r.uart_device));
    r.baud_rate        = env.getInt("UART_BAUD_RATE", fileValue(f, "uart_baud_rate", r.baud_rate));
    r.protocol         = env.getString("RADAR_PROTOCOL", fileValue(f, "radar_protocol", r.protocol));
    r.motion_threshold = env.getInt("RADAR_MOTION_THRESHOLD", fileValue(f, "radar_motion_threshold", r.motion_threshold));
    r.debug            = env.getBool("RADAR_DEBUG", fileValue(f, "radar_debug", r.debug));
    r.presence_pin     = env.getInt("PRESENCE_PIN", fileValue(f, "presence_pin", r.presence_pin));
    r.gpio_base        = env.getInt("GPIO_BASE", fileValue(f, "gpio_base", r.gpio_base));

    // FTP
    FtpSettings& ftp = c.ftp;
    ftp.enabled      = env.getBool("FTP_ENABLED", fileValue(f, "ftp_enabled", ftp.enabled));
    ftp.host         = env.getString("FTP_HOSTNAME", fileValue(f, "ftp_hostname", ftp.host));
    ftp.port         = env.getInt("FTP_PORT", fileValue(f, "ftp_port", ftp.port));
    ftp.username     = env.getString("FTP_USERNAME", fileValue(f, "ftp_username", ftp.username));
    ftp.password     = env.getString("FTP_PASSWORD", fileValue(f, "ftp_password", ftp.password));
    ftp.remote_path  = env.getString("FTP_REMOTE_PATH", fileValue(f, "ftp_remote_path", ftp.remote_path));
    ftp.use_tls      = env.getBool("FTP_TLS", fileValue(f, "ftp_tls", ftp.use_tls));
    ftp.ca_cert_path = env.getString("FTP_CA_CERT", fileValue(f, "ftp_ca_cert", ftp.ca_cert_path));

    // MQTT
    MqttSettings& m = c.mqtt;
    m.enabled      = env.getBool("MQTT_ENABLED", fileValue(f, "mqtt_enabled", m.enabled));
    m.host         = env.getString("MQTT_HOST", fileValue(f, "mqtt_host", m.host));
    m.port         = env.getInt("MQTT_PORT", fileValue(f, "mqtt_port", m.port));
    m.username     = env.getString("MQTT_USERNAME", fileValue(f, "mqtt_username", m.username));
    m.password     = env.getString("MQTT_PASSWORD", fileValue(f, "mqtt_password", m.password));
    m.client_id    = env.getString("MQTT_CLIENT_ID", fileValue(f, "mqtt_client_id", m.client_id));
    m.topic_prefix = env.getString("MQTT_TOPIC_PREFIX", fileValue(f, "mqtt_topic_prefix", m.topic_prefix));
    m.use_tls      = env.getBool("MQTT_TLS", fileValue(f, "mqtt_tls", m.use_tls));
    m.ca_cert_path = env.getString("MQTT_CA_CERT", fileValue(f, "mqtt_ca_cert", m.ca_cert_path));

    return c;
}

void CamConfig::validate() const {
    auto requirePositive = [](const std::string& name, int value) {
        if (value <= 0) {
            throw ConfigError(name + " must be positive, got " + std::to_string(value));
        }
    };

    requirePositive("VIDEO_DURATION", video_duration);
    requirePositive("CAMERA_WIDTH", video.width);
    requirePositive("CAMERA_HEIGHT", video.height);
    requirePositive("CAMERA_FPS", video.fps);
    requirePositive("CAMERA_BITRATE", video.bitrate);
    requirePositive("UART_BAUD_RATE", radar.baud_rate);
    requirePositive("FTP_PORT", ftp.port);
    requirePositive("MQTT_PORT", mqtt.port);

    if (recording_cooldown < 0) {
        throw ConfigError("RECORDING_COOLDOWN must not be negative");
    }

    for (double component : video.zoom) {
        if (!(component >= 0.0 && component <= 1.0)) {
            throw ConfigError("CAMERA_ZOOM components must be within [0, 1]");
        }
    }

    if (radar.protocol != "packet" && radar.protocol != "marker") {
        throw ConfigError("RADAR_PROTOCOL must be 'packet' or 'marker', got '" + radar.protocol + "'");
    }

    if (video.recordings_path.empty()) {
        throw ConfigError("RECORDINGS_PATH must not be empty");
    }
}

json CamConfig::toJson(bool redact_secrets) const {
    json j;
    j["video_duration"] = video_duration;
    j["recording_cooldown"] = recording_cooldown;
    j["status_frequency"] = status_frequency;
    j["log_dir"] = log_dir;

    j["recordings_path"] = video.recordings_path;
    j["camera_width"] = video.width;
    j["camera_height"] = video.height;
    j["camera_fps"] = video.fps;
    j["camera_zoom"] = video.zoom;
    j["camera_rotation"] = video.rotation;
    j["camera_hflip"] = video.hflip;
    j["camera_vflip"] = video.vflip;
    j["camera_bitrate"] = video.bitrate;

    j["uart_device"] = radar.uart_device;
    j["uart_baud_rate"] = radar.baud_rate;
    j["radar_protocol"] = radar.protocol;
    j["presence_pin"] = radar.presence_pin;

    j["ftp_enabled"] = ftp.enabled;
    j["ftp_hostname"] = ftp.host;
    j["ftp_port"] = ftp.port;
    j["ftp_username"] = ftp.username;
    j["ftp_password"] = redact_secrets ? std::string("***") : ftp.password;
    j["ftp_remote_path"] = ftp.remote_path;
    j["ftp_tls"] = ftp.use_tls;

    j["mqtt_enabled"] = mqtt.enabled;
    j["mqtt_host"] = mqtt.host;
    j["mqtt_port"] = mqtt.port;
    j["mqtt_topic_prefix"] = mqtt.topic_prefix;
    j["mqtt_password"] = redact_secrets ? std::string("***") : mqtt.password;

    return j;
}
