#include "ld2410_sensor.h"
#include "logger.h"
#include <stdexcept>

Ld2410Sensor::Ld2410Sensor(std::unique_ptr<ByteSource> source,
                           std::unique_ptr<FrameDecoder> decoder,
                           Options options,
                           std::unique_ptr<GpioPin> presence_pin)
    : source_(std::move(source))
    , decoder_(std::move(decoder))
    , presence_pin_(std::move(presence_pin))
    , options_(options)
    , monitoring_(false)
    , has_last_target_(false) {

    if (!source_ || !decoder_) {
        throw std::invalid_argument("Ld2410Sensor needs a byte source and a decoder");
    }
}

Ld2410Sensor::~Ld2410Sensor() {
    cleanup();
}

std::unique_ptr<Ld2410Sensor> Ld2410Sensor::open(const RadarSettings& settings) {
    if (settings.debug) {
        logInfo("Ld2410Sensor", "Opening UART device: " + settings.uart_device);
        logInfo("Ld2410Sensor", "Baud rate: " + std::to_string(settings.baud_rate));
    }

    std::unique_ptr<SerialPort> port;
    try {
        port = std::make_unique<SerialPort>(settings.uart_device, settings.baud_rate);
        logInfo("Ld2410Sensor", "Successfully opened UART device");
    } catch (const std::exception& e) {
        logError("Ld2410Sensor", std::string("Error opening UART: ") + e.what());
        throw;
    }

    std::unique_ptr<GpioPin> pin;
    if (settings.presence_pin >= 0) {
        try {
            pin = std::make_unique<GpioPin>(settings.presence_pin, settings.gpio_sysfs_path, settings.gpio_base);
        } catch (const std::exception& e) {
            logWarning("Ld2410Sensor", std::string("Presence pin unavailable, continuing without it: ") + e.what());
        }
    }

    Options options;
    options.debug = settings.debug;

    auto sensor = std::make_unique<Ld2410Sensor>(
        std::move(port),
        makeDecoder(settings.protocol, settings.motion_threshold),
        options,
        std::move(pin));

    // the module streams garbage for a moment after the port opens
    std::this_thread::sleep_for(std::chrono::seconds(1));
    return sensor;
}

void Ld2410Sensor::startMonitoring(DetectionCallback callback) {
    if (monitoring_) {
        logInfo("Ld2410Sensor", "Already monitoring!");
        return;
    }
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    logInfo("Ld2410Sensor", "Starting sensor monitoring...");
    monitoring_ = true;
    monitor_thread_ = std::thread(&Ld2410Sensor::monitorLoop, this, std::move(callback));
}

void Ld2410Sensor::stopMonitoring() {
    if (!monitoring_ && !monitor_thread_.joinable()) {
        return;
    }

    logInfo("Ld2410Sensor", "Stopping monitoring...");
    monitoring_ = false;
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
}

void Ld2410Sensor::cleanup() {
    stopMonitoring();

    std::lock_guard<std::mutex> lock(source_mutex_);
    if (source_ && source_->isOpen()) {
        source_->close();
    }
    presence_pin_.reset();
}

std::optional<SensorData> Ld2410Sensor::readSensor() {
    std::vector<uint8_t> raw_data;
    {
        std::lock_guard<std::mutex> lock(source_mutex_);
        size_t waiting = source_->available();
        if (waiting == 0) {
            return std::nullopt;
        }
        raw_data = source_->read(waiting);
    }

    if (raw_data.empty()) {
        return std::nullopt;
    }

    if (options_.debug) {
        logDebug("Ld2410Sensor", "Raw data received (hex): " + toHex(raw_data));
    }

    auto data = decoder_->feed(raw_data);
    if (data && presence_pin_) {
        data->presence = presence_pin_->read();
    }
    return data;
}

void Ld2410Sensor::monitorLoop(DetectionCallback callback) {
    if (options_.debug) {
        logInfo("Ld2410Sensor", "Starting monitoring loop...");
        logInfo("Ld2410Sensor", "Waiting for sensor data...");
    }

    while (monitoring_) {
        try {
            auto sensor_data = readSensor();
            auto now = std::chrono::steady_clock::now();

            if (sensor_data && sensor_data->hasTarget()) {
                bool interval_elapsed = !has_last_target_ ||
                    (now - last_target_time_) >= options_.min_target_interval;

                if (interval_elapsed) {
                    last_target_time_ = now;
                    has_last_target_ = true;
                    try {
                        callback(*sensor_data);
                    } catch (const std::exception& e) {
                        logError("Ld2410Sensor", std::string("Error in callback: ") + e.what());
                    }
                }
            }
        } catch (const std::exception& e) {
            logError("Ld2410Sensor", std::string("Error reading sensor: ") + e.what());
        }

        std::this_thread::sleep_for(options_.poll_interval);
    }

    if (options_.debug) {
        logInfo("Ld2410Sensor", "Monitoring loop stopped");
    }
}
