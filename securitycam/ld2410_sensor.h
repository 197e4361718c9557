#pragma once

#include "sensor_data.h"
#include "ld2410_decoder.h"
#include "serial_port.h"
#include "gpio_pin.h"
#include "config.h"
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>
#include <functional>

class Ld2410Sensor {
public:
    using DetectionCallback = std::function<void(const SensorData& data)>;

    struct Options {
        std::chrono::milliseconds min_target_interval{500};
        std::chrono::milliseconds poll_interval{50};
        bool debug = false;
    };

    Ld2410Sensor(std::unique_ptr<ByteSource> source,
                 std::unique_ptr<FrameDecoder> decoder,
                 Options options,
                 std::unique_ptr<GpioPin> presence_pin = nullptr);
    ~Ld2410Sensor();

    Ld2410Sensor(const Ld2410Sensor&) = delete;
    Ld2410Sensor& operator=(const Ld2410Sensor&) = delete;

    // Opens the UART and presence pin described by the settings.
    static std::unique_ptr<Ld2410Sensor> open(const RadarSettings& settings);

    // Monitoring
    void startMonitoring(DetectionCallback callback);
    void stopMonitoring();
    bool isMonitoring() const { return monitoring_; }
    void cleanup();

    // One read/decode step; used by the monitor loop.
    std::optional<SensorData> readSensor();

private:
    std::unique_ptr<ByteSource> source_;
    std::unique_ptr<FrameDecoder> decoder_;
    std::unique_ptr<GpioPin> presence_pin_;
    Options options_;

    std::mutex source_mutex_;
    std::atomic<bool> monitoring_;
    std::thread monitor_thread_;
    std::chrono::steady_clock::time_point last_target_time_;
    bool has_last_target_;

    void monitorLoop(DetectionCallback callback);
};
