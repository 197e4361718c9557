#pragma once

#include "sensor_data.h"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

// Turns raw UART bytes into readings. Decoders keep the tail of an
// incomplete frame between feed() calls.
class FrameDecoder {
public:
    virtual ~FrameDecoder() = default;

    // Returns the reading of the last complete frame seen in this chunk.
    virtual std::optional<SensorData> feed(const std::vector<uint8_t>& chunk) = 0;
    virtual void reset() = 0;
    virtual std::string name() const = 0;
};

// 7-byte frames: F8 <state> <?> <distance/10> <strength> <?> FE
class PacketDecoder : public FrameDecoder {
public:
    static constexpr uint8_t FRAME_HEAD = 0xF8;
    static constexpr uint8_t FRAME_TAIL = 0xFE;
    static constexpr size_t FRAME_SIZE = 7;

    std::optional<SensorData> feed(const std::vector<uint8_t>& chunk) override;
    void reset() override { pending_.clear(); }
    std::string name() const override { return "packet"; }

private:
    std::vector<uint8_t> pending_;
};

// Engineering output: 00 62 6E 02 followed by one signal-strength byte.
class MarkerDecoder : public FrameDecoder {
public:
    static const std::vector<uint8_t>& marker();

    explicit MarkerDecoder(int motion_threshold = 140);

    std::optional<SensorData> feed(const std::vector<uint8_t>& chunk) override;
    void reset() override { pending_.clear(); }
    std::string name() const override { return "marker"; }

    int motionThreshold() const { return motion_threshold_; }

private:
    int motion_threshold_;
    std::vector<uint8_t> pending_;
};

std::optional<SensorData> parsePacket(const std::vector<uint8_t>& packet);
std::unique_ptr<FrameDecoder> makeDecoder(const std::string& protocol, int motion_threshold);
std::string toHex(const std::vector<uint8_t>& bytes);
