#include "ld2410_decoder.h"
#include <algorithm>
#include <stdexcept>

std::optional<SensorData> parsePacket(const std::vector<uint8_t>& packet) {
    if (packet.size() < PacketDecoder::FRAME_SIZE) {
        return std::nullopt;
    }
    if (packet.front() != PacketDecoder::FRAME_HEAD || packet.back() != PacketDecoder::FRAME_TAIL) {
        return std::nullopt;
    }

    uint8_t target_state = packet[1];

    SensorData data;
    data.moving_target = (target_state & 0x01) != 0;
    data.stationary_target = (target_state & 0x02) != 0;
    data.distance = static_cast<int>(packet[3]) * 10;
    data.signal_strength = packet[4];
    data.raw_data = packet;
    data.timestamp = std::chrono::system_clock::now();
    return data;
}

std::optional<SensorData> PacketDecoder::feed(const std::vector<uint8_t>& chunk) {
    std::vector<uint8_t> buffer;
    buffer.reserve(pending_.size() + chunk.size());
    buffer.insert(buffer.end(), pending_.begin(), pending_.end());
    buffer.insert(buffer.end(), chunk.begin(), chunk.end());
    pending_.clear();

    std::optional<SensorData> latest;
    size_t i = 0;
    while (i < buffer.size()) {
        if (buffer[i] != FRAME_HEAD) {
            ++i;
            continue;
        }
        if (i + FRAME_SIZE > buffer.size()) {
            // incomplete frame, wait for the rest
            pending_.assign(buffer.begin() + i, buffer.end());
            break;
        }
        if (buffer[i + FRAME_SIZE - 1] != FRAME_TAIL) {
            ++i;
            continue;
        }

        std::vector<uint8_t> packet(buffer.begin() + i, buffer.begin() + i + FRAME_SIZE);
        auto parsed = parsePacket(packet);
        if (parsed) {
            latest = parsed;
        }
        i += FRAME_SIZE;
    }

    return latest;
}

const std::vector<uint8_t>& MarkerDecoder::marker() {
    static const std::vector<uint8_t> bytes = {0x00, 0x62, 0x6E, 0x02};
    return bytes;
}

MarkerDecoder::MarkerDecoder(int motion_threshold)
    : motion_threshold_(motion_threshold) {
}

std::optional<SensorData> MarkerDecoder::feed(const std::vector<uint8_t>& chunk) {
    std::vector<uint8_t> buffer;
    buffer.reserve(pending_.size() + chunk.size());
    buffer.insert(buffer.end(), pending_.begin(), pending_.end());
    buffer.insert(buffer.end(), chunk.begin(), chunk.end());
    pending_.clear();

    const auto& mark = marker();
    std::optional<SensorData> latest;

    auto pos = buffer.begin();
    while (true) {
        auto found = std::search(pos, buffer.end(), mark.begin(), mark.end());
        if (found == buffer.end()) {
            // keep a partial marker at the end of the buffer
            size_t keep = std::min(static_cast<size_t>(buffer.end() - pos), mark.size() - 1);
            pending_.assign(buffer.end() - keep, buffer.end());
            break;
        }

        auto signal_it = found + mark.size();
        if (signal_it == buffer.end()) {
            pending_.assign(found, buffer.end());
            break;
        }

        int signal_strength = *signal_it;

        SensorData data;
        data.moving_target = signal_strength >= motion_threshold_;
        data.stationary_target = false;
        data.distance = 0;
        data.signal_strength = signal_strength;
        data.raw_data.assign(found, signal_it + 1);
        data.timestamp = std::chrono::system_clock::now();
        latest = data;

        pos = signal_it + 1;
    }

    return latest;
}

std::unique_ptr<FrameDecoder> makeDecoder(const std::string& protocol, int motion_threshold) {
    if (protocol == "packet") {
        return std::make_unique<PacketDecoder>();
    }
    if (protocol == "marker") {
        return std::make_unique<MarkerDecoder>(motion_threshold);
    }
    throw std::invalid_argument("Unknown radar protocol: " + protocol);
}

std::string toHex(const std::vector<uint8_t>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}
