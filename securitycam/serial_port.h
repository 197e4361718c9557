#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// Anything the radar monitor can pull bytes from.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual size_t available() = 0;
    virtual std::vector<uint8_t> read(size_t max_bytes) = 0;
    virtual bool isOpen() const = 0;
    virtual void close() = 0;
};

class SerialPort : public ByteSource {
public:
    SerialPort(const std::string& device, int baud_rate);
    ~SerialPort() override;

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    size_t available() override;
    std::vector<uint8_t> read(size_t max_bytes) override;
    bool isOpen() const override { return fd_ >= 0; }
    void close() override;

    const std::string& device() const { return device_; }
    int baudRate() const { return baud_rate_; }

private:
    std::string device_;
    int baud_rate_;
    int fd_;

    void configure();
};
