#include "serial_port.h"
#include "logger.h"
#include <stdexcept>
#include <cstring>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
// termios2 gives arbitrary baud rates (the LD2410 default is 256000)
#include <asm/termbits.h>

SerialPort::SerialPort(const std::string& device, int baud_rate)
    : device_(device)
    , baud_rate_(baud_rate)
    , fd_(-1) {

    fd_ = ::open(device_.c_str(), O_RDWR | O_NOCTTY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open UART " + device_ + ": " + std::strerror(errno));
    }

    try {
        configure();
    } catch (...) {
        ::close(fd_);
        fd_ = -1;
        throw;
    }

    logInfo("SerialPort", "Opened " + device_ + " at " + std::to_string(baud_rate_) + " baud");
}

SerialPort::~SerialPort() {
    close();
}

void SerialPort::configure() {
    struct termios2 tio;
    std::memset(&tio, 0, sizeof(tio));
    if (ioctl(fd_, TCGETS2, &tio) != 0) {
        throw std::runtime_error("TCGETS2 failed on " + device_ + ": " + std::strerror(errno));
    }

    // 8N1, raw, no flow control
    tio.c_cflag &= ~(CBAUD | CSIZE | PARENB | CSTOPB | CRTSCTS);
    tio.c_cflag |= BOTHER | CS8 | CLOCAL | CREAD;
    tio.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON | IXOFF | IXANY);
    tio.c_oflag &= ~OPOST;
    tio.c_lflag &= ~(ECHO | ECHONL | ICANON | ISIG | IEXTEN);
    tio.c_ispeed = static_cast<speed_t>(baud_rate_);
    tio.c_ospeed = static_cast<speed_t>(baud_rate_);

    // read() returns what is there, or waits at most 1 s
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 10;

    if (ioctl(fd_, TCSETS2, &tio) != 0) {
        throw std::runtime_error("TCSETS2 failed on " + device_ + ": " + std::strerror(errno));
    }

    if (ioctl(fd_, TCFLSH, TCIOFLUSH) != 0) {
        logWarning("SerialPort", "Could not flush " + device_ + ": " + std::strerror(errno));
    }
}

size_t SerialPort::available() {
    if (fd_ < 0) {
        throw std::runtime_error("UART " + device_ + " is closed");
    }

    int count = 0;
    if (ioctl(fd_, FIONREAD, &count) != 0) {
        throw std::runtime_error("FIONREAD failed on " + device_ + ": " + std::strerror(errno));
    }
    return count > 0 ? static_cast<size_t>(count) : 0;
}

std::vector<uint8_t> SerialPort::read(size_t max_bytes) {
    if (fd_ < 0) {
        throw std::runtime_error("UART " + device_ + " is closed");
    }

    std::vector<uint8_t> buffer(max_bytes);
    ssize_t n = ::read(fd_, buffer.data(), buffer.size());
    if (n < 0) {
        if (errno == EAGAIN || errno == EINTR) {
            return {};
        }
        throw std::runtime_error("Read failed on " + device_ + ": " + std::strerror(errno));
    }
    buffer.resize(static_cast<size_t>(n));
    return buffer;
}

void SerialPort::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
        logInfo("SerialPort", "Closed " + device_);
    }
}
