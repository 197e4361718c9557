#pragma once

#include <string>
#include <fstream>
#include <filesystem>
#include <random>
#include <vector>
#include <deque>
#include <mutex>
#include <cstdint>
#include <stdexcept>
#include <chrono>
#include <cerrno>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>
#include <sys/time.h>
#include <sys/socket.h>
#include <unistd.h>
#include "serial_port.h"

// Scratch directory removed at scope exit.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("securitycam_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

    std::string file(const std::string& name, const std::string& contents) const {
        auto p = path_ / name;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary);
        out << contents;
        return p.string();
    }

private:
    std::filesystem::path path_;
};

// ByteSource fed from the test; each push() becomes one chunk.
class FakeByteSource : public ByteSource {
public:
    void push(const std::vector<uint8_t>& chunk) {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_.push_back(chunk);
    }

    void failNextRead() {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_next_ = true;
    }

    size_t available() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_next_) {
            fail_next_ = false;
            throw std::runtime_error("simulated UART failure");
        }
        return chunks_.empty() ? 0 : chunks_.front().size();
    }

    std::vector<uint8_t> read(size_t max_bytes) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (chunks_.empty()) {
            return {};
        }
        std::vector<uint8_t> chunk = chunks_.front();
        chunks_.pop_front();
        if (chunk.size() > max_bytes) {
            chunk.resize(max_bytes);
        }
        return chunk;
    }

    bool isOpen() const override { return open_; }
    void close() override { open_ = false; }

private:
    std::mutex mutex_;
    std::deque<std::vector<uint8_t>> chunks_;
    bool fail_next_ = false;
    bool open_ = true;
};

// Connected TCP socket with blocking, timeout-bounded reads.
class SocketStream {
public:
    explicit SocketStream(int fd = -1) : fd_(fd) {
        if (fd_ >= 0) {
            timeval tv{5, 0};
            setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        }
    }
    ~SocketStream() { close(); }

    SocketStream(SocketStream&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    SocketStream& operator=(SocketStream&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }
    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    bool valid() const { return fd_ >= 0; }

    // One CRLF-terminated line without the terminator; false on EOF or timeout.
    bool readLine(std::string& line) {
        line.clear();
        char c = 0;
        while (::recv(fd_, &c, 1, 0) == 1) {
            if (c == '\n') {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return true;
            }
            line.push_back(c);
        }
        return false;
    }

    // Up to max_bytes; empty on EOF or timeout.
    std::vector<uint8_t> readSome(size_t max_bytes = 4096) {
        std::vector<uint8_t> buffer(max_bytes);
        ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), 0);
        buffer.resize(n > 0 ? static_cast<size_t>(n) : 0);
        return buffer;
    }

    std::string readAll() {
        std::string data;
        for (auto chunk = readSome(); !chunk.empty(); chunk = readSome()) {
            data.append(chunk.begin(), chunk.end());
        }
        return data;
    }

    bool writeAll(const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
};

// Listening socket on 127.0.0.1; port 0 picks a free port.
class LoopbackListener {
public:
    explicit LoopbackListener(uint16_t port = 0) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }
        int reuse = 1;
        setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(port);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd_, 4) != 0) {
            ::close(fd_);
            throw std::runtime_error("cannot listen on 127.0.0.1:" + std::to_string(port));
        }

        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }
    ~LoopbackListener() { ::close(fd_); }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    uint16_t port() const { return port_; }

    SocketStream accept(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        pollfd pfd{fd_, POLLIN, 0};
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) {
            return SocketStream();
        }
        return SocketStream(::accept(fd_, nullptr, nullptr));
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};
