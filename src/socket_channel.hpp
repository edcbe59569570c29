#pragma once
#include "byte_channel.hpp"
#include <atomic>
#include <string>

namespace nmeascout
{

// TCP byte stream to a multiplexing daemon (gpsd by default).
// Baud rate is meaningless here; setBaudRate() accepts and ignores any value.
class SocketChannel : public ByteChannel {
public:
    // open() gives up after connectTimeoutMs; interrupt() also ends a pending connect.
    SocketChannel(const std::string &host, int port, int connectTimeoutMs = 3000);
    ~SocketChannel() override;

    void open() override;
    void close() override;
    bool isOpen() const override { return fd_ >= 0; }

    bool setBaudRate(int) override { return true; }
    int baudRate() const override { return 0; }
    void discardInput() override;

    ReadResult read(uint8_t *buffer, size_t size, int timeoutMs) override;
    bool write(const void *data, size_t len) override;

    void interrupt() override;

    const std::string &path() const override { return address_; }

    // "host:port" -> parts; returns false when the port is missing or not numeric.
    static bool splitAddress(const std::string &address, std::string &host, int &port);

private:
    std::string host_;
    int port_;
    std::string address_;
    int connectTimeoutMs_;
    int fd_;
    int wakePipe_[2];
    std::atomic<bool> interrupted_;

    int waitConnected(int fd, int timeoutMs);
};

} // namespace nmeascout
